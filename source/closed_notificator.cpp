/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * Licensed under the Apache License Version 2.0 with LLVM Exceptions
 * (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 *   https://llvm.org/LICENSE.txt
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include <pyfuture/closed_notificator.hpp>

namespace pyfuture {

poll_result<unit> closed_future::poll(const waker& w) {
  auto result = lock_.poll(w);
  if (result.is_ready()) {
    aliveLock_->unlock_shared();
  }
  return result;
}

bool closed_notificator::is_closed() const noexcept {
  if (aliveLock_->try_lock_shared()) {
    aliveLock_->unlock_shared();
    return true;
  }
  return false;
}

closed_future closed_notificator::wait() const noexcept {
  return closed_future{aliveLock_};
}

void closed_notificator::blocking_wait() const {
  aliveLock_->lock_shared();
  aliveLock_->unlock_shared();
}

} // namespace pyfuture
