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
#include <pyfuture/async_shared_mutex.hpp>

#include <pyfuture/block_on.hpp>
#include <pyfuture/config.hpp>

#include <algorithm>

namespace pyfuture {

async_shared_mutex::async_shared_mutex() noexcept
  : activeUniqueCount_(0)
  , activeSharedCount_(0) {
}

async_shared_mutex::~async_shared_mutex() {
  PYFUTURE_ASSERT(pendingQueue_.empty());
}

bool async_shared_mutex::try_lock() noexcept {
  std::lock_guard lock{mutex_};
  if (activeUniqueCount_ == 0 && activeSharedCount_ == 0) {
    PYFUTURE_ASSERT(pendingQueue_.empty());
    activeUniqueCount_++;
    return true;
  }
  return false;
}

bool async_shared_mutex::try_lock_shared() noexcept {
  std::lock_guard lock{mutex_};
  if (activeUniqueCount_ == 0 && pendingQueue_.empty()) {
    activeSharedCount_++;
    return true;
  }
  return false;
}

void async_shared_mutex::lock_shared() {
  block_on(lock_shared_async());
}

bool async_shared_mutex::try_enqueue(const std::shared_ptr<waiter>& w) noexcept {
  std::lock_guard lock{mutex_};

  if (activeUniqueCount_ == 0 && activeSharedCount_ == 0) {
    PYFUTURE_ASSERT(pendingQueue_.empty());
    if (w->unique_) {
      activeUniqueCount_++;
    } else {
      activeSharedCount_++;
    }
    return false;
  }

  if (!w->unique_ && activeUniqueCount_ == 0 && pendingQueue_.empty()) {
    PYFUTURE_ASSERT(activeSharedCount_ > 0);
    activeSharedCount_++;
    return false;
  }

  pendingQueue_.push_back(w);
  return true;
}

void async_shared_mutex::grant_waiters(std::vector<waker>& toWake) noexcept {
  while (!pendingQueue_.empty() && activeUniqueCount_ == 0 &&
         (!pendingQueue_.front()->unique_ || activeSharedCount_ == 0)) {
    auto item = std::move(pendingQueue_.front());
    pendingQueue_.pop_front();
    if (item->unique_) {
      activeUniqueCount_++;
    } else {
      activeSharedCount_++;
    }
    item->granted_ = true;
    toWake.push_back(std::move(item->waker_));
  }
  PYFUTURE_ASSERT(activeUniqueCount_ <= 1);
  PYFUTURE_ASSERT(!(activeUniqueCount_ > 0 && activeSharedCount_ > 0));
}

void async_shared_mutex::unlock() noexcept {
  std::vector<waker> toWake;
  {
    std::lock_guard lock{mutex_};
    PYFUTURE_CHECK(
        activeUniqueCount_ == 1,
        "async_shared_mutex::unlock() without a unique lock held");
    PYFUTURE_ASSERT(activeSharedCount_ == 0);
    activeUniqueCount_--;
    grant_waiters(toWake);
  }

  for (auto& w : toWake) {
    std::move(w).wake();
  }
}

void async_shared_mutex::unlock_shared() noexcept {
  std::vector<waker> toWake;
  {
    std::lock_guard lock{mutex_};
    PYFUTURE_CHECK(
        activeSharedCount_ > 0,
        "async_shared_mutex::unlock_shared() without a shared lock held");
    PYFUTURE_ASSERT(activeUniqueCount_ == 0);
    activeSharedCount_--;
    grant_waiters(toWake);
  }

  for (auto& w : toWake) {
    std::move(w).wake();
  }
}

void async_shared_mutex::cancel_waiter(const std::shared_ptr<waiter>& w) noexcept {
  bool release = false;
  std::vector<waker> toWake;
  {
    std::lock_guard lock{mutex_};
    if (w->granted_) {
      // Granted after the last poll; give the lock back.
      release = true;
    } else {
      auto it = std::find(pendingQueue_.begin(), pendingQueue_.end(), w);
      PYFUTURE_ASSERT(it != pendingQueue_.end());
      pendingQueue_.erase(it);
      // A departing writer at the front may have been holding back readers.
      grant_waiters(toWake);
    }
  }

  for (auto& wk : toWake) {
    std::move(wk).wake();
  }

  if (release) {
    if (w->unique_) {
      unlock();
    } else {
      unlock_shared();
    }
  }
}

async_shared_mutex::shared_lock_future::~shared_lock_future() {
  if (waiter_) {
    mutex_->cancel_waiter(waiter_);
  }
}

poll_result<unit> async_shared_mutex::shared_lock_future::poll(const waker& w) {
  PYFUTURE_CHECK(!completed_, "Polling a completed shared_lock_future");
  if (!waiter_) {
    auto candidate = std::make_shared<waiter>(waiter{w, false});
    if (!mutex_->try_enqueue(candidate)) {
      completed_ = true;
      return poll_result<unit>::ready();
    }
    waiter_ = std::move(candidate);
    return poll_result<unit>::pending();
  }

  std::lock_guard lock{mutex_->mutex_};
  if (waiter_->granted_) {
    waiter_.reset();
    completed_ = true;
    return poll_result<unit>::ready();
  }
  waiter_->waker_ = w;
  return poll_result<unit>::pending();
}

} // namespace pyfuture
