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
#pragma once

#include <stdexcept>

namespace pyfuture {

// Thrown to the interpreter side when a completion handle that already holds
// an outcome is given a second one. The first outcome is kept.
class already_completed : public std::logic_error {
 public:
  already_completed()
    : std::logic_error("completion handle already holds an outcome") {}
};

// Thrown when a future is requested from a runner that has been closed.
class runner_closed : public std::runtime_error {
 public:
  runner_closed() : std::runtime_error("The runner is already closed") {}
};

} // namespace pyfuture
