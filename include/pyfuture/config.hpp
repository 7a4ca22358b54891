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

#include <cassert>

// Minimum level of messages passed to the log sink until the host calls
// pyfuture::set_log_level(). One of debug, info, warning, error.
#ifndef PYFUTURE_DEFAULT_LOG_LEVEL
#define PYFUTURE_DEFAULT_LOG_LEVEL info
#endif

// Size of the buffer a single formatted log line is rendered into. Longer
// messages are truncated.
#ifndef PYFUTURE_LOG_BUFFER_SIZE
#define PYFUTURE_LOG_BUFFER_SIZE 1024
#endif

// Internal consistency checks. Compiled out with NDEBUG.
#ifndef PYFUTURE_ASSERT
#define PYFUTURE_ASSERT(...) assert((__VA_ARGS__))
#endif

// Misuse checks. Always enabled: a failed check logs the message and aborts
// the process, see pyfuture::fatal_error().
#define PYFUTURE_CHECK(cond, message)                           \
  do {                                                          \
    if (!(cond)) {                                              \
      ::pyfuture::fatal_error(__FILE__, __LINE__, (message));   \
    }                                                           \
  } while (false)

#define PYFUTURE_FATAL(message) \
  ::pyfuture::fatal_error(__FILE__, __LINE__, (message))

namespace pyfuture {

[[noreturn]] void fatal_error(
    const char* file, int line, const char* message) noexcept;

} // namespace pyfuture
