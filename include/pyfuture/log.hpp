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

#include <pyfuture/config.hpp>

#include <functional>

namespace pyfuture {

enum class log_level { debug, info, warning, error };

const char* to_string(log_level level) noexcept;

// Receives every message at or above the current level. Called from
// whichever thread logs, possibly with the interpreter lock held, so a sink
// must not block on the interpreter. No library lock is held while it runs,
// so a sink may itself log or replace the sink.
using log_sink = std::function<void(log_level, const char*)>;

// Installs a process-wide sink. An empty sink restores the default one,
// which writes to stderr.
void set_log_sink(log_sink sink);

void set_log_level(log_level level) noexcept;
log_level get_log_level() noexcept;

bool should_log(log_level level) noexcept;

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
void log(log_level level, const char* format, ...) noexcept;

} // namespace pyfuture

#define PYFUTURE_LOG(level, ...)                         \
  do {                                                   \
    if (::pyfuture::should_log(level)) {                 \
      ::pyfuture::log((level), __VA_ARGS__);             \
    }                                                    \
  } while (false)

#define PYFUTURE_LOG_DEBUG(...) \
  PYFUTURE_LOG(::pyfuture::log_level::debug, __VA_ARGS__)
#define PYFUTURE_LOG_INFO(...) \
  PYFUTURE_LOG(::pyfuture::log_level::info, __VA_ARGS__)
#define PYFUTURE_LOG_WARNING(...) \
  PYFUTURE_LOG(::pyfuture::log_level::warning, __VA_ARGS__)
#define PYFUTURE_LOG_ERROR(...) \
  PYFUTURE_LOG(::pyfuture::log_level::error, __VA_ARGS__)
