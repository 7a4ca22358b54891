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
#include <pyfuture/log.hpp>

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <mutex>
#include <utility>

namespace pyfuture {

namespace {

std::atomic<log_level> currentLevel{log_level::PYFUTURE_DEFAULT_LOG_LEVEL};

std::mutex& sink_mutex() noexcept {
  static std::mutex mutex;
  return mutex;
}

// Replaced wholesale by set_log_sink(); a logging thread keeps its own
// reference, so the sink runs without sink_mutex() held.
std::shared_ptr<const log_sink>& current_sink() noexcept {
  static std::shared_ptr<const log_sink> sink;
  return sink;
}

void default_sink(log_level level, const char* message) noexcept {
  std::fprintf(stderr, "[pyfuture] [%s] %s\n", to_string(level), message);
  std::fflush(stderr);
}

} // namespace

const char* to_string(log_level level) noexcept {
  switch (level) {
    case log_level::debug: return "debug";
    case log_level::info: return "info";
    case log_level::warning: return "warning";
    case log_level::error: return "error";
  }
  return "unknown";
}

void set_log_sink(log_sink sink) {
  std::shared_ptr<const log_sink> installed;
  if (sink) {
    installed = std::make_shared<const log_sink>(std::move(sink));
  }
  std::lock_guard lock{sink_mutex()};
  current_sink().swap(installed);
}

void set_log_level(log_level level) noexcept {
  currentLevel.store(level, std::memory_order_relaxed);
}

log_level get_log_level() noexcept {
  return currentLevel.load(std::memory_order_relaxed);
}

bool should_log(log_level level) noexcept {
  return static_cast<int>(level) >= static_cast<int>(get_log_level());
}

void log(log_level level, const char* format, ...) noexcept {
  char buffer[PYFUTURE_LOG_BUFFER_SIZE];
  va_list args;
  va_start(args, format);
  std::vsnprintf(buffer, sizeof(buffer), format, args);
  va_end(args);

  std::shared_ptr<const log_sink> sink;
  {
    std::lock_guard lock{sink_mutex()};
    sink = current_sink();
  }
  if (!sink) {
    default_sink(level, buffer);
    return;
  }
  try {
    (*sink)(level, buffer);
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "[pyfuture] log sink failed: %s\n", ex.what());
    default_sink(level, buffer);
  } catch (...) {
    std::fprintf(stderr, "[pyfuture] log sink failed with unknown error\n");
    default_sink(level, buffer);
  }
}

void fatal_error(const char* file, int line, const char* message) noexcept {
  log(log_level::error, "%s:%d: fatal: %s", file, line, message);
  std::abort();
}

} // namespace pyfuture
