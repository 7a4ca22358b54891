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

#include <atomic>
#include <cstddef>
#include <memory>
#include <utility>

namespace pyfuture {

// Operations of a waker's type-erased target. clone() returns the data
// pointer of the new reference; wake() consumes the reference it is called
// on while wake_by_ref() leaves it alive.
struct waker_vtable {
  void* (*clone)(void* data) noexcept;
  void (*wake)(void* data) noexcept;
  void (*wake_by_ref)(void* data) noexcept;
  void (*drop)(void* data) noexcept;
};

namespace _waker {
inline void* noop_clone(void*) noexcept {
  return nullptr;
}
inline void noop_wake(void*) noexcept {}

inline constexpr waker_vtable noop_vtable{
    &noop_clone, &noop_wake, &noop_wake, &noop_wake};
} // namespace _waker

// Handle used by a pending future to ask its executor to poll it again.
// Copies refer to the same task. A moved-from waker does nothing.
class waker {
 public:
  waker(void* data, const waker_vtable* vtable) noexcept
    : data_(data), vtable_(vtable) {}

  waker(const waker& other) noexcept
    : data_(other.vtable_->clone(other.data_)), vtable_(other.vtable_) {}

  waker(waker&& other) noexcept
    : data_(std::exchange(other.data_, nullptr))
    , vtable_(std::exchange(other.vtable_, &_waker::noop_vtable)) {}

  ~waker() { vtable_->drop(data_); }

  waker& operator=(const waker& other) noexcept {
    if (!will_wake(other)) {
      waker copy{other};
      swap(copy);
    }
    return *this;
  }

  waker& operator=(waker&& other) noexcept {
    waker tmp{std::move(other)};
    swap(tmp);
    return *this;
  }

  void wake() && noexcept {
    auto* vtable = std::exchange(vtable_, &_waker::noop_vtable);
    vtable->wake(std::exchange(data_, nullptr));
  }

  void wake_by_ref() const noexcept { vtable_->wake_by_ref(data_); }

  // True if waking either handle resumes the same task.
  [[nodiscard]] bool will_wake(const waker& other) const noexcept {
    return data_ == other.data_ && vtable_ == other.vtable_;
  }

  void swap(waker& other) noexcept {
    std::swap(data_, other.data_);
    std::swap(vtable_, other.vtable_);
  }

  static waker noop() noexcept {
    return waker{nullptr, &_waker::noop_vtable};
  }

 private:
  void* data_;
  const waker_vtable* vtable_;
};

namespace _waker {

template <typename Target>
struct shared_target {
  explicit shared_target(std::shared_ptr<Target> t) noexcept
    : target_(std::move(t)) {}

  static void* clone(void* data) noexcept {
    auto* self = static_cast<shared_target*>(data);
    self->refs_.fetch_add(1, std::memory_order_relaxed);
    return self;
  }

  static void wake(void* data) noexcept {
    wake_by_ref(data);
    drop(data);
  }

  static void wake_by_ref(void* data) noexcept {
    static_cast<shared_target*>(data)->target_->wake();
  }

  static void drop(void* data) noexcept {
    auto* self = static_cast<shared_target*>(data);
    if (self->refs_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      delete self;
    }
  }

  static constexpr waker_vtable vtable{&clone, &wake, &wake_by_ref, &drop};

  std::atomic<std::size_t> refs_{1};
  std::shared_ptr<Target> target_;
};

} // namespace _waker

// Builds a waker from any object exposing `void wake() noexcept`. Wakers
// built from one call compare equal under will_wake(); separate calls do not.
template <typename Target>
waker make_waker(std::shared_ptr<Target> target) {
  auto* state = new _waker::shared_target<Target>{std::move(target)};
  return waker{state, &_waker::shared_target<Target>::vtable};
}

} // namespace pyfuture
