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

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using pyfuture::async_shared_mutex;
using pyfuture::make_waker;
using pyfuture::owned_unique_lock;
using pyfuture::waker;
using pyfuture_test::counting_waker;

TEST(async_shared_mutex_test, shared_locks_coexist) {
  async_shared_mutex mutex;
  EXPECT_TRUE(mutex.try_lock_shared());
  EXPECT_TRUE(mutex.try_lock_shared());
  EXPECT_FALSE(mutex.try_lock());
  mutex.unlock_shared();
  mutex.unlock_shared();
  EXPECT_TRUE(mutex.try_lock());
  mutex.unlock();
}

TEST(async_shared_mutex_test, unique_lock_excludes_everyone) {
  async_shared_mutex mutex;
  ASSERT_TRUE(mutex.try_lock());
  EXPECT_FALSE(mutex.try_lock());
  EXPECT_FALSE(mutex.try_lock_shared());
  mutex.unlock();
  EXPECT_TRUE(mutex.try_lock_shared());
  mutex.unlock_shared();
}

TEST(async_shared_mutex_test, lock_shared_async_is_ready_when_free) {
  async_shared_mutex mutex;
  auto future = mutex.lock_shared_async();
  EXPECT_TRUE(future.poll(waker::noop()).is_ready());
  EXPECT_FALSE(mutex.try_lock());
  mutex.unlock_shared();
}

TEST(async_shared_mutex_test, queued_readers_are_woken_on_unlock) {
  async_shared_mutex mutex;
  ASSERT_TRUE(mutex.try_lock());

  auto first = std::make_shared<counting_waker>();
  auto second = std::make_shared<counting_waker>();
  auto a = mutex.lock_shared_async();
  auto b = mutex.lock_shared_async();
  EXPECT_TRUE(a.poll(make_waker(first)).is_pending());
  EXPECT_TRUE(b.poll(make_waker(second)).is_pending());

  // Queued waiters keep newcomers out until they have been served.
  EXPECT_FALSE(mutex.try_lock_shared());

  mutex.unlock();
  EXPECT_EQ(1, first->wakes());
  EXPECT_EQ(1, second->wakes());

  EXPECT_TRUE(a.poll(waker::noop()).is_ready());
  EXPECT_TRUE(b.poll(waker::noop()).is_ready());
  mutex.unlock_shared();
  mutex.unlock_shared();
  EXPECT_TRUE(mutex.try_lock());
  mutex.unlock();
}

TEST(async_shared_mutex_test, repoll_replaces_waker) {
  async_shared_mutex mutex;
  ASSERT_TRUE(mutex.try_lock());

  auto first = std::make_shared<counting_waker>();
  auto second = std::make_shared<counting_waker>();
  auto future = mutex.lock_shared_async();
  EXPECT_TRUE(future.poll(make_waker(first)).is_pending());
  EXPECT_TRUE(future.poll(make_waker(second)).is_pending());

  mutex.unlock();
  EXPECT_EQ(0, first->wakes());
  EXPECT_EQ(1, second->wakes());
  EXPECT_TRUE(future.poll(waker::noop()).is_ready());
  mutex.unlock_shared();
}

TEST(async_shared_mutex_test, dropping_pending_future_leaves_queue) {
  async_shared_mutex mutex;
  ASSERT_TRUE(mutex.try_lock());
  {
    auto future = mutex.lock_shared_async();
    EXPECT_TRUE(future.poll(waker::noop()).is_pending());
  }
  mutex.unlock();
  EXPECT_TRUE(mutex.try_lock());
  mutex.unlock();
}

TEST(async_shared_mutex_test, dropping_granted_future_releases_lock) {
  async_shared_mutex mutex;
  ASSERT_TRUE(mutex.try_lock());
  {
    auto future = mutex.lock_shared_async();
    EXPECT_TRUE(future.poll(waker::noop()).is_pending());
    mutex.unlock();
    // Granted but never polled again.
  }
  EXPECT_TRUE(mutex.try_lock());
  mutex.unlock();
}

TEST(async_shared_mutex_test, lock_shared_blocks_until_unlock) {
  auto mutex = std::make_shared<async_shared_mutex>();
  auto guard = owned_unique_lock::try_lock(mutex);
  ASSERT_TRUE(guard.has_value());
  EXPECT_FALSE(owned_unique_lock::try_lock(mutex).has_value());

  std::atomic<int> acquired{0};
  std::vector<std::thread> readers;
  for (int i = 0; i < 4; ++i) {
    readers.emplace_back([&] {
      mutex->lock_shared();
      acquired.fetch_add(1);
      mutex->unlock_shared();
    });
  }

  EXPECT_EQ(0, acquired.load());
  guard.reset();
  for (auto& t : readers) {
    t.join();
  }
  EXPECT_EQ(4, acquired.load());
  EXPECT_TRUE(mutex->try_lock());
  mutex->unlock();
}

TEST(async_shared_mutex_DeathTest, unlock_without_lock_is_fatal) {
  async_shared_mutex mutex;
  EXPECT_DEATH(mutex.unlock(), "without a unique lock held");
  EXPECT_DEATH(mutex.unlock_shared(), "without a shared lock held");
}
