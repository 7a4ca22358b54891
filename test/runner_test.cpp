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

#include <pyfuture/runner.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

using pyfuture::gate_guard;
using pyfuture::gate_token;
using pyfuture::make_waker;
using pyfuture::runner;
using pyfuture::waker;
using pyfuture_test::counting_waker;
using pyfuture_test::fake_runner;
using pyfuture_test::handle_t;
using pyfuture_test::mock_gate;

namespace {

struct runner_test : testing::Test {
  mock_gate gate;
  std::shared_ptr<std::atomic<int>> cancels =
      std::make_shared<std::atomic<int>>(0);
  std::shared_ptr<fake_runner> function =
      pyfuture_test::make_idle_runner(cancels);
  runner<std::string> r{gate, function};
  waker w = make_waker(std::make_shared<counting_waker>());
};

using runner_DeathTest = runner_test;

} // namespace

TEST_F(runner_test, new_runner_is_alive) {
  EXPECT_FALSE(r.is_closed());
  auto notificator = r.closed_notificator();
  ASSERT_TRUE(notificator.has_value());
  EXPECT_FALSE(notificator->is_closed());
}

TEST_F(runner_test, creates_futures_bound_to_its_function) {
  auto future = r.create_future("awaitable");
  EXPECT_TRUE(future.is_init());
  EXPECT_EQ(&gate, &future.gate());

  ASSERT_TRUE(future.poll(w).is_pending());
  EXPECT_EQ(1, function->calls());
  EXPECT_EQ("awaitable", function->last_handle()->awaitable());

  gate_guard guard{gate};
  future.cancel(guard.token());
}

TEST_F(runner_test, close_is_permanent_and_idempotent) {
  r.close();
  r.close();
  EXPECT_TRUE(r.is_closed());
  EXPECT_FALSE(r.try_create_future("awaitable").has_value());
  EXPECT_FALSE(r.closed_notificator().has_value());
}

TEST_F(runner_test, notificator_observes_close) {
  auto notificator = r.closed_notificator();
  ASSERT_TRUE(notificator.has_value());

  r.close();

  EXPECT_TRUE(notificator->is_closed());
  notificator->blocking_wait();
}

TEST_F(runner_test, futures_survive_close) {
  auto future = r.create_future("awaitable");
  r.close();

  ASSERT_TRUE(future.poll(w).is_pending());
  {
    gate_guard guard{gate};
    function->last_handle()->set_result(guard.token(), "value");
  }
  auto result = future.poll(w);
  ASSERT_TRUE(result.is_ready());
  EXPECT_EQ("value", result.take().get());
}

TEST_F(runner_test, each_future_gets_its_own_handle) {
  auto first = r.create_future("one");
  auto second = r.create_future("two");
  ASSERT_TRUE(first.poll(w).is_pending());
  auto firstHandle = function->last_handle();
  ASSERT_TRUE(second.poll(w).is_pending());
  auto secondHandle = function->last_handle();

  EXPECT_NE(firstHandle, secondHandle);
  EXPECT_EQ("one", firstHandle->awaitable());
  EXPECT_EQ("two", secondHandle->awaitable());

  gate_guard guard{gate};
  first.cancel(guard.token());
  second.cancel(guard.token());
  EXPECT_EQ(2, cancels->load());
}

TEST_F(runner_test, failing_task_resolves_on_second_poll) {
  auto failing = std::make_shared<fake_runner>(
      [this](gate_token& token, const std::shared_ptr<handle_t>& handle) {
        handle->set_exception(
            token, std::make_exception_ptr(std::runtime_error("boom")));
        return std::make_unique<pyfuture_test::counting_cancel_handle>(
            cancels);
      });
  runner<std::string> failingRunner{gate, failing};
  auto future = failingRunner.create_future("awaitable");

  EXPECT_TRUE(future.poll(w).is_pending());
  EXPECT_TRUE(future.is_running());

  auto result = future.poll(w);
  ASSERT_TRUE(result.is_ready());
  auto out = result.take();
  ASSERT_TRUE(out.has_error());
  try {
    std::move(out).get();
    FAIL() << "expected the task failure to be rethrown";
  } catch (const std::runtime_error& ex) {
    EXPECT_STREQ("boom", ex.what());
  }
  EXPECT_TRUE(future.is_done());
  EXPECT_EQ(1, failing->calls());
  EXPECT_EQ(0, cancels->load());
}

TEST_F(runner_DeathTest, creating_future_after_close_is_fatal) {
  r.close();
  EXPECT_DEATH(r.create_future("awaitable"), "The runner is already closed");
}
