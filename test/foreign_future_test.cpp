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

#include <pyfuture/foreign_future.hpp>

#include "test_support.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

using pyfuture::foreign_future;
using pyfuture::gate_guard;
using pyfuture::gate_token;
using pyfuture::make_waker;
using pyfuture::waker;
using pyfuture_test::cancel_handle;
using pyfuture_test::counting_waker;
using pyfuture_test::fake_runner;
using pyfuture_test::handle_t;
using pyfuture_test::log_capture;
using pyfuture_test::mock_cancel_handle;
using pyfuture_test::mock_gate;
using testing::_;
using testing::Throw;

namespace {

struct foreign_future_test : testing::Test {
  std::shared_ptr<fake_runner> idle_runner() {
    return pyfuture_test::make_idle_runner(cancels);
  }

  void complete(const std::string& value) {
    gate_guard guard{gate};
    runner->last_handle()->set_result(guard.token(), value);
  }

  mock_gate gate;
  std::shared_ptr<std::atomic<int>> cancels =
      std::make_shared<std::atomic<int>>(0);
  std::shared_ptr<fake_runner> runner = idle_runner();
  std::shared_ptr<counting_waker> target = std::make_shared<counting_waker>();
  waker w = make_waker(target);
};

using foreign_future_DeathTest = foreign_future_test;

} // namespace

TEST_F(foreign_future_test, does_nothing_until_polled) {
  foreign_future<std::string> future{gate, runner, "awaitable"};
  EXPECT_TRUE(future.is_init());
  EXPECT_EQ(0, runner->calls());
  EXPECT_EQ(0, gate.acquisitions());

  // Moved away so the drop is silent.
  auto moved = std::move(future);
  EXPECT_TRUE(future.is_done());
  EXPECT_TRUE(moved.is_init());
}

TEST_F(foreign_future_test, first_poll_starts_task_and_is_pending) {
  foreign_future<std::string> future{gate, runner, "awaitable"};

  auto result = future.poll(w);

  EXPECT_TRUE(result.is_pending());
  EXPECT_TRUE(future.is_running());
  EXPECT_EQ(1, runner->calls());
  EXPECT_EQ("awaitable", runner->last_handle()->awaitable());
  EXPECT_EQ(1, gate.acquisitions());
  EXPECT_FALSE(gate.is_held());

  gate_guard guard{gate};
  future.cancel(guard.token());
}

TEST_F(foreign_future_test, resolves_after_task_completes) {
  foreign_future<std::string> future{gate, runner, "awaitable"};
  ASSERT_TRUE(future.poll(w).is_pending());
  ASSERT_TRUE(future.poll(w).is_pending());
  EXPECT_EQ(0, target->wakes());

  complete("value");
  EXPECT_EQ(1, target->wakes());

  auto result = future.poll(w);
  ASSERT_TRUE(result.is_ready());
  EXPECT_EQ("value", result.take().get());
  EXPECT_TRUE(future.is_done());
  EXPECT_EQ(1, runner->calls());
  EXPECT_EQ(0, cancels->load());
}

TEST_F(foreign_future_test, first_poll_is_pending_even_if_runner_completes) {
  auto eager = std::make_shared<fake_runner>(
      [this](gate_token& token, const std::shared_ptr<handle_t>& handle) {
        handle->set_result(token, handle->awaitable() + "!");
        return std::make_unique<pyfuture_test::counting_cancel_handle>(
            cancels);
      });
  foreign_future<std::string> future{gate, eager, "done"};

  EXPECT_TRUE(future.poll(w).is_pending());
  EXPECT_EQ(1, target->wakes());

  auto result = future.poll(w);
  ASSERT_TRUE(result.is_ready());
  EXPECT_EQ("done!", result.take().get());
}

TEST_F(foreign_future_test, failure_is_reported_as_error_outcome) {
  foreign_future<std::string> future{gate, runner, "awaitable"};
  ASSERT_TRUE(future.poll(w).is_pending());
  {
    gate_guard guard{gate};
    runner->last_handle()->set_exception(
        guard.token(), std::make_exception_ptr(std::runtime_error("boom")));
  }

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
}

TEST_F(foreign_future_test, latest_waker_is_woken) {
  auto first = std::make_shared<counting_waker>();
  auto second = std::make_shared<counting_waker>();
  foreign_future<std::string> future{gate, runner, "awaitable"};

  ASSERT_TRUE(future.poll(make_waker(first)).is_pending());
  ASSERT_TRUE(future.poll(make_waker(second)).is_pending());
  complete("value");

  EXPECT_EQ(0, first->wakes());
  EXPECT_EQ(1, second->wakes());
  EXPECT_TRUE(future.poll(w).is_ready());
}

TEST_F(foreign_future_test, cancel_is_requested_once) {
  auto cancel = std::make_unique<mock_cancel_handle>();
  EXPECT_CALL(*cancel, cancel(_)).Times(1);
  std::unique_ptr<cancel_handle> pending = std::move(cancel);
  auto cancellable = std::make_shared<fake_runner>(
      [&pending](gate_token&, const std::shared_ptr<handle_t>&) {
        return std::move(pending);
      });

  foreign_future<std::string> future{gate, cancellable, "awaitable"};
  ASSERT_TRUE(future.poll(w).is_pending());
  EXPECT_FALSE(future.is_cancellation_requested());

  gate_guard guard{gate};
  future.cancel(guard.token());
  future.cancel(guard.token());
  EXPECT_TRUE(future.is_cancellation_requested());
  EXPECT_TRUE(future.is_running());
}

TEST_F(foreign_future_test, failed_cancel_is_thrown_and_not_recorded) {
  auto cancel = std::make_unique<mock_cancel_handle>();
  EXPECT_CALL(*cancel, cancel(_))
      .WillOnce(Throw(std::runtime_error("cannot cancel")))
      .WillOnce(testing::Return());
  std::unique_ptr<cancel_handle> pending = std::move(cancel);
  auto cancellable = std::make_shared<fake_runner>(
      [&pending](gate_token&, const std::shared_ptr<handle_t>&) {
        return std::move(pending);
      });

  foreign_future<std::string> future{gate, cancellable, "awaitable"};
  ASSERT_TRUE(future.poll(w).is_pending());

  gate_guard guard{gate};
  EXPECT_THROW(future.cancel(guard.token()), std::runtime_error);
  EXPECT_FALSE(future.is_cancellation_requested());
  future.cancel(guard.token());
  EXPECT_TRUE(future.is_cancellation_requested());
}

TEST_F(foreign_future_test, completed_task_still_resolves_after_cancel) {
  foreign_future<std::string> future{gate, runner, "awaitable"};
  ASSERT_TRUE(future.poll(w).is_pending());
  {
    gate_guard guard{gate};
    future.cancel(guard.token());
  }
  EXPECT_EQ(1, cancels->load());

  complete("late");
  auto result = future.poll(w);
  ASSERT_TRUE(result.is_ready());
  EXPECT_EQ("late", result.take().get());
}

TEST_F(foreign_future_test, dropping_running_future_logs_warning) {
  log_capture capture;
  {
    foreign_future<std::string> future{gate, runner, "awaitable"};
    ASSERT_TRUE(future.poll(w).is_pending());
  }
  EXPECT_EQ(0, cancels->load());
  ASSERT_EQ(1u, capture.lines().size());
  EXPECT_EQ(pyfuture::log_level::warning, capture.lines()[0].first);
  EXPECT_EQ(1, capture.count_containing("cancellation was never requested"));
}

TEST_F(foreign_future_test, dropping_quietly_when_nothing_is_running) {
  log_capture capture;
  {
    foreign_future<std::string> unpolled{gate, runner, "awaitable"};
  }
  {
    foreign_future<std::string> finished{gate, runner, "awaitable"};
    ASSERT_TRUE(finished.poll(w).is_pending());
    complete("value");
    ASSERT_TRUE(finished.poll(w).is_ready());
  }
  {
    foreign_future<std::string> cancelled{gate, runner, "awaitable"};
    ASSERT_TRUE(cancelled.poll(w).is_pending());
    gate_guard guard{gate};
    cancelled.cancel(guard.token());
  }
  EXPECT_TRUE(capture.lines().empty());
}

TEST_F(foreign_future_DeathTest, polling_done_future_is_fatal) {
  foreign_future<std::string> future{gate, runner, "awaitable"};
  ASSERT_TRUE(future.poll(w).is_pending());
  complete("value");
  ASSERT_TRUE(future.poll(w).is_ready());

  EXPECT_DEATH(future.poll(w), "Polling a done future");
}

TEST_F(foreign_future_DeathTest, cancelling_unstarted_future_is_fatal) {
  foreign_future<std::string> future{gate, runner, "awaitable"};
  EXPECT_DEATH(
      {
        gate_guard guard{gate};
        future.cancel(guard.token());
      },
      "Cancel a non-running future");
}

TEST_F(foreign_future_DeathTest, runner_failure_is_fatal) {
  auto failing = std::make_shared<fake_runner>(
      [](gate_token&, const std::shared_ptr<handle_t>&)
          -> std::unique_ptr<cancel_handle> {
        throw std::runtime_error("no event loop");
      });
  foreign_future<std::string> future{gate, failing, "awaitable"};

  EXPECT_DEATH(
      future.poll(w), "Error while calling runner fake_runner: no event loop");
}

TEST_F(foreign_future_DeathTest, missing_cancel_handle_is_fatal) {
  auto broken = std::make_shared<fake_runner>(
      [](gate_token&, const std::shared_ptr<handle_t>&) {
        return std::unique_ptr<cancel_handle>{};
      });
  foreign_future<std::string> future{gate, broken, "awaitable"};

  EXPECT_DEATH(future.poll(w), "runner returned no cancel handle");
}
