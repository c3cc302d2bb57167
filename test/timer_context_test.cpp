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
#include <scopex/timer_context.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using scopex::timer_context;

namespace {

struct recording_task : timer_context::task_base {
  recording_task(int id, std::mutex& mutex, std::condition_variable& cv, std::vector<int>& order)
    : task_base(&recording_task::execute_impl)
    , id_(id)
    , mutex_(&mutex)
    , cv_(&cv)
    , order_(&order) {}

  static void execute_impl(task_base* t) noexcept {
    auto& self = *static_cast<recording_task*>(t);
    std::lock_guard lock{*self.mutex_};
    self.order_->push_back(self.id_);
    self.cv_->notify_all();
  }

  int id_;
  std::mutex* mutex_;
  std::condition_variable* cv_;
  std::vector<int>* order_;
};

} // namespace

struct timer_context_test : testing::Test {
  std::mutex mutex;
  std::condition_variable cv;
  std::vector<int> order;
  // Declared last so the timer thread is joined first.
  timer_context context;

  bool wait_for_count(std::size_t count) {
    std::unique_lock lock{mutex};
    return cv.wait_for(lock, 5s, [&] { return order.size() >= count; });
  }
};

TEST_F(timer_context_test, runs_task_at_due_time) {
  recording_task task{1, mutex, cv, order};
  auto start = timer_context::clock_t::now();

  context.schedule_at(&task, start + 20ms);

  ASSERT_TRUE(wait_for_count(1));
  EXPECT_GE(timer_context::clock_t::now() - start, 20ms);
  EXPECT_EQ(context.pending(), 0u);
}

TEST_F(timer_context_test, runs_tasks_in_due_time_order) {
  recording_task late{1, mutex, cv, order};
  recording_task early{2, mutex, cv, order};
  recording_task middle{3, mutex, cv, order};
  auto now = timer_context::clock_t::now();

  context.schedule_at(&late, now + 60ms);
  context.schedule_at(&early, now + 10ms);
  context.schedule_at(&middle, now + 30ms);

  ASSERT_TRUE(wait_for_count(3));
  EXPECT_EQ(order, (std::vector<int>{2, 3, 1}));
}

TEST_F(timer_context_test, past_due_task_runs_promptly) {
  recording_task task{1, mutex, cv, order};

  context.schedule_at(&task, timer_context::clock_t::now() - 1s);

  ASSERT_TRUE(wait_for_count(1));
}

TEST_F(timer_context_test, cancelled_task_does_not_run) {
  recording_task task{1, mutex, cv, order};
  context.schedule_at(&task, timer_context::clock_t::now() + 50ms);
  EXPECT_EQ(context.pending(), 1u);

  EXPECT_TRUE(context.cancel(&task));
  EXPECT_EQ(context.pending(), 0u);

  std::this_thread::sleep_for(100ms);
  std::lock_guard lock{mutex};
  EXPECT_TRUE(order.empty());
}

TEST_F(timer_context_test, cancel_is_idempotent) {
  recording_task task{1, mutex, cv, order};
  context.schedule_at(&task, timer_context::clock_t::now() + 1s);

  EXPECT_TRUE(context.cancel(&task));
  EXPECT_FALSE(context.cancel(&task));
}

TEST_F(timer_context_test, cancel_after_run_returns_false) {
  recording_task task{1, mutex, cv, order};
  context.schedule_at(&task, timer_context::clock_t::now());

  ASSERT_TRUE(wait_for_count(1));
  EXPECT_FALSE(context.cancel(&task));
}
