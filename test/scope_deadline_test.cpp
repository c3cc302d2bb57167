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
#include <scopex/scope.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace std::chrono_literals;
using scopex::background;
using scopex::scope;
using scopex::scope_errc;
using scopex::timer_context;
using scopex::with_cancel;
using scopex::with_deadline;
using scopex::with_timeout;
using scopex::with_value;

using clock_type = scope::clock_t;

struct scope_deadline_test : testing::Test {
  timer_context timer;
};

TEST_F(scope_deadline_test, timeout_fires_deadline_exceeded) {
  auto start = clock_type::now();
  auto [s, cancel] = with_timeout(background(), 30ms, timer);
  EXPECT_FALSE(s.done());

  s.wait();

  EXPECT_GE(clock_type::now() - start, 30ms);
  EXPECT_EQ(s.err(), scope_errc::deadline_exceeded);
}

TEST_F(scope_deadline_test, timeout_reports_its_deadline) {
  auto before = clock_type::now();
  auto [s, cancel] = with_timeout(background(), 10s, timer);

  ASSERT_TRUE(s.deadline().has_value());
  EXPECT_GE(*s.deadline(), before + 10s);
  EXPECT_LE(*s.deadline(), clock_type::now() + 10s);
}

TEST_F(scope_deadline_test, past_deadline_fires_immediately) {
  auto [s, cancel] = with_deadline(background(), clock_type::now() - 1s, timer);

  EXPECT_TRUE(s.done());
  EXPECT_EQ(s.err(), scope_errc::deadline_exceeded);
  EXPECT_EQ(timer.pending(), 0u);
}

TEST_F(scope_deadline_test, past_deadline_under_cancelled_parent_keeps_parent_reason) {
  auto [parent, cancelParent] = with_cancel(background());
  cancelParent();

  auto [s, cancel] = with_deadline(parent, clock_type::now() - 1s, timer);

  EXPECT_EQ(s.err(), scope_errc::canceled);
}

TEST_F(scope_deadline_test, zero_timeout_fires_immediately) {
  auto [s, cancel] = with_timeout(background(), 0ms, timer);

  EXPECT_EQ(s.err(), scope_errc::deadline_exceeded);
}

TEST_F(scope_deadline_test, unrepresentable_timeout_never_fires) {
  auto [hours, cancelHours] =
      with_timeout(background(), std::chrono::hours::max(), timer);
  auto [seconds, cancelSeconds] =
      with_timeout(background(), std::chrono::seconds::max(), timer);

  EXPECT_FALSE(hours.done());
  EXPECT_FALSE(seconds.done());
  EXPECT_FALSE(hours.deadline().has_value());
  EXPECT_FALSE(hours.wait_for(std::chrono::milliseconds(20)));
  EXPECT_EQ(timer.pending(), 0u);

  cancelHours();

  EXPECT_EQ(hours.err(), scope_errc::canceled);
  EXPECT_FALSE(seconds.done());
}

TEST_F(scope_deadline_test, large_timeout_under_deadline_parent_keeps_parent_deadline) {
  auto [parent, cancelParent] = with_timeout(background(), 20ms, timer);
  auto [child, cancelChild] =
      with_timeout(parent, std::chrono::hours::max(), timer);

  EXPECT_EQ(child.deadline(), parent.deadline());

  child.wait();

  EXPECT_EQ(child.err(), scope_errc::deadline_exceeded);
}

TEST_F(scope_deadline_test, near_deadline_under_cancelled_parent_keeps_parent_reason) {
  for (int iteration = 0; iteration < 50; ++iteration) {
    auto [parent, cancelParent] = with_cancel(background());
    cancelParent();

    auto [s, cancel] = with_deadline(parent, clock_type::now() + 1us, timer);
    std::this_thread::sleep_for(1ms);

    EXPECT_EQ(s.err(), scope_errc::canceled);
    EXPECT_EQ(timer.pending(), 0u);
  }
}

TEST_F(scope_deadline_test, cancel_before_deadline_records_canceled) {
  auto [s, cancel] = with_timeout(background(), 10s, timer);
  EXPECT_EQ(timer.pending(), 1u);

  cancel();

  EXPECT_EQ(s.err(), scope_errc::canceled);
  EXPECT_EQ(timer.pending(), 0u);
}

TEST_F(scope_deadline_test, cancel_after_deadline_keeps_deadline_exceeded) {
  auto [s, cancel] = with_timeout(background(), 10ms, timer);
  s.wait();

  cancel();

  EXPECT_EQ(s.err(), scope_errc::deadline_exceeded);
}

TEST_F(scope_deadline_test, parent_cancel_disarms_child_timer) {
  auto [parent, cancelParent] = with_cancel(background());
  auto [child, cancelChild] = with_timeout(parent, 10s, timer);
  EXPECT_EQ(timer.pending(), 1u);

  cancelParent();

  EXPECT_EQ(child.err(), scope_errc::canceled);
  EXPECT_EQ(timer.pending(), 0u);
}

TEST_F(scope_deadline_test, handle_destructor_disarms_timer) {
  {
    auto [s, cancel] = with_timeout(background(), 10s, timer);
    EXPECT_EQ(timer.pending(), 1u);
  }
  EXPECT_EQ(timer.pending(), 0u);
}

TEST_F(scope_deadline_test, child_cannot_extend_parent_deadline) {
  auto start = clock_type::now();
  auto [parent, cancelParent] = with_timeout(background(), 30ms, timer);
  auto [child, cancelChild] = with_timeout(parent, 10s, timer);

  EXPECT_EQ(child.deadline(), parent.deadline());
  // Only the parent's timer is armed.
  EXPECT_EQ(timer.pending(), 1u);

  child.wait();

  EXPECT_LT(clock_type::now() - start, 5s);
  EXPECT_EQ(child.err(), scope_errc::deadline_exceeded);
  EXPECT_EQ(parent.err(), scope_errc::deadline_exceeded);
}

TEST_F(scope_deadline_test, child_deadline_shortens_parent_deadline) {
  auto [parent, cancelParent] = with_timeout(background(), 10s, timer);
  auto [child, cancelChild] = with_timeout(parent, 20ms, timer);

  EXPECT_LT(*child.deadline(), *parent.deadline());

  child.wait();

  EXPECT_EQ(child.err(), scope_errc::deadline_exceeded);
  EXPECT_FALSE(parent.done());
}

TEST_F(scope_deadline_test, cancel_child_of_deadline_parent_inherits_deadline) {
  auto [parent, cancelParent] = with_timeout(background(), 20ms, timer);
  auto [child, cancelChild] = with_cancel(parent);

  EXPECT_EQ(child.deadline(), parent.deadline());

  child.wait();

  EXPECT_EQ(child.err(), scope_errc::deadline_exceeded);
}

TEST_F(scope_deadline_test, value_scope_inherits_deadline) {
  static const scopex::scope_key<int> key{"key"};
  auto [parent, cancelParent] = with_timeout(background(), 20ms, timer);
  auto child = with_value(parent, key, 1);

  EXPECT_EQ(child.deadline(), parent.deadline());

  child.wait();

  EXPECT_EQ(child.err(), scope_errc::deadline_exceeded);
}

TEST_F(scope_deadline_test, default_timer_context_drives_deadlines) {
  auto [s, cancel] = with_timeout(background(), 10ms);

  EXPECT_TRUE(s.wait_for(5s));
  EXPECT_EQ(s.err(), scope_errc::deadline_exceeded);
}

TEST_F(scope_deadline_test, racing_cancel_and_deadline_records_one_reason) {
  for (int iteration = 0; iteration < 50; ++iteration) {
    auto [s, cancel] = with_timeout(background(), 1ms, timer);
    std::thread canceller{[&cancel = cancel] {
      std::this_thread::sleep_for(1ms);
      cancel();
    }};
    s.wait();
    auto first = s.err();
    canceller.join();

    EXPECT_TRUE(first == scope_errc::canceled ||
                first == scope_errc::deadline_exceeded);
    EXPECT_EQ(s.err(), first);
    EXPECT_EQ(timer.pending(), 0u);
  }
}
