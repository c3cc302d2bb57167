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

#include <scopex/config.hpp>
#include <scopex/detail/intrusive_heap.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace scopex {

namespace _timer {
  using clock_t = std::chrono::steady_clock;
  using time_point = typename clock_t::time_point;

  struct task_base {
    using execute_fn = void(task_base*) noexcept;

    explicit task_base(execute_fn* execute) noexcept
      : execute_(execute) {}

    task_base* next_ = nullptr;
    task_base* prev_ = nullptr;
    execute_fn* execute_;
    time_point dueTime_;

    void execute() noexcept {
      execute_(this);
    }
  };
} // namespace _timer

// Runs timed tasks on a single dedicated thread, in due-time order.
// Tasks are intrusive: the caller owns the storage and must keep it alive
// until the task has run or cancel() has returned.
class timer_context {
 public:
  using clock_t = _timer::clock_t;
  using time_point = _timer::time_point;
  using task_base = _timer::task_base;

  timer_context();
  ~timer_context();

  timer_context(const timer_context&) = delete;
  timer_context& operator=(const timer_context&) = delete;

  void schedule_at(task_base* task, time_point dueTime) noexcept;

  // Removes 'task' from the queue. Returns true if it was still queued.
  // If the task is executing on the timer thread, waits for it to finish
  // first, unless called from the timer thread itself.
  bool cancel(task_base* task) noexcept;

  // Number of queued tasks that have not started executing.
  std::size_t pending() const noexcept;

 private:
  void run();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable taskCompleted_;

  detail::intrusive_heap<
      task_base,
      &task_base::next_,
      &task_base::prev_,
      time_point,
      &task_base::dueTime_>
      heap_;
  task_base* running_ = nullptr;
  bool stop_ = false;

  std::thread thread_;
};

// The context used by with_timeout() and with_deadline() when the caller
// does not supply one.
timer_context& default_timer_context();

} // namespace scopex
