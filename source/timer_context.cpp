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

namespace scopex {

timer_context::timer_context()
  : thread_([this] { this->run(); }) {
}

timer_context::~timer_context() {
  {
    std::lock_guard lock{mutex_};
    stop_ = true;
    cv_.notify_one();
  }
  thread_.join();

  SCOPEX_ASSERT(heap_.empty());
}

void timer_context::schedule_at(task_base* task, time_point dueTime) noexcept {
  std::lock_guard lock{mutex_};

  task->dueTime_ = dueTime;
  heap_.insert(task);
  if (heap_.top() == task) {
    // New earliest task; the timer thread may be sleeping past it.
    cv_.notify_one();
  }
}

bool timer_context::cancel(task_base* task) noexcept {
  std::unique_lock lock{mutex_};
  if (heap_.remove(task)) {
    return true;
  }
  if (running_ == task && std::this_thread::get_id() != thread_.get_id()) {
    taskCompleted_.wait(lock, [&] { return running_ != task; });
  }
  return false;
}

std::size_t timer_context::pending() const noexcept {
  std::lock_guard lock{mutex_};
  return heap_.size();
}

void timer_context::run() {
  std::unique_lock lock{mutex_};

  while (!stop_) {
    if (!heap_.empty()) {
      auto now = clock_t::now();
      auto nextDueTime = heap_.top()->dueTime_;
      if (nextDueTime <= now) {
        auto* task = heap_.pop();
        running_ = task;
        lock.unlock();

        task->execute();

        lock.lock();
        running_ = nullptr;
        taskCompleted_.notify_all();
      } else {
        // Not yet due. Sleep until it is, or until an earlier task arrives.
        cv_.wait_until(lock, nextDueTime);
      }
    } else {
      cv_.wait(lock);
    }
  }
}

timer_context& default_timer_context() {
  static timer_context context;
  return context;
}

} // namespace scopex
