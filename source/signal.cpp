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
#include <scopex/signal.hpp>

#include <scopex/detail/spin_wait.hpp>

#ifndef NDEBUG
#include <cstdio>
#endif

namespace scopex {

signal_source::~signal_source() {
  SCOPEX_ASSERT((state_.load(std::memory_order_relaxed) & locked_flag) == 0);
#ifndef NDEBUG
  for (auto* cb = callbacks_; cb != nullptr; cb = cb->next_) {
    std::fprintf(stderr, "dangling signal_callback: %s\n", cb->type_name());
    std::fflush(stderr);
  }
#endif
  SCOPEX_ASSERT(callbacks_ == nullptr);
}

bool signal_source::fire(scope_errc reason) noexcept {
  const std::uint8_t firedState = encode(reason);
  if (!try_lock_unless_fired(firedState)) {
    return false;
  }

  notifyingThreadId_ = std::this_thread::get_id();

  // The lock is held here and around each pop, never while a callback runs.
  // The reason bits are already set, so registrations made meanwhile run
  // inline instead of joining the list.
  for (auto* callback = pop_front(); callback != nullptr;
       callback = pop_front()) {
    unlock(firedState);
    run(callback);
    lock();
  }
  unlock(firedState);

  return true;
}

signal_callback_base* signal_source::pop_front() noexcept {
  auto* callback = callbacks_;
  if (callback != nullptr) {
    callbacks_ = callback->next_;
    if (callbacks_ != nullptr) {
      callbacks_->prevPtr_ = &callbacks_;
    }
    // A null prevPtr_ tells remove_callback() the callback has been taken.
    callback->prevPtr_ = nullptr;
  }
  return callback;
}

void signal_source::run(signal_callback_base* callback) noexcept {
  bool destroyed = false;
  callback->removedDuringCallback_ = &destroyed;
  callback->execute();
  // 'callback' may be gone already if it deregistered itself.
  if (!destroyed) {
    callback->removedDuringCallback_ = nullptr;
    callback->callbackCompleted_.store(true, std::memory_order_release);
  }
}

void signal_token::wait() const noexcept {
  _signal::wait_state state;
  signal_callback<_signal::notify_waiter> callback{
      *this, _signal::notify_waiter{&state}};
  std::unique_lock lock{state.mutex_};
  state.cv_.wait(lock, [&] { return state.fired_; });
}

std::uint8_t signal_source::lock() noexcept {
  detail::spin_wait spin;
  auto oldState = state_.load(std::memory_order_relaxed);
  do {
    while ((oldState & locked_flag) != 0) {
      spin.wait();
      oldState = state_.load(std::memory_order_relaxed);
    }
  } while (!state_.compare_exchange_weak(
      oldState,
      oldState | locked_flag,
      std::memory_order_acquire,
      std::memory_order_relaxed));

  return oldState;
}

void signal_source::unlock(std::uint8_t oldState) noexcept {
  state_.store(oldState, std::memory_order_release);
}

bool signal_source::try_lock_unless_fired(std::uint8_t firedBits) noexcept {
  detail::spin_wait spin;
  auto oldState = state_.load(std::memory_order_relaxed);
  for (;;) {
    if (decode(oldState).has_value()) {
      return false;
    }
    if ((oldState & locked_flag) != 0) {
      spin.wait();
      oldState = state_.load(std::memory_order_relaxed);
    } else if (state_.compare_exchange_weak(
                   oldState,
                   static_cast<std::uint8_t>(locked_flag | firedBits),
                   std::memory_order_acq_rel,
                   std::memory_order_relaxed)) {
      return true;
    }
  }
}

bool signal_source::try_add_callback(signal_callback_base* callback) noexcept {
  if (!try_lock_unless_fired(0)) {
    return false;
  }

  callback->next_ = callbacks_;
  callback->prevPtr_ = &callbacks_;
  if (callbacks_ != nullptr) {
    callbacks_->prevPtr_ = &callback->next_;
  }
  callbacks_ = callback;

  unlock(0);

  return true;
}

void signal_source::remove_callback(signal_callback_base* callback) noexcept {
  auto oldState = lock();

  const bool queued = callback->prevPtr_ != nullptr;
  if (queued) {
    *callback->prevPtr_ = callback->next_;
    if (callback->next_ != nullptr) {
      callback->next_->prevPtr_ = callback->prevPtr_;
    }
  }
  const auto firingThread = notifyingThreadId_;
  unlock(oldState);

  if (queued) {
    return;
  }

  if (std::this_thread::get_id() == firingThread) {
    // On the firing thread a taken callback is either the one running now
    // or already completed.
    if (callback->removedDuringCallback_ != nullptr) {
      *callback->removedDuringCallback_ = true;
    }
    return;
  }

  detail::spin_wait spin;
  while (!callback->callbackCompleted_.load(std::memory_order_acquire)) {
    spin.wait();
  }
}

} // namespace scopex
