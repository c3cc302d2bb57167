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
#include <scopex/scope_errc.hpp>
#include <scopex/detail/saturate.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace scopex {

class signal_source;
class signal_token;
template <typename F>
class signal_callback;

class signal_callback_base {
 public:
  void execute() noexcept {
    this->execute_(this);
  }

#ifndef NDEBUG
  char const* type_name() const noexcept {
    return type_name_;
  }
#endif

 protected:
  using execute_fn = void(signal_callback_base* cb) noexcept;

#ifndef NDEBUG
  explicit signal_callback_base(
      signal_source* source, execute_fn* execute, char const* type_name) noexcept
    : source_(source), execute_(execute), type_name_(type_name) {}
#else
  explicit signal_callback_base(
      signal_source* source, execute_fn* execute) noexcept
    : source_(source), execute_(execute) {}
#endif

  void register_callback() noexcept;

  friend signal_source;

  signal_source* source_;
  execute_fn* execute_;
  signal_callback_base* next_ = nullptr;
  signal_callback_base** prevPtr_ = nullptr;
  bool* removedDuringCallback_ = nullptr;
  std::atomic<bool> callbackCompleted_{false};
#ifndef NDEBUG
  char const* type_name_ = nullptr;
#endif
};

// A one-shot broadcast. fire() records a reason and runs every registered
// callback exactly once; the recorded reason never changes afterwards.
class signal_source {
 public:
  signal_source() noexcept = default;

  ~signal_source();

  signal_source(const signal_source&) = delete;
  signal_source(signal_source&&) = delete;
  signal_source& operator=(signal_source&&) = delete;
  signal_source& operator=(const signal_source&) = delete;

  // Returns true if this call fired the signal, false if it had already
  // fired (in which case the earlier reason is kept).
  bool fire(scope_errc reason) noexcept;

  signal_token get_token() noexcept;

  bool fired() const noexcept {
    return (state_.load(std::memory_order_acquire) & reason_mask) != 0;
  }

  std::optional<scope_errc> reason() const noexcept {
    return decode(state_.load(std::memory_order_acquire));
  }

 private:
  friend signal_token;
  friend signal_callback_base;
  template <typename F>
  friend class signal_callback;

  static constexpr std::uint8_t locked_flag = 1;
  static constexpr std::uint8_t reason_shift = 1;
  static constexpr std::uint8_t reason_mask = 3 << reason_shift;

  static constexpr std::uint8_t encode(scope_errc reason) noexcept {
    return static_cast<std::uint8_t>(
        static_cast<std::uint8_t>(reason) << reason_shift);
  }

  static std::optional<scope_errc> decode(std::uint8_t state) noexcept {
    if ((state & reason_mask) == 0) {
      return std::nullopt;
    }
    return static_cast<scope_errc>((state & reason_mask) >> reason_shift);
  }

  std::uint8_t lock() noexcept;
  void unlock(std::uint8_t oldState) noexcept;

  bool try_lock_unless_fired(std::uint8_t firedBits) noexcept;

  bool try_add_callback(signal_callback_base* callback) noexcept;

  // fire() holds the lock around pop_front() but not around run().
  signal_callback_base* pop_front() noexcept;
  static void run(signal_callback_base* callback) noexcept;

  void remove_callback(signal_callback_base* callback) noexcept;

  std::atomic<std::uint8_t> state_{0};
  signal_callback_base* callbacks_ = nullptr;
  std::thread::id notifyingThreadId_;
};

// A non-owning view of a signal_source. A default-constructed token refers
// to no source and can never fire.
class signal_token {
 public:
  template <typename F>
  using callback_type = signal_callback<F>;

  signal_token() noexcept : source_(nullptr) {}

  signal_token(const signal_token& other) noexcept = default;

  signal_token(signal_token&& other) noexcept
    : source_(std::exchange(other.source_, {})) {}

  signal_token& operator=(const signal_token& other) noexcept = default;

  signal_token& operator=(signal_token&& other) noexcept {
    source_ = std::exchange(other.source_, nullptr);
    return *this;
  }

  bool fired() const noexcept {
    return source_ != nullptr && source_->fired();
  }

  std::optional<scope_errc> reason() const noexcept {
    return source_ != nullptr ? source_->reason() : std::nullopt;
  }

  bool fire_possible() const noexcept {
    return source_ != nullptr;
  }

  // Blocks until the signal fires. Never returns for a token that cannot
  // fire.
  void wait() const noexcept;

  // Blocks until the signal fires or 'dueTime' is reached. Returns true if
  // the signal fired.
  template <typename Clock, typename Duration>
  bool wait_until(const std::chrono::time_point<Clock, Duration>& dueTime) const;

  template <typename Rep, typename Ratio>
  bool wait_for(const std::chrono::duration<Rep, Ratio>& duration) const {
    using clock = std::chrono::steady_clock;
    auto dueTime = detail::saturating_add<clock>(clock::now(), duration);
    if (dueTime == clock::time_point::max()) {
      wait();
      return true;
    }
    return wait_until(dueTime);
  }

  void swap(signal_token& other) noexcept {
    std::swap(source_, other.source_);
  }

  friend bool operator==(const signal_token& a, const signal_token& b) noexcept {
    return a.source_ == b.source_;
  }

  friend bool operator!=(const signal_token& a, const signal_token& b) noexcept {
    return !(a == b);
  }

 private:
  friend signal_source;
  template <typename F>
  friend class signal_callback;

  explicit signal_token(signal_source* source) noexcept
    : source_(source) {}

  signal_source* source_;
};

inline signal_token signal_source::get_token() noexcept {
  return signal_token{this};
}

// Runs 'func' once when the signal fires, or immediately on construction if
// it already has. The destructor deregisters; if the callback is running on
// another thread at that point, the destructor waits for it to finish.
template <typename F>
class signal_callback final : private signal_callback_base {
  static_assert(std::is_nothrow_invocable_v<F&>,
      "signal callbacks must be noexcept");

 public:
  template <typename T,
      std::enable_if_t<std::is_convertible_v<T, F>, int> = 0>
  explicit signal_callback(signal_token token, T&& func) noexcept(
      std::is_nothrow_constructible_v<F, T>)
#ifndef NDEBUG
    : signal_callback_base(token.source_, &signal_callback::execute_impl, typeid(F).name())
#else
    : signal_callback_base(token.source_, &signal_callback::execute_impl)
#endif
    , func_((T&&) func) {
    this->register_callback();
  }

  ~signal_callback() {
    if (source_ != nullptr) {
      source_->remove_callback(this);
    }
  }

  signal_callback(const signal_callback&) = delete;
  signal_callback& operator=(const signal_callback&) = delete;

 private:
  static void execute_impl(signal_callback_base* cb) noexcept {
    auto& self = *static_cast<signal_callback*>(cb);
    self.func_();
  }

  SCOPEX_NO_UNIQUE_ADDRESS F func_;
};

template <typename F>
signal_callback(signal_token, F) -> signal_callback<F>;

inline void signal_callback_base::register_callback() noexcept {
  if (source_ != nullptr) {
    if (!source_->try_add_callback(this)) {
      source_ = nullptr;
      // Already fired. Run inline.
      execute();
    }
  }
}

namespace _signal {
struct wait_state {
  std::mutex mutex_;
  std::condition_variable cv_;
  bool fired_ = false;
};

struct notify_waiter {
  wait_state* state_;

  void operator()() const noexcept {
    std::lock_guard lock{state_->mutex_};
    state_->fired_ = true;
    state_->cv_.notify_all();
  }
};
} // namespace _signal

template <typename Clock, typename Duration>
bool signal_token::wait_until(
    const std::chrono::time_point<Clock, Duration>& dueTime) const {
  if (fired()) {
    return true;
  }
  _signal::wait_state state;
  signal_callback<_signal::notify_waiter> callback{
      *this, _signal::notify_waiter{&state}};
  std::unique_lock lock{state.mutex_};
  return state.cv_.wait_until(lock, dueTime, [&] { return state.fired_; });
}

} // namespace scopex
