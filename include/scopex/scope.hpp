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
#include <scopex/signal.hpp>
#include <scopex/timer_context.hpp>
#include <scopex/detail/saturate.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <system_error>
#include <type_traits>
#include <utility>

namespace scopex {

class scope;
class cancel_handle;

namespace _scope {
  // Returns a process-unique, never reused, non-zero id.
  std::uint64_t next_key_id() noexcept;
} // namespace _scope

// Identifies one request-scoped value of type T. Every key constructed gets
// an identity of its own, so two keys with the same name never collide, a
// key re-created in the storage of a destroyed one does not see the old
// bindings, and the key fixes the type of the value bound to it.
template <typename T>
class scope_key {
  static_assert(!std::is_reference_v<T>, "scope values are stored by value");

 public:
  explicit scope_key(const char* name) noexcept
    : name_(name), id_(_scope::next_key_id()) {}

  scope_key(const scope_key&) = delete;
  scope_key& operator=(const scope_key&) = delete;

  const char* name() const noexcept {
    return name_;
  }

  std::uint64_t id() const noexcept {
    return id_;
  }

 private:
  const char* name_;
  const std::uint64_t id_;
};

namespace _scope {
  using clock_t = timer_context::clock_t;
  using time_point = timer_context::time_point;

  class cancel_node;

  struct node {
    explicit node(std::shared_ptr<node> parent) noexcept
      : parent_(std::move(parent)) {
      if (parent_ != nullptr) {
        source_ = parent_->source_;
        deadline_ = parent_->deadline_;
      }
    }

    node(const node&) = delete;
    node& operator=(const node&) = delete;

    std::shared_ptr<node> parent_;
    // Nearest node, this one or an ancestor, that owns a signal. Null when
    // nothing above can ever fire.
    cancel_node* source_ = nullptr;
    std::optional<time_point> deadline_;
    // Id of the key bound by this node, 0 for nodes that bind nothing.
    std::uint64_t keyId_ = 0;
  };

  template <typename T>
  struct value_node final : node {
    template <typename V>
    value_node(std::shared_ptr<node> parent, const scope_key<T>& key, V&& value)
      : node(std::move(parent)), value_((V&&) value) {
      keyId_ = key.id();
    }

    const T value_;
  };

  class cancel_node final : public node, private timer_context::task_base {
   public:
    explicit cancel_node(std::shared_ptr<node> parent) noexcept;
    ~cancel_node();

    // Subscribes to the parent's signal. Called once, before the node is
    // handed out.
    void link() noexcept;

    // Schedules the deadline. Called at most once, after link(). Safe
    // against the node firing concurrently: a node that has fired never
    // stays armed.
    void arm(timer_context& timer, time_point dueTime) noexcept;

    // Fires the signal and disarms the deadline. Returns false if the
    // signal had already fired.
    bool cancel(scope_errc reason) noexcept;

    // Cancels, then drops the parent subscription. Idempotent.
    void release() noexcept;

    // The effective reason: this node's own, or, if an ancestor has fired
    // but the propagation has not reached us yet, the ancestor's (which we
    // adopt on the spot).
    std::optional<scope_errc> settle() noexcept;

    signal_token get_token() noexcept {
      return signal_.get_token();
    }

   private:
    struct propagate_from_parent {
      cancel_node* self_;

      void operator()() const noexcept;
    };

    static void execute_impl(task_base* t) noexcept;

    void disarm() noexcept;

    cancel_node* const parentSource_;
    signal_source signal_;
    std::optional<signal_callback<propagate_from_parent>> parentLink_;
    // Set once by arm(). Only read by the destructor.
    timer_context* timer_ = nullptr;
    // Non-null while the deadline task may still be queued.
    std::atomic<timer_context*> armed_{nullptr};
    std::atomic<bool> released_{false};
  };
} // namespace _scope

// A handle to one node of the scope tree. Copies refer to the same node.
// A scope is always passed explicitly to the code that observes it.
class scope {
 public:
  using clock_t = _scope::clock_t;
  using time_point = _scope::time_point;

  // True once this scope or any ancestor has fired.
  bool done() const noexcept {
    return reason().has_value();
  }

  std::optional<scope_errc> reason() const noexcept;

  // Empty until the scope fires, then scope_errc::canceled or
  // scope_errc::deadline_exceeded.
  std::error_code err() const noexcept {
    auto r = reason();
    return r.has_value() ? make_error_code(*r) : std::error_code{};
  }

  void throw_if_done() const {
    if (auto r = reason()) {
      throw_(scope_error{*r});
    }
  }

  // The earliest deadline of this scope and its ancestors, if any.
  std::optional<time_point> deadline() const noexcept {
    return node_->deadline_;
  }

  // Nearest binding of 'key' walking towards the root, or nullptr. The
  // pointer stays valid while any handle to this scope exists.
  template <typename T>
  const T* value(const scope_key<T>& key) const noexcept;

  // Blocks until the scope fires. Never returns for a root scope.
  void wait() const noexcept {
    token().wait();
  }

  // Returns true if the scope fired before 'dueTime'.
  template <typename Clock, typename Duration>
  bool wait_until(const std::chrono::time_point<Clock, Duration>& dueTime) const {
    return token().wait_until(dueTime);
  }

  template <typename Rep, typename Ratio>
  bool wait_for(const std::chrono::duration<Rep, Ratio>& duration) const {
    return token().wait_for(duration);
  }

  // Settles the scope against its ancestors and returns its signal.
  signal_token token() const noexcept;

  friend bool operator==(const scope& a, const scope& b) noexcept {
    return a.node_ == b.node_;
  }

  friend bool operator!=(const scope& a, const scope& b) noexcept {
    return !(a == b);
  }

 private:
  friend scope background();
  friend scope todo();
  friend std::pair<scope, cancel_handle> with_cancel(const scope& parent);
  friend std::pair<scope, cancel_handle> with_deadline(
      const scope& parent, time_point dueTime, timer_context& timer);
  template <typename T, typename V>
  friend scope with_value(const scope& parent, const scope_key<T>& key, V&& value);

  explicit scope(std::shared_ptr<_scope::node> node) noexcept
    : node_(std::move(node)) {}

  std::shared_ptr<_scope::node> node_;
};

// Releases a cancellable scope: fires it with scope_errc::canceled unless
// it already fired, disarms its deadline and unsubscribes it from its
// parent. Calling it is idempotent and thread-safe. Destroying the handle
// releases the scope as well.
class cancel_handle {
 public:
  cancel_handle() noexcept = default;

  cancel_handle(cancel_handle&& other) noexcept = default;

  cancel_handle& operator=(cancel_handle&& other) noexcept {
    if (this != &other) {
      (*this)();
      node_ = std::move(other.node_);
    }
    return *this;
  }

  ~cancel_handle() {
    (*this)();
  }

  void operator()() const noexcept {
    if (node_ != nullptr) {
      node_->release();
    }
  }

 private:
  friend std::pair<scope, cancel_handle> with_cancel(const scope& parent);
  friend std::pair<scope, cancel_handle> with_deadline(
      const scope& parent, scope::time_point dueTime, timer_context& timer);

  explicit cancel_handle(std::shared_ptr<_scope::cancel_node> node) noexcept
    : node_(std::move(node)) {}

  std::shared_ptr<_scope::cancel_node> node_;
};

// The root of every scope tree. Never fires.
scope background();

// A root for code that has not been given a scope yet. Behaves exactly like
// background().
scope todo();

std::pair<scope, cancel_handle> with_cancel(const scope& parent);

// Fires with scope_errc::deadline_exceeded at 'dueTime', or earlier if
// 'parent' fires or the handle is released. time_point::max() means no
// deadline.
std::pair<scope, cancel_handle> with_deadline(
    const scope& parent, scope::time_point dueTime, timer_context& timer);

inline std::pair<scope, cancel_handle> with_deadline(
    const scope& parent, scope::time_point dueTime) {
  return with_deadline(parent, dueTime, default_timer_context());
}

template <typename Rep, typename Ratio>
std::pair<scope, cancel_handle> with_timeout(
    const scope& parent,
    std::chrono::duration<Rep, Ratio> timeout,
    timer_context& timer) {
  return with_deadline(
      parent,
      detail::saturating_add<scope::clock_t>(scope::clock_t::now(), timeout),
      timer);
}

template <typename Rep, typename Ratio>
std::pair<scope, cancel_handle> with_timeout(
    const scope& parent, std::chrono::duration<Rep, Ratio> timeout) {
  return with_timeout(parent, timeout, default_timer_context());
}

// Binds 'value' under 'key' for the returned scope and its descendants.
// The result fires exactly when 'parent' does.
template <typename T, typename V>
scope with_value(const scope& parent, const scope_key<T>& key, V&& value) {
  static_assert(std::is_constructible_v<T, V>);
  return scope{std::make_shared<_scope::value_node<T>>(
      parent.node_, key, (V&&) value)};
}

template <typename T>
const T* scope::value(const scope_key<T>& key) const noexcept {
  for (const _scope::node* n = node_.get(); n != nullptr;
       n = n->parent_.get()) {
    if (n->keyId_ == key.id()) {
      return &static_cast<const _scope::value_node<T>*>(n)->value_;
    }
  }
  return nullptr;
}

// Runs 'func' once when the scope fires, on the firing thread, or inline
// if it already has. Keeps the scope alive for its own lifetime.
template <typename F>
class scope_callback {
 public:
  template <typename T>
  explicit scope_callback(scope s, T&& func)
    : scope_(std::move(s)), callback_(scope_.token(), (T&&) func) {}

  scope_callback(const scope_callback&) = delete;
  scope_callback& operator=(const scope_callback&) = delete;

 private:
  scope scope_;
  signal_callback<F> callback_;
};

template <typename F>
scope_callback(scope, F) -> scope_callback<F>;

} // namespace scopex
