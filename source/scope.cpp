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

namespace scopex {

namespace _scope {

std::uint64_t next_key_id() noexcept {
  static std::atomic<std::uint64_t> nextId{1};
  return nextId.fetch_add(1, std::memory_order_relaxed);
}

cancel_node::cancel_node(std::shared_ptr<node> parent) noexcept
  : node(std::move(parent))
  , task_base(&cancel_node::execute_impl)
  , parentSource_(source_) {
  source_ = this;
}

cancel_node::~cancel_node() {
  if (timer_ != nullptr) {
    // Also waits out a deadline task still running on the timer thread.
    (void)timer_->cancel(this);
  }
}

void cancel_node::link() noexcept {
  if (parentSource_ != nullptr) {
    parentLink_.emplace(
        parentSource_->get_token(), propagate_from_parent{this});
  }
}

void cancel_node::arm(timer_context& timer, time_point dueTime) noexcept {
  SCOPEX_ASSERT(timer_ == nullptr);
  timer_ = &timer;
  timer.schedule_at(this, dueTime);
  armed_.store(&timer, std::memory_order_seq_cst);

  // Pairs with the fence in cancel(): either cancel() sees armed_ set, or
  // we see the signal fired.
  std::atomic_thread_fence(std::memory_order_seq_cst);
  if (signal_.fired()) {
    disarm();
  }
}

bool cancel_node::cancel(scope_errc reason) noexcept {
  if (!signal_.fire(reason)) {
    return false;
  }
  std::atomic_thread_fence(std::memory_order_seq_cst);
  disarm();
  return true;
}

void cancel_node::release() noexcept {
  (void)cancel(scope_errc::canceled);
  if (!released_.exchange(true, std::memory_order_acq_rel)) {
    parentLink_.reset();
  }
}

std::optional<scope_errc> cancel_node::settle() noexcept {
  if (auto reason = signal_.reason()) {
    return reason;
  }
  if (parentSource_ != nullptr) {
    if (auto parentReason = parentSource_->settle()) {
      (void)cancel(*parentReason);
      return signal_.reason();
    }
  }
  return std::nullopt;
}

void cancel_node::propagate_from_parent::operator()() const noexcept {
  auto reason = self_->parentSource_->signal_.reason();
  SCOPEX_ASSERT(reason.has_value());
  (void)self_->cancel(*reason);
}

void cancel_node::execute_impl(task_base* t) noexcept {
  auto& self = *static_cast<cancel_node*>(t);
  (void)self.cancel(scope_errc::deadline_exceeded);
}

void cancel_node::disarm() noexcept {
  if (auto* timer = armed_.exchange(nullptr, std::memory_order_acq_rel)) {
    (void)timer->cancel(this);
  }
}

} // namespace _scope

std::optional<scope_errc> scope::reason() const noexcept {
  auto* source = node_->source_;
  return source != nullptr ? source->settle() : std::nullopt;
}

signal_token scope::token() const noexcept {
  auto* source = node_->source_;
  if (source == nullptr) {
    return signal_token{};
  }
  (void)source->settle();
  return source->get_token();
}

namespace {
std::shared_ptr<_scope::node> make_root() {
  return std::make_shared<_scope::node>(nullptr);
}
} // namespace

scope background() {
  static const std::shared_ptr<_scope::node> root = make_root();
  return scope{root};
}

scope todo() {
  static const std::shared_ptr<_scope::node> root = make_root();
  return scope{root};
}

std::pair<scope, cancel_handle> with_cancel(const scope& parent) {
  auto node = std::make_shared<_scope::cancel_node>(parent.node_);
  node->link();
  return {scope{node}, cancel_handle{node}};
}

std::pair<scope, cancel_handle> with_deadline(
    const scope& parent, scope::time_point dueTime, timer_context& timer) {
  auto parentDeadline = parent.deadline();
  if (dueTime == scope::time_point::max() ||
      (parentDeadline.has_value() && *parentDeadline <= dueTime)) {
    // Either no deadline at all, or the parent's comes first and will reach
    // us by propagation.
    return with_cancel(parent);
  }

  auto node = std::make_shared<_scope::cancel_node>(parent.node_);
  node->deadline_ = dueTime;
  // Linking before arming means a parent that has already fired decides the
  // reason; the timer cannot get in first.
  node->link();
  if (dueTime <= scope::clock_t::now()) {
    (void)node->cancel(scope_errc::deadline_exceeded);
  } else if (!node->settle().has_value()) {
    node->arm(timer, dueTime);
  }
  return {scope{node}, cancel_handle{node}};
}

} // namespace scopex
