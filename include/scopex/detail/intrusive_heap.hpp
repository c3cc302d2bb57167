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

#include <cstddef>

namespace scopex::detail {

// A doubly-linked intrusive list kept in ascending order of 'SortKey'.
// Items not in the list have both links null and are not the head.
template <typename T, T* T::*Next, T* T::*Prev, typename Key, Key T::*SortKey>
class intrusive_heap {
 public:
  intrusive_heap() noexcept = default;

  ~intrusive_heap() {
    SCOPEX_ASSERT(empty());
  }

  intrusive_heap(const intrusive_heap&) = delete;
  intrusive_heap& operator=(const intrusive_heap&) = delete;

  bool empty() const noexcept {
    return head_ == nullptr;
  }

  std::size_t size() const noexcept {
    return size_;
  }

  T* top() const noexcept {
    SCOPEX_ASSERT(!empty());
    return head_;
  }

  T* pop() noexcept {
    SCOPEX_ASSERT(!empty());
    T* item = head_;
    head_ = item->*Next;
    if (head_ != nullptr) {
      head_->*Prev = nullptr;
    }
    item->*Next = nullptr;
    --size_;
    return item;
  }

  bool contains(const T* item) const noexcept {
    return item->*Prev != nullptr || head_ == item;
  }

  void insert(T* item) noexcept {
    SCOPEX_ASSERT(!contains(item));
    ++size_;
    if (head_ == nullptr) {
      head_ = item;
      item->*Next = nullptr;
      item->*Prev = nullptr;
    } else if (item->*SortKey < head_->*SortKey) {
      item->*Next = head_;
      item->*Prev = nullptr;
      head_->*Prev = item;
      head_ = item;
    } else {
      // Items with equal keys keep their insertion order.
      auto* insertAfter = head_;
      while (insertAfter->*Next != nullptr &&
             insertAfter->*Next->*SortKey <= item->*SortKey) {
        insertAfter = insertAfter->*Next;
      }

      auto* insertBefore = insertAfter->*Next;

      item->*Prev = insertAfter;
      item->*Next = insertBefore;
      insertAfter->*Next = item;
      if (insertBefore != nullptr) {
        insertBefore->*Prev = item;
      }
    }
  }

  // Returns false if 'item' was not in the list.
  bool remove(T* item) noexcept {
    if (!contains(item)) {
      return false;
    }
    auto* prev = item->*Prev;
    auto* next = item->*Next;
    if (prev != nullptr) {
      prev->*Next = next;
    } else {
      head_ = next;
    }
    if (next != nullptr) {
      next->*Prev = prev;
    }
    item->*Next = nullptr;
    item->*Prev = nullptr;
    --size_;
    return true;
  }

 private:
  T* head_ = nullptr;
  std::size_t size_ = 0;
};

} // namespace scopex::detail
