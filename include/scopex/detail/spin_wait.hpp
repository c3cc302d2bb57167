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

#include <cstdint>
#include <thread>

namespace scopex::detail {

// Busy-waits for a short while, then starts yielding the thread. Used for
// the signal's internal lock, which is only ever held for a few
// instructions.
class spin_wait {
 public:
  spin_wait() noexcept = default;

  void wait() noexcept {
    if (count_ < yield_threshold) {
      ++count_;
    } else {
      std::this_thread::yield();
    }
  }

 private:
  static constexpr std::uint32_t yield_threshold = 20;

  std::uint32_t count_ = 0;
};

} // namespace scopex::detail
