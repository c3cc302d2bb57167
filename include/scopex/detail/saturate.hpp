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

#include <chrono>

namespace scopex::detail {

// now + d, clamped to time_point::max() when the sum is not representable.
// A non-positive d yields now.
template <typename Clock, typename Rep, typename Ratio>
typename Clock::time_point saturating_add(
    typename Clock::time_point now,
    std::chrono::duration<Rep, Ratio> d) noexcept {
  using time_point = typename Clock::time_point;
  using duration = typename Clock::duration;
  using wide = std::chrono::duration<long double, typename duration::period>;

  if (d <= d.zero()) {
    return now;
  }
  if (wide(d) >= wide(time_point::max() - now)) {
    return time_point::max();
  }
  return now + std::chrono::duration_cast<duration>(d);
}

} // namespace scopex::detail
