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

#include <scopex/scope.hpp>

#include <chrono>
#include <system_error>

namespace scopex {

// Sleeps for 'duration' unless 's' fires first. Returns an empty
// error_code if the full duration elapsed, otherwise the scope's error.
template <typename Rep, typename Ratio>
std::error_code sleep_for(
    const scope& s, std::chrono::duration<Rep, Ratio> duration) {
  if (s.wait_for(duration)) {
    return s.err();
  }
  return {};
}

template <typename Clock, typename Duration>
std::error_code sleep_until(
    const scope& s, std::chrono::time_point<Clock, Duration> dueTime) {
  if (s.wait_until(dueTime)) {
    return s.err();
  }
  return {};
}

} // namespace scopex
