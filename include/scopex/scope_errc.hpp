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

#include <cstdint>
#include <exception>
#include <system_error>
#include <type_traits>

namespace scopex {

// The reasons a scope can terminate. Exactly one is recorded when a scope
// fires and it never changes afterwards.
enum class scope_errc : std::uint8_t {
  canceled = 1,
  deadline_exceeded = 2,
};

const std::error_category& scope_category() noexcept;

inline std::error_code make_error_code(scope_errc e) noexcept {
  return std::error_code{static_cast<int>(e), scope_category()};
}

class scope_error : public std::system_error {
 public:
  explicit scope_error(scope_errc reason)
    : std::system_error(make_error_code(reason)) {}

  scope_errc reason() const noexcept {
    return static_cast<scope_errc>(code().value());
  }
};

namespace _throw {
struct _fn {
  template <typename Exception>
  [[noreturn]] void operator()([[maybe_unused]] Exception&& ex) const {
#if !SCOPEX_NO_EXCEPTIONS
    throw (Exception&&) ex;
#else
    std::terminate();
#endif
  }
};
} // namespace _throw
inline constexpr _throw::_fn throw_{};

} // namespace scopex

namespace std {
template <>
struct is_error_code_enum<scopex::scope_errc> : true_type {};
} // namespace std
