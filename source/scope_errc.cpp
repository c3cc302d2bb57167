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
#include <scopex/scope_errc.hpp>

#include <string>

namespace scopex {

namespace {
class scope_category_impl final : public std::error_category {
 public:
  const char* name() const noexcept override {
    return "scopex";
  }

  std::string message(int value) const override {
    switch (static_cast<scope_errc>(value)) {
      case scope_errc::canceled:
        return "scope canceled";
      case scope_errc::deadline_exceeded:
        return "scope deadline exceeded";
    }
    return "unknown scope error";
  }
};
} // namespace

const std::error_category& scope_category() noexcept {
  static const scope_category_impl category;
  return category;
}

} // namespace scopex
