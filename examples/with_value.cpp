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

#include <cstdio>
#include <string>

using namespace scopex;

namespace {

const scope_key<std::string> username_key{"username"};
const scope_key<std::string> password_key{"password"};

void validate_data(const std::string& username, const std::string& password) {
  std::printf(
      "[Without scope] Username: %s, password: %s is valid\n",
      username.c_str(),
      password.c_str());
}

void save_data(const std::string& username, const std::string& password) {
  std::printf(
      "[Without scope] Username: %s, password: %s is saved\n",
      username.c_str(),
      password.c_str());
}

// Every layer has to accept and forward each request value by hand.
void operation_without_value(const std::string& username, const std::string& password) {
  std::printf("\n[Without scope] Start processing\n");
  validate_data(username, password);
  save_data(username, password);
  std::printf("[Without scope] Finish\n");
}

struct credentials {
  const std::string* username;
  const std::string* password;
};

// Returns false if the scope does not carry both values.
bool lookup_credentials(const scope& s, credentials& out) {
  out.username = s.value(username_key);
  out.password = s.value(password_key);
  return out.username != nullptr && out.password != nullptr;
}

bool validate_data_with_scope(const scope& s) {
  credentials c;
  if (!lookup_credentials(s, c)) {
    std::printf("[With scope] Missing credentials\n");
    return false;
  }
  std::printf(
      "[With scope] Username: %s, password: %s is valid\n",
      c.username->c_str(),
      c.password->c_str());
  return true;
}

bool save_data_with_scope(const scope& s) {
  credentials c;
  if (!lookup_credentials(s, c)) {
    std::printf("[With scope] Missing credentials\n");
    return false;
  }
  std::printf(
      "[With scope] Username: %s, password: %s is saved\n",
      c.username->c_str(),
      c.password->c_str());
  return true;
}

bool operation_with_value(const scope& s) {
  std::printf("\n[With scope] Start processing\n");
  if (!validate_data_with_scope(s) || !save_data_with_scope(s)) {
    return false;
  }
  std::printf("[With scope] Finish\n");
  return true;
}

} // namespace

int main() {
  const std::string username = "boy123";
  const std::string password = "password456";

  operation_without_value(username, password);

  auto s = background();
  s = with_value(s, username_key, username);
  s = with_value(s, password_key, password);

  return operation_with_value(s) ? 0 : 1;
}
