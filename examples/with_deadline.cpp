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
#include <scopex/sleep.hpp>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>
#include <thread>

using namespace scopex;
using namespace std::chrono;
using namespace std::chrono_literals;

namespace {

std::string timestamp() {
  auto now = system_clock::to_time_t(system_clock::now());
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buffer;
}

void operation_without_deadline() {
  std::printf("This operation will run exactly for 5 seconds without interruption\n");
  std::printf("[%s] Operation starts\n", timestamp().c_str());
  std::this_thread::sleep_for(5s);
  std::printf("[%s] Operation finishes\n", timestamp().c_str());
}

void operation_with_deadline(const scope& s) {
  std::printf(
      "This operation is designed to run for 5 seconds, but will be "
      "interrupted in 3 seconds\n");
  std::printf("[%s] Operation starts\n", timestamp().c_str());

  if (auto ec = sleep_for(s, 5s)) {
    std::printf(
        "[%s] Operation cancelled: %s\n",
        timestamp().c_str(),
        ec.message().c_str());
  } else {
    std::printf("[%s] Operation finishes\n", timestamp().c_str());
  }
}

void print_elapsed(steady_clock::time_point start) {
  auto ms = duration_cast<milliseconds>(steady_clock::now() - start);
  std::printf("Elapsed time: %i ms\n", (int)ms.count());
}

} // namespace

int main() {
  std::printf("\nSimulate operation without a deadline\n");
  {
    auto start = steady_clock::now();
    operation_without_deadline();
    print_elapsed(start);
  }

  std::printf("\nSimulate operation with a deadline\n");
  {
    auto [s, cancel] = with_deadline(background(), steady_clock::now() + 3s);
    auto start = steady_clock::now();
    operation_with_deadline(s);
    print_elapsed(start);
  }

  return 0;
}
