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

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>
#include <thread>

using namespace scopex;
using namespace std::chrono_literals;

namespace {

std::string timestamp() {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buffer;
}

// The stop request is a flag the caller has to own, share and set by hand.
void operation_without_timeout(const std::atomic<bool>& stopRequested) {
  std::printf(
      "Simulate long running operation (10 seconds) that will be cancelled "
      "manually after 5 seconds running\n");
  for (int i = 0; i < 10; ++i) {
    if (stopRequested.load()) {
      std::printf("[%s] : Operation %d cancelled\n", timestamp().c_str(), i);
      return;
    }
    std::printf("[%s] : Operation %d running\n", timestamp().c_str(), i);
    std::this_thread::sleep_for(1s);
  }
  std::printf("[%s] : Simulation complete\n", timestamp().c_str());
}

void operation_with_timeout(scope s) {
  std::printf(
      "\nSimulate long running operation (10 seconds) that will be cancelled "
      "via with_timeout() in 5 seconds\n");
  for (int i = 0; i < 10; ++i) {
    if (s.done()) {
      std::printf(
          "[%s] : Operation %d abandoned: %s\n",
          timestamp().c_str(),
          i,
          s.err().message().c_str());
      return;
    }
    std::printf("[%s] : Operation %d running\n", timestamp().c_str(), i);
    std::this_thread::sleep_for(1s);
  }
  std::printf("[%s] : Simulation complete\n", timestamp().c_str());
}

} // namespace

int main() {
  {
    std::atomic<bool> stopRequested{false};
    std::thread worker{[&] { operation_without_timeout(stopRequested); }};
    std::this_thread::sleep_for(5s);
    stopRequested = true;
    worker.join();
  }

  {
    auto [s, cancel] = with_timeout(background(), 5s);
    std::thread worker{operation_with_timeout, s};
    s.wait();
    worker.join();
  }

  return 0;
}
