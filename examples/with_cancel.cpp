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
#include <condition_variable>
#include <cstdio>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <thread>
#include <vector>

using namespace scopex;
using namespace std::chrono;

namespace {

constexpr int workerCount = 10;

// Collects the first worker to find the key, and tracks how many workers
// are still running so the driver does not wait forever when nobody finds
// it.
class search_result {
 public:
  explicit search_result(int workers) : running_(workers) {}

  void found(int id) {
    std::lock_guard lock{mutex_};
    if (!winner_.has_value()) {
      winner_ = id;
    }
    cv_.notify_all();
  }

  void finished() {
    std::lock_guard lock{mutex_};
    --running_;
    cv_.notify_all();
  }

  std::optional<int> wait() {
    std::unique_lock lock{mutex_};
    cv_.wait(lock, [&] { return winner_.has_value() || running_ == 0; });
    return winner_;
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::optional<int> winner_;
  int running_;
};

struct assignment {
  int keyFound;
  seconds workDuration;
};

std::vector<assignment> make_assignments() {
  std::mt19937 engine{std::random_device{}()};
  std::uniform_int_distribution<int> dist{1, 5};
  std::vector<assignment> assignments;
  for (int i = 0; i < workerCount; ++i) {
    int keyFound = dist(engine);
    assignments.push_back({keyFound, seconds{dist(engine)}});
  }
  return assignments;
}

void operation_without_cancel(int id, assignment work, search_result& result) {
  std::printf("Worker %d start\n", id);
  std::this_thread::sleep_for(work.workDuration);
  if (work.keyFound == id) {
    std::printf("Worker %d found the key\n", id);
    result.found(id);
  }
  std::printf("Worker %d finish\n", id);
  result.finished();
}

void operation_with_cancel(
    const scope& s, int id, assignment work, search_result& result) {
  std::printf("Worker %d start\n", id);
  if (auto ec = sleep_for(s, work.workDuration)) {
    std::printf("Worker %d cancelled: %s\n", id, ec.message().c_str());
  } else {
    if (work.keyFound == id) {
      std::printf("Worker %d found the key\n", id);
      result.found(id);
    }
    std::printf("Worker %d finish\n", id);
  }
  result.finished();
}

void report(const std::optional<int>& winner, const char* others) {
  if (winner.has_value()) {
    std::printf("Got result from worker %d, %s\n", *winner, others);
  } else {
    std::printf("No worker found the key\n");
  }
}

void simulate_without_cancel() {
  std::printf("\nSimulate work without cancel\n");
  auto assignments = make_assignments();
  search_result result{workerCount};
  std::vector<std::thread> workers;
  for (int id = 0; id < workerCount; ++id) {
    workers.emplace_back(operation_without_cancel, id, assignments[id], std::ref(result));
  }

  report(result.wait(), "other workers still running");

  for (auto& t : workers) {
    t.join();
  }
  std::printf("Simulation finishes\n");
}

void simulate_with_cancel() {
  std::printf("\nSimulate work with cancel\n");
  auto assignments = make_assignments();
  search_result result{workerCount};
  auto [s, cancel] = with_cancel(background());
  std::vector<std::thread> workers;
  for (int id = 0; id < workerCount; ++id) {
    workers.emplace_back(
        operation_with_cancel, s, id, assignments[id], std::ref(result));
  }

  report(result.wait(), "other workers cancelled");
  cancel();

  for (auto& t : workers) {
    t.join();
  }
  std::printf("Simulation finishes\n");
}

} // namespace

int main() {
  simulate_without_cancel();
  simulate_with_cancel();
  return 0;
}
