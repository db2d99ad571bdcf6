// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <array>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>
#include <catch2/catch.hpp>

#include "utils/future.h"

using namespace std::chrono_literals;

TEST_CASE("Waiting on a pair of futures", "[future]")
{
  std::atomic<int> finished = 0;
  auto slow = std::async(std::launch::async, [&finished] {
    std::this_thread::sleep_for(50ms);
    ++finished;
  });
  auto fast = std::async(std::launch::async, [&finished] {
    ++finished;
  });

  geodist::utils::wait_for_all(slow, fast);
  REQUIRE(finished == 2);

  // both futures are still valid, nothing was moved out of them
  REQUIRE(slow.valid());
  REQUIRE(fast.valid());
}

TEST_CASE("Waiting on a range of futures", "[future]")
{
  std::atomic<int> finished = 0;
  std::vector<std::future<void>> tasks;
  for (int i = 0; i < 3; ++i) {
    tasks.emplace_back(std::async(std::launch::async, [&finished, i] {
      std::this_thread::sleep_for(i * 10ms);
      ++finished;
    }));
  }

  geodist::utils::wait_for_all(tasks.begin(), tasks.end());
  REQUIRE(finished == 3);
}
