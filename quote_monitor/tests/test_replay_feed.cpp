// tests/test_replay_feed.cpp
#include "test_assert.hpp"

#include "ReplayFeed.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

int main() {
  const std::string path = "test_replay_feed.tmp.jsonl";
  {
    std::ofstream out(path);
    out << "# captured 2023-07-22\n"
        << R"({"symbol":"SiU5","bid":91500,"ask":91502})" << "\n"
        << "\n"
        << R"({"symbol":"SiU5","bid":91501,"ask":91502})" << "\r\n"
        << R"({"symbol":"RIU5","bid":110000,"ask":110010})" << "\n";
  }

  // --- every data line delivered in order, comments and blanks skipped ---
  {
    ReplayFeed feed(path);
    std::vector<std::string> got;
    feed.on_message = [&](const std::string& raw, Instant) { got.push_back(raw); };
    feed.run();

    ASSERT_EQ(got.size(), 3u);
    ASSERT_EQ(feed.lines_delivered(), 3u);
    ASSERT_STR_EQ(got[1], R"({"symbol":"SiU5","bid":91501,"ask":91502})");
    ASSERT_CONTAINS(got[2], "RIU5");
  }

  // --- stop() cuts a paced replay short ---
  {
    ReplayFeed feed(path, 10000ms);
    feed.on_message = [](const std::string&, Instant) {};
    std::thread t([&] { feed.run(); });
    std::this_thread::sleep_for(100ms);
    const auto t0 = std::chrono::steady_clock::now();
    feed.stop();
    t.join();
    ASSERT_TRUE(std::chrono::steady_clock::now() - t0 < 5s);
    ASSERT_EQ(feed.lines_delivered(), 1u);
  }

  // --- stop() before run() ---
  {
    ReplayFeed feed(path, 10000ms);
    feed.stop();
    feed.run();
    ASSERT_EQ(feed.lines_delivered(), 1u);
  }

  // --- missing file: returns without delivering ---
  {
    ReplayFeed feed("no/such/capture.jsonl");
    feed.run();
    ASSERT_EQ(feed.lines_delivered(), 0u);
  }

  std::remove(path.c_str());
  std::cout << "All replay_feed tests passed.\n";
  return 0;
}
