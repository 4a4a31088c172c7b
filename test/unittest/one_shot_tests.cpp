#include <atomic>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include <utils/one_shot.h>

using namespace std::chrono_literals;
using dgate::utils::OneShot;

TEST(OneShot, FirstSettleWins)
{
  OneShot<std::string> cell;
  EXPECT_FALSE(cell.IsSettled());
  EXPECT_TRUE(cell.TrySettle("first"));
  EXPECT_FALSE(cell.TrySettle("second"));
  EXPECT_EQ(cell.Peek(), "first");
  EXPECT_EQ(cell.Wait(), "first");
}

TEST(OneShot, WaitForTimesOutWhenNotSettled)
{
  OneShot<int> cell;
  EXPECT_FALSE(cell.WaitFor(20ms).has_value());
  EXPECT_FALSE(cell.Peek().has_value());
}

TEST(OneShot, AllWaitersObserveTheSameValue)
{
  OneShot<int> cell;
  std::vector<int> seen(4, 0);
  std::vector<std::thread> waiters;
  for (auto i = 0u; i < seen.size(); ++i) {
    waiters.emplace_back([&cell, &seen, i]() { seen[i] = cell.Wait(); });
  }
  std::this_thread::sleep_for(10ms);
  cell.TrySettle(42);
  for (auto &t : waiters) {
    t.join();
  }
  for (auto value : seen) {
    EXPECT_EQ(value, 42);
  }
}

TEST(OneShot, ConcurrentSettlersHaveExactlyOneWinner)
{
  OneShot<int> cell;
  std::atomic<int> winners{ 0 };
  std::vector<std::thread> settlers;
  for (auto i = 0; i < 8; ++i) {
    settlers.emplace_back([&cell, &winners, i]() {
      if (cell.TrySettle(i)) {
        ++winners;
      }
    });
  }
  for (auto &t : settlers) {
    t.join();
  }
  EXPECT_EQ(winners, 1);
  EXPECT_TRUE(cell.IsSettled());
}
