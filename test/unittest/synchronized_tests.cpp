#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include <utils/synchronized.h>

using dgate::utils::Synchronized;

TEST(Synchronized, TransformReturnsNewValue)
{
  Synchronized<int> value{ 1 };
  EXPECT_EQ(value.Transform([](int v) { return v + 1; }), 2);
  EXPECT_EQ(value.Get(), 2);
  EXPECT_EQ(value.Read([](const int &v) { return v * 10; }), 20);
}

TEST(Synchronized, TransformsAreSerialized)
{
  Synchronized<int> counter{ 0 };
  std::vector<std::thread> threads;
  for (auto i = 0; i < 8; ++i) {
    threads.emplace_back([&counter]() {
      for (auto n = 0; n < 1000; ++n) {
        counter.Transform([](int v) { return v + 1; });
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  EXPECT_EQ(counter.Get(), 8000);
}
