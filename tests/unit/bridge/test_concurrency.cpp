#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "uast_bridge/bridge/boundary.hpp"
#include "uast_bridge/bridge/filter.hpp"
#include "uast_bridge/bridge/iterator.hpp"
#include "uast_bridge/test_support/tree_helpers.hpp"

using namespace uast_bridge;

TEST(Concurrency, ParallelFiltersGetTheirOwnResults)
{
  const NodePtr a = test_support::make_wide_tree(3, 4, "Alpha");
  const NodePtr b = test_support::make_wide_tree(3, 2, "Beta");
  const size_t a_count = count_nodes(*a);
  const size_t b_count = count_nodes(*b);

  std::atomic<int> failures{0};
  auto worker = [&failures](const NodePtr & root, const std::string & query, size_t expected) {
    for (int i = 0; i < 50; ++i) {
      const auto result = filter(root, query);
      if (result.size() != expected) ++failures;
    }
  };

  std::thread t1(worker, a, "//Alpha", a_count);
  std::thread t2(worker, b, "//Beta", b_count);
  std::thread t3(worker, a, "//Beta", size_t{0});
  t1.join();
  t2.join();
  t3.join();

  EXPECT_EQ(failures.load(), 0);
}

TEST(Concurrency, FilterAndIterationRunSideBySide)
{
  const NodePtr filtered = test_support::make_wide_tree(4, 3, "Query");
  const NodePtr iterated = test_support::make_wide_tree(4, 3, "Walk");
  const size_t total = count_nodes(*iterated);

  auto filter_task = std::async(std::launch::async, [&filtered] {
    size_t matched = 0;
    for (int i = 0; i < 20; ++i) {
      matched += filter(filtered, "//Query[@token='7']").size();
    }
    return matched;
  });

  auto iterate_task = std::async(std::launch::async, [&iterated] {
    size_t visited = 0;
    for (int i = 0; i < 20; ++i) {
      auto it = Iterator::create(iterated, TreeOrder::LevelOrder);
      while (it.next()) ++visited;
    }
    return visited;
  });

  EXPECT_EQ(filter_task.get(), 20U);
  EXPECT_EQ(iterate_task.get(), 20U * total);
}

TEST(Concurrency, IterationProceedsWhileEvaluationLockIsHeld)
{
  const auto t = test_support::make_sample_tree();
  BoundaryScope evaluation(BoundaryKind::Evaluation, t.root);

  // Runs on another thread while this one holds the evaluation lock
  auto visited = std::async(std::launch::async, [root = t.root] {
    auto it = Iterator::create(root, TreeOrder::PostOrder);
    size_t n = 0;
    while (it.next()) ++n;
    return n;
  });
  EXPECT_EQ(visited.get(), 6U);
}

TEST(Concurrency, InterleavedIteratorsOnOneThread)
{
  const auto t = test_support::make_sample_tree();
  auto pre = Iterator::create(t.root, TreeOrder::PreOrder);
  auto level = Iterator::create(t.root, TreeOrder::LevelOrder);

  std::vector<std::string> pre_tokens;
  std::vector<std::string> level_tokens;
  for (int i = 0; i < 6; ++i) {
    pre_tokens.push_back(pre.next()->token);
    level_tokens.push_back(level.next()->token);
  }
  EXPECT_EQ(pre_tokens, (std::vector<std::string>{"", "main", "x", "print", "y", "# done"}));
  EXPECT_EQ(level_tokens, (std::vector<std::string>{"", "main", "# done", "x", "print", "y"}));
  EXPECT_EQ(pre.next(), nullptr);
  EXPECT_EQ(level.next(), nullptr);
}

TEST(Concurrency, SharedIteratorHandsOutEachNodeOnce)
{
  const NodePtr root = test_support::make_wide_tree(4, 4);
  const size_t total = count_nodes(*root);
  auto it = Iterator::create(root, TreeOrder::PreOrder);
  std::mutex it_mutex;

  std::atomic<size_t> visited{0};
  auto consumer = [&] {
    while (true) {
      NodePtr n;
      {
        const std::lock_guard<std::mutex> lock(it_mutex);
        if (!it.is_active()) return;
        n = it.next();
      }
      if (!n) return;
      ++visited;
    }
  };

  std::thread c1(consumer);
  std::thread c2(consumer);
  c1.join();
  c2.join();
  EXPECT_EQ(visited.load(), total);
}
