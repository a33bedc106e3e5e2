#include <gtest/gtest.h>

#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "fake_tree.hpp"
#include "uast_bridge/bridge/boundary.hpp"
#include "uast_bridge/bridge/engine_error.hpp"
#include "uast_bridge/bridge/node_access.hpp"
#include "uast_bridge/engine/uast_engine.h"

using uast_bridge::BoundaryKind;
using uast_bridge::boundary_mutex;

namespace
{

// Drives the engine directly with the fake host tree. Both boundary locks are
// held for the whole test and the bridge's callback table is restored after.
class EngineCApi : public ::testing::Test
{
protected:
  void SetUp() override
  {
    uast_bridge::ensure_engine_initialized();
    evaluation_ = std::unique_lock<std::mutex>(boundary_mutex(BoundaryKind::Evaluation));
    iteration_ = std::unique_lock<std::mutex>(boundary_mutex(BoundaryKind::Iteration));
    UastEngineInit(&fake_tree::iface());
    root_ = fake_tree::build_abc();
  }

  void TearDown() override
  {
    UastEngineRegisterRole(7, nullptr);
    UastEngineInit(&uast_bridge::node_access::node_iface());
  }

  std::string results()
  {
    std::string out;
    for (int i = 0; i < UastEngineResultSize(); ++i) {
      out += fake_tree::at(UastEngineResultAt(i)).type;
    }
    return out;
  }

  std::unique_lock<std::mutex> evaluation_;
  std::unique_lock<std::mutex> iteration_;
  uintptr_t root_ = 0;
};

}  // namespace

TEST_F(EngineCApi, FilterFillsResultSet)
{
  ASSERT_TRUE(UastEngineFilter(root_, "//*[@token='d' or @token='f']"));
  EXPECT_EQ(results(), "DF");
  EXPECT_EQ(UastEngineResultAt(2), 0U);
  EXPECT_EQ(UastEngineResultAt(-1), 0U);
}

TEST_F(EngineCApi, FilterResultsInDocumentOrder)
{
  ASSERT_TRUE(UastEngineFilter(root_, "//F | //B | //A"));
  EXPECT_EQ(results(), "ABF");
}

TEST_F(EngineCApi, FailureClearsResultsAndSetsError)
{
  ASSERT_TRUE(UastEngineFilter(root_, "//B"));
  ASSERT_EQ(UastEngineResultSize(), 1);

  EXPECT_FALSE(UastEngineFilter(root_, "//B["));
  EXPECT_EQ(UastEngineResultSize(), 0);

  const uast_bridge::EngineString err(UastEngineLastError());
  ASSERT_TRUE(err);
  EXPECT_NE(*err, '\0');
}

TEST_F(EngineCApi, SuccessClearsLastError)
{
  EXPECT_FALSE(UastEngineFilter(0, "//A"));
  EXPECT_EQ(uast_bridge::take_engine_error(""), "invalid root node");

  ASSERT_TRUE(UastEngineFilter(root_, "//A"));
  EXPECT_FALSE(uast_bridge::EngineString(UastEngineLastError()));
}

TEST_F(EngineCApi, NullQueryIsAnError)
{
  EXPECT_FALSE(UastEngineFilter(root_, nullptr));
  EXPECT_EQ(uast_bridge::take_engine_error(""), "null query");
}

TEST_F(EngineCApi, ScalarResultIsAnError)
{
  EXPECT_FALSE(UastEngineFilter(root_, "count(//*)"));
  EXPECT_EQ(uast_bridge::take_engine_error(""), "query does not evaluate to a node set");
}

TEST_F(EngineCApi, RoleNamesChangeAttributeNames)
{
  fake_tree::at(root_ + 3).roles = {7};

  ASSERT_TRUE(UastEngineFilter(root_, "//*[@role7]"));
  EXPECT_EQ(results(), "D");

  UastEngineRegisterRole(7, "Callee");
  ASSERT_TRUE(UastEngineFilter(root_, "//*[@roleCallee]"));
  EXPECT_EQ(results(), "D");
  ASSERT_TRUE(UastEngineFilter(root_, "//*[@role7]"));
  EXPECT_EQ(results(), "");

  UastEngineRegisterRole(7, nullptr);
  ASSERT_TRUE(UastEngineFilter(root_, "//*[@role7]"));
  EXPECT_EQ(results(), "D");
}

TEST_F(EngineCApi, PropertiesAndPositionsBecomeAttributes)
{
  auto & c = fake_tree::at(root_ + 2);
  c.properties = {{"kind", "call"}, {"token", "shadow"}};
  c.has_start = true;
  c.start[0] = 12;
  c.start[1] = 2;
  c.start[2] = 5;

  ASSERT_TRUE(UastEngineFilter(root_, "//*[@kind='call' and @startOffset='12' and @startCol='5']"));
  EXPECT_EQ(results(), "C");
  ASSERT_TRUE(UastEngineFilter(root_, "//*[@token='shadow']"));
  EXPECT_EQ(results(), "");
  ASSERT_TRUE(UastEngineFilter(root_, "//*[@endOffset]"));
  EXPECT_EQ(results(), "");
}

TEST_F(EngineCApi, IteratorWalksTree)
{
  UastIterator * it = UastEngineIteratorNew(root_, UAST_LEVEL_ORDER);
  ASSERT_NE(it, nullptr);

  std::string order;
  while (const uintptr_t h = UastEngineIteratorNext(it)) {
    order += fake_tree::at(h).type;
  }
  EXPECT_EQ(order, "ABCDEF");
  EXPECT_EQ(UastEngineIteratorNext(it), 0U);
  UastEngineIteratorFree(it);
}

TEST_F(EngineCApi, IteratorNextClearsLastError)
{
  UastIterator * it = UastEngineIteratorNew(root_, UAST_PRE_ORDER);
  ASSERT_NE(it, nullptr);

  EXPECT_FALSE(UastEngineFilter(0, "//A"));
  ASSERT_TRUE(uast_bridge::EngineString(UastEngineLastError()));

  EXPECT_NE(UastEngineIteratorNext(it), 0U);
  EXPECT_FALSE(uast_bridge::EngineString(UastEngineLastError()));

  // End of traversal is 0 with no error recorded
  while (UastEngineIteratorNext(it) != 0U) {
  }
  EXPECT_FALSE(uast_bridge::EngineString(UastEngineLastError()));
  UastEngineIteratorFree(it);
}

TEST_F(EngineCApi, IteratorCreationErrors)
{
  EXPECT_EQ(UastEngineIteratorNew(0, UAST_PRE_ORDER), nullptr);
  EXPECT_EQ(uast_bridge::take_engine_error(""), "invalid root node");

  EXPECT_EQ(UastEngineIteratorNew(root_, 9), nullptr);
  EXPECT_EQ(uast_bridge::take_engine_error(""), "unknown tree order 9");
}

TEST_F(EngineCApi, NullIteratorIsAccepted)
{
  EXPECT_EQ(UastEngineIteratorNext(nullptr), 0U);
  UastEngineIteratorFree(nullptr);
}

TEST_F(EngineCApi, LastErrorIsPerThread)
{
  EXPECT_FALSE(UastEngineFilter(0, "//A"));

  std::string other_thread_error = "unset";
  std::thread([&other_thread_error] {
    const uast_bridge::EngineString err(UastEngineLastError());
    other_thread_error = err ? err.get() : "";
  }).join();

  EXPECT_EQ(other_thread_error, "");
  EXPECT_EQ(uast_bridge::take_engine_error(""), "invalid root node");
}
