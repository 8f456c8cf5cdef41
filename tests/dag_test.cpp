#include "dagrun/dag/dag.hpp"
#include "dagrun/util/id.hpp"

#include "gtest/gtest.h"

using namespace dagrun;

class DAGTest : public ::testing::Test {
protected:
  DAG dag_;
};

TEST_F(DAGTest, EmptyDAG) {
  EXPECT_EQ(dag_.size(), 0);
  EXPECT_TRUE(dag_.empty());
  EXPECT_TRUE(dag_.is_valid().has_value());
  EXPECT_TRUE(dag_.get_topological_order().empty());
}

TEST_F(DAGTest, AddSingleNode) {
  auto idx_result = dag_.add_node(TaskId("task1"));
  ASSERT_TRUE(idx_result.has_value());
  auto idx = *idx_result;
  EXPECT_NE(idx, kInvalidNode);
  EXPECT_EQ(dag_.size(), 1);
  EXPECT_TRUE(dag_.has_node(TaskId("task1")));
  EXPECT_EQ(dag_.get_index(TaskId("task1")), idx);
}

TEST_F(DAGTest, AddDuplicateNodeReturnsSameIndex) {
  auto idx1_result = dag_.add_node(TaskId("task1"));
  auto idx2_result = dag_.add_node(TaskId("task1"));
  ASSERT_TRUE(idx1_result.has_value());
  ASSERT_TRUE(idx2_result.has_value());
  EXPECT_EQ(*idx1_result, *idx2_result);
  EXPECT_EQ(dag_.size(), 1);
}

TEST_F(DAGTest, AddEdgeOrdersDependencyFirst) {
  // Inserted dependent-first; the edge must override insertion order.
  ASSERT_TRUE(dag_.add_node(TaskId("task2")).has_value());
  ASSERT_TRUE(dag_.add_node(TaskId("task1")).has_value());

  EXPECT_TRUE(dag_.add_edge(TaskId("task1"), TaskId("task2")).has_value());

  auto order = dag_.get_topological_order();
  ASSERT_EQ(order.size(), 2);
  EXPECT_EQ(order[0], TaskId("task1"));
  EXPECT_EQ(order[1], TaskId("task2"));
}

TEST_F(DAGTest, AddEdge_NonExistentTarget_Fails) {
  ASSERT_TRUE(dag_.add_node(TaskId("a")).has_value());
  auto r = dag_.add_edge(TaskId("a"), TaskId("missing"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(DAGTest, DuplicateEdgeIsIgnored) {
  ASSERT_TRUE(dag_.add_node(TaskId("a")).has_value());
  ASSERT_TRUE(dag_.add_node(TaskId("b")).has_value());
  EXPECT_TRUE(dag_.add_edge(TaskId("a"), TaskId("b")).has_value());
  EXPECT_TRUE(dag_.add_edge(TaskId("a"), TaskId("b")).has_value());
  EXPECT_TRUE(dag_.is_valid().has_value());
  auto order = dag_.get_topological_order();
  ASSERT_EQ(order.size(), 2);
  EXPECT_EQ(order.back(), TaskId("b"));
}

TEST_F(DAGTest, TopologicalOrder) {
  ASSERT_TRUE(dag_.add_node(TaskId("task1")).has_value());
  ASSERT_TRUE(dag_.add_node(TaskId("task2")).has_value());
  ASSERT_TRUE(dag_.add_node(TaskId("task3")).has_value());

  EXPECT_TRUE(dag_.add_edge(TaskId("task1"), TaskId("task2")).has_value());
  EXPECT_TRUE(dag_.add_edge(TaskId("task2"), TaskId("task3")).has_value());

  auto order = dag_.get_topological_order();
  ASSERT_EQ(order.size(), 3);
  EXPECT_EQ(order[0], TaskId("task1"));
  EXPECT_EQ(order[1], TaskId("task2"));
  EXPECT_EQ(order[2], TaskId("task3"));
}

TEST_F(DAGTest, IndependentNodesKeepInsertionOrder) {
  ASSERT_TRUE(dag_.add_node(TaskId("z")).has_value());
  ASSERT_TRUE(dag_.add_node(TaskId("a")).has_value());
  ASSERT_TRUE(dag_.add_node(TaskId("m")).has_value());

  auto order = dag_.get_topological_order();
  ASSERT_EQ(order.size(), 3);
  EXPECT_EQ(order[0], TaskId("z"));
  EXPECT_EQ(order[1], TaskId("a"));
  EXPECT_EQ(order[2], TaskId("m"));
}

TEST_F(DAGTest, IsValidWithCycle) {
  ASSERT_TRUE(dag_.add_node(TaskId("task1")).has_value());
  ASSERT_TRUE(dag_.add_node(TaskId("task2")).has_value());

  EXPECT_TRUE(dag_.add_edge(TaskId("task1"), TaskId("task2")).has_value());
  EXPECT_TRUE(dag_.is_valid().has_value());

  EXPECT_TRUE(dag_.add_edge(TaskId("task2"), TaskId("task1")).has_value());
  auto r = dag_.is_valid();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::CycleDetected));
}

TEST_F(DAGTest, CyclePathIsReported) {
  ASSERT_TRUE(dag_.add_node(TaskId("a")).has_value());
  ASSERT_TRUE(dag_.add_node(TaskId("b")).has_value());
  ASSERT_TRUE(dag_.add_node(TaskId("c")).has_value());
  EXPECT_TRUE(dag_.add_edge(TaskId("a"), TaskId("b")).has_value());
  EXPECT_TRUE(dag_.add_edge(TaskId("b"), TaskId("c")).has_value());
  EXPECT_TRUE(dag_.add_edge(TaskId("c"), TaskId("a")).has_value());

  std::vector<TaskId> cycle;
  ASSERT_FALSE(dag_.is_valid(&cycle).has_value());
  ASSERT_EQ(cycle.size(), 4);
  EXPECT_EQ(cycle.front(), cycle.back());
}

TEST_F(DAGTest, GetNonExistentNode) {
  EXPECT_EQ(dag_.get_index(TaskId("nonexistent")), kInvalidNode);
  EXPECT_FALSE(dag_.has_node(TaskId("nonexistent")));
}

TEST_F(DAGTest, Diamond) {
  ASSERT_TRUE(dag_.add_node(TaskId("start")).has_value());
  ASSERT_TRUE(dag_.add_node(TaskId("middle1")).has_value());
  ASSERT_TRUE(dag_.add_node(TaskId("middle2")).has_value());
  ASSERT_TRUE(dag_.add_node(TaskId("end")).has_value());

  EXPECT_TRUE(dag_.add_edge(TaskId("start"), TaskId("middle1")).has_value());
  EXPECT_TRUE(dag_.add_edge(TaskId("start"), TaskId("middle2")).has_value());
  EXPECT_TRUE(dag_.add_edge(TaskId("middle1"), TaskId("end")).has_value());
  EXPECT_TRUE(dag_.add_edge(TaskId("middle2"), TaskId("end")).has_value());

  EXPECT_TRUE(dag_.is_valid().has_value());

  auto order = dag_.get_topological_order();
  ASSERT_EQ(order.size(), 4);
  EXPECT_EQ(order[0], TaskId("start"));
  EXPECT_EQ(order[3], TaskId("end"));
}

TEST_F(DAGTest, AddEdge_SelfLoop_Fails) {
  ASSERT_TRUE(dag_.add_node(TaskId("task1")).has_value());
  auto result = dag_.add_edge(TaskId("task1"), TaskId("task1"));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::CycleDetected));
}

TEST_F(DAGTest, AddEdge_NonExistentSource_Fails) {
  ASSERT_TRUE(dag_.add_node(TaskId("task2")).has_value());
  auto result = dag_.add_edge(TaskId("nonexistent"), TaskId("task2"));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::NotFound));
}
