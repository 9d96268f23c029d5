// tests/node_test.cc
#include "btree/node.hh"

#include <gtest/gtest.h>
#include <sstream>
#include <vector>

namespace btree {
namespace {

using IntNode = Node<int>;
using NodePtr = IntNode::NodePtr;

NodePtr Leaf(size_t order, std::vector<int> keys) {
  return IntNode::Make(order, NodeKind::Leaf, std::move(keys));
}

template <typename... Children> std::vector<NodePtr> Kids(Children... c) {
  std::vector<NodePtr> children;
  (children.push_back(std::move(c)), ...);
  return children;
}

// Root [2, 6] over leaves [1], [3, 4], [7]
NodePtr SmallTree() {
  return IntNode::Make(3, NodeKind::Root, {2, 6},
                       Kids(Leaf(3, {1}), Leaf(3, {3, 4}), Leaf(3, {7})));
}

TEST(NodeTest, SplitChildrenPromotesMedian) {
  auto node = IntNode::Make(3, NodeKind::Internal, {2, 6},
                            Kids(Leaf(3, {1}), Leaf(3, {3, 4, 5}),
                                 Leaf(3, {7})));
  ASSERT_TRUE(node->GetChildren()[1]->IsOverflow());

  node->SplitChildren(1);

  auto expected = IntNode::Make(3, NodeKind::Internal, {2, 4, 6},
                                Kids(Leaf(3, {1}), Leaf(3, {3}), Leaf(3, {5}),
                                     Leaf(3, {7})));
  EXPECT_EQ(*expected, *node);
}

TEST(NodeTest, SplitChildrenMovesGrandchildren) {
  auto overflowing = IntNode::Make(
      3, NodeKind::Internal, {2, 4, 6},
      Kids(Leaf(3, {1}), Leaf(3, {3}), Leaf(3, {5}), Leaf(3, {7})));
  auto sibling = IntNode::Make(3, NodeKind::Internal, {20},
                               Kids(Leaf(3, {15}), Leaf(3, {25})));
  auto root = IntNode::Make(3, NodeKind::Root, {10},
                            Kids(std::move(overflowing), std::move(sibling)));

  root->SplitChildren(0);

  EXPECT_EQ((std::vector<int>{4, 10}), root->GetKeys());
  ASSERT_EQ(3u, root->GetChildren().size());

  const auto &left = *root->GetChildren()[0];
  const auto &right = *root->GetChildren()[1];
  EXPECT_EQ(NodeKind::Internal, left.GetKind());
  EXPECT_EQ(NodeKind::Internal, right.GetKind());
  EXPECT_EQ(std::vector<int>{2}, left.GetKeys());
  EXPECT_EQ(std::vector<int>{6}, right.GetKeys());
  ASSERT_EQ(2u, left.GetChildren().size());
  ASSERT_EQ(2u, right.GetChildren().size());
  EXPECT_EQ(std::vector<int>{3}, left.GetChildren()[1]->GetKeys());
  EXPECT_EQ(std::vector<int>{5}, right.GetChildren()[0]->GetKeys());
  EXPECT_EQ(std::vector<int>{20}, root->GetChildren()[2]->GetKeys());
}

TEST(NodeTest, OverflowAtOrderKeys) {
  IntNode node(3, NodeKind::Root);
  EXPECT_FALSE(node.IsOverflow());
  EXPECT_TRUE(node.Insert(1));
  EXPECT_TRUE(node.Insert(2));
  EXPECT_FALSE(node.IsOverflow());
  EXPECT_TRUE(node.Insert(3));
  // A node never resolves its own overflow.
  EXPECT_TRUE(node.IsOverflow());
  EXPECT_EQ((std::vector<int>{1, 2, 3}), node.GetKeys());
}

TEST(NodeTest, InsertKeepsKeysSorted) {
  IntNode node(8, NodeKind::Root);
  for (int key : {5, 1, 4, 2, 3}) {
    node.Insert(key);
  }
  EXPECT_EQ((std::vector<int>{1, 2, 3, 4, 5}), node.GetKeys());
}

TEST(NodeTest, InsertSplitsOverflowingChild) {
  auto root = SmallTree();
  EXPECT_TRUE(root->Insert(5));

  EXPECT_EQ((std::vector<int>{2, 4, 6}), root->GetKeys());
  ASSERT_EQ(4u, root->GetChildren().size());
  EXPECT_EQ(std::vector<int>{3}, root->GetChildren()[1]->GetKeys());
  EXPECT_EQ(std::vector<int>{5}, root->GetChildren()[2]->GetKeys());
  // The split propagated a key into the root, which is now the caller's
  // problem.
  EXPECT_TRUE(root->IsOverflow());
}

TEST(NodeTest, InsertDuplicateIsNoOp) {
  auto root = SmallTree();
  auto before = root->Traverse();

  EXPECT_FALSE(root->Insert(2));
  EXPECT_FALSE(root->Insert(4));
  EXPECT_EQ(before, root->Traverse());
  EXPECT_EQ((std::vector<int>{3, 4}), root->GetChildren()[1]->GetKeys());
}

TEST(NodeTest, GetFindsKeysAtEveryLevel) {
  auto root = SmallTree();
  for (int key : {1, 2, 3, 4, 6, 7}) {
    auto found = root->Get(key);
    ASSERT_TRUE(found.has_value()) << "missing key " << key;
    EXPECT_EQ(key, *found);
  }
  for (int key : {0, 5, 8}) {
    EXPECT_FALSE(root->Get(key).has_value()) << "unexpected key " << key;
  }
}

TEST(NodeTest, GetOnEmptyRoot) {
  IntNode node(4, NodeKind::Root);
  EXPECT_FALSE(node.Get(1).has_value());
  EXPECT_TRUE(node.IsLeaf());
}

TEST(NodeTest, TraverseIsInOrder) {
  auto root = SmallTree();
  EXPECT_EQ((std::vector<int>{1, 2, 3, 4, 6, 7}), root->Traverse());
  // Reading does not change anything.
  EXPECT_EQ(root->Traverse(), root->Traverse());
}

TEST(NodeTest, DumpIndentsChildren) {
  auto root = SmallTree();
  std::ostringstream os;
  root->Dump(os);
  EXPECT_EQ("root [2, 6]\n"
            "  leaf [1]\n"
            "  leaf [3, 4]\n"
            "  leaf [7]\n",
            os.str());
}

TEST(NodeTest, EqualityComparesStructure) {
  EXPECT_EQ(*SmallTree(), *SmallTree());
  auto other = SmallTree();
  other->Insert(5);
  EXPECT_NE(*SmallTree(), *other);
  EXPECT_NE(*Leaf(3, {1}), *Leaf(4, {1}));
}

} // namespace
} // namespace btree

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
