#include <gtest/gtest.h>
#include "trie_node.hpp"

using namespace pcoll;

TEST(PopcountTest, CountsSetBits) {
    EXPECT_EQ(popcount(0u), 0u);
    EXPECT_EQ(popcount(0xFFFFFFFFu), 32u);
    EXPECT_EQ(popcount(0b1011u), 3u);
}

TEST(NodePtrTest, SharesAndReleasesReferences) {
    VectorNode::Ptr leaf = VectorNode::newLeaf({Value(1), Value(2)});
    EXPECT_EQ(leaf->getRefCount(), 1u);
    {
        VectorNode::Ptr copy = leaf;
        EXPECT_EQ(leaf->getRefCount(), 2u);
        EXPECT_EQ(copy, leaf);
    }
    EXPECT_EQ(leaf->getRefCount(), 1u);

    VectorNode::Ptr moved = std::move(leaf);
    EXPECT_FALSE(leaf);
    EXPECT_EQ(moved->getRefCount(), 1u);
}

TEST(NodePtrTest, AssignFromChildOfReleasedNode) {
    VectorNode::Ptr node = VectorNode::newInner({VectorNode::newLeaf({Value(7)})});
    ASSERT_EQ(node->getRefCount(), 1u);

    // The parent dies during the assignment; its child must survive
    node = node->childAt(0);
    ASSERT_TRUE(node->isLeaf());
    EXPECT_EQ(node->valueAt(0), Value(7));
    EXPECT_EQ(node->getRefCount(), 1u);

    VectorNode::Ptr outer = VectorNode::newInner({VectorNode::newInner({VectorNode::newLeaf({Value(8)})})});
    outer = VectorNode::Ptr(outer->childAt(0));
    outer = outer->childAt(0);
    EXPECT_EQ(outer->valueAt(0), Value(8));
}

TEST(VectorNodeTest, LeafEditsCopyOnWrite) {
    VectorNode::Ptr leaf = VectorNode::newLeaf({Value(1), Value(2)});
    VectorNode::Ptr edited = leaf->withValueAt(1, Value(20));
    VectorNode::Ptr appended = leaf->withValueAt(2, Value(3));

    EXPECT_EQ(leaf->valueAt(1), Value(2));
    EXPECT_EQ(edited->valueAt(1), Value(20));
    EXPECT_EQ(appended->size(), 3u);
    EXPECT_EQ(leaf->size(), 2u);
}

TEST(VectorNodeTest, InnerEditsShareUntouchedChildren) {
    VectorNode::Ptr a = VectorNode::newLeaf({Value(1)});
    VectorNode::Ptr b = VectorNode::newLeaf({Value(2)});
    VectorNode::Ptr inner = VectorNode::newInner({a, b});

    VectorNode::Ptr replaced = inner->withChildAt(1, VectorNode::newLeaf({Value(3)}));
    EXPECT_EQ(replaced->childAt(0), a);
    EXPECT_NE(replaced->childAt(1), b);
    EXPECT_EQ(inner->childAt(1), b);

    VectorNode::Ptr cut = replaced->truncated(1);
    EXPECT_EQ(cut->size(), 1u);
    EXPECT_EQ(cut->childAt(0), a);
}

TEST(VectorNodeTest, RejectsOverfullAndOutOfRangeSlots) {
    std::vector<Value> tooMany(NODE_SIZE + 1, Value(0));
    EXPECT_THROW(VectorNode::newLeaf(tooMany), std::length_error);

    VectorNode::Ptr leaf = VectorNode::newLeaf({Value(1)});
    EXPECT_THROW(leaf->withValueAt(5, Value(0)), std::out_of_range);
    EXPECT_THROW(leaf->withChildAt(0, nullptr), std::out_of_range);
    EXPECT_THROW(leaf->childAt(0), std::out_of_range);
}

TEST(VectorNodeTest, EmptyInnerIsShared) {
    EXPECT_EQ(VectorNode::emptyInner(), VectorNode::emptyInner());
    EXPECT_FALSE(VectorNode::emptyInner()->isLeaf());
    EXPECT_EQ(VectorNode::emptyInner()->size(), 0u);
}
