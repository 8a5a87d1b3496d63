#include <gtest/gtest.h>
#include "rendercore/scene/draw_order.h"

#include <vector>

using namespace rendercore;

TEST(DrawOrderTest, AppendKeepsInsertionOrderAndIgnoresDuplicates) {
    DrawOrder order;
    order.append(3);
    order.append(1);
    order.append(2);
    order.append(1);
    order.append(kNoElement);
    EXPECT_EQ(order.ids(), (std::vector<ElementId>{3, 1, 2}));
    EXPECT_LT(order.rankOf(3), order.rankOf(1));
    EXPECT_LT(order.rankOf(1), order.rankOf(2));
}

TEST(DrawOrderTest, RemoveLeavesRelativeOrder) {
    DrawOrder order;
    for (ElementId id = 1; id <= 5; ++id) order.append(id);
    EXPECT_TRUE(order.remove(3));
    EXPECT_FALSE(order.remove(3));
    EXPECT_FALSE(order.contains(3));
    EXPECT_EQ(order.size(), 4u);
    EXPECT_EQ(order.ids(), (std::vector<ElementId>{1, 2, 4, 5}));
}

TEST(DrawOrderTest, CompactionPreservesRanks) {
    DrawOrder order;
    for (ElementId id = 1; id <= 4000; ++id) order.append(id);
    for (ElementId id = 1; id <= 3000; ++id) ASSERT_TRUE(order.remove(id));
    EXPECT_EQ(order.size(), 1000u);

    const std::vector<ElementId> ids = order.ids();
    ASSERT_EQ(ids.size(), 1000u);
    for (std::size_t i = 1; i < ids.size(); ++i) {
        EXPECT_LT(ids[i - 1], ids[i]);
        EXPECT_LT(order.rankOf(ids[i - 1]), order.rankOf(ids[i]));
    }
}

TEST(DrawOrderTest, SetOrderPutsListedFirstAndKeepsTheRest) {
    DrawOrder order;
    for (ElementId id = 1; id <= 6; ++id) order.append(id);

    const ElementId next[] = {5, 2, 99, 5, 4};
    order.setOrder(next, 5);
    EXPECT_EQ(order.ids(), (std::vector<ElementId>{5, 2, 4, 1, 3, 6}));
    EXPECT_EQ(order.size(), 6u);
    EXPECT_FALSE(order.contains(99));
}

TEST(DrawOrderTest, ClearResets) {
    DrawOrder order;
    order.append(7);
    order.clear();
    EXPECT_EQ(order.size(), 0u);
    EXPECT_TRUE(order.ids().empty());
    order.append(7);
    EXPECT_EQ(order.rankOf(7), 0u);
}
