#include "core/BodyStore.h"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

using namespace BouncePit;

namespace {

Body makeBody(double x, double radius = 5.0)
{
    Body body;
    body.position = Vector2d{ x, 0.0 };
    body.setRadius(radius);
    return body;
}

} // namespace

TEST(BodyStoreTest, AddAssignsDistinctHandles)
{
    spdlog::info("Starting BodyStoreTest::AddAssignsDistinctHandles test");
    BodyStore store;

    const BodyHandle a = store.add(makeBody(1.0));
    const BodyHandle b = store.add(makeBody(2.0));

    EXPECT_NE(a, b);
    EXPECT_EQ(store.size(), 2u);
    EXPECT_TRUE(store.contains(a));
    EXPECT_TRUE(store.contains(b));

    ASSERT_NE(store.find(a), nullptr);
    EXPECT_EQ(store.find(a)->position.x, 1.0);
    EXPECT_EQ(store.find(a)->handle, a);
    EXPECT_EQ(store.find(b)->position.x, 2.0);
}

TEST(BodyStoreTest, BodiesKeepSpawnOrder)
{
    spdlog::info("Starting BodyStoreTest::BodiesKeepSpawnOrder test");
    BodyStore store;
    for (int i = 0; i < 5; ++i) {
        store.add(makeBody(static_cast<double>(i)));
    }

    ASSERT_EQ(store.size(), 5u);
    for (size_t i = 0; i < store.size(); ++i) {
        EXPECT_EQ(store.at(i).position.x, static_cast<double>(i));
    }
}

TEST(BodyStoreTest, ClearMakesHandlesStale)
{
    spdlog::info("Starting BodyStoreTest::ClearMakesHandlesStale test");
    BodyStore store;
    const BodyHandle a = store.add(makeBody(1.0));
    const BodyHandle b = store.add(makeBody(2.0));

    store.clear();
    EXPECT_TRUE(store.empty());
    EXPECT_FALSE(store.contains(a));
    EXPECT_FALSE(store.contains(b));
    EXPECT_EQ(store.find(a), nullptr);

    // Slots are reused under a new generation; the old handles stay stale.
    const BodyHandle c = store.add(makeBody(3.0));
    const BodyHandle d = store.add(makeBody(4.0));
    EXPECT_TRUE(store.contains(c));
    EXPECT_TRUE(store.contains(d));
    EXPECT_FALSE(store.contains(a));
    EXPECT_FALSE(store.contains(b));
    EXPECT_LT(c.index, 2u);
    EXPECT_LT(d.index, 2u);
    EXPECT_GT(c.generation, 0u);
    EXPECT_EQ(store.find(c)->position.x, 3.0);
}

TEST(BodyStoreTest, RemovePreservesOrderOfTheRest)
{
    spdlog::info("Starting BodyStoreTest::RemovePreservesOrderOfTheRest test");
    BodyStore store;
    const BodyHandle a = store.add(makeBody(1.0));
    const BodyHandle b = store.add(makeBody(2.0));
    const BodyHandle c = store.add(makeBody(3.0));

    EXPECT_TRUE(store.remove(b));
    EXPECT_FALSE(store.contains(b));
    ASSERT_EQ(store.size(), 2u);
    EXPECT_EQ(store.at(0).handle, a);
    EXPECT_EQ(store.at(1).handle, c);

    // Lookups still resolve after the dense indices shifted.
    ASSERT_NE(store.find(c), nullptr);
    EXPECT_EQ(store.find(c)->position.x, 3.0);

    // Removing twice is a stale handle.
    EXPECT_FALSE(store.remove(b));

    const BodyHandle e = store.add(makeBody(5.0));
    EXPECT_EQ(e.index, b.index);
    EXPECT_NE(e.generation, b.generation);
    EXPECT_EQ(store.at(2).handle, e);
}

TEST(BodyStoreTest, UnknownHandleIsStale)
{
    spdlog::info("Starting BodyStoreTest::UnknownHandleIsStale test");
    BodyStore store;
    EXPECT_FALSE(store.contains(BodyHandle{ 42, 0 }));
    EXPECT_EQ(store.find(BodyHandle{ 42, 0 }), nullptr);
    EXPECT_FALSE(store.remove(BodyHandle{ 42, 0 }));
}

TEST(BodyStoreTest, DuplicatePositionsAllowed)
{
    spdlog::info("Starting BodyStoreTest::DuplicatePositionsAllowed test");
    BodyStore store;
    store.add(makeBody(7.0));
    store.add(makeBody(7.0));
    EXPECT_EQ(store.size(), 2u);
}
