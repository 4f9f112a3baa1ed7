#include <gtest/gtest.h>

#include <stdexcept>

#include "customize/ChangeHistory.hpp"

namespace customize {
namespace test {

static CustomizationChange change(const std::string& property) {
    CustomizationChange c;
    c.kind = ChangeKind::Layout;
    c.property = property;
    c.previous_value = {{"v", property + "-old"}};
    c.new_value = {{"v", property + "-new"}};
    c.timestamp = "2024-01-01T00:00:00.000Z";
    return c;
}

TEST(ChangeHistoryTest, PushAndPopLatest) {
    ChangeHistory h(4);
    EXPECT_TRUE(h.empty());
    EXPECT_EQ(h.latest(), nullptr);
    EXPECT_FALSE(h.pop_latest().has_value());

    h.push(change("a"));
    h.push(change("b"));
    ASSERT_NE(h.latest(), nullptr);
    EXPECT_EQ(h.latest()->property, "b");

    auto popped = h.pop_latest();
    ASSERT_TRUE(popped.has_value());
    EXPECT_EQ(popped->property, "b");
    EXPECT_EQ(h.size(), 1u);
    EXPECT_EQ(h.latest()->property, "a");
}

TEST(ChangeHistoryTest, FullBufferDropsOldest) {
    ChangeHistory h(3);
    for (const char* p : {"a", "b", "c", "d", "e"}) h.push(change(p));

    EXPECT_EQ(h.size(), 3u);
    const auto entries = h.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].property, "c");
    EXPECT_EQ(entries[2].property, "e");

    h.pop_latest();
    h.push(change("f"));
    EXPECT_EQ(h.entries().front().property, "c");
    EXPECT_EQ(h.latest()->property, "f");
}

TEST(ChangeHistoryTest, DefaultCapacity) {
    ChangeHistory h;
    for (int i = 0; i < 60; ++i) h.push(change(std::to_string(i)));
    EXPECT_EQ(h.capacity(), ChangeHistory::kDefaultCapacity);
    EXPECT_EQ(h.size(), 50u);
    EXPECT_EQ(h.entries().front().property, "10");

    h.clear();
    EXPECT_TRUE(h.empty());
}

TEST(ChangeHistoryTest, JsonRoundTrip) {
    CustomizationChange c = change("preset");
    c.kind = ChangeKind::Role;
    c.metadata = {{"role", "designer"}};

    const nlohmann::json j = c.to_json();
    EXPECT_EQ(j.at("type"), "role");
    EXPECT_EQ(j.at("previousValue").at("v"), "preset-old");

    const CustomizationChange back = CustomizationChange::from_json(j, "change");
    EXPECT_EQ(back.kind, ChangeKind::Role);
    EXPECT_EQ(back.metadata.at("role"), "designer");

    EXPECT_THROW(CustomizationChange::from_json({{"type", "teleport"}}, "change"), std::runtime_error);
    EXPECT_THROW(CustomizationChange::from_json({{"property", "x"}}, "change"), std::runtime_error);
}

} // namespace test
} // namespace customize
