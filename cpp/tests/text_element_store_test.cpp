#include <gtest/gtest.h>
#include "folio/text/text_element_store.h"
#include "tests/editor_test_common.h"

using namespace folio::text;

class TextElementStoreTest : public ::testing::Test {
protected:
    TextElementStore store;

    // Helper to create a simple text element
    TextElement& createSimpleText(std::uint32_t id, const char* content, int zIndex = 0) {
        TextElement element;
        element.id = id;
        element.zIndex = zIndex;
        element.spans = editor_test::singleSpan(content, defaultTextStyle());
        return store.upsertElement(std::move(element));
    }
};

// =============================================================================
// Basic CRUD Tests
// =============================================================================

TEST_F(TextElementStoreTest, CreateElement) {
    createSimpleText(1, "Hello World");
    EXPECT_TRUE(store.hasElement(1));
    EXPECT_EQ(store.getElementCount(), 1u);
}

TEST_F(TextElementStoreTest, GetElement) {
    createSimpleText(1, "Hello");

    const TextElement* element = store.getElement(1);
    ASSERT_NE(element, nullptr);
    EXPECT_EQ(element->id, 1u);
    EXPECT_EQ(element->text(), "Hello");
}

TEST_F(TextElementStoreTest, GetNonExistentElement) {
    EXPECT_EQ(store.getElement(999), nullptr);
    EXPECT_EQ(store.getElementMutable(999), nullptr);
}

TEST_F(TextElementStoreTest, DeleteElement) {
    createSimpleText(1, "Hello");
    EXPECT_TRUE(store.deleteElement(1));
    EXPECT_FALSE(store.hasElement(1));
    EXPECT_EQ(store.getElementCount(), 0u);
}

TEST_F(TextElementStoreTest, DeleteNonExistentElement) {
    EXPECT_FALSE(store.deleteElement(999));
}

TEST_F(TextElementStoreTest, UpsertReplacesExisting) {
    createSimpleText(1, "Hello");
    createSimpleText(1, "World");
    EXPECT_EQ(store.getElement(1)->text(), "World");
    EXPECT_EQ(store.getElementCount(), 1u);
}

TEST_F(TextElementStoreTest, ZeroIdAllocatesFreshId) {
    createSimpleText(4, "a");
    const std::uint32_t id = createSimpleText(0, "b").id;
    EXPECT_NE(id, 0u);
    EXPECT_NE(id, 4u);
    EXPECT_TRUE(store.hasElement(id));
}

TEST_F(TextElementStoreTest, GetAllIds_Sorted) {
    createSimpleText(3, "c");
    createSimpleText(1, "a");
    createSimpleText(2, "b");
    EXPECT_EQ(store.getAllIds(), (std::vector<std::uint32_t>{1, 2, 3}));
}

TEST_F(TextElementStoreTest, MaxZIndex) {
    EXPECT_FALSE(store.maxZIndex().has_value());
    createSimpleText(1, "a", 3);
    createSimpleText(2, "b", 7);
    EXPECT_EQ(store.maxZIndex(), 7);
}

// =============================================================================
// Invariants on insert
// =============================================================================

TEST_F(TextElementStoreTest, Upsert_NormalizesSpans) {
    TextElement element;
    element.id = 1;
    element.spans = SpanList{{"ab", defaultTextStyle()}, {"", editor_test::styleWithColor("#f00")}, {"cd", defaultTextStyle()}};
    const TextElement& stored = store.upsertElement(std::move(element));
    ASSERT_EQ(stored.spans.size(), 1u);
    EXPECT_EQ(stored.spans[0].text, "abcd");
}

TEST_F(TextElementStoreTest, Upsert_EmptySpanListGetsOneSpan) {
    TextElement element;
    element.id = 1;
    const TextElement& stored = store.upsertElement(std::move(element));
    ASSERT_EQ(stored.spans.size(), 1u);
    EXPECT_EQ(stored.spans[0].style, defaultTextStyle());
}

TEST_F(TextElementStoreTest, Upsert_CanonicalizesLineAlignments) {
    TextElement element;
    element.id = 1;
    element.textAlign = TextAlign::Center;
    element.lineAlignments = {TextAlign::Center, std::nullopt};
    EXPECT_TRUE(store.upsertElement(std::move(element)).lineAlignments.empty());
}

// =============================================================================
// Dirty Tracking
// =============================================================================

TEST_F(TextElementStoreTest, UpsertMarksDirty) {
    createSimpleText(1, "a");
    createSimpleText(2, "b");
    EXPECT_TRUE(store.hasDirtyElements());
    EXPECT_EQ(store.consumeDirtyIds(), (std::vector<std::uint32_t>{1, 2}));
    EXPECT_FALSE(store.hasDirtyElements());
}

TEST_F(TextElementStoreTest, MarkDirty_IgnoresUnknownIds) {
    store.markDirty(42);
    EXPECT_FALSE(store.hasDirtyElements());
}

TEST_F(TextElementStoreTest, DeleteClearsDirtyFlag) {
    createSimpleText(1, "a");
    store.deleteElement(1);
    EXPECT_TRUE(store.consumeDirtyIds().empty());
}

TEST_F(TextElementStoreTest, Clear) {
    createSimpleText(1, "a");
    createSimpleText(2, "b");
    store.clear();
    EXPECT_EQ(store.getElementCount(), 0u);
    EXPECT_FALSE(store.hasDirtyElements());
}
