/**
 * TextEditor integration tests
 *
 * Drive the editor the way the host page does: surface events carry a
 * mirrored DOM and a DOM selection, commands use the recorded selection.
 */

#include <gtest/gtest.h>
#include "folio/editor/text_editor.h"
#include "folio/surface/offset_mapper.h"
#include "tests/editor_test_common.h"

using namespace folio;
using namespace folio::text;
using editor::TextEditor;
using surface::DomPosition;
using surface::DomRange;
using surface::Node;
using editor_test::buildLines;
using editor_test::lineText;
using editor_test::styleWithColor;

class TextEditorTest : public ::testing::Test {
protected:
    TextEditor editor;

    // Element holding `content` in a single span of `style`, left aligned.
    std::uint32_t createText(const std::string& content, const TextStyle& style = defaultTextStyle()) {
        TextElement element;
        element.width = 300.0f;
        element.height = 100.0f;
        element.spans = SpanList{{content, style}};
        return editor.store().upsertElement(std::move(element)).id;
    }

    const TextElement& element(std::uint32_t id) const {
        return *editor.store().getElement(id);
    }

    static DomRange caretIn(const Node* node, std::uint32_t offset) {
        return DomRange{DomPosition{node, offset}, DomPosition{node, offset}};
    }
};

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(TextEditorTest, AddText_UsesPreset) {
    const std::uint32_t id = editor.addText();
    const TextElement* el = editor.store().getElement(id);
    ASSERT_NE(el, nullptr);

    EXPECT_FLOAT_EQ(el->x, 50.0f);
    EXPECT_FLOAT_EQ(el->y, 50.0f);
    EXPECT_FLOAT_EQ(el->width, 300.0f);
    EXPECT_FLOAT_EQ(el->height, 100.0f);
    EXPECT_FLOAT_EQ(el->padding, 10.0f);
    EXPECT_EQ(el->textAlign, TextAlign::Right);
    EXPECT_EQ(el->verticalAlign, VerticalAlign::Middle);
    EXPECT_TRUE(el->lineAlignments.empty());
    EXPECT_EQ(el->zIndex, 1);

    ASSERT_EQ(el->spans.size(), 1u);
    EXPECT_EQ(el->spans[0].text, editor_constants::AddText::SAMPLE_TEXT);
    EXPECT_EQ(el->spans[0].style.fontFamily, "Heebo");
    EXPECT_FLOAT_EQ(el->spans[0].style.fontSize, 48.0f);
    EXPECT_EQ(el->spans[0].style.fontWeight, 700);
    EXPECT_EQ(el->spans[0].style.color, "#FFFFFF");
}

TEST_F(TextEditorTest, AddText_StacksAboveExisting) {
    TextElement below;
    below.zIndex = 5;
    editor.store().upsertElement(std::move(below));

    const std::uint32_t id = editor.addText();
    EXPECT_EQ(element(id).zIndex, 6);
}

TEST_F(TextEditorTest, DeleteText_ClearsSelection) {
    const std::uint32_t id = createText("abc");
    ASSERT_TRUE(editor.setSelection(id, SelectionRange{1, 2}));

    EXPECT_TRUE(editor.deleteText(id));
    EXPECT_FALSE(editor.store().hasElement(id));
    EXPECT_FALSE(editor.selectionFor(id).has_value());
    EXPECT_FALSE(editor.deleteText(id));
}

// =============================================================================
// Surface events
// =============================================================================

TEST_F(TextEditorTest, HandleInput_ReconcilesTyping) {
    const std::uint32_t id = createText("ABCD", styleWithColor("#123456"));
    auto surface = buildLines({"ABXCD"});

    const auto caret = editor.handleInput(id, *surface, caretIn(lineText(*surface, 0), 3));
    ASSERT_TRUE(caret.has_value());
    EXPECT_EQ(*caret, (SelectionRange{3, 3}));

    ASSERT_EQ(element(id).spans.size(), 1u);
    EXPECT_EQ(element(id).spans[0], (TextSpan{"ABXCD", styleWithColor("#123456")}));
    EXPECT_EQ(editor.selectionFor(id), caret);
}

TEST_F(TextEditorTest, HandleInput_KeepsStylesAroundEdit) {
    const std::uint32_t id = createText("Hello");
    TextStylePatch red;
    red.color = "#f00";
    ASSERT_TRUE(editor.setSelection(id, SelectionRange{1, 3}));
    ASSERT_TRUE(editor.applyStyle(id, red).has_value());

    // User types "!" at the end.
    auto surface = buildLines({"Hello!"});
    editor.handleInput(id, *surface, caretIn(lineText(*surface, 0), 6));

    const SpanList& spans = element(id).spans;
    ASSERT_EQ(spans.size(), 3u);
    EXPECT_EQ(spans[1], (TextSpan{"el", styleWithColor("#f00")}));
    EXPECT_EQ(spans[2].text, "lo!");
}

TEST_F(TextEditorTest, HandleInput_SplitsLinesAndTracksAlignment) {
    const std::uint32_t id = createText("AB");
    editor.store().getElementMutable(id)->textAlign = TextAlign::Right;

    auto surface = buildLines({"A", "B"});
    const auto caret = editor.handleInput(id, *surface, caretIn(lineText(*surface, 1), 0));

    ASSERT_TRUE(caret.has_value());
    EXPECT_EQ(caret->start, 2u);
    EXPECT_EQ(element(id).text(), "A\nB");
    EXPECT_TRUE(element(id).lineAlignments.empty());
}

TEST_F(TextEditorTest, HandleInput_SoftBreakSplitsLine) {
    const std::uint32_t id = createText("abcd");

    // Shift+Enter leaves a <br> inside the line container.
    auto surface = Node::makeElement("div");
    Node& line = surface->appendChild(Node::makeElement("div"));
    line.appendChild(Node::makeText("ab"));
    line.appendChild(Node::makeElement("br"));
    const Node& tail = line.appendChild(Node::makeText("cd"));

    const auto caret = editor.handleInput(id, *surface, caretIn(&tail, 0));
    ASSERT_TRUE(caret.has_value());
    EXPECT_EQ(*caret, (SelectionRange{3, 3}));
    EXPECT_EQ(element(id).text(), "ab\ncd");
}

TEST_F(TextEditorTest, HandleInput_IgnoresPlaceholders) {
    const std::uint32_t id = createText("");
    auto surface = Node::makeElement("div");
    Node& line = surface->appendChild(Node::makeElement("div"));
    const Node& text = line.appendChild(Node::makeText(std::string(editor_test::kZwsp) + "x"));

    const auto caret = editor.handleInput(id, *surface, caretIn(&text, 2));
    EXPECT_EQ(element(id).text(), "x");
    EXPECT_EQ(caret->start, 1u);
}

TEST_F(TextEditorTest, HandleInput_SelectionOutsideParksCaretAtEnd) {
    const std::uint32_t id = createText("ab");
    auto surface = buildLines({"abc"});
    auto elsewhere = Node::makeText("zz");

    const auto caret = editor.handleInput(id, *surface, caretIn(elsewhere.get(), 0));
    ASSERT_TRUE(caret.has_value());
    EXPECT_EQ(*caret, (SelectionRange{3, 3}));
}

TEST_F(TextEditorTest, HandleInput_UnknownElement) {
    auto surface = buildLines({"abc"});
    EXPECT_FALSE(editor.handleInput(99, *surface, caretIn(lineText(*surface, 0), 0)).has_value());
}

TEST_F(TextEditorTest, HandleSelectionChange_RecordsRange) {
    const std::uint32_t id = createText("ab\ncd");
    auto surface = buildLines({"ab", "cd"});
    const DomRange range{DomPosition{lineText(*surface, 1), 2}, DomPosition{lineText(*surface, 0), 1}};

    EXPECT_TRUE(editor.handleSelectionChange(id, *surface, range));
    EXPECT_EQ(editor.selectionFor(id), (SelectionRange{1, 5}));
}

TEST_F(TextEditorTest, HandleSelectionChange_OutsideSurfaceIgnored) {
    const std::uint32_t id = createText("ab");
    ASSERT_TRUE(editor.setSelection(id, SelectionRange{1, 1}));
    auto surface = buildLines({"ab"});
    auto elsewhere = Node::makeText("zz");

    EXPECT_FALSE(editor.handleSelectionChange(id, *surface, caretIn(elsewhere.get(), 1)));
    EXPECT_EQ(editor.selectionFor(id), (SelectionRange{1, 1}));
}

TEST_F(TextEditorTest, SetSelection_ClampsAndOrders) {
    const std::uint32_t id = createText("abc");
    ASSERT_TRUE(editor.setSelection(id, SelectionRange{10, 1}));
    EXPECT_EQ(editor.selectionFor(id), (SelectionRange{1, 3}));
    EXPECT_FALSE(editor.setSelection(42, SelectionRange{0, 0}));
}

// =============================================================================
// Commands
// =============================================================================

TEST_F(TextEditorTest, InsertNewline_AtCaret) {
    const std::uint32_t id = createText("AB");
    editor.store().getElementMutable(id)->textAlign = TextAlign::Right;
    ASSERT_TRUE(editor.setSelection(id, SelectionRange{1, 1}));

    const auto caret = editor.insertNewline(id);
    ASSERT_TRUE(caret.has_value());
    EXPECT_EQ(*caret, (SelectionRange{2, 2}));
    EXPECT_EQ(element(id).text(), "A\nB");
    EXPECT_TRUE(element(id).lineAlignments.empty());
}

TEST_F(TextEditorTest, InsertNewline_ReplacesSelection) {
    const std::uint32_t id = createText("Hello");
    const auto caret = editor.insertNewline(id, SelectionRange{1, 4});
    EXPECT_EQ(element(id).text(), "H\no");
    EXPECT_EQ(caret->start, 2u);
    EXPECT_EQ(editor.selectionFor(id), (SelectionRange{2, 2}));
}

TEST_F(TextEditorTest, InsertNewline_NewLineInheritsOverride) {
    const std::uint32_t id = createText("ab\ncd");
    ASSERT_TRUE(editor.setSelection(id, SelectionRange{4, 4}));
    ASSERT_TRUE(editor.setAlignment(id, TextAlign::Center));

    editor.insertNewline(id);
    const TextElement& el = element(id);
    EXPECT_EQ(el.text(), "ab\nc\nd");
    EXPECT_EQ(effectiveAlignment(el.lineAlignments, 0, el.textAlign), TextAlign::Left);
    EXPECT_EQ(effectiveAlignment(el.lineAlignments, 1, el.textAlign), TextAlign::Center);
    EXPECT_EQ(effectiveAlignment(el.lineAlignments, 2, el.textAlign), TextAlign::Center);
}

TEST_F(TextEditorTest, InsertNewline_AtEndOfInnerLineKeepsThatLinesAlignment) {
    const std::uint32_t id = createText("A\nB");
    editor.store().getElementMutable(id)->lineAlignments = {TextAlign::Center, TextAlign::Right};

    const auto caret = editor.insertNewline(id, SelectionRange{1, 1});
    EXPECT_EQ(caret, (SelectionRange{2, 2}));
    const TextElement& el = element(id);
    EXPECT_EQ(el.text(), "A\n\nB");
    EXPECT_EQ(effectiveAlignment(el.lineAlignments, 0, el.textAlign), TextAlign::Center);
    EXPECT_EQ(effectiveAlignment(el.lineAlignments, 1, el.textAlign), TextAlign::Center);
    EXPECT_EQ(effectiveAlignment(el.lineAlignments, 2, el.textAlign), TextAlign::Right);
}

TEST_F(TextEditorTest, InsertNewline_OverLineBreakLeavesAlignments) {
    const std::uint32_t id = createText("A\nB");
    editor.store().getElementMutable(id)->lineAlignments = {TextAlign::Center, TextAlign::Right};

    editor.insertNewline(id, SelectionRange{1, 2});
    const TextElement& el = element(id);
    EXPECT_EQ(el.text(), "A\nB");
    EXPECT_EQ(el.lineAlignments, (LineAlignments{TextAlign::Center, TextAlign::Right}));
}

TEST_F(TextEditorTest, InsertNewline_WithoutSelectionAppends) {
    const std::uint32_t id = createText("ab");
    editor.insertNewline(id);
    EXPECT_EQ(element(id).text(), "ab\n");
}

TEST_F(TextEditorTest, DeleteAll_KeepsCurrentStyle) {
    const std::uint32_t id = createText("abc", styleWithColor("#0a0"));
    editor.store().getElementMutable(id)->lineAlignments = {std::nullopt, TextAlign::Center};
    ASSERT_TRUE(editor.setSelection(id, SelectionRange{0, 3}));

    EXPECT_TRUE(editor.deleteAll(id));
    const TextElement& el = element(id);
    ASSERT_EQ(el.spans.size(), 1u);
    EXPECT_EQ(el.spans[0], (TextSpan{"", styleWithColor("#0a0")}));
    EXPECT_TRUE(el.lineAlignments.empty());
    EXPECT_EQ(editor.selectionFor(id), (SelectionRange{0, 0}));
}

TEST_F(TextEditorTest, ApplyStyle_SplitsSelection) {
    const std::uint32_t id = createText("Hello");
    ASSERT_TRUE(editor.setSelection(id, SelectionRange{1, 3}));
    TextStylePatch patch;
    patch.color = "#f00";

    const auto restore = editor.applyStyle(id, patch);
    ASSERT_TRUE(restore.has_value());
    EXPECT_EQ(*restore, (SelectionRange{1, 3}));

    const SpanList& spans = element(id).spans;
    ASSERT_EQ(spans.size(), 3u);
    EXPECT_EQ(spans[0], (TextSpan{"H", defaultTextStyle()}));
    EXPECT_EQ(spans[1], (TextSpan{"el", styleWithColor("#f00")}));
    EXPECT_EQ(spans[2], (TextSpan{"lo", defaultTextStyle()}));
}

TEST_F(TextEditorTest, ApplyStyle_WithoutSelectionDoesNothing) {
    const std::uint32_t id = createText("Hello");
    TextStylePatch patch;
    patch.color = "#f00";

    EXPECT_FALSE(editor.applyStyle(id, patch).has_value());
    EXPECT_EQ(element(id).spans, (SpanList{{"Hello", defaultTextStyle()}}));
}

TEST_F(TextEditorTest, ApplyStyleToElement_StylesEverything) {
    const std::uint32_t id = createText("Hello");
    ASSERT_TRUE(editor.setSelection(id, SelectionRange{1, 3}));
    ASSERT_TRUE(editor.applyStyle(id, TextStylePatch{std::nullopt, 30.0f}).has_value());

    TextStylePatch patch;
    patch.color = "#f00";
    EXPECT_TRUE(editor.applyStyleToElement(id, patch));
    for (const TextSpan& span : element(id).spans) {
        EXPECT_EQ(span.style.color, "#f00");
    }
    EXPECT_EQ(element(id).text(), "Hello");
}

TEST_F(TextEditorTest, ApplyStyleToElement_EmptyTextStylesTypingSpan) {
    const std::uint32_t id = createText("");
    TextStylePatch patch;
    patch.fontWeight = 900;
    EXPECT_TRUE(editor.applyStyleToElement(id, patch));
    ASSERT_EQ(element(id).spans.size(), 1u);
    EXPECT_EQ(element(id).spans[0].style.fontWeight, 900);
}

TEST_F(TextEditorTest, SetAlignment_WithoutSelectionSetsBlock) {
    const std::uint32_t id = createText("ab\ncd");
    editor.store().getElementMutable(id)->lineAlignments = {TextAlign::Center, std::nullopt};

    EXPECT_TRUE(editor.setAlignment(id, TextAlign::Right));
    EXPECT_EQ(element(id).textAlign, TextAlign::Right);
    EXPECT_TRUE(element(id).lineAlignments.empty());
}

TEST_F(TextEditorTest, SetAlignment_CaretLineOnly) {
    const std::uint32_t id = createText("ab\ncd");
    ASSERT_TRUE(editor.setSelection(id, SelectionRange{0, 0}));

    EXPECT_TRUE(editor.setAlignment(id, TextAlign::Center));
    const TextElement& el = element(id);
    EXPECT_EQ(el.textAlign, TextAlign::Left);
    EXPECT_EQ(effectiveAlignment(el.lineAlignments, 0, el.textAlign), TextAlign::Center);
    EXPECT_EQ(effectiveAlignment(el.lineAlignments, 1, el.textAlign), TextAlign::Left);
}

TEST_F(TextEditorTest, UnknownElement_CommandsFail) {
    TextStylePatch patch;
    patch.color = "#f00";
    EXPECT_FALSE(editor.insertNewline(7).has_value());
    EXPECT_FALSE(editor.deleteAll(7));
    EXPECT_FALSE(editor.applyStyle(7, patch).has_value());
    EXPECT_FALSE(editor.applyStyleToElement(7, patch));
    EXPECT_FALSE(editor.setAlignment(7, TextAlign::Center));
    EXPECT_FALSE(editor.activeStyle(7).has_value());
    EXPECT_TRUE(editor.renderSurface(7) == nullptr);
}

// =============================================================================
// Queries
// =============================================================================

TEST_F(TextEditorTest, ActiveStyle_FollowsSelection) {
    const std::uint32_t id = createText("ab");
    editor.store().getElementMutable(id)->spans = SpanList{{"a", styleWithColor("#1")}, {"b", styleWithColor("#2")}};

    EXPECT_EQ(editor.activeStyle(id), styleWithColor("#1"));
    ASSERT_TRUE(editor.setSelection(id, SelectionRange{1, 2}));
    EXPECT_EQ(editor.activeStyle(id), styleWithColor("#2"));
}

TEST_F(TextEditorTest, RenderSurface_MatchesModel) {
    const std::uint32_t id = editor.addText();
    ASSERT_TRUE(editor.setSelection(id, SelectionRange{0, 0}));
    editor.insertNewline(id);

    const auto surface = editor.renderSurface(id);
    ASSERT_NE(surface, nullptr);
    EXPECT_EQ(surface::extractText(*surface), element(id).text());
    EXPECT_EQ(surface->childCount(), 2u);
}

TEST_F(TextEditorTest, SelectionOverlay_UsesElementFrameAndOutline) {
    const std::uint32_t id = createText("Hello");
    const float h = defaultTextStyle().fontSize * defaultTextStyle().lineHeight;

    const std::vector<geometry::Rect> rects = editor.selectionOverlay(
        id,
        {geometry::Rect{20.0f, 30.0f, 100.0f, h}},
        geometry::Rect{0.0f, 0.0f, 300.0f, 100.0f},
        1.0f);

    ASSERT_EQ(rects.size(), 1u);
    EXPECT_NEAR(rects[0].x, 17.0f, 1e-3f);
    EXPECT_NEAR(rects[0].y, 27.0f, 1e-3f);
    EXPECT_NEAR(rects[0].width, 100.0f, 1e-3f);
    EXPECT_NEAR(rects[0].height, h, 1e-3f);
}

TEST_F(TextEditorTest, Edits_MarkElementDirty) {
    const std::uint32_t id = createText("ab");
    editor.store().consumeDirtyIds();

    editor.insertNewline(id);
    EXPECT_EQ(editor.store().consumeDirtyIds(), (std::vector<std::uint32_t>{id}));

    // Unchanged surface text is not an edit.
    auto surface = buildLines({"ab", ""});
    editor.handleInput(id, *surface, caretIn(lineText(*surface, 0), 0));
    EXPECT_FALSE(editor.store().hasDirtyElements());
}
