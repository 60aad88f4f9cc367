#include "folio/editor/text_editor.h"
#include "folio/core/logging.h"
#include "folio/core/string_utils.h"
#include "folio/surface/offset_mapper.h"
#include "folio/surface/surface_renderer.h"
#include "folio/text/line_alignment.h"
#include "folio/text/span_reconciler.h"
#include "folio/text/style_range.h"
#include <algorithm>

namespace folio::editor {

using text::SelectionRange;
using text::TextElement;

TextEditor::TextEditor(TextEditorOptions options)
    : options_(std::move(options)) {}

TextEditor::~TextEditor() = default;

// =============================================================================
// Element Lifecycle
// =============================================================================

std::uint32_t TextEditor::addText() {
    namespace preset = editor_constants::AddText;

    text::TextStylePatch style;
    style.fontSize = preset::FONT_SIZE;
    style.fontWeight = preset::FONT_WEIGHT;
    style.color = std::string(editor_constants::DEFAULT_COLOR);

    TextElement element;
    element.x = preset::X;
    element.y = preset::Y;
    element.width = preset::WIDTH;
    element.height = preset::HEIGHT;
    element.padding = preset::PADDING;
    element.textAlign = text::TextAlign::Right;
    element.verticalAlign = text::VerticalAlign::Middle;
    element.spans.push_back(text::TextSpan{preset::SAMPLE_TEXT, text::mergeStyle(options_.defaultStyle, style)});

    const std::optional<int> topZ = store_.maxZIndex();
    element.zIndex = topZ ? *topZ + 1 : 1;

    const TextElement& stored = store_.upsertElement(std::move(element));
    FOLIO_LOG_DEBUG("addText: id=%u z=%d", stored.id, stored.zIndex);
    return stored.id;
}

bool TextEditor::deleteText(std::uint32_t id) {
    if (!store_.deleteElement(id)) {
        return false;
    }
    if (selection_ && selection_->elementId == id) {
        selection_.reset();
    }
    return true;
}

// =============================================================================
// Surface Events
// =============================================================================

std::optional<SelectionRange> TextEditor::handleInput(
    std::uint32_t id,
    const surface::Node& root,
    const surface::DomRange& domSelection
) {
    TextElement* element = store_.getElementMutable(id);
    if (!element) {
        FOLIO_LOG_WARN("handleInput: unknown element %u", id);
        return std::nullopt;
    }

    const std::string newText = surface::extractText(root);
    commitText(*element, newText);

    SelectionRange caret;
    if (surface::touchesSurface(root, domSelection)) {
        caret = surface::toSelectionRange(root, domSelection);
    } else {
        FOLIO_LOG_DEBUG("handleInput: selection outside surface, caret at end");
        const std::uint32_t end = logicalLength(newText);
        caret = SelectionRange{end, end};
    }
    selection_ = EditorSelection{id, caret};
    return caret;
}

bool TextEditor::handleSelectionChange(std::uint32_t id, const surface::Node& root, const surface::DomRange& domRange) {
    if (!store_.hasElement(id)) {
        FOLIO_LOG_WARN("handleSelectionChange: unknown element %u", id);
        return false;
    }
    if (!surface::touchesSurface(root, domRange)) {
        FOLIO_LOG_DEBUG("handleSelectionChange: selection outside surface ignored");
        return false;
    }
    selection_ = EditorSelection{id, surface::toSelectionRange(root, domRange)};
    return true;
}

bool TextEditor::setSelection(std::uint32_t id, SelectionRange range) {
    const TextElement* element = store_.getElement(id);
    if (!element) {
        FOLIO_LOG_WARN("setSelection: unknown element %u", id);
        return false;
    }

    const std::uint32_t length = text::spanTextLength(element->spans);
    range.start = std::min(range.start, length);
    range.end = std::min(range.end, length);
    if (range.start > range.end) {
        std::swap(range.start, range.end);
    }
    selection_ = EditorSelection{id, range};
    return true;
}

void TextEditor::clearSelection() {
    selection_.reset();
}

std::optional<SelectionRange> TextEditor::selectionFor(std::uint32_t id) const {
    if (selection_ && selection_->elementId == id) {
        return selection_->range;
    }
    return std::nullopt;
}

// =============================================================================
// Editing Commands
// =============================================================================

std::optional<SelectionRange> TextEditor::insertNewline(
    std::uint32_t id,
    const std::optional<SelectionRange>& range
) {
    TextElement* element = store_.getElementMutable(id);
    if (!element) {
        FOLIO_LOG_WARN("insertNewline: unknown element %u", id);
        return std::nullopt;
    }

    const std::string oldText = element->text();
    const std::uint32_t length = logicalLength(oldText);

    SelectionRange target{length, length};
    if (range) {
        target = *range;
    } else if (const auto last = selectionFor(id)) {
        target = *last;
    }
    std::uint32_t start = std::min(std::min(target.start, target.end), length);
    std::uint32_t end = std::min(std::max(target.start, target.end), length);

    const std::uint32_t startByte = logicalToByteIndex(oldText, start);
    const std::uint32_t endByte = logicalToByteIndex(oldText, end);

    // The break position is known exactly; a prefix diff would slide it past
    // an adjacent '\n' onto the following line.
    text::TextEdit edit;
    edit.prefixBytes = startByte;
    edit.removed = oldText.substr(startByte, endByte - startByte);
    edit.inserted = "\n";

    std::string newText;
    newText.reserve(oldText.size() + 1);
    newText.append(oldText, 0, startByte);
    newText.append(edit.inserted);
    newText.append(oldText, endByte, std::string::npos);
    if (edit.removed != edit.inserted) {
        commitEdit(*element, oldText, newText, edit);
    }

    const SelectionRange caret{start + 1, start + 1};
    selection_ = EditorSelection{id, caret};
    return caret;
}

bool TextEditor::deleteAll(std::uint32_t id) {
    TextElement* element = store_.getElementMutable(id);
    if (!element) {
        FOLIO_LOG_WARN("deleteAll: unknown element %u", id);
        return false;
    }

    const text::TextStyle current = text::activeStyleAt(element->spans, selectionFor(id));
    element->spans.assign(1, text::TextSpan{std::string(), current});
    element->lineAlignments.clear();
    store_.markDirty(id);

    selection_ = EditorSelection{id, SelectionRange{0, 0}};
    return true;
}

std::optional<SelectionRange> TextEditor::applyStyle(std::uint32_t id, const text::TextStylePatch& patch) {
    TextElement* element = store_.getElementMutable(id);
    if (!element) {
        FOLIO_LOG_WARN("applyStyle: unknown element %u", id);
        return std::nullopt;
    }

    const std::optional<SelectionRange> range = selectionFor(id);
    if (!range) {
        FOLIO_LOG_DEBUG("applyStyle: no selection on element %u", id);
        return std::nullopt;
    }

    element->spans = text::applyStyleToSpans(element->spans, range, patch, options_.defaultStyle);
    store_.markDirty(id);
    return range;
}

bool TextEditor::applyStyleToElement(std::uint32_t id, const text::TextStylePatch& patch) {
    TextElement* element = store_.getElementMutable(id);
    if (!element) {
        FOLIO_LOG_WARN("applyStyleToElement: unknown element %u", id);
        return false;
    }

    const SelectionRange all{0, text::spanTextLength(element->spans)};
    element->spans = text::applyStyleToSpans(element->spans, all, patch, options_.defaultStyle);
    store_.markDirty(id);
    return true;
}

bool TextEditor::setAlignment(std::uint32_t id, text::TextAlign align) {
    TextElement* element = store_.getElementMutable(id);
    if (!element) {
        FOLIO_LOG_WARN("setAlignment: unknown element %u", id);
        return false;
    }

    text::setAlignment(element->lineAlignments, element->textAlign, element->text(), selectionFor(id), align);
    store_.markDirty(id);
    return true;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<text::TextStyle> TextEditor::activeStyle(std::uint32_t id) const {
    const TextElement* element = store_.getElement(id);
    if (!element || element->spans.empty()) {
        return std::nullopt;
    }
    return text::activeStyleAt(element->spans, selectionFor(id));
}

std::unique_ptr<surface::Node> TextEditor::renderSurface(std::uint32_t id) const {
    const TextElement* element = store_.getElement(id);
    if (!element) {
        FOLIO_LOG_WARN("renderSurface: unknown element %u", id);
        return nullptr;
    }
    return surface::renderSurface(*element);
}

std::vector<geometry::Rect> TextEditor::selectionOverlay(
    std::uint32_t id,
    const std::vector<geometry::Rect>& deviceRects,
    const geometry::Rect& wrapperBox,
    float zoom
) const {
    const TextElement* element = store_.getElement(id);
    if (!element || element->spans.empty()) {
        return {};
    }

    const text::TextStyle& style = text::activeStyleAt(element->spans, selectionFor(id));

    geometry::ProjectionFrame frame;
    frame.elementWidth = element->width;
    frame.elementHeight = element->height;
    frame.rotationDeg = element->rotation;
    frame.zoom = zoom;
    frame.fontSize = style.fontSize;
    frame.lineHeight = style.lineHeight;
    frame.outlineWidth = options_.outlineWidth;
    frame.wrapperBox = wrapperBox;
    return geometry::projectSelectionRects(deviceRects, frame);
}

// =============================================================================
// Private Helpers
// =============================================================================

void TextEditor::commitText(TextElement& element, const std::string& newText) {
    const std::string oldText = element.text();
    if (oldText == newText) {
        return;
    }
    commitEdit(element, oldText, newText, text::computeTextEdit(oldText, newText));
}

void TextEditor::commitEdit(
    TextElement& element,
    const std::string& oldText,
    const std::string& newText,
    const text::TextEdit& edit
) {
    element.spans = text::reconcileSpans(oldText, newText, element.spans);
    text::applyTextEdit(element.lineAlignments, oldText, edit, element.textAlign);
    store_.markDirty(element.id);
}

} // namespace folio::editor
