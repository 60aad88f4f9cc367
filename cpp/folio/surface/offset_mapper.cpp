#include "folio/surface/offset_mapper.h"
#include "folio/core/editor_constants.h"
#include "folio/core/logging.h"
#include "folio/core/string_utils.h"
#include <algorithm>

namespace folio::surface {

namespace {

// Visible UTF-16 units among the first `rawLimit` raw units of a text node.
std::uint32_t visibleUnits(std::string_view text, std::uint32_t rawLimit) {
    std::uint32_t raw = 0;
    std::uint32_t visible = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(text, pos, byteLen);
        if (byteLen == 0) break;
        const std::uint32_t units = utf16Units(cp);
        if (raw + units > rawLimit) {
            // Limit falls inside a surrogate pair.
            if (!isPlaceholder(cp)) visible += rawLimit - raw;
            break;
        }
        raw += units;
        if (!isPlaceholder(cp)) visible += units;
        pos += byteLen;
    }
    return visible;
}

// Raw offset just past the `visible`-th visible unit; 0 for visible == 0.
// May point between the halves of a surrogate pair, as DOM offsets can.
std::uint32_t rawOffsetForVisible(std::string_view text, std::uint32_t visible) {
    std::uint32_t raw = 0;
    std::uint32_t seen = 0;
    std::size_t pos = 0;
    while (pos < text.size() && seen < visible) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(text, pos, byteLen);
        if (byteLen == 0) break;
        const std::uint32_t units = utf16Units(cp);
        if (!isPlaceholder(cp) && seen + units > visible) {
            raw += visible - seen;
            break;
        }
        raw += units;
        if (!isPlaceholder(cp)) seen += units;
        pos += byteLen;
    }
    return raw;
}

// A <br> with inline content after it breaks the line; a trailing one only
// keeps an empty container open.
bool breaksLine(const Node& node) {
    if (!node.isLineBreak() || !node.parent()) return false;
    const Node* next = node.parent()->child(node.indexInParent() + 1);
    return next && !next->isBlock();
}

std::uint32_t nodeLength(const Node& node) {
    if (node.isText()) {
        return visibleUnits(node.text(), UINT32_MAX);
    }
    if (node.isLineBreak()) {
        return breaksLine(node) ? 1 : 0;
    }
    std::uint32_t total = 0;
    for (std::size_t i = 0; i < node.childCount(); ++i) {
        total += nodeLength(*node.child(i));
    }
    return total;
}

std::uint32_t segmentLength(const Node& root, const LineSegment& seg) {
    std::uint32_t total = 0;
    for (std::size_t i = seg.firstChild; i < seg.lastChild; ++i) {
        total += nodeLength(*root.child(i));
    }
    return total;
}

void appendVisible(std::string& out, const Node& node) {
    if (node.isText()) {
        const std::string& text = node.text();
        std::size_t pos = 0;
        while (pos < text.size()) {
            std::uint32_t byteLen = 0;
            const std::uint32_t cp = decodeUtf8Codepoint(text, pos, byteLen);
            if (byteLen == 0) break;
            if (!isPlaceholder(cp)) out.append(text, pos, byteLen);
            pos += byteLen;
        }
        return;
    }
    if (breaksLine(node)) {
        out.push_back('\n');
        return;
    }
    for (std::size_t i = 0; i < node.childCount(); ++i) {
        appendVisible(out, *node.child(i));
    }
}

// Accumulate visible text preceding `position` in document order.
// Returns true once the position's node has been reached.
bool measureUntil(const Node& node, const DomPosition& position, std::uint32_t& acc) {
    if (&node == position.node) {
        if (node.isText()) {
            acc += visibleUnits(node.text(), position.offset);
        } else {
            const std::size_t limit = std::min<std::size_t>(position.offset, node.childCount());
            for (std::size_t i = 0; i < limit; ++i) {
                acc += nodeLength(*node.child(i));
            }
        }
        return true;
    }
    if (node.isText() || node.isLineBreak()) {
        acc += nodeLength(node);
        return false;
    }
    for (std::size_t i = 0; i < node.childCount(); ++i) {
        if (measureUntil(*node.child(i), position, acc)) return true;
    }
    return false;
}

// First text node or line break (document order) able to hold `local` visible units.
bool locateText(const Node& node, std::uint32_t& local, DomPosition& out) {
    if (node.isText()) {
        const std::uint32_t length = nodeLength(node);
        if (local <= length) {
            out = DomPosition{&node, rawOffsetForVisible(node.text(), local)};
            return true;
        }
        local -= length;
        return false;
    }
    if (breaksLine(node)) {
        const Node* parent = node.parent();
        const auto index = static_cast<std::uint32_t>(node.indexInParent());
        if (local == 0) {
            out = DomPosition{parent, index};
            return true;
        }
        local -= 1;
        if (local == 0) {
            out = DomPosition{parent, index + 1};
            return true;
        }
        return false;
    }
    for (std::size_t i = 0; i < node.childCount(); ++i) {
        if (locateText(*node.child(i), local, out)) return true;
    }
    return false;
}

const Node* lastTextNode(const Node& node) {
    if (node.isText()) return &node;
    for (std::size_t i = node.childCount(); i > 0; --i) {
        if (const Node* found = lastTextNode(*node.child(i - 1))) return found;
    }
    return nullptr;
}

} // namespace

bool isPlaceholder(std::uint32_t codepoint) {
    return codepoint == editor_constants::PLACEHOLDER_ZWSP || codepoint == editor_constants::PLACEHOLDER_BOM;
}

std::vector<LineSegment> collectSegments(const Node& root) {
    std::vector<LineSegment> segments;
    const std::size_t count = root.childCount();
    std::size_t i = 0;
    while (i < count) {
        const Node* child = root.child(i);
        if (child->isBlock()) {
            segments.push_back(LineSegment{child, i, i + 1, false});
            ++i;
            continue;
        }
        const std::size_t first = i;
        while (i < count && !root.child(i)->isBlock()) {
            ++i;
        }
        segments.push_back(LineSegment{&root, first, i, true});
    }
    return segments;
}

std::string extractText(const Node& root) {
    std::string out;
    bool first = true;
    for (const LineSegment& seg : collectSegments(root)) {
        if (!first) out.push_back('\n');
        first = false;
        for (std::size_t i = seg.firstChild; i < seg.lastChild; ++i) {
            appendVisible(out, *root.child(i));
        }
    }
    return out;
}

std::uint32_t textLength(const Node& root) {
    const std::vector<LineSegment> segments = collectSegments(root);
    std::uint32_t total = 0;
    for (const LineSegment& seg : segments) {
        total += segmentLength(root, seg);
    }
    if (!segments.empty()) {
        total += static_cast<std::uint32_t>(segments.size() - 1);
    }
    return total;
}

// =============================================================================
// DOM position -> logical offset
// =============================================================================

std::uint32_t toOffset(const Node& root, const DomPosition& position) {
    if (!position.node || !root.contains(position.node)) {
        FOLIO_LOG_DEBUG("toOffset: position outside surface, parking at end");
        return textLength(root);
    }

    const std::vector<LineSegment> segments = collectSegments(root);

    // Boundary point between root children.
    if (position.node == &root) {
        std::uint32_t start = 0;
        for (const LineSegment& seg : segments) {
            if (position.offset <= seg.firstChild) {
                return start;
            }
            if (position.offset < seg.lastChild) {
                std::uint32_t acc = 0;
                for (std::size_t i = seg.firstChild; i < position.offset; ++i) {
                    acc += nodeLength(*root.child(i));
                }
                return start + acc;
            }
            start += segmentLength(root, seg) + 1;
        }
        return textLength(root);
    }

    const Node* top = position.node;
    while (top->parent() != &root) {
        top = top->parent();
    }
    const std::size_t childIndex = top->indexInParent();

    std::uint32_t start = 0;
    for (const LineSegment& seg : segments) {
        if (childIndex >= seg.firstChild && childIndex < seg.lastChild) {
            std::uint32_t acc = 0;
            for (std::size_t i = seg.firstChild; i < seg.lastChild; ++i) {
                if (measureUntil(*root.child(i), position, acc)) break;
            }
            return start + acc;
        }
        start += segmentLength(root, seg) + 1;
    }
    return textLength(root);
}

// =============================================================================
// Logical offset -> DOM position
// =============================================================================

DomPosition toPosition(const Node& root, std::uint32_t offset) {
    const std::vector<LineSegment> segments = collectSegments(root);
    if (segments.empty()) {
        return DomPosition{&root, 0};
    }

    std::uint32_t start = 0;
    for (const LineSegment& seg : segments) {
        const std::uint32_t length = segmentLength(root, seg);
        if (offset <= start + length) {
            std::uint32_t local = offset - start;
            DomPosition found;
            for (std::size_t i = seg.firstChild; i < seg.lastChild; ++i) {
                if (locateText(*root.child(i), local, found)) return found;
            }
            // Line without text nodes (empty div, lone <br>).
            if (seg.implicit) {
                return DomPosition{&root, static_cast<std::uint32_t>(seg.firstChild)};
            }
            return DomPosition{seg.container, 0};
        }
        start += length + 1;
    }

    if (const Node* last = lastTextNode(root)) {
        return DomPosition{last, last->domLength()};
    }
    const LineSegment& tail = segments.back();
    if (tail.implicit) {
        return DomPosition{&root, static_cast<std::uint32_t>(tail.lastChild)};
    }
    return DomPosition{tail.container, tail.container->domLength()};
}

// =============================================================================
// Ranges
// =============================================================================

text::SelectionRange toSelectionRange(const Node& root, const DomRange& range) {
    std::uint32_t start = toOffset(root, range.start);
    std::uint32_t end = toOffset(root, range.end);
    if (start > end) std::swap(start, end);
    return text::SelectionRange{start, end};
}

DomRange toDomRange(const Node& root, const text::SelectionRange& range) {
    return DomRange{toPosition(root, range.start), toPosition(root, range.end)};
}

bool touchesSurface(const Node& root, const DomRange& range) {
    return (range.start.node && root.contains(range.start.node))
        || (range.end.node && root.contains(range.end.node));
}

} // namespace folio::surface
