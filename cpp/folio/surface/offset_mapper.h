#ifndef FOLIO_SURFACE_OFFSET_MAPPER_H
#define FOLIO_SURFACE_OFFSET_MAPPER_H

#include "folio/surface/node.h"
#include "folio/text/text_span.h"
#include <cstdint>
#include <string>
#include <vector>

namespace folio::surface {

/**
 * One line of the surface. A block child of the root (div, p) is a segment
 * on its own; a run of consecutive non-block root children forms an implicit
 * segment. Covers root children [firstChild, lastChild).
 */
struct LineSegment {
    const Node* container;      // block child, or the root for an implicit segment
    std::size_t firstChild;
    std::size_t lastChild;
    bool implicit;
};

std::vector<LineSegment> collectSegments(const Node& root);

/**
 * True for code points that never count as text (U+200B, U+FEFF).
 */
bool isPlaceholder(std::uint32_t codepoint);

/**
 * Visible text of the surface: segments joined with '\n', placeholders removed.
 */
std::string extractText(const Node& root);

/**
 * Logical length of extractText(root).
 */
std::uint32_t textLength(const Node& root);

/**
 * Map a DOM position to a logical offset. Positions outside root (or with
 * no node) map to the end of the text.
 */
std::uint32_t toOffset(const Node& root, const DomPosition& position);

/**
 * Map a logical offset to a DOM position. Offsets past the end resolve to
 * the end of the content. toOffset(root, toPosition(root, k)) == k for every
 * k in [0, textLength(root)].
 */
DomPosition toPosition(const Node& root, std::uint32_t offset);

/**
 * Logical selection for a DOM range, ordered so start <= end.
 */
text::SelectionRange toSelectionRange(const Node& root, const DomRange& range);

/**
 * DOM range for a logical selection, used to restore the caret.
 */
DomRange toDomRange(const Node& root, const text::SelectionRange& range);

/**
 * True if either end of the range lies inside root.
 */
bool touchesSurface(const Node& root, const DomRange& range);

} // namespace folio::surface

#endif // FOLIO_SURFACE_OFFSET_MAPPER_H
