#ifndef FOLIO_TEXT_SPAN_H
#define FOLIO_TEXT_SPAN_H

#include "folio/text/text_style.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace folio::text {

// A "span" is a maximal run of characters sharing one style.
// Rich text = an ordered list of spans whose texts concatenate to the full text.
struct TextSpan {
    std::string text;   // UTF-8
    TextStyle style;

    bool operator==(const TextSpan& other) const { return text == other.text && style == other.style; }
    bool operator!=(const TextSpan& other) const { return !(*this == other); }
};

using SpanList = std::vector<TextSpan>;

// Selection in logical offsets (UTF-16 code units) into the joined span text.
// Absence (std::nullopt) means "whole element, no text selection".
struct SelectionRange {
    std::uint32_t start;
    std::uint32_t end;

    bool collapsed() const { return start == end; }
    bool operator==(const SelectionRange& other) const { return start == other.start && end == other.end; }
    bool operator!=(const SelectionRange& other) const { return !(*this == other); }
};

/**
 * Concatenate all span texts.
 */
std::string joinSpanText(const SpanList& spans);

/**
 * Logical length (UTF-16 code units) of the joined text.
 */
std::uint32_t spanTextLength(const SpanList& spans);

/**
 * Restore the sequence invariants in place:
 * - adjacent spans with equal styles are merged
 * - empty spans are dropped
 * - at least one span remains; an empty result keeps one empty span styled
 *   with fallbackStyle
 */
void normalizeSpans(SpanList& spans, const TextStyle& fallbackStyle);

/**
 * True if the sequence satisfies the invariants normalizeSpans establishes.
 */
bool isNormalized(const SpanList& spans);

/**
 * Style shown for a selection: the span holding range->start, else the first span.
 * With no range, the first span's style. Requires a non-empty list.
 */
const TextStyle& activeStyleAt(const SpanList& spans, const std::optional<SelectionRange>& range);

} // namespace folio::text

#endif // FOLIO_TEXT_SPAN_H
