#ifndef FOLIO_TEXT_SPAN_RECONCILER_H
#define FOLIO_TEXT_SPAN_RECONCILER_H

#include "folio/text/text_span.h"
#include <cstdint>
#include <string>
#include <string_view>

namespace folio::text {

/**
 * Minimal description of an external text mutation:
 * old[prefixBytes, prefixBytes + removed.size()) was replaced by `inserted`.
 * Byte offsets always fall on UTF-8 code point boundaries.
 */
struct TextEdit {
    std::uint32_t prefixBytes = 0;
    std::string removed;
    std::string inserted;

    bool empty() const { return removed.empty() && inserted.empty(); }
};

/**
 * Diff two texts by common prefix and common suffix. The suffix never overlaps
 * the prefix, so a full replacement yields prefixBytes == 0 and the whole old
 * text in `removed`.
 */
TextEdit computeTextEdit(std::string_view oldText, std::string_view newText);

/**
 * Rebuild the span list after the surface changed oldText into newText.
 *
 * Text outside the changed region keeps its per-character style. Inserted text
 * takes the style of the span holding the prefix boundary (the following span
 * when the boundary falls between spans, the last span when it is past the end).
 * Returns oldSpans unchanged when the texts are equal.
 */
SpanList reconcileSpans(std::string_view oldText, std::string_view newText, const SpanList& oldSpans);

} // namespace folio::text

#endif // FOLIO_TEXT_SPAN_RECONCILER_H
