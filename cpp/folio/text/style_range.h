#ifndef FOLIO_TEXT_STYLE_RANGE_H
#define FOLIO_TEXT_STYLE_RANGE_H

#include "folio/text/text_span.h"
#include "folio/text/text_style.h"
#include <optional>

namespace folio::text {

/**
 * Apply a partial style to a logical range of a span list.
 *
 * - no range: spans are returned as-is
 * - collapsed range: the first span whose closed interval [start, end]
 *   holds the offset is restyled (the typing style)
 * - otherwise each span overlapping [start, end) is split into
 *   before / styled / after parts
 *
 * Styled parts resolve as defaults <- span style <- update. The result is
 * normalized (merged, no empty spans, at least one span).
 */
SpanList applyStyleToSpans(
    const SpanList& spans,
    const std::optional<SelectionRange>& range,
    const TextStylePatch& update,
    const TextStyle& defaults = defaultTextStyle()
);

} // namespace folio::text

#endif // FOLIO_TEXT_STYLE_RANGE_H
