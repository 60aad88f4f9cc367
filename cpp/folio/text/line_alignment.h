#ifndef FOLIO_TEXT_LINE_ALIGNMENT_H
#define FOLIO_TEXT_LINE_ALIGNMENT_H

#include "folio/text/span_reconciler.h"
#include "folio/text/text_span.h"
#include "folio/text/text_style.h"
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace folio::text {

// Sparse per-line alignment overrides, indexed by '\n'-delimited line.
// A missing or empty slot means "use the block alignment".
// Canonical form: empty whenever every defined slot equals the block alignment.
using LineAlignments = std::vector<std::optional<TextAlign>>;

TextAlign effectiveAlignment(const LineAlignments& alignments, std::uint32_t line, TextAlign blockAlign);

/**
 * Line `line` was split `count` times: each new line inherits the effective
 * alignment of `line`; later slots shift right.
 */
void insertLineBreaks(LineAlignments& alignments, std::uint32_t line, std::uint32_t count, TextAlign blockAlign);

/**
 * `count` newlines following line `line` were deleted: slots line+1 ..
 * line+count are dropped; later slots shift left.
 */
void removeLineBreaks(LineAlignments& alignments, std::uint32_t line, std::uint32_t count);

/**
 * Collapse to an empty array when no slot deviates from the block alignment.
 */
void canonicalizeAlignments(LineAlignments& alignments, TextAlign blockAlign);

/**
 * Fold a reconciler edit of oldText into the overrides and canonicalize.
 */
void applyTextEdit(LineAlignments& alignments, std::string_view oldText, const TextEdit& edit, TextAlign blockAlign);

/**
 * Alignment command. With no range the block alignment changes and all
 * overrides are cleared; otherwise every line the range touches (the caret
 * line for a collapsed range) gets an override.
 */
void setAlignment(
    LineAlignments& alignments,
    TextAlign& blockAlign,
    std::string_view text,
    const std::optional<SelectionRange>& range,
    TextAlign align
);

} // namespace folio::text

#endif // FOLIO_TEXT_LINE_ALIGNMENT_H
