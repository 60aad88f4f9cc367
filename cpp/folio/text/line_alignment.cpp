#include "folio/text/line_alignment.h"
#include "folio/core/string_utils.h"
#include <algorithm>

namespace folio::text {

TextAlign effectiveAlignment(const LineAlignments& alignments, std::uint32_t line, TextAlign blockAlign) {
    if (line < alignments.size() && alignments[line]) {
        return *alignments[line];
    }
    return blockAlign;
}

void insertLineBreaks(LineAlignments& alignments, std::uint32_t line, std::uint32_t count, TextAlign blockAlign) {
    if (count == 0) return;

    const TextAlign inherited = effectiveAlignment(alignments, line, blockAlign);
    const std::size_t at = static_cast<std::size_t>(line) + 1;

    // Nothing to shift and nothing to record.
    if (at >= alignments.size() && inherited == blockAlign) {
        return;
    }

    if (alignments.size() < at) {
        alignments.resize(at);
    }
    alignments.insert(alignments.begin() + static_cast<std::ptrdiff_t>(at), count, inherited);
}

void removeLineBreaks(LineAlignments& alignments, std::uint32_t line, std::uint32_t count) {
    const std::size_t first = static_cast<std::size_t>(line) + 1;
    if (count == 0 || first >= alignments.size()) return;

    const std::size_t last = std::min(alignments.size(), first + count);
    alignments.erase(
        alignments.begin() + static_cast<std::ptrdiff_t>(first),
        alignments.begin() + static_cast<std::ptrdiff_t>(last));
}

void canonicalizeAlignments(LineAlignments& alignments, TextAlign blockAlign) {
    const bool anyOverride = std::any_of(alignments.begin(), alignments.end(),
        [blockAlign](const std::optional<TextAlign>& a) { return a && *a != blockAlign; });
    if (!anyOverride) {
        alignments.clear();
    }
}

void applyTextEdit(LineAlignments& alignments, std::string_view oldText, const TextEdit& edit, TextAlign blockAlign) {
    const std::size_t prefix = std::min<std::size_t>(edit.prefixBytes, oldText.size());
    const std::uint32_t line = countChar(oldText.substr(0, prefix), '\n');

    removeLineBreaks(alignments, line, countChar(edit.removed, '\n'));
    insertLineBreaks(alignments, line, countChar(edit.inserted, '\n'), blockAlign);

    const std::uint32_t newLineCount = countChar(oldText, '\n')
        - countChar(edit.removed, '\n')
        + countChar(edit.inserted, '\n')
        + 1;
    if (alignments.size() > newLineCount) {
        alignments.resize(newLineCount);
    }

    canonicalizeAlignments(alignments, blockAlign);
}

void setAlignment(
    LineAlignments& alignments,
    TextAlign& blockAlign,
    std::string_view text,
    const std::optional<SelectionRange>& range,
    TextAlign align
) {
    if (!range) {
        blockAlign = align;
        alignments.clear();
        return;
    }

    const std::uint32_t startLogical = std::min(range->start, range->end);
    const std::uint32_t endLogical = std::max(range->start, range->end);
    const std::uint32_t startByte = logicalToByteIndex(text, startLogical);
    const std::uint32_t endByte = logicalToByteIndex(text, endLogical);

    const std::uint32_t firstLine = countChar(text.substr(0, startByte), '\n');
    const std::uint32_t lastLine = countChar(text.substr(0, endByte), '\n');

    if (alignments.size() <= lastLine) {
        alignments.resize(static_cast<std::size_t>(lastLine) + 1);
    }
    for (std::uint32_t line = firstLine; line <= lastLine; ++line) {
        alignments[line] = align;
    }

    canonicalizeAlignments(alignments, blockAlign);
}

} // namespace folio::text
