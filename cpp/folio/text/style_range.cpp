#include "folio/text/style_range.h"
#include "folio/core/string_utils.h"
#include <algorithm>

namespace folio::text {

SpanList applyStyleToSpans(
    const SpanList& spans,
    const std::optional<SelectionRange>& range,
    const TextStylePatch& update,
    const TextStyle& defaults
) {
    if (!range || spans.empty()) {
        return spans;
    }

    std::uint32_t start = range->start;
    std::uint32_t end = range->end;
    if (start > end) std::swap(start, end);

    auto restyle = [&](const TextStyle& current) {
        return mergeStyle(defaults, toPatch(current), update);
    };

    SpanList out;
    out.reserve(spans.size() + 2);

    // Caret-only: restyle the run the caret sits in (typing style).
    if (start == end) {
        out = spans;
        std::uint32_t spanStart = 0;
        for (TextSpan& span : out) {
            const std::uint32_t spanEnd = spanStart + logicalLength(span.text);
            if (start >= spanStart && start <= spanEnd) {
                span.style = restyle(span.style);
                break;
            }
            spanStart = spanEnd;
        }
        const TextStyle fallback = out.front().style;
        normalizeSpans(out, fallback);
        return out;
    }

    // Range: split every touched span into pre / selected / post parts.
    std::uint32_t spanStart = 0;
    for (const TextSpan& span : spans) {
        const std::uint32_t spanLength = logicalLength(span.text);
        const std::uint32_t spanEnd = spanStart + spanLength;
        const std::uint32_t selStart = std::max(spanStart, start);
        const std::uint32_t selEnd = std::min(spanEnd, end);

        if (selStart < selEnd) {
            const std::uint32_t preBytes = logicalToByteIndex(span.text, selStart - spanStart);
            const std::uint32_t postBytes = logicalToByteIndex(span.text, selEnd - spanStart);

            if (preBytes > 0) {
                out.push_back(TextSpan{span.text.substr(0, preBytes), span.style});
            }
            if (postBytes > preBytes) {
                out.push_back(TextSpan{span.text.substr(preBytes, postBytes - preBytes), restyle(span.style)});
            }
            if (postBytes < span.text.size()) {
                out.push_back(TextSpan{span.text.substr(postBytes), span.style});
            }
        } else {
            out.push_back(span);
        }

        spanStart = spanEnd;
    }

    const TextStyle fallback = out.empty() ? spans.front().style : out.front().style;
    normalizeSpans(out, fallback);
    return out;
}

} // namespace folio::text
