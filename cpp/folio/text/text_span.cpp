#include "folio/text/text_span.h"
#include "folio/core/string_utils.h"

namespace folio::text {

std::string joinSpanText(const SpanList& spans) {
    std::size_t total = 0;
    for (const TextSpan& span : spans) total += span.text.size();

    std::string out;
    out.reserve(total);
    for (const TextSpan& span : spans) out += span.text;
    return out;
}

std::uint32_t spanTextLength(const SpanList& spans) {
    std::uint32_t length = 0;
    for (const TextSpan& span : spans) length += logicalLength(span.text);
    return length;
}

void normalizeSpans(SpanList& spans, const TextStyle& fallbackStyle) {
    SpanList merged;
    merged.reserve(spans.size());

    for (TextSpan& span : spans) {
        if (span.text.empty()) continue;
        if (!merged.empty() && merged.back().style == span.style) {
            merged.back().text += span.text;
        } else {
            merged.push_back(std::move(span));
        }
    }

    if (merged.empty()) {
        merged.push_back(TextSpan{std::string(), fallbackStyle});
    }

    spans = std::move(merged);
}

bool isNormalized(const SpanList& spans) {
    if (spans.empty()) return false;
    if (spans.size() == 1) return true;
    for (std::size_t i = 0; i < spans.size(); ++i) {
        if (spans[i].text.empty()) return false;
        if (i > 0 && spans[i - 1].style == spans[i].style) return false;
    }
    return true;
}

const TextStyle& activeStyleAt(const SpanList& spans, const std::optional<SelectionRange>& range) {
    if (!range) return spans.front().style;

    std::uint32_t spanStart = 0;
    for (const TextSpan& span : spans) {
        const std::uint32_t spanEnd = spanStart + logicalLength(span.text);
        if (range->start >= spanStart && range->start < spanEnd) {
            return span.style;
        }
        spanStart = spanEnd;
    }
    return spans.front().style;
}

} // namespace folio::text
