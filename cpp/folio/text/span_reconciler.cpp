#include "folio/text/span_reconciler.h"
#include "folio/core/logging.h"
#include "folio/core/string_utils.h"
#include <algorithm>

namespace folio::text {

namespace {

bool continuationAt(std::string_view s, std::size_t i) {
    return i < s.size() && isUtf8Continuation(static_cast<unsigned char>(s[i]));
}

// Style for text inserted at byte offset `offset` of the old text.
const TextStyle& styleAtBoundary(const SpanList& spans, std::size_t offset) {
    std::size_t spanStart = 0;
    for (const TextSpan& span : spans) {
        const std::size_t spanEnd = spanStart + span.text.size();
        if (offset >= spanStart && offset < spanEnd) {
            return span.style;
        }
        spanStart = spanEnd;
    }
    return spans.back().style;
}

// Append the part of `span` (which starts at spanStart) that lies inside [from, to).
void appendClipped(SpanList& out, const TextSpan& span, std::size_t spanStart, std::size_t from, std::size_t to) {
    const std::size_t spanEnd = spanStart + span.text.size();
    const std::size_t lo = std::max(spanStart, from);
    const std::size_t hi = std::min(spanEnd, to);
    if (lo >= hi) return;
    out.push_back(TextSpan{span.text.substr(lo - spanStart, hi - lo), span.style});
}

} // namespace

TextEdit computeTextEdit(std::string_view oldText, std::string_view newText) {
    const std::size_t oldLen = oldText.size();
    const std::size_t newLen = newText.size();
    const std::size_t minLen = std::min(oldLen, newLen);

    std::size_t prefix = 0;
    while (prefix < minLen && oldText[prefix] == newText[prefix]) {
        ++prefix;
    }
    while (prefix > 0 && (continuationAt(oldText, prefix) || continuationAt(newText, prefix))) {
        --prefix;
    }

    // Suffix search stops at the prefix boundary.
    const std::size_t maxSuffix = minLen - prefix;
    std::size_t suffix = 0;
    while (suffix < maxSuffix && oldText[oldLen - 1 - suffix] == newText[newLen - 1 - suffix]) {
        ++suffix;
    }
    while (suffix > 0 && (continuationAt(oldText, oldLen - suffix) || continuationAt(newText, newLen - suffix))) {
        --suffix;
    }

    TextEdit edit;
    edit.prefixBytes = static_cast<std::uint32_t>(prefix);
    edit.removed = std::string(oldText.substr(prefix, oldLen - suffix - prefix));
    edit.inserted = std::string(newText.substr(prefix, newLen - suffix - prefix));
    return edit;
}

SpanList reconcileSpans(std::string_view oldText, std::string_view newText, const SpanList& oldSpans) {
    if (oldText == newText) {
        return oldSpans;
    }

    const TextEdit edit = computeTextEdit(oldText, newText);
    const std::size_t head = edit.prefixBytes;
    const std::size_t tailStart = head + edit.removed.size();
    const std::size_t oldLen = oldText.size();

    const TextStyle middleStyle = oldSpans.empty() ? defaultTextStyle() : styleAtBoundary(oldSpans, head);

    SpanList out;
    out.reserve(oldSpans.size() + 2);

    std::size_t spanStart = 0;
    for (const TextSpan& span : oldSpans) {
        appendClipped(out, span, spanStart, 0, head);
        spanStart += span.text.size();
    }

    if (!edit.inserted.empty()) {
        out.push_back(TextSpan{edit.inserted, middleStyle});
    }

    spanStart = 0;
    for (const TextSpan& span : oldSpans) {
        appendClipped(out, span, spanStart, tailStart, oldLen);
        spanStart += span.text.size();
    }

    normalizeSpans(out, middleStyle);

    FOLIO_LOG_DEBUG("reconcile: prefix=%u removed=%zu inserted=%zu spans=%zu",
        edit.prefixBytes, edit.removed.size(), edit.inserted.size(), out.size());
    return out;
}

} // namespace folio::text
