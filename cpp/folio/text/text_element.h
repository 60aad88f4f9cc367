#ifndef FOLIO_TEXT_ELEMENT_H
#define FOLIO_TEXT_ELEMENT_H

#include "folio/text/line_alignment.h"
#include "folio/text/text_span.h"
#include "folio/text/text_style.h"
#include <cstdint>
#include <optional>
#include <string>

namespace folio::text {

/**
 * A text item placed on the canvas.
 *
 * The span list is the only source of truth for the text; any rendering of
 * it (see folio/surface) is disposable.
 */
struct TextElement {
    std::uint32_t id = 0;

    // Placement (local frame, CSS px / degrees)
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    float rotation = 0.0f;
    int zIndex = 0;

    // Content
    SpanList spans;

    // Block layout
    TextAlign textAlign = TextAlign::Left;
    LineAlignments lineAlignments;      // canonical: empty when nothing deviates
    VerticalAlign verticalAlign = VerticalAlign::Top;
    float letterSpacing = 0.0f;
    float padding = 0.0f;
    std::optional<float> scaleX;
    std::optional<float> scaleY;

    std::string text() const { return joinSpanText(spans); }
};

} // namespace folio::text

#endif // FOLIO_TEXT_ELEMENT_H
