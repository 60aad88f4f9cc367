#ifndef FOLIO_PERSISTENCE_TEXT_ELEMENT_JSON_H
#define FOLIO_PERSISTENCE_TEXT_ELEMENT_JSON_H

#include "folio/text/text_element.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace folio::persistence {

using json = nlohmann::json;

json textStyleToJson(const text::TextStyle& style);

/**
 * Read the style keys that are present and well-typed; everything else is
 * left unset.
 */
text::TextStylePatch textStylePatchFromJson(const json& js);

/**
 * Plain JSON form of an element: {type, id, x, y, width, height, rotation,
 * zIndex, spans: [{text, style}], textAlign, lineAlignments (null for lines
 * without an override), verticalAlign, letterSpacing, padding[, scaleX,
 * scaleY]}.
 */
json textElementToJson(const text::TextElement& element);

/**
 * Lenient loader. Missing fields keep their defaults, missing style keys
 * resolve against `defaults`, and a missing or empty span list becomes one
 * empty span. Returns nullopt (with a warning) when the document is not an
 * object, is not a text element, or its spans are not an array.
 */
std::optional<text::TextElement> textElementFromJson(
    const json& js,
    const text::TextStyle& defaults = text::defaultTextStyle()
);

std::string serializeTextElement(const text::TextElement& element);

/**
 * Parse and load in one step; malformed JSON yields nullopt.
 */
std::optional<text::TextElement> parseTextElement(
    std::string_view source,
    const text::TextStyle& defaults = text::defaultTextStyle()
);

} // namespace folio::persistence

#endif // FOLIO_PERSISTENCE_TEXT_ELEMENT_JSON_H
