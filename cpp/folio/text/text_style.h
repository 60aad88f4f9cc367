#ifndef FOLIO_TEXT_STYLE_H
#define FOLIO_TEXT_STYLE_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace folio::text {

// ============================================================================
// Alignment
// ============================================================================

enum class TextAlign : std::uint8_t {
    Left   = 0,
    Center = 1,
    Right  = 2,
};

enum class VerticalAlign : std::uint8_t {
    Top    = 0,
    Middle = 1,
    Bottom = 2,
};

const char* toCssKeyword(TextAlign align);
const char* toCssKeyword(VerticalAlign align);
std::optional<TextAlign> parseTextAlign(std::string_view keyword);
std::optional<VerticalAlign> parseVerticalAlign(std::string_view keyword);

// ============================================================================
// Text Style
// ============================================================================

/**
 * Character style of a run. A value type: two styles are equal when every
 * field is equal.
 */
struct TextStyle {
    std::string fontFamily;
    float fontSize;             // CSS px, > 0
    int fontWeight;             // 100-900
    std::string color;          // CSS color string
    std::string textShadow;     // CSS shadow syntax, or empty
    float lineHeight;           // multiple of fontSize, > 0

    bool operator==(const TextStyle& other) const;
    bool operator!=(const TextStyle& other) const { return !(*this == other); }
};

/**
 * Partial style carried by a style command. Unset fields leave the
 * underlying value alone.
 */
struct TextStylePatch {
    std::optional<std::string> fontFamily;
    std::optional<float> fontSize;
    std::optional<int> fontWeight;
    std::optional<std::string> color;
    std::optional<std::string> textShadow;
    std::optional<float> lineHeight;

    bool empty() const;
};

TextStyle defaultTextStyle();

/**
 * Resolve a style as defaults <- existing <- patch.
 * Out-of-range patch values (non-positive sizes, weights outside 100-900)
 * are skipped.
 */
TextStyle mergeStyle(const TextStyle& defaults, const TextStylePatch& existing, const TextStylePatch& patch);
TextStyle mergeStyle(const TextStyle& existing, const TextStylePatch& patch);

TextStylePatch toPatch(const TextStyle& style);

/**
 * CSS declarations for an inline span, e.g. "font-family: Heebo; font-size: 16px; ...".
 */
std::string toCssDeclarations(const TextStyle& style);

} // namespace folio::text

#endif // FOLIO_TEXT_STYLE_H
