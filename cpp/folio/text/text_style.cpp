#include "folio/text/text_style.h"
#include "folio/core/editor_constants.h"
#include "folio/core/logging.h"
#include <cstdio>

namespace folio::text {

namespace {

namespace ec = folio::editor_constants;

std::string formatNumber(float v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", static_cast<double>(v));
    return std::string(buf);
}

// Layers a patch onto a resolved style, skipping values a style cannot hold.
void overlay(TextStyle& style, const TextStylePatch& patch) {
    if (patch.fontFamily) style.fontFamily = *patch.fontFamily;
    if (patch.fontSize) {
        if (*patch.fontSize > 0.0f) {
            style.fontSize = *patch.fontSize;
        } else {
            FOLIO_LOG_WARN("ignoring fontSize %f", static_cast<double>(*patch.fontSize));
        }
    }
    if (patch.fontWeight) {
        if (*patch.fontWeight >= ec::MIN_FONT_WEIGHT && *patch.fontWeight <= ec::MAX_FONT_WEIGHT) {
            style.fontWeight = *patch.fontWeight;
        } else {
            FOLIO_LOG_WARN("ignoring fontWeight %d", *patch.fontWeight);
        }
    }
    if (patch.color) style.color = *patch.color;
    if (patch.textShadow) style.textShadow = *patch.textShadow;
    if (patch.lineHeight) {
        if (*patch.lineHeight > 0.0f) {
            style.lineHeight = *patch.lineHeight;
        } else {
            FOLIO_LOG_WARN("ignoring lineHeight %f", static_cast<double>(*patch.lineHeight));
        }
    }
}

} // namespace

const char* toCssKeyword(TextAlign align) {
    switch (align) {
        case TextAlign::Left: return "left";
        case TextAlign::Center: return "center";
        case TextAlign::Right: return "right";
    }
    return "left";
}

const char* toCssKeyword(VerticalAlign align) {
    switch (align) {
        case VerticalAlign::Top: return "top";
        case VerticalAlign::Middle: return "middle";
        case VerticalAlign::Bottom: return "bottom";
    }
    return "top";
}

std::optional<TextAlign> parseTextAlign(std::string_view keyword) {
    if (keyword == "left") return TextAlign::Left;
    if (keyword == "center") return TextAlign::Center;
    if (keyword == "right") return TextAlign::Right;
    return std::nullopt;
}

std::optional<VerticalAlign> parseVerticalAlign(std::string_view keyword) {
    if (keyword == "top") return VerticalAlign::Top;
    if (keyword == "middle") return VerticalAlign::Middle;
    if (keyword == "bottom") return VerticalAlign::Bottom;
    return std::nullopt;
}

bool TextStyle::operator==(const TextStyle& other) const {
    return fontFamily == other.fontFamily
        && fontSize == other.fontSize
        && fontWeight == other.fontWeight
        && color == other.color
        && textShadow == other.textShadow
        && lineHeight == other.lineHeight;
}

bool TextStylePatch::empty() const {
    return !fontFamily && !fontSize && !fontWeight && !color && !textShadow && !lineHeight;
}

TextStyle defaultTextStyle() {
    TextStyle style;
    style.fontFamily = ec::DEFAULT_FONT_FAMILY;
    style.fontSize = ec::DEFAULT_FONT_SIZE;
    style.fontWeight = ec::DEFAULT_FONT_WEIGHT;
    style.color = ec::DEFAULT_COLOR;
    style.textShadow.clear();
    style.lineHeight = ec::DEFAULT_LINE_HEIGHT;
    return style;
}

TextStyle mergeStyle(const TextStyle& defaults, const TextStylePatch& existing, const TextStylePatch& patch) {
    TextStyle out = defaults;
    overlay(out, existing);
    overlay(out, patch);
    return out;
}

TextStyle mergeStyle(const TextStyle& existing, const TextStylePatch& patch) {
    TextStyle out = existing;
    overlay(out, patch);
    return out;
}

TextStylePatch toPatch(const TextStyle& style) {
    TextStylePatch patch;
    patch.fontFamily = style.fontFamily;
    patch.fontSize = style.fontSize;
    patch.fontWeight = style.fontWeight;
    patch.color = style.color;
    patch.textShadow = style.textShadow;
    patch.lineHeight = style.lineHeight;
    return patch;
}

std::string toCssDeclarations(const TextStyle& style) {
    std::string css;
    css.reserve(128);
    css += "font-family: ";
    css += style.fontFamily;
    css += "; font-size: ";
    css += formatNumber(style.fontSize);
    css += "px; font-weight: ";
    css += std::to_string(style.fontWeight);
    css += "; color: ";
    css += style.color;
    if (!style.textShadow.empty()) {
        css += "; text-shadow: ";
        css += style.textShadow;
    }
    css += "; line-height: ";
    css += formatNumber(style.lineHeight);
    return css;
}

} // namespace folio::text
