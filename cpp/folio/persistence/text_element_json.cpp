#include "folio/persistence/text_element_json.h"
#include "folio/core/logging.h"
#include <cmath>
#include <limits>

namespace folio::persistence {

namespace {

constexpr const char* kElementType = "text";

void readFloat(const json& js, const char* key, float& out) {
    if (js.contains(key) && js[key].is_number()) {
        out = js[key].get<float>();
    }
}

// Integral value of a numeric field; nullopt (with a warning) when it is not
// finite or does not fit an int.
std::optional<int> readInt(const json& js, const char* key) {
    if (!js.contains(key) || !js[key].is_number()) return std::nullopt;
    const double value = js[key].get<double>();
    if (!std::isfinite(value)
        || value < static_cast<double>(std::numeric_limits<int>::min())
        || value > static_cast<double>(std::numeric_limits<int>::max())) {
        FOLIO_LOG_WARN("ignoring out-of-range '%s'", key);
        return std::nullopt;
    }
    return static_cast<int>(value);
}

void readOptionalFloat(const json& js, const char* key, std::optional<float>& out) {
    if (js.contains(key) && js[key].is_number()) {
        out = js[key].get<float>();
    }
}

json lineAlignmentsToJson(const text::LineAlignments& alignments) {
    json arr = json::array();
    for (const std::optional<text::TextAlign>& a : alignments) {
        if (a) {
            arr.push_back(text::toCssKeyword(*a));
        } else {
            arr.push_back(nullptr);
        }
    }
    return arr;
}

text::LineAlignments lineAlignmentsFromJson(const json& arr) {
    text::LineAlignments out;
    if (!arr.is_array()) return out;
    out.reserve(arr.size());
    for (const json& entry : arr) {
        std::optional<text::TextAlign> align;
        if (entry.is_string()) {
            align = text::parseTextAlign(entry.get<std::string>());
        }
        out.push_back(align);
    }
    return out;
}

} // namespace

// =============================================================================
// Style
// =============================================================================

json textStyleToJson(const text::TextStyle& style) {
    json js;
    js["fontFamily"] = style.fontFamily;
    js["fontSize"] = style.fontSize;
    js["fontWeight"] = style.fontWeight;
    js["color"] = style.color;
    js["textShadow"] = style.textShadow;
    js["lineHeight"] = style.lineHeight;
    return js;
}

text::TextStylePatch textStylePatchFromJson(const json& js) {
    text::TextStylePatch patch;
    if (!js.is_object()) return patch;

    if (js.contains("fontFamily") && js["fontFamily"].is_string())
        patch.fontFamily = js["fontFamily"].get<std::string>();
    if (js.contains("fontSize") && js["fontSize"].is_number())
        patch.fontSize = js["fontSize"].get<float>();
    if (const auto weight = readInt(js, "fontWeight"))
        patch.fontWeight = *weight;
    if (js.contains("color") && js["color"].is_string())
        patch.color = js["color"].get<std::string>();
    if (js.contains("textShadow") && js["textShadow"].is_string())
        patch.textShadow = js["textShadow"].get<std::string>();
    if (js.contains("lineHeight") && js["lineHeight"].is_number())
        patch.lineHeight = js["lineHeight"].get<float>();
    return patch;
}

// =============================================================================
// Element
// =============================================================================

json textElementToJson(const text::TextElement& element) {
    json js;
    js["type"] = kElementType;
    js["id"] = element.id;
    js["x"] = element.x;
    js["y"] = element.y;
    js["width"] = element.width;
    js["height"] = element.height;
    js["rotation"] = element.rotation;
    js["zIndex"] = element.zIndex;

    json spans = json::array();
    for (const text::TextSpan& span : element.spans) {
        spans.push_back(json{{"text", span.text}, {"style", textStyleToJson(span.style)}});
    }
    js["spans"] = std::move(spans);

    js["textAlign"] = text::toCssKeyword(element.textAlign);
    js["lineAlignments"] = lineAlignmentsToJson(element.lineAlignments);
    js["verticalAlign"] = text::toCssKeyword(element.verticalAlign);
    js["letterSpacing"] = element.letterSpacing;
    js["padding"] = element.padding;
    if (element.scaleX) js["scaleX"] = *element.scaleX;
    if (element.scaleY) js["scaleY"] = *element.scaleY;
    return js;
}

std::optional<text::TextElement> textElementFromJson(const json& js, const text::TextStyle& defaults) {
    if (!js.is_object()) {
        FOLIO_LOG_WARN("textElementFromJson: document is not an object");
        return std::nullopt;
    }
    if (js.contains("type") && (!js["type"].is_string() || js["type"].get<std::string>() != kElementType)) {
        FOLIO_LOG_WARN("textElementFromJson: not a text element");
        return std::nullopt;
    }
    if (js.contains("spans") && !js["spans"].is_array()) {
        FOLIO_LOG_WARN("textElementFromJson: 'spans' is not an array");
        return std::nullopt;
    }

    text::TextElement element;
    if (js.contains("id") && js["id"].is_number_unsigned()) {
        const std::uint64_t id = js["id"].get<std::uint64_t>();
        if (id <= std::numeric_limits<std::uint32_t>::max()) {
            element.id = static_cast<std::uint32_t>(id);
        } else {
            FOLIO_LOG_WARN("textElementFromJson: ignoring out-of-range id");
        }
    }
    readFloat(js, "x", element.x);
    readFloat(js, "y", element.y);
    readFloat(js, "width", element.width);
    readFloat(js, "height", element.height);
    readFloat(js, "rotation", element.rotation);
    if (const auto z = readInt(js, "zIndex"))
        element.zIndex = *z;

    if (js.contains("spans")) {
        for (const json& entry : js["spans"]) {
            if (!entry.is_object()) continue;
            text::TextSpan span;
            if (entry.contains("text") && entry["text"].is_string())
                span.text = entry["text"].get<std::string>();
            const text::TextStylePatch stored = entry.contains("style")
                ? textStylePatchFromJson(entry["style"])
                : text::TextStylePatch{};
            span.style = text::mergeStyle(defaults, stored, text::TextStylePatch{});
            element.spans.push_back(std::move(span));
        }
    }

    if (js.contains("textAlign") && js["textAlign"].is_string()) {
        if (auto a = text::parseTextAlign(js["textAlign"].get<std::string>())) element.textAlign = *a;
    }
    if (js.contains("verticalAlign") && js["verticalAlign"].is_string()) {
        if (auto a = text::parseVerticalAlign(js["verticalAlign"].get<std::string>())) element.verticalAlign = *a;
    }
    if (js.contains("lineAlignments"))
        element.lineAlignments = lineAlignmentsFromJson(js["lineAlignments"]);
    readFloat(js, "letterSpacing", element.letterSpacing);
    readFloat(js, "padding", element.padding);
    readOptionalFloat(js, "scaleX", element.scaleX);
    readOptionalFloat(js, "scaleY", element.scaleY);

    const text::TextStyle fallback = element.spans.empty() ? defaults : element.spans.front().style;
    text::normalizeSpans(element.spans, fallback);
    text::canonicalizeAlignments(element.lineAlignments, element.textAlign);
    return element;
}

std::string serializeTextElement(const text::TextElement& element) {
    return textElementToJson(element).dump();
}

std::optional<text::TextElement> parseTextElement(std::string_view source, const text::TextStyle& defaults) {
    try {
        const json js = json::parse(source.begin(), source.end());
        return textElementFromJson(js, defaults);
    } catch (const nlohmann::json::exception& e) {
        FOLIO_LOG_WARN("parseTextElement: %s", e.what());
        return std::nullopt;
    }
}

} // namespace folio::persistence
