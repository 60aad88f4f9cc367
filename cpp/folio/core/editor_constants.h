#pragma once

#include <cstdint>

/**
 * @file editor_constants.h
 * @brief Constants shared by the text editing core.
 *
 * The host mirrors the add-text preset and the placeholder code points; keep
 * them in sync with the page that embeds the module.
 */

namespace folio::editor_constants {

// =============================================================================
// Editable Surface
// =============================================================================

/// ZERO WIDTH SPACE, used to give empty lines a caret target
constexpr std::uint32_t PLACEHOLDER_ZWSP = 0x200B;

/// ZERO WIDTH NO-BREAK SPACE, inserted by some browsers around inline edits
constexpr std::uint32_t PLACEHOLDER_BOM = 0xFEFF;

// =============================================================================
// Selection Overlay
// =============================================================================

/// Below this, a trig coefficient is treated as zero when undoing rotation
constexpr float PROJECTION_EPSILON = 1e-6f;

/// Inset of a text item's padding box from its border box (drag border)
constexpr float SELECTION_OUTLINE_WIDTH_PX = 3.0f;

// =============================================================================
// Default Text Style
// =============================================================================

constexpr const char* DEFAULT_FONT_FAMILY = "Heebo";
constexpr float DEFAULT_FONT_SIZE = 16.0f;
constexpr int DEFAULT_FONT_WEIGHT = 400;
constexpr const char* DEFAULT_COLOR = "#FFFFFF";
constexpr float DEFAULT_LINE_HEIGHT = 1.2f;

constexpr int MIN_FONT_WEIGHT = 100;
constexpr int MAX_FONT_WEIGHT = 900;

// =============================================================================
// Add-Text Preset
// =============================================================================

namespace AddText {
    constexpr const char* SAMPLE_TEXT = "\xD7\x98\xD7\xA7\xD7\xA1\xD7\x98 \xD7\x9C\xD7\x93\xD7\x95\xD7\x92\xD7\x9E\xD7\x94"; // "sample text" (Hebrew)
    constexpr float FONT_SIZE = 48.0f;
    constexpr int FONT_WEIGHT = 700;
    constexpr float X = 50.0f;
    constexpr float Y = 50.0f;
    constexpr float WIDTH = 300.0f;
    constexpr float HEIGHT = 100.0f;
    constexpr float PADDING = 10.0f;
}

} // namespace folio::editor_constants
