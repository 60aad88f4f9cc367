#ifndef FOLIO_EDITOR_TEXT_EDITOR_H
#define FOLIO_EDITOR_TEXT_EDITOR_H

#include "folio/core/editor_constants.h"
#include "folio/geometry/selection_projector.h"
#include "folio/surface/node.h"
#include "folio/text/span_reconciler.h"
#include "folio/text/text_element_store.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace folio::editor {

/**
 * Runtime knobs the host may change.
 */
struct TextEditorOptions {
    text::TextStyle defaultStyle = text::defaultTextStyle();
    float outlineWidth = editor_constants::SELECTION_OUTLINE_WIDTH_PX;
};

/**
 * Last known text selection. Only one element is edited at a time.
 */
struct EditorSelection {
    std::uint32_t elementId;
    text::SelectionRange range;
};

/**
 * TextEditor: event-level entry point for the editable text surface.
 *
 * Every surface event is turned into a logical selection right away; the
 * span list stored on the element is only ever changed by reconciliation,
 * style commands and alignment commands. Unknown ids are reported through
 * bool / optional returns and leave all state untouched.
 */
class TextEditor {
public:
    explicit TextEditor(TextEditorOptions options = TextEditorOptions{});
    ~TextEditor();

    text::TextElementStore& store() { return store_; }
    const text::TextElementStore& store() const { return store_; }

    const TextEditorOptions& options() const { return options_; }
    void setOptions(const TextEditorOptions& options) { options_ = options; }

    // ==========================================================================
    // Element Lifecycle
    // ==========================================================================

    /**
     * Create a text element from the add-text preset, stacked above every
     * existing element.
     * @return ID of the new element
     */
    std::uint32_t addText();

    /**
     * Delete an element (also used when it is converted to an image).
     * @return True if the element existed
     */
    bool deleteText(std::uint32_t id);

    // ==========================================================================
    // Surface Events
    // ==========================================================================

    /**
     * The surface content changed. Reconciles the surface text into the
     * element's spans and line alignments.
     * @param root Current surface
     * @param domSelection Selection after the mutation
     * @return Logical caret range to restore, or nullopt for an unknown id
     */
    std::optional<text::SelectionRange> handleInput(
        std::uint32_t id,
        const surface::Node& root,
        const surface::DomRange& domSelection
    );

    /**
     * The surface selection changed. Ignored unless an end of the range
     * lies inside root.
     * @return True if the selection was recorded
     */
    bool handleSelectionChange(std::uint32_t id, const surface::Node& root, const surface::DomRange& domRange);

    /**
     * Record a logical selection directly (clamped to the text length).
     */
    bool setSelection(std::uint32_t id, text::SelectionRange range);

    /**
     * Drop the selection; commands fall back to whole-element context.
     */
    void clearSelection();

    std::optional<text::SelectionRange> selectionFor(std::uint32_t id) const;

    // ==========================================================================
    // Editing Commands
    // ==========================================================================

    /**
     * Enter key: replace the range (the last selection when omitted, else
     * the end of the text) with a line break.
     * @return Caret after the break, or nullopt for an unknown id
     */
    std::optional<text::SelectionRange> insertNewline(
        std::uint32_t id,
        const std::optional<text::SelectionRange>& range = std::nullopt
    );

    /**
     * Select-all followed by Delete. Keeps one empty span carrying the
     * current style.
     */
    bool deleteAll(std::uint32_t id);

    /**
     * Style the last selection.
     * @return Selection to restore on the next tick; nullopt if there is no
     *         selection on this element (nothing changes)
     */
    std::optional<text::SelectionRange> applyStyle(std::uint32_t id, const text::TextStylePatch& patch);

    /**
     * Style the whole text, or the sole empty span of an empty element.
     */
    bool applyStyleToElement(std::uint32_t id, const text::TextStylePatch& patch);

    /**
     * Align the lines touched by the last selection, or the whole block when
     * there is none.
     */
    bool setAlignment(std::uint32_t id, text::TextAlign align);

    // ==========================================================================
    // Queries
    // ==========================================================================

    std::optional<text::TextStyle> activeStyle(std::uint32_t id) const;

    /**
     * Fresh editable surface for an element, or nullptr for an unknown id.
     */
    std::unique_ptr<surface::Node> renderSurface(std::uint32_t id) const;

    /**
     * Selection highlight rectangles in the element's local frame.
     * @param deviceRects Native selection rectangles (device space)
     * @param wrapperBox Device-space box of the unrotated wrapper
     * @param zoom Canvas scale factor
     */
    std::vector<geometry::Rect> selectionOverlay(
        std::uint32_t id,
        const std::vector<geometry::Rect>& deviceRects,
        const geometry::Rect& wrapperBox,
        float zoom
    ) const;

private:
    // Replace the element's text, keeping styles and line alignments.
    void commitText(text::TextElement& element, const std::string& newText);
    // Same, for an edit whose position is already known.
    void commitEdit(
        text::TextElement& element,
        const std::string& oldText,
        const std::string& newText,
        const text::TextEdit& edit
    );

    text::TextElementStore store_;
    TextEditorOptions options_;
    std::optional<EditorSelection> selection_;
};

} // namespace folio::editor

#endif // FOLIO_EDITOR_TEXT_EDITOR_H
