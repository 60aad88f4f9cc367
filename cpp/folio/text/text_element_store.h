#ifndef FOLIO_TEXT_ELEMENT_STORE_H
#define FOLIO_TEXT_ELEMENT_STORE_H

#include "folio/text/text_element.h"
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace folio::text {

/**
 * TextElementStore: owns every text element of the document.
 *
 * Responsibilities:
 * - CRUD operations for TextElement records
 * - Id allocation and z-order queries for new elements
 * - Dirty tracking for the host's re-render and persistence passes
 *
 * Non-responsibilities (handled by TextEditor):
 * - Reconciling surface edits
 * - Selection state
 */
class TextElementStore {
public:
    TextElementStore();
    ~TextElementStore();

    // ==========================================================================
    // Element Operations
    // ==========================================================================

    /**
     * Create or replace an element. Its id is taken from element.id; an id of
     * 0 is replaced by a freshly allocated one.
     * @return Reference to the stored element
     */
    TextElement& upsertElement(TextElement element);

    /**
     * Delete an element.
     * @param id Element ID to delete
     * @return True if the element existed and was deleted
     */
    bool deleteElement(std::uint32_t id);

    /**
     * Get an element by ID.
     * @return Pointer to the element or nullptr if not found
     */
    const TextElement* getElement(std::uint32_t id) const;
    TextElement* getElementMutable(std::uint32_t id);

    bool hasElement(std::uint32_t id) const;

    /**
     * All element IDs in ascending order.
     */
    std::vector<std::uint32_t> getAllIds() const;

    std::size_t getElementCount() const;

    /**
     * Highest zIndex in the store, or nullopt when empty.
     */
    std::optional<int> maxZIndex() const;

    std::uint32_t allocateId();

    // ==========================================================================
    // Dirty Tracking
    // ==========================================================================

    /**
     * Mark an element as changed. Unknown ids are ignored.
     */
    void markDirty(std::uint32_t id);

    /**
     * Get all dirty element IDs (ascending) and clear the dirty set.
     */
    std::vector<std::uint32_t> consumeDirtyIds();

    bool hasDirtyElements() const;

    // ==========================================================================
    // Bulk Operations
    // ==========================================================================

    void clear();

private:
    std::unordered_map<std::uint32_t, TextElement> elements_;
    std::unordered_set<std::uint32_t> dirtyIds_;
    std::uint32_t nextId_ = 1;
};

} // namespace folio::text

#endif // FOLIO_TEXT_ELEMENT_STORE_H
