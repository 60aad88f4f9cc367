#include "folio/text/text_element_store.h"
#include "folio/core/logging.h"
#include <algorithm>

namespace folio::text {

TextElementStore::TextElementStore() = default;
TextElementStore::~TextElementStore() = default;

// =============================================================================
// Element Operations
// =============================================================================

TextElement& TextElementStore::upsertElement(TextElement element) {
    if (element.id == 0) {
        element.id = allocateId();
    } else if (element.id >= nextId_) {
        nextId_ = element.id + 1;
    }

    // Every stored element satisfies the span sequence invariants.
    const TextStyle fallback = element.spans.empty() ? defaultTextStyle() : element.spans.front().style;
    normalizeSpans(element.spans, fallback);
    canonicalizeAlignments(element.lineAlignments, element.textAlign);

    const std::uint32_t id = element.id;
    TextElement& stored = elements_[id];
    stored = std::move(element);
    markDirty(id);
    return stored;
}

bool TextElementStore::deleteElement(std::uint32_t id) {
    auto it = elements_.find(id);
    if (it == elements_.end()) {
        FOLIO_LOG_WARN("deleteElement: unknown id %u", id);
        return false;
    }

    elements_.erase(it);
    dirtyIds_.erase(id);
    return true;
}

const TextElement* TextElementStore::getElement(std::uint32_t id) const {
    auto it = elements_.find(id);
    return it != elements_.end() ? &it->second : nullptr;
}

TextElement* TextElementStore::getElementMutable(std::uint32_t id) {
    auto it = elements_.find(id);
    return it != elements_.end() ? &it->second : nullptr;
}

bool TextElementStore::hasElement(std::uint32_t id) const {
    return elements_.find(id) != elements_.end();
}

std::vector<std::uint32_t> TextElementStore::getAllIds() const {
    std::vector<std::uint32_t> ids;
    ids.reserve(elements_.size());
    for (const auto& [id, _] : elements_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t TextElementStore::getElementCount() const {
    return elements_.size();
}

std::optional<int> TextElementStore::maxZIndex() const {
    std::optional<int> result;
    for (const auto& [_, element] : elements_) {
        if (!result || element.zIndex > *result) {
            result = element.zIndex;
        }
    }
    return result;
}

std::uint32_t TextElementStore::allocateId() {
    while (hasElement(nextId_)) {
        ++nextId_;
    }
    return nextId_++;
}

// =============================================================================
// Dirty Tracking
// =============================================================================

void TextElementStore::markDirty(std::uint32_t id) {
    if (hasElement(id)) {
        dirtyIds_.insert(id);
    }
}

std::vector<std::uint32_t> TextElementStore::consumeDirtyIds() {
    std::vector<std::uint32_t> result(dirtyIds_.begin(), dirtyIds_.end());
    std::sort(result.begin(), result.end());
    dirtyIds_.clear();
    return result;
}

bool TextElementStore::hasDirtyElements() const {
    return !dirtyIds_.empty();
}

// =============================================================================
// Bulk Operations
// =============================================================================

void TextElementStore::clear() {
    elements_.clear();
    dirtyIds_.clear();
    nextId_ = 1;
}

} // namespace folio::text
