#ifndef FOLIO_SURFACE_NODE_H
#define FOLIO_SURFACE_NODE_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace folio::surface {

enum class NodeKind : std::uint8_t {
    Element = 0,
    Text = 1,
};

/**
 * Minimal mirror of the editable surface's DOM subtree.
 *
 * Element nodes carry a lower-case tag and an inline style attribute; text
 * nodes carry UTF-8 text. A node owns its children and knows its parent.
 */
class Node {
public:
    static std::unique_ptr<Node> makeElement(std::string tag, std::string style = {});
    static std::unique_ptr<Node> makeText(std::string text);

    NodeKind kind() const { return kind_; }
    bool isText() const { return kind_ == NodeKind::Text; }
    bool isElement() const { return kind_ == NodeKind::Element; }

    /** div and p open a new line-segment container. */
    bool isBlock() const;
    bool isLineBreak() const;

    const std::string& tag() const { return tag_; }
    const std::string& style() const { return style_; }
    const std::string& text() const { return text_; }
    void setText(std::string text) { text_ = std::move(text); }

    const Node* parent() const { return parent_; }
    std::size_t childCount() const { return children_.size(); }
    const Node* child(std::size_t index) const;
    Node* childMutable(std::size_t index);

    /**
     * Append a child and take ownership of it.
     * @return The appended node
     */
    Node& appendChild(std::unique_ptr<Node> child);

    /**
     * Index among the parent's children, or 0 for a detached node.
     */
    std::size_t indexInParent() const;

    /**
     * True if `other` is this node or one of its descendants.
     */
    bool contains(const Node* other) const;

    /**
     * DOM length: UTF-16 units for a text node, child count for an element.
     */
    std::uint32_t domLength() const;

private:
    Node(NodeKind kind, std::string tag, std::string style, std::string text);

    NodeKind kind_;
    std::string tag_;
    std::string style_;
    std::string text_;
    Node* parent_ = nullptr;
    std::vector<std::unique_ptr<Node>> children_;
};

/**
 * A DOM boundary point. For a text node the offset counts UTF-16 units of
 * its raw text (placeholders included); for an element it is a child index.
 */
struct DomPosition {
    const Node* node = nullptr;
    std::uint32_t offset = 0;

    bool operator==(const DomPosition& other) const { return node == other.node && offset == other.offset; }
    bool operator!=(const DomPosition& other) const { return !(*this == other); }
};

struct DomRange {
    DomPosition start;
    DomPosition end;
};

} // namespace folio::surface

#endif // FOLIO_SURFACE_NODE_H
