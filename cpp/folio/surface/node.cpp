#include "folio/surface/node.h"
#include "folio/core/string_utils.h"

namespace folio::surface {

Node::Node(NodeKind kind, std::string tag, std::string style, std::string text)
    : kind_(kind), tag_(std::move(tag)), style_(std::move(style)), text_(std::move(text)) {}

std::unique_ptr<Node> Node::makeElement(std::string tag, std::string style) {
    for (char& c : tag) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return std::unique_ptr<Node>(new Node(NodeKind::Element, std::move(tag), std::move(style), {}));
}

std::unique_ptr<Node> Node::makeText(std::string text) {
    return std::unique_ptr<Node>(new Node(NodeKind::Text, {}, {}, std::move(text)));
}

bool Node::isBlock() const {
    return kind_ == NodeKind::Element && (tag_ == "div" || tag_ == "p");
}

bool Node::isLineBreak() const {
    return kind_ == NodeKind::Element && tag_ == "br";
}

const Node* Node::child(std::size_t index) const {
    return index < children_.size() ? children_[index].get() : nullptr;
}

Node* Node::childMutable(std::size_t index) {
    return index < children_.size() ? children_[index].get() : nullptr;
}

Node& Node::appendChild(std::unique_ptr<Node> child) {
    child->parent_ = this;
    children_.push_back(std::move(child));
    return *children_.back();
}

std::size_t Node::indexInParent() const {
    if (!parent_) return 0;
    for (std::size_t i = 0; i < parent_->children_.size(); ++i) {
        if (parent_->children_[i].get() == this) return i;
    }
    return 0;
}

bool Node::contains(const Node* other) const {
    for (const Node* n = other; n; n = n->parent_) {
        if (n == this) return true;
    }
    return false;
}

std::uint32_t Node::domLength() const {
    if (isText()) {
        return logicalLength(text_);
    }
    return static_cast<std::uint32_t>(children_.size());
}

} // namespace folio::surface
