#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/val.h>
#endif

#include "folio/core/logging.h"
#include "folio/editor/text_editor.h"
#include "folio/persistence/text_element_json.h"
#include "folio/surface/offset_mapper.h"
#include "folio/surface/surface_renderer.h"

#ifdef EMSCRIPTEN
namespace {

using emscripten::val;
using folio::surface::DomPosition;
using folio::surface::DomRange;
using folio::surface::Node;

constexpr int kElementNode = 1;
constexpr int kTextNode = 3;

// Snapshot of the live surface plus the DOM node behind each mirror node.
struct SurfaceMirror {
    std::unique_ptr<Node> root;
    std::vector<std::pair<val, const Node*>> nodes;

    const Node* find(const val& domNode) const {
        if (domNode.isNull() || domNode.isUndefined()) return nullptr;
        for (const auto& [dom, node] : nodes) {
            if (dom.strictlyEquals(domNode)) return node;
        }
        return nullptr;
    }

    val toDom(const Node* node) const {
        for (const auto& [dom, mirrored] : nodes) {
            if (mirrored == node) return dom;
        }
        return val::null();
    }
};

// Comments and processing instructions are skipped.
void mirrorChildren(const val& domParent, Node& parent, SurfaceMirror& mirror) {
    const val children = domParent["childNodes"];
    const int count = children["length"].as<int>();
    for (int i = 0; i < count; ++i) {
        const val child = children[i];
        const int type = child["nodeType"].as<int>();
        if (type == kTextNode) {
            Node& text = parent.appendChild(Node::makeText(child["data"].as<std::string>()));
            mirror.nodes.emplace_back(child, &text);
        } else if (type == kElementNode) {
            const val style = child.call<val>("getAttribute", std::string("style"));
            Node& element = parent.appendChild(Node::makeElement(
                child["tagName"].as<std::string>(),
                style.isNull() ? std::string() : style.as<std::string>()));
            mirror.nodes.emplace_back(child, &element);
            mirrorChildren(child, element, mirror);
        }
    }
}

SurfaceMirror mirrorSurface(const val& domRoot) {
    SurfaceMirror mirror;
    mirror.root = Node::makeElement("div");
    mirror.nodes.emplace_back(domRoot, mirror.root.get());
    mirrorChildren(domRoot, *mirror.root, mirror);
    return mirror;
}

// Accepts a DOM Range (or StaticRange); null maps to an empty range.
DomRange readRange(const SurfaceMirror& mirror, const val& range) {
    DomRange out;
    if (range.isNull() || range.isUndefined()) return out;
    out.start = DomPosition{mirror.find(range["startContainer"]), range["startOffset"].as<std::uint32_t>()};
    out.end = DomPosition{mirror.find(range["endContainer"]), range["endOffset"].as<std::uint32_t>()};
    return out;
}

val selectionToVal(const std::optional<folio::text::SelectionRange>& range) {
    if (!range) return val::null();
    val out = val::object();
    out.set("start", range->start);
    out.set("end", range->end);
    return out;
}

val jsonToVal(const folio::persistence::json& js) {
    return val::global("JSON").call<val>("parse", js.dump());
}

folio::text::TextStylePatch patchFromVal(const val& patch) {
    if (patch.isNull() || patch.isUndefined()) return {};
    const std::string source = val::global("JSON").call<std::string>("stringify", patch);
    try {
        return folio::persistence::textStylePatchFromJson(folio::persistence::json::parse(source));
    } catch (const nlohmann::json::exception& e) {
        FOLIO_LOG_WARN("patchFromVal: %s", e.what());
        return {};
    }
}

/**
 * JavaScript face of TextEditor. Surfaces and selections arrive as live DOM
 * objects and are mirrored on every call.
 */
class WasmTextEditor {
public:
    std::uint32_t addText() { return editor_.addText(); }
    bool deleteText(std::uint32_t id) { return editor_.deleteText(id); }

    val handleInput(std::uint32_t id, val root, val range) {
        const SurfaceMirror mirror = mirrorSurface(root);
        return selectionToVal(editor_.handleInput(id, *mirror.root, readRange(mirror, range)));
    }

    bool handleSelectionChange(std::uint32_t id, val root, val range) {
        const SurfaceMirror mirror = mirrorSurface(root);
        return editor_.handleSelectionChange(id, *mirror.root, readRange(mirror, range));
    }

    bool setSelection(std::uint32_t id, std::uint32_t start, std::uint32_t end) {
        return editor_.setSelection(id, folio::text::SelectionRange{start, end});
    }

    void clearSelection() { editor_.clearSelection(); }

    val insertNewline(std::uint32_t id) { return selectionToVal(editor_.insertNewline(id)); }
    bool deleteAll(std::uint32_t id) { return editor_.deleteAll(id); }

    val applyStyle(std::uint32_t id, val patch) {
        return selectionToVal(editor_.applyStyle(id, patchFromVal(patch)));
    }

    bool applyStyleToElement(std::uint32_t id, val patch) {
        return editor_.applyStyleToElement(id, patchFromVal(patch));
    }

    bool setAlignment(std::uint32_t id, std::string align) {
        const auto parsed = folio::text::parseTextAlign(align);
        if (!parsed) {
            FOLIO_LOG_WARN("setAlignment: unknown alignment '%s'", align.c_str());
            return false;
        }
        return editor_.setAlignment(id, *parsed);
    }

    val activeStyle(std::uint32_t id) const {
        const auto style = editor_.activeStyle(id);
        return style ? jsonToVal(folio::persistence::textStyleToJson(*style)) : val::null();
    }

    std::string renderSurfaceHtml(std::uint32_t id) const {
        const auto surface = editor_.renderSurface(id);
        return surface ? folio::surface::serializeHtml(*surface) : std::string();
    }

    // Resolve a logical selection against the live surface for cursor restoration.
    val restoreSelection(val root, std::uint32_t start, std::uint32_t end) const {
        const SurfaceMirror mirror = mirrorSurface(root);
        const DomRange range = folio::surface::toDomRange(*mirror.root, folio::text::SelectionRange{start, end});
        val out = val::object();
        out.set("startContainer", mirror.toDom(range.start.node));
        out.set("startOffset", range.start.offset);
        out.set("endContainer", mirror.toDom(range.end.node));
        out.set("endOffset", range.end.offset);
        return out;
    }

    val selectionOverlay(std::uint32_t id, val deviceRects, val wrapperBox, float zoom) const {
        std::vector<folio::geometry::Rect> rects;
        const int count = deviceRects["length"].as<int>();
        rects.reserve(static_cast<std::size_t>(count));
        for (int i = 0; i < count; ++i) {
            rects.push_back(readRect(deviceRects[i]));
        }

        val out = val::array();
        for (const folio::geometry::Rect& r : editor_.selectionOverlay(id, rects, readRect(wrapperBox), zoom)) {
            val item = val::object();
            item.set("x", r.x);
            item.set("y", r.y);
            item.set("width", r.width);
            item.set("height", r.height);
            out.call<void>("push", item);
        }
        return out;
    }

    std::string toJson(std::uint32_t id) const {
        const folio::text::TextElement* element = editor_.store().getElement(id);
        return element ? folio::persistence::serializeTextElement(*element) : std::string();
    }

    // Returns the element id, or 0 if the document could not be loaded.
    std::uint32_t loadJson(std::string source) {
        auto element = folio::persistence::parseTextElement(source, editor_.options().defaultStyle);
        if (!element) return 0;
        return editor_.store().upsertElement(std::move(*element)).id;
    }

    std::vector<std::uint32_t> consumeDirtyIds() { return editor_.store().consumeDirtyIds(); }

private:
    static folio::geometry::Rect readRect(const val& r) {
        return folio::geometry::Rect{
            r["x"].as<float>(), r["y"].as<float>(), r["width"].as<float>(), r["height"].as<float>()
        };
    }

    folio::editor::TextEditor editor_;
};

} // namespace

EMSCRIPTEN_BINDINGS(folio_module) {
    emscripten::register_vector<std::uint32_t>("VectorUInt32");

    emscripten::class_<WasmTextEditor>("TextEditor")
        .constructor<>()
        .function("addText", &WasmTextEditor::addText)
        .function("deleteText", &WasmTextEditor::deleteText)
        .function("handleInput", &WasmTextEditor::handleInput)
        .function("handleSelectionChange", &WasmTextEditor::handleSelectionChange)
        .function("setSelection", &WasmTextEditor::setSelection)
        .function("clearSelection", &WasmTextEditor::clearSelection)
        .function("insertNewline", &WasmTextEditor::insertNewline)
        .function("deleteAll", &WasmTextEditor::deleteAll)
        .function("applyStyle", &WasmTextEditor::applyStyle)
        .function("applyStyleToElement", &WasmTextEditor::applyStyleToElement)
        .function("setAlignment", &WasmTextEditor::setAlignment)
        .function("activeStyle", &WasmTextEditor::activeStyle)
        .function("renderSurfaceHtml", &WasmTextEditor::renderSurfaceHtml)
        .function("restoreSelection", &WasmTextEditor::restoreSelection)
        .function("selectionOverlay", &WasmTextEditor::selectionOverlay)
        .function("toJson", &WasmTextEditor::toJson)
        .function("loadJson", &WasmTextEditor::loadJson)
        .function("consumeDirtyIds", &WasmTextEditor::consumeDirtyIds);
}
#endif
