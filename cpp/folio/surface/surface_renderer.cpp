#include "folio/surface/surface_renderer.h"
#include "folio/core/editor_constants.h"
#include "folio/core/string_utils.h"

namespace folio::surface {

namespace {

std::unique_ptr<Node> makeLine(text::TextAlign align) {
    return Node::makeElement("div", std::string("text-align: ") + text::toCssKeyword(align));
}

void appendRun(Node& line, const std::string& text, const text::TextStyle& style) {
    Node& span = line.appendChild(Node::makeElement("span", text::toCssDeclarations(style)));
    span.appendChild(Node::makeText(text));
}

void escapeInto(std::string& out, const std::string& text, bool attribute) {
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"':
                if (attribute) { out += "&quot;"; break; }
                out.push_back(c);
                break;
            default: out.push_back(c); break;
        }
    }
}

} // namespace

std::unique_ptr<Node> renderSurface(const text::TextElement& element) {
    auto root = Node::makeElement("div");

    std::string placeholder;
    appendUtf8(placeholder, editor_constants::PLACEHOLDER_ZWSP);

    std::uint32_t lineIndex = 0;
    auto line = makeLine(text::effectiveAlignment(element.lineAlignments, lineIndex, element.textAlign));
    const text::TextStyle* lastStyle = element.spans.empty() ? nullptr : &element.spans.front().style;

    auto closeLine = [&]() {
        if (line->childCount() == 0) {
            appendRun(*line, placeholder, lastStyle ? *lastStyle : text::defaultTextStyle());
        }
        root->appendChild(std::move(line));
    };

    for (const text::TextSpan& span : element.spans) {
        lastStyle = &span.style;
        std::size_t pos = 0;
        while (pos <= span.text.size()) {
            const std::size_t nl = span.text.find('\n', pos);
            const std::size_t pieceEnd = nl == std::string::npos ? span.text.size() : nl;
            if (pieceEnd > pos) {
                appendRun(*line, span.text.substr(pos, pieceEnd - pos), span.style);
            }
            if (nl == std::string::npos) break;

            closeLine();
            ++lineIndex;
            line = makeLine(text::effectiveAlignment(element.lineAlignments, lineIndex, element.textAlign));
            pos = nl + 1;
        }
    }
    closeLine();

    return root;
}

std::string serializeHtml(const Node& node) {
    std::string out;
    if (node.isText()) {
        escapeInto(out, node.text(), false);
        return out;
    }

    out += '<';
    out += node.tag();
    if (!node.style().empty()) {
        out += " style=\"";
        escapeInto(out, node.style(), true);
        out += '"';
    }
    out += '>';
    if (node.isLineBreak()) {
        return out;
    }
    for (std::size_t i = 0; i < node.childCount(); ++i) {
        out += serializeHtml(*node.child(i));
    }
    out += "</";
    out += node.tag();
    out += '>';
    return out;
}

} // namespace folio::surface
