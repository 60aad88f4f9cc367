#ifndef FOLIO_SURFACE_RENDERER_H
#define FOLIO_SURFACE_RENDERER_H

#include "folio/surface/node.h"
#include "folio/text/text_element.h"
#include <memory>
#include <string>

namespace folio::surface {

/**
 * Build the editable surface for an element.
 *
 * The root is a bare div. Each '\n'-delimited line becomes a div container
 * carrying the line's effective text-align; each span piece on the line
 * becomes a styled span. An empty line holds a span with a placeholder
 * (U+200B) text node so the caret has somewhere to sit.
 *
 * extractText(*renderSurface(e)) == e.text().
 */
std::unique_ptr<Node> renderSurface(const text::TextElement& element);

/**
 * Serialize a node and its subtree as HTML. Text and attribute values are
 * escaped; <br> is written as a void element.
 */
std::string serializeHtml(const Node& node);

} // namespace folio::surface

#endif // FOLIO_SURFACE_RENDERER_H
