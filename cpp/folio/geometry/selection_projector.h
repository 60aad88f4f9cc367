#ifndef FOLIO_GEOMETRY_SELECTION_PROJECTOR_H
#define FOLIO_GEOMETRY_SELECTION_PROJECTOR_H

#include <vector>

namespace folio::geometry {

struct Point2 { float x; float y; };

struct Rect {
    float x;
    float y;
    float width;
    float height;
};

/**
 * Transform state of the element a selection belongs to.
 */
struct ProjectionFrame {
    float elementWidth;     // local frame
    float elementHeight;
    float rotationDeg;      // CSS rotation, clockwise
    float zoom;             // canvas scale factor
    float fontSize;         // active style
    float lineHeight;       // multiple of fontSize
    float outlineWidth;     // border inset of the padding box
    Rect wrapperBox;        // device-space box of the unrotated wrapper
};

Point2 rotatePoint(Point2 p, float angleRad);

/**
 * Map one native selection rectangle (device space, rotated and zoomed)
 * into the element's local unrotated frame.
 *
 * The line height comes from the style; the width is recovered from the
 * bounding box using the larger of |cos| and |sin|. A near-zero divisor
 * yields width 0.
 */
Rect projectSelectionRect(const Rect& deviceRect, const ProjectionFrame& frame);

/**
 * One local rectangle per device rectangle, in order.
 */
std::vector<Rect> projectSelectionRects(const std::vector<Rect>& deviceRects, const ProjectionFrame& frame);

} // namespace folio::geometry

#endif // FOLIO_GEOMETRY_SELECTION_PROJECTOR_H
