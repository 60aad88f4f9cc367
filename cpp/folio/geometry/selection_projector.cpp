#include "folio/geometry/selection_projector.h"
#include "folio/core/editor_constants.h"
#include "folio/core/logging.h"
#include <algorithm>
#include <cmath>

namespace folio::geometry {

namespace {

constexpr float kDegToRad = 3.14159265358979323846f / 180.0f;

} // namespace

Point2 rotatePoint(Point2 p, float angleRad) {
    const float c = std::cos(angleRad);
    const float s = std::sin(angleRad);
    return Point2{p.x * c - p.y * s, p.x * s + p.y * c};
}

Rect projectSelectionRect(const Rect& deviceRect, const ProjectionFrame& frame) {
    using editor_constants::PROJECTION_EPSILON;

    float zoom = frame.zoom;
    if (!(zoom > PROJECTION_EPSILON)) {
        FOLIO_LOG_WARN("projectSelectionRect: invalid zoom %g, using 1", static_cast<double>(zoom));
        zoom = 1.0f;
    }

    const float theta = frame.rotationDeg * kDegToRad;
    const float absCos = std::fabs(std::cos(theta));
    const float absSin = std::fabs(std::sin(theta));
    const float h = frame.fontSize * frame.lineHeight;

    // Bounding box of a w x h box rotated by theta:
    //   W = w|cos| + h|sin|,  H = w|sin| + h|cos|
    float w = 0.0f;
    if (absCos >= absSin) {
        if (absCos > PROJECTION_EPSILON) {
            w = (deviceRect.width / zoom - h * absSin) / absCos;
        } else {
            FOLIO_LOG_DEBUG("projectSelectionRect: cos divisor below epsilon");
        }
    } else {
        if (absSin > PROJECTION_EPSILON) {
            w = (deviceRect.height / zoom - h * absCos) / absSin;
        } else {
            FOLIO_LOG_DEBUG("projectSelectionRect: sin divisor below epsilon");
        }
    }
    w = std::max(0.0f, w);

    const Point2 rectCenter{deviceRect.x + deviceRect.width * 0.5f, deviceRect.y + deviceRect.height * 0.5f};
    const Point2 wrapperCenter{
        frame.wrapperBox.x + frame.wrapperBox.width * 0.5f,
        frame.wrapperBox.y + frame.wrapperBox.height * 0.5f
    };
    const Point2 device{(rectCenter.x - wrapperCenter.x) / zoom, (rectCenter.y - wrapperCenter.y) / zoom};
    const Point2 local = rotatePoint(device, -theta);

    Rect out;
    out.x = frame.elementWidth * 0.5f + local.x - w * 0.5f - frame.outlineWidth;
    out.y = frame.elementHeight * 0.5f + local.y - h * 0.5f - frame.outlineWidth;
    out.width = w;
    out.height = h;
    return out;
}

std::vector<Rect> projectSelectionRects(const std::vector<Rect>& deviceRects, const ProjectionFrame& frame) {
    std::vector<Rect> out;
    out.reserve(deviceRects.size());
    for (const Rect& r : deviceRects) {
        out.push_back(projectSelectionRect(r, frame));
    }
    return out;
}

} // namespace folio::geometry
