#ifndef NODEMARK_CONSTANTS_H
#define NODEMARK_CONSTANTS_H

#include <QColor>

namespace NodeMark {

// ============================================================================
// ZOOM BOUNDS & STEPS
// ============================================================================
namespace Bounds {
constexpr double kMinZoom = 0.1;
constexpr double kMaxZoom = 5.0;
constexpr double kMinOpacity = 0.0;
constexpr double kMaxOpacity = 1.0;
}  // namespace Bounds

namespace Zoom {
constexpr double kKeyboardStep = 1.2;       // Ctrl+= / Ctrl+-
constexpr double kWheelStep = 1.1;          // Ctrl+wheel notch
constexpr double kDefaultMagnification = 1.5;  // Rasterizer base magnification
constexpr int kWheelNotchDelta = 120;       // QWheelEvent angleDelta per notch
constexpr double kWheelScrollPixels = 40.0; // Plain wheel pans by this per notch
}  // namespace Zoom

// ============================================================================
// HIT TESTING (screen pixels, converted by the current effective scale)
// ============================================================================
namespace HitTolerance {
constexpr double kSelection = 25.0;   // Forgiving initial selection
constexpr double kPointGrab = 15.0;   // Vertex grab while point-editing
constexpr double kInsertion = 25.0;   // Right-click segment insertion
}  // namespace HitTolerance

// ============================================================================
// OVERLAY RENDERING (raster pixels unless noted)
// ============================================================================
namespace Overlay {
constexpr double kSelectedWidthPadding = 3.0;   // Document units
constexpr double kSelectedWidthFactor = 2.0;
constexpr double kDashLength = 10.0;
constexpr double kDashGap = 5.0;
constexpr double kDotLength = 3.0;
constexpr double kDotDashLength = 8.0;
constexpr double kDotDashGap = 4.0;
constexpr double kMinArrowLength = 10.0;
constexpr double kArrowLengthFactor = 3.0;      // Times stroke width
constexpr double kArrowAngleDegrees = 30.0;
constexpr double kVertexMarkerSize = 8.0;       // Document units, min 8 px
constexpr int kOutlineWidth = 2;
constexpr double kIndicatorRadius = 8.0;        // Document units
constexpr double kIndicatorSpacingFactor = 2.5; // Times radius, center to center
constexpr double kIndicatorPerpendicularGap = 2.0;
constexpr int kLabelPadding = 2;
constexpr double kLabelRotateMinDegrees = 45.0;
constexpr double kLabelRotateMaxDegrees = 135.0;
inline const QColor kLabelChip{255, 255, 255, 200};
inline const QColor kMarkerOutline{255, 255, 255, 255};
}  // namespace Overlay

// ============================================================================
// DRAG REPAINT
// ============================================================================
namespace Drag {
constexpr int kFullRepaintInterval = 3;   // Every Nth move recomposes the raster
}  // namespace Drag

}  // namespace NodeMark

#endif // NODEMARK_CONSTANTS_H
