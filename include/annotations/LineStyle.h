#ifndef LINESTYLE_H
#define LINESTYLE_H

/**
 * @brief Stroke pattern for node polylines.
 *
 * The pattern follows the node's interaction state; geometry is identical
 * for all three.
 */
enum class LineStyle {
    Solid = 0,   // ─────────  idle
    Dashed,      // ─ ─ ─ ─ ─  selected
    DotDash      // · ─ · ─ ·  point editing
};

#endif // LINESTYLE_H
