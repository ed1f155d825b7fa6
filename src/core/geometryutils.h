// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "types.h"
#include "tessera_export.h"
#include <QPointF>
#include <QRect>
#include <QSize>
#include <QVector>

namespace Tessera {

/**
 * @brief Geometry helpers shared by the partition tree and the layout
 */
namespace GeometryUtils {

/**
 * @brief Extent of a rectangle along a split axis
 * @return Height for Horizontal, width for Vertical
 */
TESSERA_EXPORT int lengthAlong(const QRect& rect, Orientation orientation);

/**
 * @brief Shrink a rectangle by @p amount on all four sides
 *
 * Unlike QRect::adjusted this never produces a negative size.
 */
TESSERA_EXPORT QRect shrinkBy(const QRect& rect, int amount);

/**
 * @brief Split orientation that keeps subdivisions balanced
 *
 * Wider than tall splits side by side (Vertical), otherwise stacked
 * (Horizontal).
 */
TESSERA_EXPORT Orientation orientationForSize(const QSize& size);

/**
 * @brief Orientation of the group joining two trees on one output
 *
 * At least as wide as tall stacks the trees (Horizontal), otherwise they
 * go side by side (Vertical).
 */
TESSERA_EXPORT Orientation mergeOrientationForSize(const QSize& size);

/**
 * @brief Divide a rectangle into contiguous slices along an axis
 * @param rect Rectangle to divide
 * @param orientation Axis the slices are laid out along
 * @param sizes Extent of each slice along the axis, in order
 * @return One rectangle per size, each spanning the full cross-axis extent
 */
TESSERA_EXPORT QVector<QRect> sliceAlong(const QRect& rect, Orientation orientation, const QVector<int>& sizes);

/**
 * @brief Edge midpoint of the focused window that a search starts from
 *
 * Down uses the bottom edge, Up the top edge, Left the left edge and Right
 * the right edge. Out has no reference point and yields the center.
 */
TESSERA_EXPORT QPointF focusOriginPoint(const QRect& rect, FocusDirection direction);

/**
 * @brief Edge midpoint of a candidate facing the origin
 *
 * The opposite edge of focusOriginPoint: a candidate below is measured at
 * its top edge, a candidate to the right at its left edge, and so on.
 */
TESSERA_EXPORT QPointF focusCandidatePoint(const QRect& rect, FocusDirection direction);

TESSERA_EXPORT qreal distance(const QPointF& a, const QPointF& b);

/**
 * @brief Convert a logical position to physical pixels
 */
TESSERA_EXPORT QPoint toPhysical(const QPoint& logical, qreal scale);

} // namespace GeometryUtils

} // namespace Tessera
