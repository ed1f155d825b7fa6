// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include <QDebug>
#include <QHashFunctions>
#include <QPoint>
#include <QString>

namespace Tessera {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared Types
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Split axis of a group
 *
 * Horizontal stacks children top-to-bottom, so sizes are heights.
 * Vertical places children side by side, so sizes are widths.
 */
enum class Orientation {
    Horizontal = 0,
    Vertical = 1
};

/**
 * @brief Direction of a focus navigation request
 *
 * Out moves focus from a window to the group that contains it.
 */
enum class FocusDirection {
    Left,
    Right,
    Up,
    Down,
    Out
};

/**
 * @brief Stable handle of a node inside a PartitionTree arena
 *
 * The generation distinguishes successive occupants of the same slot, so a
 * handle kept past its node's removal never resolves to the slot's next node.
 */
struct TESSERA_EXPORT NodeId
{
    int index = -1;          ///< Arena slot
    quint32 generation = 0;  ///< Slot generation at creation time

    bool isValid() const
    {
        return index >= 0;
    }

    bool operator==(const NodeId &other) const = default;
};

inline size_t qHash(const NodeId &id, size_t seed = 0) noexcept
{
    return qHashMulti(seed, id.index, id.generation);
}

inline QDebug operator<<(QDebug debug, const NodeId &id)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "NodeId(" << id.index << "@" << id.generation << ")";
    return debug;
}

/**
 * @brief Sub-surface of a window with its offset from the window origin
 */
struct TESSERA_EXPORT SurfaceEntry
{
    QString surfaceId;  ///< Opaque surface identifier
    QPoint offset;      ///< Offset relative to the window's top-left corner

    bool operator==(const SurfaceEntry &other) const = default;
};

/**
 * @brief A drawable produced for one output
 *
 * Location is in physical pixels of the output the element was built for.
 */
struct TESSERA_EXPORT RenderElement
{
    QString surfaceId;
    QPoint location;   ///< Physical location
    qreal scale = 1.0; ///< Output scale factor used for the conversion
};

inline QDebug operator<<(QDebug debug, Orientation orientation)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << (orientation == Orientation::Horizontal ? "Horizontal" : "Vertical");
    return debug;
}

} // namespace Tessera
