// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "core/types.h"
#include "tessera_export.h"
#include <QPointer>
#include <QRect>
#include <QVector>
#include <memory>
#include <variant>

namespace Tessera {

class Window;

/**
 * @brief Marker whose lifetime equals that of the group owning it
 *
 * Focus targets keep a std::weak_ptr to it and test expired() to find out
 * whether the group they point at still exists.
 */
struct GroupMarker
{
};

/**
 * @brief Split node: lays its children out along one axis
 *
 * sizes holds one extent per child, in child order. After every geometry
 * propagation the sizes add up to lengthAlong(geometry, orientation) exactly.
 */
struct TESSERA_EXPORT GroupData
{
    Orientation orientation = Orientation::Horizontal;
    QVector<int> sizes;
    QRect geometry;                        ///< Last geometry assigned by propagation
    std::shared_ptr<GroupMarker> marker;   ///< Sole strong owner of the liveness marker

    /**
     * @brief New binary group with two equal sizes
     * @param geometry Placeholder geometry until the first propagation
     */
    static GroupData create(Orientation orientation, const QRect &geometry);

    /**
     * @brief Extent of the last geometry along the group's own axis
     */
    int length() const;

    int sum() const;

    /**
     * @brief Make room for one more child at @p index
     *
     * Existing sizes shrink by the ratio (L - L/(n+1)) / L. The new entry
     * gets what is left, so the sum stays L.
     */
    void addChild(int index);

    /**
     * @brief Drop the size at @p index and redistribute it
     *
     * Each remaining sibling grows by removed * own / (sum of remaining).
     * Rounding drift lands on the last sibling.
     */
    void removeChild(int index);

    /**
     * @brief Take a new geometry, rescaling sizes to its extent
     *
     * Sizes are scaled by new/old extent and rounded. Drift lands on the
     * last child so the sum equals the new extent.
     */
    void updateGeometry(const QRect &newGeometry);

    /**
     * @brief Switch to @p newOrientation keeping the current geometry
     *
     * Sizes are rescaled from the extent along the old axis to the extent
     * along the new one.
     */
    void setOrientation(Orientation newOrientation);

private:
    void rescale(int previousLength, int newLength);
    void absorbDrift(int length);
};

/**
 * @brief Window node: holds one tiled window
 */
struct TESSERA_EXPORT LeafData
{
    QPointer<Window> window; ///< Non-owning, null once the window object is destroyed
    QRect geometry;          ///< Last geometry assigned by propagation, gaps not applied
};

/**
 * @brief Data stored at every position of a PartitionTree
 */
class TESSERA_EXPORT PartitionNode
{
public:
    explicit PartitionNode(GroupData group);
    explicit PartitionNode(LeafData leaf);

    bool isGroup() const;
    bool isLeaf() const;

    /**
     * @brief Group payload; fatal if this is a leaf
     */
    GroupData &group();
    const GroupData &group() const;

    /**
     * @brief Leaf payload; fatal if this is a group
     */
    LeafData &leaf();
    const LeafData &leaf() const;

    QRect geometry() const;

    /**
     * @brief Assign a propagated geometry
     *
     * Groups rescale their sizes (GroupData::updateGeometry), leaves just
     * store it.
     */
    void updateGeometry(const QRect &geometry);

    /**
     * @brief Window held by this node, nullptr for groups
     */
    Window *window() const;

private:
    std::variant<GroupData, LeafData> m_data;
};

} // namespace Tessera
