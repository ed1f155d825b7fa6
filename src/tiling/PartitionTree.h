// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "PartitionNode.h"
#include "core/types.h"
#include "tessera_export.h"
#include <QVector>
#include <optional>
#include <vector>

namespace Tessera {

class Window;

/**
 * @brief Ordered tree of PartitionNodes stored in an arena
 *
 * Nodes live in a slot vector and refer to each other by NodeId. Removed
 * slots go to a free list and are reused with a bumped generation, so a
 * stale NodeId never resolves to the slot's next occupant.
 *
 * The tree may transiently hold detached nodes (no parent, not the root)
 * while a caller restructures it, e.g. the survivor of a collapsed group.
 *
 * Lookups with an id that does not resolve are invariant violations and
 * abort via qFatal. Use contains() to test foreign ids first.
 *
 * Every structural change marks the tree dirty. The layout clears the flag
 * once it has propagated geometry.
 */
class TESSERA_EXPORT PartitionTree
{
public:
    /**
     * @brief What remove() does with the children of the removed node
     */
    enum class RemoveBehavior {
        OrphanChildren, ///< Children become detached and must be reattached
        DropChildren    ///< Whole subtree is removed
    };

    PartitionTree() = default;

    PartitionTree(PartitionTree &&) = default;
    PartitionTree &operator=(PartitionTree &&) = default;
    PartitionTree(const PartitionTree &) = delete;
    PartitionTree &operator=(const PartitionTree &) = delete;

    bool isEmpty() const;

    /**
     * @brief Number of live nodes, detached ones included
     */
    int nodeCount() const;

    std::optional<NodeId> root() const;

    bool contains(const NodeId &id) const;

    PartitionNode &node(const NodeId &id);
    const PartitionNode &node(const NodeId &id) const;

    std::optional<NodeId> parent(const NodeId &id) const;
    const QVector<NodeId> &children(const NodeId &id) const;

    /**
     * @brief Position of @p id among its siblings
     * @return -1 for the root and detached nodes
     */
    int childIndex(const NodeId &id) const;

    // ═══════════════════════════════════════════════════════════════════════
    // Structural changes
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Insert the first node of an empty tree
     */
    NodeId insertRoot(PartitionNode node);

    /**
     * @brief Insert a node as child of @p parent
     * @param index Sibling position, -1 appends
     */
    NodeId insertUnder(const NodeId &parent, PartitionNode node, int index = -1);

    /**
     * @brief Replace @p target by a new group holding target and @p node
     *
     * The group takes target's place (same parent, same sibling index, or
     * the root). Target becomes its first child, the new node its second.
     * The group starts with a placeholder geometry and two equal sizes.
     *
     * @return Id of the inserted @p node
     */
    NodeId wrap(const NodeId &target, Orientation orientation, PartitionNode node);

    /**
     * @brief Attach a detached node under @p parent
     * @param index Sibling position, -1 appends
     */
    void attachUnder(const NodeId &id, const NodeId &parent, int index = -1);

    /**
     * @brief Make a detached node the root of a tree without one
     */
    void attachAsRoot(const NodeId &id);

    void remove(const NodeId &id, RemoveBehavior behavior);

    /**
     * @brief Copy @p source into this tree
     *
     * An empty tree takes the source structure as is. Otherwise the source
     * root is wrapped next to this tree's root (see wrap()) and the remaining
     * source nodes are copied depth-first under new ids. Either way every
     * grafted group gets a fresh liveness marker.
     *
     * @return Ids of every leaf that came from @p source
     */
    QVector<NodeId> graft(PartitionTree &&source, Orientation orientation);

    // ═══════════════════════════════════════════════════════════════════════
    // Traversal
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Pre-order ids of the subtree at @p from
     */
    QVector<NodeId> preorder(const NodeId &from) const;

    /**
     * @brief Pre-order ids of the whole tree, empty for an empty tree
     */
    QVector<NodeId> preorder() const;

    /**
     * @brief Leaf ids in pre-order
     */
    QVector<NodeId> leaves() const;

    /**
     * @brief Leaf holding @p window, if any
     */
    std::optional<NodeId> findWindow(const Window *window) const;

    // ═══════════════════════════════════════════════════════════════════════
    // Propagation bookkeeping
    // ═══════════════════════════════════════════════════════════════════════

    bool isDirty() const
    {
        return m_dirty;
    }

    void markDirty()
    {
        m_dirty = true;
    }

    void clearDirty()
    {
        m_dirty = false;
    }

private:
    struct Slot {
        std::optional<PartitionNode> node;
        quint32 generation = 0;
        std::optional<NodeId> parent;
        QVector<NodeId> children;
    };

    Slot &slot(const NodeId &id);
    const Slot &slot(const NodeId &id) const;
    NodeId allocate(PartitionNode node);
    void release(const NodeId &id);
    void detach(const NodeId &id);

    std::vector<Slot> m_slots;
    QVector<int> m_freeSlots;
    std::optional<NodeId> m_root;
    int m_count = 0;
    bool m_dirty = false;
};

} // namespace Tessera
