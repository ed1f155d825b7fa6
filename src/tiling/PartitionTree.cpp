// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "PartitionTree.h"
#include "core/constants.h"
#include "core/logging.h"
#include "core/window.h"

namespace Tessera {

namespace {
PartitionNode copyForGraft(const PartitionNode &node)
{
    if (node.isGroup()) {
        GroupData group = node.group();
        // The source group keeps its own marker, the copy is a new group
        group.marker = std::make_shared<GroupMarker>();
        return PartitionNode(std::move(group));
    }
    return PartitionNode(node.leaf());
}
} // anonymous namespace

// =============================================================================
// Queries
// =============================================================================

bool PartitionTree::isEmpty() const
{
    return !m_root.has_value();
}

int PartitionTree::nodeCount() const
{
    return m_count;
}

std::optional<NodeId> PartitionTree::root() const
{
    return m_root;
}

bool PartitionTree::contains(const NodeId &id) const
{
    if (id.index < 0 || id.index >= static_cast<int>(m_slots.size())) {
        return false;
    }
    const Slot &candidate = m_slots[id.index];
    return candidate.node.has_value() && candidate.generation == id.generation;
}

PartitionNode &PartitionTree::node(const NodeId &id)
{
    return *slot(id).node;
}

const PartitionNode &PartitionTree::node(const NodeId &id) const
{
    return *slot(id).node;
}

std::optional<NodeId> PartitionTree::parent(const NodeId &id) const
{
    return slot(id).parent;
}

const QVector<NodeId> &PartitionTree::children(const NodeId &id) const
{
    return slot(id).children;
}

int PartitionTree::childIndex(const NodeId &id) const
{
    const std::optional<NodeId> parentId = slot(id).parent;
    if (!parentId) {
        return -1;
    }
    const int index = slot(*parentId).children.indexOf(id);
    if (index < 0) {
        qFatal("PartitionTree: node is missing from its parent's child list");
    }
    return index;
}

// =============================================================================
// Structural changes
// =============================================================================

NodeId PartitionTree::insertRoot(PartitionNode node)
{
    if (m_root) {
        qFatal("PartitionTree::insertRoot on a tree that already has a root");
    }
    const NodeId id = allocate(std::move(node));
    m_root = id;
    m_dirty = true;
    return id;
}

NodeId PartitionTree::insertUnder(const NodeId &parent, PartitionNode node, int index)
{
    // Resolve the parent before allocating so a bad id aborts early
    slot(parent);
    const NodeId id = allocate(std::move(node));
    attachUnder(id, parent, index);
    return id;
}

NodeId PartitionTree::wrap(const NodeId &target, Orientation orientation, PartitionNode node)
{
    const std::optional<NodeId> parentId = slot(target).parent;
    const int position = childIndex(target);

    const QRect placeholder(0, 0, TilingDefaults::PlaceholderLength, TilingDefaults::PlaceholderLength);
    const NodeId groupId = allocate(PartitionNode(GroupData::create(orientation, placeholder)));

    // The group takes the target's place without disturbing sibling order
    if (parentId) {
        slot(*parentId).children[position] = groupId;
        slot(groupId).parent = parentId;
    } else {
        m_root = groupId;
    }

    slot(target).parent = groupId;
    slot(groupId).children.append(target);

    m_dirty = true;
    return insertUnder(groupId, std::move(node));
}

void PartitionTree::attachUnder(const NodeId &id, const NodeId &parent, int index)
{
    Slot &child = slot(id);
    if (child.parent || m_root == id) {
        qFatal("PartitionTree::attachUnder on a node that is still attached");
    }

    QVector<NodeId> &siblings = slot(parent).children;
    if (index < 0 || index > siblings.size()) {
        index = siblings.size();
    }
    siblings.insert(index, id);
    child.parent = parent;
    m_dirty = true;
}

void PartitionTree::attachAsRoot(const NodeId &id)
{
    if (m_root) {
        qFatal("PartitionTree::attachAsRoot on a tree that already has a root");
    }
    if (slot(id).parent) {
        qFatal("PartitionTree::attachAsRoot on a node that still has a parent");
    }
    m_root = id;
    m_dirty = true;
}

void PartitionTree::remove(const NodeId &id, RemoveBehavior behavior)
{
    detach(id);

    if (behavior == RemoveBehavior::DropChildren) {
        const QVector<NodeId> subtree = preorder(id);
        for (const NodeId &member : subtree) {
            release(member);
        }
    } else {
        for (const NodeId &child : std::as_const(slot(id).children)) {
            slot(child).parent.reset();
        }
        release(id);
    }
    m_dirty = true;
}

QVector<NodeId> PartitionTree::graft(PartitionTree &&source, Orientation orientation)
{
    if (source.isEmpty()) {
        return {};
    }

    if (isEmpty()) {
        *this = std::move(source);
        source = PartitionTree();
        m_dirty = true;
        // Moved groups belong to a new tree, handles taken on the source expire
        for (const NodeId &id : preorder()) {
            PartitionNode &moved = node(id);
            if (moved.isGroup()) {
                moved.group().marker = std::make_shared<GroupMarker>();
            }
        }
        return leaves();
    }

    const NodeId sourceRoot = *source.root();
    const PartitionNode &sourceRootNode = source.node(sourceRoot);
    const NodeId copiedRoot = wrap(*m_root, orientation, copyForGraft(sourceRootNode));

    QVector<NodeId> grafted;
    if (sourceRootNode.isLeaf()) {
        grafted.append(copiedRoot);
    }

    struct Pending {
        NodeId sourceId;
        NodeId parentId;
    };

    // Children are pushed in reverse so siblings are copied in order
    QVector<Pending> stack;
    const QVector<NodeId> &rootChildren = source.children(sourceRoot);
    for (auto it = rootChildren.crbegin(); it != rootChildren.crend(); ++it) {
        stack.append({*it, copiedRoot});
    }

    while (!stack.isEmpty()) {
        const Pending pending = stack.takeLast();
        const PartitionNode &sourceNode = source.node(pending.sourceId);
        const NodeId copied = insertUnder(pending.parentId, copyForGraft(sourceNode));
        if (sourceNode.isLeaf()) {
            grafted.append(copied);
        }

        const QVector<NodeId> &children = source.children(pending.sourceId);
        for (auto it = children.crbegin(); it != children.crend(); ++it) {
            stack.append({*it, copied});
        }
    }

    source = PartitionTree();
    return grafted;
}

// =============================================================================
// Traversal
// =============================================================================

QVector<NodeId> PartitionTree::preorder(const NodeId &from) const
{
    QVector<NodeId> order;
    QVector<NodeId> stack{from};
    while (!stack.isEmpty()) {
        const NodeId current = stack.takeLast();
        order.append(current);
        const QVector<NodeId> &kids = children(current);
        for (auto it = kids.crbegin(); it != kids.crend(); ++it) {
            stack.append(*it);
        }
    }
    return order;
}

QVector<NodeId> PartitionTree::preorder() const
{
    return m_root ? preorder(*m_root) : QVector<NodeId>();
}

QVector<NodeId> PartitionTree::leaves() const
{
    QVector<NodeId> result;
    for (const NodeId &id : preorder()) {
        if (node(id).isLeaf()) {
            result.append(id);
        }
    }
    return result;
}

std::optional<NodeId> PartitionTree::findWindow(const Window *window) const
{
    if (!window) {
        return std::nullopt;
    }
    for (const NodeId &id : leaves()) {
        if (node(id).window() == window) {
            return id;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Arena management
// =============================================================================

PartitionTree::Slot &PartitionTree::slot(const NodeId &id)
{
    if (!contains(id)) {
        qFatal("PartitionTree: stale or foreign node id %d@%u", id.index, id.generation);
    }
    return m_slots[id.index];
}

const PartitionTree::Slot &PartitionTree::slot(const NodeId &id) const
{
    if (!contains(id)) {
        qFatal("PartitionTree: stale or foreign node id %d@%u", id.index, id.generation);
    }
    return m_slots[id.index];
}

NodeId PartitionTree::allocate(PartitionNode node)
{
    int index;
    if (!m_freeSlots.isEmpty()) {
        index = m_freeSlots.takeLast();
    } else {
        index = static_cast<int>(m_slots.size());
        m_slots.emplace_back();
    }

    Slot &fresh = m_slots[index];
    fresh.node.emplace(std::move(node));
    fresh.parent.reset();
    fresh.children.clear();
    ++m_count;
    return NodeId{index, fresh.generation};
}

void PartitionTree::release(const NodeId &id)
{
    Slot &old = slot(id);
    old.node.reset();
    old.parent.reset();
    old.children.clear();
    ++old.generation;
    m_freeSlots.append(id.index);
    --m_count;
}

void PartitionTree::detach(const NodeId &id)
{
    Slot &target = slot(id);
    if (target.parent) {
        slot(*target.parent).children.removeOne(id);
        target.parent.reset();
    } else if (m_root == id) {
        m_root.reset();
    }
}

} // namespace Tessera
