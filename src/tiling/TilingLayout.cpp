// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "TilingLayout.h"
#include "core/constants.h"
#include "core/geometryutils.h"
#include "core/logging.h"
#include "core/output.h"
#include "core/seat.h"
#include "core/window.h"
#include <QScopeGuard>
#include <QThread>
#include <algorithm>
#include <limits>

namespace Tessera {

TilingLayout::TilingLayout(const TilingConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
{
}

TilingLayout::~TilingLayout()
{
    // Windows outlive the layout, do not leave them pointing into freed trees
    for (OutputEntry &entry : m_outputs) {
        QObject::disconnect(entry.destroyedConnection);
        for (const NodeId &id : entry.tree.leaves()) {
            if (Window *window = entry.tree.node(id).window()) {
                window->setTilingNode(std::nullopt);
            }
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════════

const TilingConfig &TilingLayout::config() const
{
    return m_config;
}

void TilingLayout::setConfig(const TilingConfig &config)
{
    checkOwningThread();
    if (config == m_config) {
        return;
    }
    m_config = config;

    // Gap changes move every window even where the root area is unchanged
    for (OutputEntry &entry : m_outputs) {
        entry.tree.markDirty();
    }
    refresh();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Outputs
// ═══════════════════════════════════════════════════════════════════════════════

void TilingLayout::mapOutput(Output *output, const QPoint &location)
{
    checkOwningThread();
    if (!output) {
        qCWarning(lcOutput) << "mapOutput: null output";
        return;
    }

    if (OutputEntry *entry = findEntry(output)) {
        qCDebug(lcOutput) << "Output" << output->name() << "moved from" << entry->location << "to" << location;
        entry->location = location;
        return;
    }

    OutputEntry entry;
    entry.output = output;
    entry.location = location;
    // QPointer would already be null by the time destroyed() fires, so the
    // raw pointer is captured and only compared
    entry.destroyedConnection = connect(output, &QObject::destroyed, this, [this, output]() {
        qCInfo(lcOutput) << "Registered output destroyed, unmapping it";
        removeEntry(output);
    });
    m_outputs.push_back(std::move(entry));

    qCInfo(lcOutput) << "Output mapped:" << output->name() << "at" << location << "usable area"
                     << output->usableArea();
}

void TilingLayout::unmapOutput(Output *output)
{
    checkOwningThread();
    if (!findEntry(output)) {
        qCWarning(lcOutput) << "unmapOutput: output not registered" << (output ? output->name() : QString());
        return;
    }
    qCInfo(lcOutput) << "Output unmapped:" << output->name();
    removeEntry(output);
}

bool TilingLayout::hasOutput(const Output *output) const
{
    return findEntry(output) != nullptr;
}

QList<Output *> TilingLayout::outputs() const
{
    QList<Output *> result;
    result.reserve(static_cast<qsizetype>(m_outputs.size()));
    for (const OutputEntry &entry : m_outputs) {
        result.append(entry.output);
    }
    return result;
}

std::optional<QPoint> TilingLayout::outputLocation(const Output *output) const
{
    const OutputEntry *entry = findEntry(output);
    if (!entry) {
        return std::nullopt;
    }
    return entry->location;
}

const PartitionTree *TilingLayout::tree(const Output *output) const
{
    const OutputEntry *entry = findEntry(output);
    return entry ? &entry->tree : nullptr;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Windows
// ═══════════════════════════════════════════════════════════════════════════════

void TilingLayout::map(Window *window, Seat *seat, const QList<Window *> &focusStack)
{
    checkOwningThread();
    if (!window) {
        qCWarning(lcTiling) << "map: null window";
        return;
    }
    if (locate(window)) {
        qCWarning(lcTiling) << "map: window" << window->windowId() << "is already tiled";
        return;
    }

    OutputEntry *entry = activeEntry(seat, "map");
    if (!entry) {
        return;
    }

    insertWindow(*entry, window, focusStack);
    refresh();
}

bool TilingLayout::unmap(Window *window)
{
    checkOwningThread();
    const std::optional<WindowLocation> location = locate(window);
    if (!location) {
        return false;
    }

    removeLeaf(m_outputs[location->entryIndex].tree, location->node);
    window->setTilingNode(std::nullopt);
    window->setTiled(false);
    qCDebug(lcTiling) << "Unmapped window" << window->windowId();

    refresh();
    return true;
}

void TilingLayout::refresh()
{
    checkOwningThread();
    if (m_refreshing) {
        return;
    }

    QList<Output *> changed;
    {
        QScopeGuard guard([this] {
            m_refreshing = false;
        });
        m_refreshing = true;

        sweepDeadWindows();
        for (OutputEntry &entry : m_outputs) {
            if (propagate(entry)) {
                changed.append(entry.output);
            }
        }
    }

    // Emitted outside the guard, receivers may call back into the layout
    for (Output *output : std::as_const(changed)) {
        Q_EMIT layoutChanged(output);
    }
}

void TilingLayout::updateOrientation(Orientation orientation, Seat *seat, const QList<Window *> &focusStack)
{
    checkOwningThread();
    OutputEntry *entry = activeEntry(seat, "updateOrientation");
    if (!entry) {
        return;
    }

    if (const std::optional<NodeId> leaf = lastActiveLeaf(entry->tree, focusStack)) {
        if (const std::optional<NodeId> parent = entry->tree.parent(*leaf)) {
            GroupData &group = entry->tree.node(*parent).group();
            qCDebug(lcTiling) << "Orientation of" << *parent << "changed from" << group.orientation << "to"
                              << orientation;
            group.setOrientation(orientation);
            entry->tree.markDirty();
        }
    }
    refresh();
}

std::optional<FocusTarget> TilingLayout::nextFocus(FocusDirection direction, Seat *seat,
                                                   const QList<Window *> &focusStack)
{
    checkOwningThread();
    OutputEntry *entry = activeEntry(seat, "nextFocus");
    if (!entry) {
        return std::nullopt;
    }
    const PartitionTree &tree = entry->tree;

    const std::optional<NodeId> leaf = lastActiveLeaf(tree, focusStack);
    if (!leaf) {
        qCDebug(lcFocus) << "No focused window tiled on" << entry->output->name();
        return std::nullopt;
    }

    Window *focused = tree.node(*leaf).window();
    // Composite windows move focus between their own elements
    if (focused->handleFocus(direction)) {
        qCDebug(lcFocus) << "Window" << focused->windowId() << "handled focus itself";
        return std::nullopt;
    }

    const QRect origin = tree.node(*leaf).geometry();
    NodeId child = *leaf;

    while (const std::optional<NodeId> groupId = tree.parent(child)) {
        const GroupData &group = tree.node(*groupId).group();

        if (direction == FocusDirection::Out) {
            return FocusTarget(WindowGroup{*groupId, QPointer<Output>(entry->output), group.marker});
        }

        const QVector<NodeId> &siblings = tree.children(*groupId);
        const int idx = tree.childIndex(child);
        const bool horizontal = group.orientation == Orientation::Horizontal;

        std::optional<NodeId> neighbor;
        if ((horizontal && direction == FocusDirection::Down) || (!horizontal && direction == FocusDirection::Right)) {
            if (idx < siblings.size() - 1) {
                neighbor = siblings.at(idx + 1);
            }
        } else if ((horizontal && direction == FocusDirection::Up)
                   || (!horizontal && direction == FocusDirection::Left)) {
            if (idx > 0) {
                neighbor = siblings.at(idx - 1);
            }
        }

        if (!neighbor) {
            child = *groupId;
            continue;
        }

        // Descend to a leaf. Groups along the same axis are entered from the
        // near end, groups across it at the child closest to the origin.
        const bool forward = direction == FocusDirection::Down || direction == FocusDirection::Right;
        const QPointF originPoint = GeometryUtils::focusOriginPoint(origin, direction);
        NodeId current = *neighbor;
        while (tree.node(current).isGroup()) {
            const QVector<NodeId> &candidates = tree.children(current);
            if (tree.node(current).group().orientation == group.orientation) {
                current = forward ? candidates.first() : candidates.last();
                continue;
            }

            qreal best = std::numeric_limits<qreal>::max();
            for (const NodeId &candidate : candidates) {
                const QPointF point = GeometryUtils::focusCandidatePoint(tree.node(candidate).geometry(), direction);
                const qreal dist = GeometryUtils::distance(originPoint, point);
                if (dist < best) {
                    best = dist;
                    current = candidate;
                }
            }
        }

        Window *target = tree.node(current).window();
        if (!target) {
            qCDebug(lcFocus) << "Focus candidate" << current << "lost its window";
            return std::nullopt;
        }
        qCDebug(lcFocus) << "Focus moves from" << focused->windowId() << "to" << target->windowId();
        return FocusTarget(target);
    }

    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════════

bool TilingLayout::isTiled(const Window *window) const
{
    return locate(window).has_value();
}

int TilingLayout::windowCount() const
{
    int count = 0;
    for (const OutputEntry &entry : m_outputs) {
        count += entry.tree.leaves().size();
    }
    return count;
}

std::optional<QRect> TilingLayout::elementGeometry(const Window *window) const
{
    const std::optional<WindowLocation> location = locate(window);
    if (!location) {
        return std::nullopt;
    }
    const OutputEntry &entry = m_outputs[location->entryIndex];
    const QRect slot = entry.tree.node(location->node).geometry();
    return GeometryUtils::shrinkBy(slot, m_config.innerGap).translated(entry.location);
}

Output *TilingLayout::outputForElement(const Window *window) const
{
    const std::optional<WindowLocation> location = locate(window);
    return location ? m_outputs[location->entryIndex].output : nullptr;
}

QVector<MappedWindow> TilingLayout::mapped() const
{
    QVector<MappedWindow> result;
    for (const OutputEntry &entry : m_outputs) {
        for (const NodeId &id : entry.tree.leaves()) {
            const PartitionNode &node = entry.tree.node(id);
            Window *window = node.window();
            if (!window) {
                continue;
            }
            const QPoint origin = GeometryUtils::shrinkBy(node.geometry(), m_config.innerGap).topLeft();
            result.append(MappedWindow{entry.output, window, entry.location + origin});
        }
    }
    return result;
}

QVector<MappedSurface> TilingLayout::windows() const
{
    QVector<MappedSurface> result;
    for (const MappedWindow &mappedWindow : mapped()) {
        for (const SurfaceEntry &surface : mappedWindow.window->surfaces()) {
            result.append(MappedSurface{mappedWindow.output, mappedWindow.window, surface.surfaceId,
                                        mappedWindow.location + surface.offset});
        }
    }
    return result;
}

std::optional<QVector<RenderElement>> TilingLayout::renderOutput(const Output *output) const
{
    if (!findEntry(output)) {
        qCWarning(lcTiling) << "renderOutput: output not registered" << (output ? output->name() : QString());
        return std::nullopt;
    }

    // Window origins land on the integer grid, surfaces keep the fractional scale
    const qreal scale = output->scale();
    const int integerScale = output->integerScale();
    QVector<RenderElement> elements;
    for (const MappedWindow &mappedWindow : mapped()) {
        if (mappedWindow.output != output) {
            continue;
        }
        elements.append(
            mappedWindow.window->renderElements(GeometryUtils::toPhysical(mappedWindow.location, integerScale), scale));
    }
    return elements;
}

void TilingLayout::merge(TilingLayout &other)
{
    checkOwningThread();
    if (&other == this) {
        return;
    }

    std::vector<OutputEntry> incoming = std::move(other.m_outputs);
    other.m_outputs.clear();

    for (OutputEntry &source : incoming) {
        QObject::disconnect(source.destroyedConnection);
        if (!hasOutput(source.output)) {
            mapOutput(source.output, source.location);
        }
        const Orientation orientation = GeometryUtils::mergeOrientationForSize(source.output->geometry().size());
        graftInto(*findEntry(source.output), std::move(source.tree), orientation);
    }

    refresh();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Private helpers
// ═══════════════════════════════════════════════════════════════════════════════

TilingLayout::OutputEntry *TilingLayout::findEntry(const Output *output)
{
    for (OutputEntry &entry : m_outputs) {
        if (entry.output == output) {
            return &entry;
        }
    }
    return nullptr;
}

const TilingLayout::OutputEntry *TilingLayout::findEntry(const Output *output) const
{
    for (const OutputEntry &entry : m_outputs) {
        if (entry.output == output) {
            return &entry;
        }
    }
    return nullptr;
}

TilingLayout::OutputEntry *TilingLayout::activeEntry(Seat *seat, const char *operation)
{
    Output *output = seat ? seat->activeOutput() : nullptr;
    OutputEntry *entry = output ? findEntry(output) : nullptr;
    if (!entry) {
        qCWarning(lcTiling) << operation << ": active output not registered" << (output ? output->name() : QString());
    }
    return entry;
}

std::optional<TilingLayout::WindowLocation> TilingLayout::locate(const Window *window) const
{
    if (!window) {
        return std::nullopt;
    }
    const std::optional<NodeId> id = window->tilingNode();
    if (!id) {
        return std::nullopt;
    }

    // Ids are per tree, so the leaf must also hold this window
    for (int i = 0; i < static_cast<int>(m_outputs.size()); ++i) {
        const PartitionTree &tree = m_outputs[i].tree;
        if (tree.contains(*id) && tree.node(*id).window() == window) {
            return WindowLocation{i, *id};
        }
    }
    return std::nullopt;
}

std::optional<NodeId> TilingLayout::lastActiveLeaf(const PartitionTree &tree, const QList<Window *> &focusStack)
{
    for (const Window *window : focusStack) {
        if (!window) {
            continue;
        }
        const std::optional<NodeId> id = window->tilingNode();
        if (id && tree.contains(*id) && tree.node(*id).window() == window) {
            return id;
        }
    }
    return std::nullopt;
}

void TilingLayout::insertWindow(OutputEntry &entry, Window *window, const QList<Window *> &focusStack)
{
    PartitionTree &tree = entry.tree;
    const QRect placeholder(0, 0, TilingDefaults::PlaceholderLength, TilingDefaults::PlaceholderLength);
    PartitionNode leaf(LeafData{QPointer<Window>(window), placeholder});

    NodeId id;
    if (tree.isEmpty()) {
        id = tree.insertRoot(std::move(leaf));
    } else {
        NodeId reference;
        QSize referenceSize;
        if (const std::optional<NodeId> active = lastActiveLeaf(tree, focusStack)) {
            reference = *active;
            referenceSize = tree.node(reference).geometry().size();
        } else {
            reference = *tree.root();
            referenceSize = entry.output->geometry().size();
        }

        const Orientation orientation = GeometryUtils::orientationForSize(referenceSize);
        id = tree.wrap(reference, orientation, std::move(leaf));
        qCDebug(lcTiling) << "Split" << reference << orientation << "for window" << window->windowId();
    }

    window->setTilingNode(id);
    qCDebug(lcTiling) << "Mapped window" << window->windowId() << "as" << id << "on" << entry.output->name();
}

void TilingLayout::removeLeaf(PartitionTree &tree, const NodeId &leaf)
{
    const std::optional<NodeId> parentId = tree.parent(leaf);
    if (!parentId) {
        // Root leaf, the tree becomes empty
        tree.remove(leaf, PartitionTree::RemoveBehavior::DropChildren);
        return;
    }

    const int position = tree.childIndex(leaf);
    const std::optional<NodeId> grandparentId = tree.parent(*parentId);
    tree.remove(leaf, PartitionTree::RemoveBehavior::DropChildren);

    const QVector<NodeId> &remaining = tree.children(*parentId);
    if (remaining.size() > 1) {
        tree.node(*parentId).group().removeChild(position);
        return;
    }
    if (remaining.isEmpty()) {
        qFatal("TilingLayout: group with a single child found while removing a leaf");
    }

    // A group with one child is redundant, its survivor takes its place
    const NodeId survivor = remaining.first();
    const int groupPosition = tree.childIndex(*parentId);
    tree.remove(*parentId, PartitionTree::RemoveBehavior::OrphanChildren);
    if (grandparentId) {
        tree.attachUnder(survivor, *grandparentId, groupPosition);
    } else {
        tree.attachAsRoot(survivor);
    }
}

void TilingLayout::sweepDeadWindows()
{
    for (OutputEntry &entry : m_outputs) {
        for (const NodeId &id : entry.tree.leaves()) {
            Window *window = entry.tree.node(id).window();
            if (window && window->isAlive()) {
                continue;
            }
            if (window) {
                qCDebug(lcTiling) << "Removing dead window" << window->windowId();
                window->setTilingNode(std::nullopt);
            } else {
                qCDebug(lcTiling) << "Removing leaf" << id << "of a destroyed window";
            }
            removeLeaf(entry.tree, id);
        }
    }
}

bool TilingLayout::propagate(OutputEntry &entry)
{
    PartitionTree &tree = entry.tree;
    if (tree.isEmpty()) {
        tree.clearDirty();
        return false;
    }

    const QRect target = GeometryUtils::shrinkBy(entry.output->usableArea(), m_config.outerGap);
    const NodeId root = *tree.root();
    if (!tree.isDirty() && tree.node(root).geometry() == target) {
        return false;
    }

    struct Assignment {
        NodeId node;
        QRect geometry;
    };

    // Breadth-first: a group's slices are queued in child order
    QVector<Assignment> queue{{root, target}};
    for (int i = 0; i < queue.size(); ++i) {
        const Assignment current = queue.at(i);
        PartitionNode &node = tree.node(current.node);
        node.updateGeometry(current.geometry);

        if (node.isGroup()) {
            const GroupData &group = node.group();
            const QVector<NodeId> &children = tree.children(current.node);
            if (children.size() < 2 || children.size() != group.sizes.size()) {
                qFatal("TilingLayout: group %d@%u has %lld children and %lld sizes", current.node.index,
                       current.node.generation, static_cast<long long>(children.size()),
                       static_cast<long long>(group.sizes.size()));
            }
            const QVector<QRect> slices = GeometryUtils::sliceAlong(current.geometry, group.orientation, group.sizes);
            for (int c = 0; c < children.size(); ++c) {
                queue.append({children.at(c), slices.at(c)});
            }
            continue;
        }

        Window *window = node.window();
        // Fullscreen windows keep their own size
        if (!window || window->isFullscreen()) {
            continue;
        }
        window->setTiled(true);
        window->setSize(GeometryUtils::shrinkBy(current.geometry, m_config.innerGap).size());
        window->configure();
    }

    tree.clearDirty();
    qCDebug(lcTiling) << "Propagated" << queue.size() << "nodes on" << entry.output->name() << "into" << target;
    return true;
}

void TilingLayout::graftInto(OutputEntry &destination, PartitionTree &&source, Orientation orientation)
{
    const QVector<NodeId> grafted = destination.tree.graft(std::move(source), orientation);
    for (const NodeId &id : grafted) {
        if (Window *window = destination.tree.node(id).window()) {
            window->setTilingNode(id);
        }
    }
    if (!grafted.isEmpty()) {
        qCInfo(lcTiling) << "Merged" << grafted.size() << "windows into" << destination.output->name();
    }
}

TilingLayout::OutputEntry *TilingLayout::mergeTarget()
{
    if (m_outputs.empty()) {
        return nullptr;
    }

    if (m_config.unmapPolicy == TilingConfig::UnmapPolicy::MergeIntoFirst) {
        return &m_outputs.front();
    }

    OutputEntry *largest = nullptr;
    qint64 largestArea = -1;
    for (OutputEntry &entry : m_outputs) {
        const QRect area = entry.output->usableArea();
        const qint64 size = static_cast<qint64>(area.width()) * area.height();
        // Strict comparison keeps the earlier output on ties
        if (size > largestArea) {
            largestArea = size;
            largest = &entry;
        }
    }
    return largest;
}

void TilingLayout::removeEntry(const Output *output)
{
    auto it = std::find_if(m_outputs.begin(), m_outputs.end(), [output](const OutputEntry &entry) {
        return entry.output == output;
    });
    if (it == m_outputs.end()) {
        return;
    }

    QObject::disconnect(it->destroyedConnection);
    PartitionTree orphaned = std::move(it->tree);
    m_outputs.erase(it);

    if (orphaned.isEmpty()) {
        return;
    }

    OutputEntry *target = mergeTarget();
    if (!target) {
        releaseWindows(orphaned);
        return;
    }

    const Orientation orientation = GeometryUtils::mergeOrientationForSize(target->output->geometry().size());
    graftInto(*target, std::move(orphaned), orientation);
    refresh();
}

void TilingLayout::releaseWindows(PartitionTree &tree)
{
    QList<Window *> released;
    for (const NodeId &id : tree.leaves()) {
        Window *window = tree.node(id).window();
        if (!window) {
            continue;
        }
        window->setTilingNode(std::nullopt);
        window->setTiled(false);
        released.append(window);
    }
    tree = PartitionTree();

    qCInfo(lcTiling) << "No output left, released" << released.size() << "windows";
    if (!released.isEmpty()) {
        Q_EMIT windowsReleased(released);
    }
}

void TilingLayout::checkOwningThread() const
{
    Q_ASSERT_X(QThread::currentThread() == thread(), "TilingLayout", "called from a thread other than its own");
}

} // namespace Tessera
