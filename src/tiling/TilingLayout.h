// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "FocusTarget.h"
#include "PartitionTree.h"
#include "TilingConfig.h"
#include "core/types.h"
#include "tessera_export.h"
#include <QList>
#include <QObject>
#include <QPoint>
#include <QRect>
#include <QVector>
#include <optional>
#include <vector>

namespace Tessera {

class Output;
class Seat;
class Window;

/**
 * @brief A tiled window with its global position
 */
struct TESSERA_EXPORT MappedWindow
{
    Output *output = nullptr;
    Window *window = nullptr;
    QPoint location; ///< Top-left of the window's tiled rectangle, global logical coordinates
};

/**
 * @brief A sub-surface of a tiled window with its global position
 */
struct TESSERA_EXPORT MappedSurface
{
    Output *output = nullptr;
    Window *window = nullptr;
    QString surfaceId;
    QPoint location; ///< Global logical coordinates
};

/**
 * @brief Tiling layout engine: one partition tree per output
 *
 * TilingLayout keeps every tiled window in exactly one leaf of the
 * partition tree of the output it lives on. Groups split their area along
 * one axis into integer sizes; propagation walks each tree top-down and
 * hands every leaf its rectangle.
 *
 * Every public mutation (map, unmap, updateOrientation, merge, output
 * changes) ends with refresh(), which sweeps dead windows and propagates
 * geometry to every tree whose root area changed or whose structure was
 * touched.
 *
 * Usage:
 * @code
 * auto *layout = new TilingLayout(TilingConfig::load(), this);
 * layout->mapOutput(output, output->geometry().topLeft());
 * layout->map(window, seat, focusStack);          // focusStack: most recent first
 * auto target = layout->nextFocus(FocusDirection::Right, seat, focusStack);
 * @endcode
 *
 * @note Not thread-safe. All calls must come from the thread the layout
 *       lives in. Other threads may only read Window::tilingNode().
 */
class TESSERA_EXPORT TilingLayout : public QObject
{
    Q_OBJECT

public:
    explicit TilingLayout(const TilingConfig &config = TilingConfig(), QObject *parent = nullptr);
    ~TilingLayout() override;

    // ═══════════════════════════════════════════════════════════════════════════
    // Configuration
    // ═══════════════════════════════════════════════════════════════════════════

    const TilingConfig &config() const;

    /**
     * @brief Apply a new configuration and relayout every output
     */
    void setConfig(const TilingConfig &config);

    // ═══════════════════════════════════════════════════════════════════════════
    // Outputs
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Register an output, or move an already registered one
     *
     * @param output Output to tile on (not owned)
     * @param location Placement offset of the output in global coordinates
     *
     * A re-registered output keeps its tree and its registration order.
     * Destroying a registered output unmaps it.
     */
    void mapOutput(Output *output, const QPoint &location);

    /**
     * @brief Unregister an output and hand its windows to another output
     *
     * The tree is merged into the output picked by TilingConfig::unmapPolicy.
     * With no output left, its windows are released and windowsReleased()
     * is emitted.
     */
    void unmapOutput(Output *output);

    bool hasOutput(const Output *output) const;

    /**
     * @brief Registered outputs in registration order
     */
    QList<Output *> outputs() const;

    /**
     * @brief Placement offset of a registered output
     */
    std::optional<QPoint> outputLocation(const Output *output) const;

    /**
     * @brief Partition tree of a registered output, nullptr otherwise
     */
    const PartitionTree *tree(const Output *output) const;

    // ═══════════════════════════════════════════════════════════════════════════
    // Windows
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Tile a window on the seat's active output
     *
     * The new leaf splits the most recently focused window of @p focusStack
     * that is tiled on that output, or the whole tree if none is.
     *
     * @param focusStack Windows ordered most recently focused first
     */
    void map(Window *window, Seat *seat, const QList<Window *> &focusStack);

    /**
     * @brief Remove a window from the layout
     * @return false if the window was not tiled by this layout
     */
    bool unmap(Window *window);

    /**
     * @brief Sweep dead windows and propagate geometry
     */
    void refresh();

    /**
     * @brief Change the split axis of the group around the focused window
     *
     * Sizes are rescaled to the extent along the new axis.
     */
    void updateOrientation(Orientation orientation, Seat *seat, const QList<Window *> &focusStack);

    /**
     * @brief Find the window or group focus should move to
     *
     * Left/Right/Up/Down search the neighbor in that direction, Out yields
     * the group around the focused window.
     *
     * @return std::nullopt at the edge of the layout, when nothing is
     *         focused, or when the focused window handled the request itself
     */
    std::optional<FocusTarget> nextFocus(FocusDirection direction, Seat *seat, const QList<Window *> &focusStack);

    // ═══════════════════════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════════════════════

    bool isTiled(const Window *window) const;

    int windowCount() const;

    /**
     * @brief Tiled rectangle of a window in global coordinates
     *
     * This is the window's slot shrunk by the inner gap.
     */
    std::optional<QRect> elementGeometry(const Window *window) const;

    /**
     * @brief Output a window is tiled on, nullptr if not tiled
     */
    Output *outputForElement(const Window *window) const;

    /**
     * @brief All tiled windows in tree order, output by output
     */
    QVector<MappedWindow> mapped() const;

    /**
     * @brief Sub-surfaces of all tiled windows
     */
    QVector<MappedSurface> windows() const;

    /**
     * @brief Render elements of every window tiled on @p output
     * @return std::nullopt if @p output is not registered
     */
    std::optional<QVector<RenderElement>> renderOutput(const Output *output) const;

    /**
     * @brief Move all windows of @p other into this layout
     *
     * Trees are merged output by output. Outputs unknown to this layout are
     * registered at the location @p other had them. @p other is left empty.
     */
    void merge(TilingLayout &other);

Q_SIGNALS:
    /**
     * @brief Emitted after propagation changed the geometry of an output's windows
     */
    void layoutChanged(Output *output);

    /**
     * @brief Emitted when windows lose their tiling because no output is left
     */
    void windowsReleased(const QList<Window *> &windows);

private:
    struct OutputEntry {
        Output *output = nullptr;
        QPoint location;
        PartitionTree tree;
        QMetaObject::Connection destroyedConnection;
    };

    struct WindowLocation {
        int entryIndex = -1; ///< Index into m_outputs
        NodeId node;
    };

    OutputEntry *findEntry(const Output *output);
    const OutputEntry *findEntry(const Output *output) const;
    OutputEntry *activeEntry(Seat *seat, const char *operation);
    std::optional<WindowLocation> locate(const Window *window) const;

    /**
     * @brief Leaf of the most recently focused window tiled in @p tree
     */
    static std::optional<NodeId> lastActiveLeaf(const PartitionTree &tree, const QList<Window *> &focusStack);

    void insertWindow(OutputEntry &entry, Window *window, const QList<Window *> &focusStack);

    /**
     * @brief Remove a leaf, collapsing its group if it had two children
     */
    static void removeLeaf(PartitionTree &tree, const NodeId &leaf);

    void sweepDeadWindows();

    /**
     * @brief Propagate geometry through one tree
     * @return true if the tree was laid out
     */
    bool propagate(OutputEntry &entry);

    void graftInto(OutputEntry &destination, PartitionTree &&source, Orientation orientation);
    OutputEntry *mergeTarget();
    void removeEntry(const Output *output);
    void releaseWindows(PartitionTree &tree);
    void checkOwningThread() const;

    TilingConfig m_config;
    std::vector<OutputEntry> m_outputs;
    bool m_refreshing = false;
};

} // namespace Tessera
