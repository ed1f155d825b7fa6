// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "core/output.h"
#include "core/seat.h"
#include "core/window.h"
#include "tiling/TilingLayout.h"

#include <QDebug>
#include <QRect>
#include <QSize>
#include <QString>
#include <QVector>

namespace Tessera {

/**
 * @brief Window double that records what the layout asks of it
 */
class MockWindow : public Window
{
public:
    explicit MockWindow(const QString &id, QObject *parent = nullptr)
        : Window(parent)
        , m_id(id)
    {
    }

    QString windowId() const override
    {
        return m_id;
    }

    bool isAlive() const override
    {
        return alive;
    }

    bool isFullscreen() const override
    {
        return fullscreen;
    }

    bool handleFocus(FocusDirection direction) override
    {
        lastFocusRequest = direction;
        ++focusRequests;
        return handlesFocus;
    }

    void setTiled(bool value) override
    {
        tiled = value;
    }

    void setSize(const QSize &value) override
    {
        size = value;
        ++setSizeCalls;
    }

    void configure() override
    {
        ++configureCalls;
    }

    QVector<SurfaceEntry> surfaces() const override
    {
        return surfaceList;
    }

    // Behavior
    bool alive = true;
    bool fullscreen = false;
    bool handlesFocus = false;
    QVector<SurfaceEntry> surfaceList;

    // Recorded state
    bool tiled = false;
    QSize size;
    int setSizeCalls = 0;
    int configureCalls = 0;
    int focusRequests = 0;
    FocusDirection lastFocusRequest = FocusDirection::Out;

private:
    QString m_id;
};

/**
 * @brief Output with fixed, settable geometry
 */
class MockOutput : public Output
{
public:
    MockOutput(const QString &name, const QRect &geometry, QObject *parent = nullptr)
        : Output(parent)
        , m_name(name)
        , m_geometry(geometry)
        , m_usableArea(QRect(QPoint(0, 0), geometry.size()))
    {
    }

    QString name() const override
    {
        return m_name;
    }

    QRect geometry() const override
    {
        return m_geometry;
    }

    qreal scale() const override
    {
        return m_scale;
    }

    QRect usableArea() const override
    {
        return m_usableArea;
    }

    void setUsableArea(const QRect &area)
    {
        m_usableArea = area;
    }

    void setScale(qreal scale)
    {
        m_scale = scale;
    }

private:
    QString m_name;
    QRect m_geometry;
    QRect m_usableArea;
    qreal m_scale = 1.0;
};

class MockSeat : public Seat
{
public:
    explicit MockSeat(Output *output = nullptr)
        : active(output)
    {
    }

    Output *activeOutput() const override
    {
        return active;
    }

    Output *active = nullptr;
};

/**
 * @brief Structural checks every tree must pass after any operation
 *
 * Every group has at least two children, one size per child, and sizes that
 * sum to its extent along the split axis.
 */
inline bool treeInvariantsHold(const PartitionTree &tree)
{
    for (const NodeId &id : tree.preorder()) {
        const PartitionNode &node = tree.node(id);
        if (!node.isGroup()) {
            continue;
        }
        const GroupData &group = node.group();
        const int childCount = tree.children(id).size();
        if (childCount < 2 || group.sizes.size() != childCount || group.sum() != group.length()) {
            qWarning() << "Broken group" << id << "children" << childCount << "sizes" << group.sizes
                       << "extent" << group.length();
            return false;
        }
    }
    return true;
}

inline bool layoutInvariantsHold(const TilingLayout &layout)
{
    const QList<Output *> outputs = layout.outputs();
    for (Output *output : outputs) {
        if (!treeInvariantsHold(*layout.tree(output))) {
            qWarning() << "on output" << output->name();
            return false;
        }
    }
    return true;
}

} // namespace Tessera
