// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "types.h"
#include "tessera_export.h"
#include <QObject>
#include <QReadWriteLock>
#include <QSize>
#include <QVector>
#include <optional>

namespace Tessera {

class TilingLayout;

/**
 * @brief A toplevel window as seen by the tiling layout
 *
 * Windows are owned by the surface management layer. The layout keeps
 * non-owning references and drives the window through the virtual
 * interface below.
 *
 * Each window carries one piece of tiling state: the identifier of the
 * partition tree leaf currently representing it. Only TilingLayout writes
 * it; any thread may read it through tilingNode().
 */
class TESSERA_EXPORT Window : public QObject
{
    Q_OBJECT

public:
    explicit Window(QObject* parent = nullptr);
    ~Window() override;

    /**
     * @brief Stable identifier used in log output
     */
    virtual QString windowId() const = 0;

    /**
     * @brief Whether the client behind this window still exists
     *
     * Dead windows are swept out of the layout on the next refresh.
     */
    virtual bool isAlive() const = 0;

    virtual bool isFullscreen() const = 0;

    /**
     * @brief Offer a directional focus request to the window itself
     *
     * Composite windows (tab stacks and the like) move focus between their
     * own elements and return true. The layout then does nothing.
     */
    virtual bool handleFocus(FocusDirection direction) = 0;

    virtual void setTiled(bool tiled) = 0;
    virtual void setSize(const QSize& size) = 0;

    /**
     * @brief Commit pending state (tiled flag, size) to the client
     */
    virtual void configure() = 0;

    /**
     * @brief Constituent surfaces with offsets from the window origin
     */
    virtual QVector<SurfaceEntry> surfaces() const = 0;

    /**
     * @brief Build render elements for this window
     * @param physicalLocation Window origin in physical output pixels
     * @param scale Output scale factor
     *
     * The default implementation emits one element per surface.
     */
    virtual QVector<RenderElement> renderElements(const QPoint& physicalLocation, qreal scale) const;

    /**
     * @brief Leaf currently representing this window, if tiled
     *
     * Thread-safe.
     */
    std::optional<NodeId> tilingNode() const;

    bool isTiledInLayout() const
    {
        return tilingNode().has_value();
    }

private:
    friend class TilingLayout;
    void setTilingNode(std::optional<NodeId> node);

    mutable QReadWriteLock m_nodeLock;
    std::optional<NodeId> m_tilingNode;
};

} // namespace Tessera
