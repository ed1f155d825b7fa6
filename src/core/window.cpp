// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "window.h"
#include "geometryutils.h"

namespace Tessera {

Window::Window(QObject* parent)
    : QObject(parent)
{
}

Window::~Window() = default;

QVector<RenderElement> Window::renderElements(const QPoint& physicalLocation, qreal scale) const
{
    const QVector<SurfaceEntry> entries = surfaces();

    QVector<RenderElement> elements;
    elements.reserve(entries.size());
    for (const SurfaceEntry& entry : entries) {
        elements.append(RenderElement{entry.surfaceId,
                                      physicalLocation + GeometryUtils::toPhysical(entry.offset, scale), scale});
    }
    return elements;
}

std::optional<NodeId> Window::tilingNode() const
{
    QReadLocker locker(&m_nodeLock);
    return m_tilingNode;
}

void Window::setTilingNode(std::optional<NodeId> node)
{
    QWriteLocker locker(&m_nodeLock);
    m_tilingNode = node;
}

} // namespace Tessera
