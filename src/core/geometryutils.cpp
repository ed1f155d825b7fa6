// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "geometryutils.h"
#include "logging.h"
#include <QtMath>
#include <algorithm>

namespace Tessera {

namespace GeometryUtils {

int lengthAlong(const QRect& rect, Orientation orientation)
{
    return orientation == Orientation::Horizontal ? rect.height() : rect.width();
}

QRect shrinkBy(const QRect& rect, int amount)
{
    const int width = std::max(0, rect.width() - 2 * amount);
    const int height = std::max(0, rect.height() - 2 * amount);
    return QRect(rect.x() + amount, rect.y() + amount, width, height);
}

Orientation orientationForSize(const QSize& size)
{
    return size.width() > size.height() ? Orientation::Vertical : Orientation::Horizontal;
}

Orientation mergeOrientationForSize(const QSize& size)
{
    return size.width() >= size.height() ? Orientation::Horizontal : Orientation::Vertical;
}

QVector<QRect> sliceAlong(const QRect& rect, Orientation orientation, const QVector<int>& sizes)
{
    QVector<QRect> slices;
    slices.reserve(sizes.size());

    int previous = 0;
    for (int size : sizes) {
        if (orientation == Orientation::Horizontal) {
            slices.append(QRect(rect.x(), rect.y() + previous, rect.width(), size));
        } else {
            slices.append(QRect(rect.x() + previous, rect.y(), size, rect.height()));
        }
        previous += size;
    }
    return slices;
}

QPointF focusOriginPoint(const QRect& rect, FocusDirection direction)
{
    const qreal x = rect.x();
    const qreal y = rect.y();
    const qreal w = rect.width();
    const qreal h = rect.height();

    switch (direction) {
    case FocusDirection::Down:
        return QPointF(x + w / 2, y + h);
    case FocusDirection::Up:
        return QPointF(x + w / 2, y);
    case FocusDirection::Left:
        return QPointF(x, y + h / 2);
    case FocusDirection::Right:
        return QPointF(x + w, y + h / 2);
    case FocusDirection::Out:
        break;
    }
    qCDebug(lcCore) << "focusOriginPoint: no edge for direction Out, using center";
    return QPointF(x + w / 2, y + h / 2);
}

QPointF focusCandidatePoint(const QRect& rect, FocusDirection direction)
{
    const qreal x = rect.x();
    const qreal y = rect.y();
    const qreal w = rect.width();
    const qreal h = rect.height();

    switch (direction) {
    case FocusDirection::Down:
        return QPointF(x + w / 2, y);
    case FocusDirection::Up:
        return QPointF(x + w / 2, y + h);
    case FocusDirection::Left:
        return QPointF(x + w, y + h / 2);
    case FocusDirection::Right:
        return QPointF(x, y + h / 2);
    case FocusDirection::Out:
        break;
    }
    qCDebug(lcCore) << "focusCandidatePoint: no edge for direction Out, using center";
    return QPointF(x + w / 2, y + h / 2);
}

qreal distance(const QPointF& a, const QPointF& b)
{
    const QPointF delta = b - a;
    return qSqrt(delta.x() * delta.x() + delta.y() * delta.y());
}

QPoint toPhysical(const QPoint& logical, qreal scale)
{
    return QPoint(qRound(logical.x() * scale), qRound(logical.y() * scale));
}

} // namespace GeometryUtils

} // namespace Tessera
