// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include <QObject>
#include <QPointer>
#include <QRect>
#include <QString>

class QScreen;

namespace Tessera {

/**
 * @brief A display output windows can be tiled on
 *
 * Identity is object identity: two Output pointers denote the same output
 * only if they are equal. Implementations are owned by the display
 * configuration layer; the tiling layout only references them.
 */
class TESSERA_EXPORT Output : public QObject
{
    Q_OBJECT

public:
    explicit Output(QObject* parent = nullptr);
    ~Output() override;

    virtual QString name() const = 0;

    /**
     * @brief Logical geometry of the whole output in compositor space
     */
    virtual QRect geometry() const = 0;

    /**
     * @brief Logical to physical pixel ratio
     */
    virtual qreal scale() const = 0;

    /**
     * @brief Integer buffer scale, scale() rounded up
     *
     * Element locations are placed on this integer grid; surface content is
     * still drawn at the fractional scale().
     */
    virtual int integerScale() const;

    /**
     * @brief Area not reserved by panels or docks
     *
     * In output-local logical coordinates (0,0 is the output's top-left).
     */
    virtual QRect usableArea() const = 0;
};

/**
 * @brief Output backed by a QScreen
 *
 * The usable area is QScreen::availableGeometry() moved into the screen's
 * local coordinate space. A destroyed screen reports empty geometry.
 */
class TESSERA_EXPORT ScreenOutput : public Output
{
    Q_OBJECT

public:
    explicit ScreenOutput(QScreen* screen, QObject* parent = nullptr);
    ~ScreenOutput() override;

    QScreen* screen() const;

    QString name() const override;
    QRect geometry() const override;
    qreal scale() const override;
    QRect usableArea() const override;

private:
    QPointer<QScreen> m_screen;
};

} // namespace Tessera
