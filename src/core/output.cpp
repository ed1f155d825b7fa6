// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "output.h"
#include "logging.h"
#include <QScreen>
#include <QtMath>

namespace Tessera {

Output::Output(QObject* parent)
    : QObject(parent)
{
}

Output::~Output() = default;

int Output::integerScale() const
{
    return qMax(1, qCeil(scale()));
}

ScreenOutput::ScreenOutput(QScreen* screen, QObject* parent)
    : Output(parent)
    , m_screen(screen)
{
    if (!screen) {
        qCWarning(lcOutput) << "ScreenOutput created without a screen";
        return;
    }
    qCDebug(lcOutput) << "Wrapping screen" << screen->name() << screen->geometry();
}

ScreenOutput::~ScreenOutput() = default;

QScreen* ScreenOutput::screen() const
{
    return m_screen;
}

QString ScreenOutput::name() const
{
    return m_screen ? m_screen->name() : QString();
}

QRect ScreenOutput::geometry() const
{
    return m_screen ? m_screen->geometry() : QRect();
}

qreal ScreenOutput::scale() const
{
    return m_screen ? m_screen->devicePixelRatio() : 1.0;
}

QRect ScreenOutput::usableArea() const
{
    if (!m_screen) {
        return QRect();
    }

    const QRect screenGeom = m_screen->geometry();
    QRect availGeom = m_screen->availableGeometry();

    // Some platforms report an empty available area before the first
    // panel strut arrives
    if (!availGeom.isValid()) {
        availGeom = screenGeom;
    }
    return availGeom.translated(-screenGeom.topLeft());
}

} // namespace Tessera
