// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "FocusTarget.h"
#include "core/output.h"
#include "core/window.h"

namespace Tessera {

bool WindowGroup::isAlive() const
{
    return !alive.expired() && !output.isNull();
}

FocusTarget::FocusTarget(Window *window)
    : m_target(QPointer<Window>(window))
{
}

FocusTarget::FocusTarget(WindowGroup group)
    : m_target(std::move(group))
{
}

bool FocusTarget::isWindow() const
{
    return std::holds_alternative<QPointer<Window>>(m_target);
}

bool FocusTarget::isGroup() const
{
    return std::holds_alternative<WindowGroup>(m_target);
}

Window *FocusTarget::window() const
{
    if (const auto *window = std::get_if<QPointer<Window>>(&m_target)) {
        return window->data();
    }
    return nullptr;
}

const WindowGroup &FocusTarget::group() const
{
    if (!isGroup()) {
        qFatal("FocusTarget::group() called on a window target");
    }
    return std::get<WindowGroup>(m_target);
}

} // namespace Tessera
