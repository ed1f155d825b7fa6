// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "PartitionNode.h"
#include "core/types.h"
#include "tessera_export.h"
#include <QPointer>
#include <memory>
#include <variant>

namespace Tessera {

class Output;
class Window;

/**
 * @brief Weak reference to a group of a partition tree
 *
 * Produced by focusing "out" of a window. Neither the group nor the output
 * is kept alive by it: check isAlive() before acting on the node id.
 */
struct TESSERA_EXPORT WindowGroup
{
    NodeId node;                        ///< Group id in the output's tree
    QPointer<Output> output;            ///< Output whose tree holds the group
    std::weak_ptr<GroupMarker> alive;   ///< Expires when the group is removed

    /**
     * @brief Whether the group and its output still exist
     */
    bool isAlive() const;
};

/**
 * @brief Result of a directional focus search: a window or a group
 */
class TESSERA_EXPORT FocusTarget
{
public:
    explicit FocusTarget(Window *window);
    explicit FocusTarget(WindowGroup group);

    bool isWindow() const;
    bool isGroup() const;

    /**
     * @brief Target window, nullptr for groups or once the window is gone
     */
    Window *window() const;

    /**
     * @brief Target group; fatal if this targets a window
     */
    const WindowGroup &group() const;

private:
    std::variant<QPointer<Window>, WindowGroup> m_target;
};

} // namespace Tessera
