// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"

namespace Tessera {

class Output;

/**
 * @brief Input seat, queried for the output that has focus
 */
class TESSERA_EXPORT Seat
{
public:
    virtual ~Seat() = default;

    /**
     * @brief Output new windows and focus requests apply to
     * @return nullptr when no output is active
     */
    virtual Output* activeOutput() const = 0;
};

} // namespace Tessera
