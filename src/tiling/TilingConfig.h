// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include <KSharedConfig>
#include <QJsonObject>
#include <QMetaType>

namespace Tessera {

/**
 * @brief Configuration for the tiling layout
 *
 * This is a value type (not QObject) for easy copying and comparison.
 *
 * @note Default values here must match TilingDefaults in constants.h.
 *       Validation and clamping use those shared constants.
 */
struct TESSERA_EXPORT TilingConfig
{
    // ═══════════════════════════════════════════════════════════════════════
    // Gap Settings
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Gap between the usable area and the tree root, in pixels
     *
     * Range: 0 to 50
     * Default: 0
     */
    int outerGap = 0;

    /**
     * @brief Inset applied to each side of every tiled window, in pixels
     *
     * Adjacent windows end up 2 * innerGap apart.
     * Range: 0 to 50
     * Default: 4
     */
    int innerGap = 4;

    // ═══════════════════════════════════════════════════════════════════════
    // Output Removal
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Which output inherits the windows of a removed output
     */
    enum class UnmapPolicy {
        MergeIntoFirst,  ///< Earliest registered remaining output (default)
        MergeIntoLargest ///< Remaining output with the largest usable area
    };

    UnmapPolicy unmapPolicy = UnmapPolicy::MergeIntoFirst;

    // ═══════════════════════════════════════════════════════════════════════
    // Comparison and Serialization
    // ═══════════════════════════════════════════════════════════════════════

    bool operator==(const TilingConfig &other) const;
    bool operator!=(const TilingConfig &other) const;

    /**
     * @brief Serialize to JSON
     */
    QJsonObject toJson() const;

    /**
     * @brief Deserialize from JSON
     *
     * Missing keys keep their defaults, out-of-range gaps are clamped.
     */
    static TilingConfig fromJson(const QJsonObject &json);

    /**
     * @brief Read the [Tiling] group of a KConfig file
     *
     * Invalid entries are logged and replaced with defaults.
     */
    static TilingConfig load(const KSharedConfigPtr &config);

    /**
     * @brief Read from the default tesserarc
     */
    static TilingConfig load();

    /**
     * @brief Write to the [Tiling] group and sync
     */
    void save(const KSharedConfigPtr &config) const;
};

} // namespace Tessera

Q_DECLARE_METATYPE(Tessera::TilingConfig)
