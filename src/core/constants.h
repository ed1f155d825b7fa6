// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>

namespace Tessera {

/**
 * @brief Default values and limits for the tiling layout
 *
 * @note TilingConfig member initializers must match these values.
 *       Validation and clamping use the same constants.
 */
namespace TilingDefaults {
// Gaps (pixels)
constexpr int OuterGap = 0; // Gap between the usable area edge and the root
constexpr int InnerGap = 4; // Inset applied on each side of every tiled window
constexpr int MinGap = 0;
constexpr int MaxGap = 50;

// Geometry that new leaves and groups carry until their first propagation
constexpr int PlaceholderLength = 100;
}

/**
 * @brief JSON keys for TilingConfig serialization
 */
namespace TilingJsonKeys {
inline constexpr QLatin1String OuterGap{"outerGap"};
inline constexpr QLatin1String InnerGap{"innerGap"};
inline constexpr QLatin1String UnmapPolicy{"unmapPolicy"};

// UnmapPolicy values
inline constexpr QLatin1String MergeIntoFirst{"first"};
inline constexpr QLatin1String MergeIntoLargest{"largest"};
}

/**
 * @brief KConfig file, group and entry names
 */
namespace ConfigKeys {
inline constexpr QLatin1String ConfigFile{"tesserarc"};
inline constexpr QLatin1String TilingGroup{"Tiling"};
inline constexpr QLatin1String OuterGap{"OuterGap"};
inline constexpr QLatin1String InnerGap{"InnerGap"};
inline constexpr QLatin1String UnmapPolicy{"UnmapPolicy"};
}

} // namespace Tessera
