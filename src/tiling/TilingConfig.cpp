// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "TilingConfig.h"
#include "core/constants.h"
#include "core/logging.h"
#include <KConfigGroup>
#include <algorithm>

namespace Tessera {

using namespace TilingDefaults;

namespace {
QString unmapPolicyToString(TilingConfig::UnmapPolicy policy)
{
    switch (policy) {
    case TilingConfig::UnmapPolicy::MergeIntoLargest:
        return TilingJsonKeys::MergeIntoLargest;
    case TilingConfig::UnmapPolicy::MergeIntoFirst:
    default:
        return TilingJsonKeys::MergeIntoFirst;
    }
}

TilingConfig::UnmapPolicy stringToUnmapPolicy(const QString &str)
{
    if (str == TilingJsonKeys::MergeIntoLargest) {
        return TilingConfig::UnmapPolicy::MergeIntoLargest;
    }
    if (str != TilingJsonKeys::MergeIntoFirst) {
        qCWarning(lcConfig) << "Unknown unmap policy" << str << "using" << TilingJsonKeys::MergeIntoFirst;
    }
    return TilingConfig::UnmapPolicy::MergeIntoFirst;
}

int readValidatedGap(const KConfigGroup &group, QLatin1String key, int defaultValue)
{
    const int value = group.readEntry(QString(key), defaultValue);
    if (value < MinGap || value > MaxGap) {
        qCWarning(lcConfig) << "Invalid" << key << ":" << value << "using default (must be" << MinGap << "-"
                            << MaxGap << ")";
        return defaultValue;
    }
    return value;
}
} // anonymous namespace

bool TilingConfig::operator==(const TilingConfig &other) const
{
    return outerGap == other.outerGap
        && innerGap == other.innerGap
        && unmapPolicy == other.unmapPolicy;
}

bool TilingConfig::operator!=(const TilingConfig &other) const
{
    return !(*this == other);
}

QJsonObject TilingConfig::toJson() const
{
    QJsonObject json;
    json[TilingJsonKeys::OuterGap] = outerGap;
    json[TilingJsonKeys::InnerGap] = innerGap;
    json[TilingJsonKeys::UnmapPolicy] = unmapPolicyToString(unmapPolicy);
    return json;
}

TilingConfig TilingConfig::fromJson(const QJsonObject &json)
{
    TilingConfig config;

    if (json.contains(TilingJsonKeys::OuterGap)) {
        config.outerGap = json[TilingJsonKeys::OuterGap].toInt(config.outerGap);
        config.outerGap = std::clamp(config.outerGap, MinGap, MaxGap);
    }
    if (json.contains(TilingJsonKeys::InnerGap)) {
        config.innerGap = json[TilingJsonKeys::InnerGap].toInt(config.innerGap);
        config.innerGap = std::clamp(config.innerGap, MinGap, MaxGap);
    }
    if (json.contains(TilingJsonKeys::UnmapPolicy)) {
        config.unmapPolicy = stringToUnmapPolicy(json[TilingJsonKeys::UnmapPolicy].toString());
    }

    return config;
}

TilingConfig TilingConfig::load(const KSharedConfigPtr &config)
{
    TilingConfig result;
    if (!config) {
        qCWarning(lcConfig) << "No config object, using tiling defaults";
        return result;
    }

    const KConfigGroup group = config->group(QString(ConfigKeys::TilingGroup));
    result.outerGap = readValidatedGap(group, ConfigKeys::OuterGap, OuterGap);
    result.innerGap = readValidatedGap(group, ConfigKeys::InnerGap, InnerGap);
    result.unmapPolicy = stringToUnmapPolicy(
        group.readEntry(QString(ConfigKeys::UnmapPolicy), QString(TilingJsonKeys::MergeIntoFirst)));

    qCDebug(lcConfig) << "Loaded tiling config: outerGap" << result.outerGap << "innerGap" << result.innerGap
                      << "unmapPolicy" << unmapPolicyToString(result.unmapPolicy);
    return result;
}

TilingConfig TilingConfig::load()
{
    auto config = KSharedConfig::openConfig(QString(ConfigKeys::ConfigFile));
    // KSharedConfig caches in memory, pick up external edits
    config->reparseConfiguration();
    return load(config);
}

void TilingConfig::save(const KSharedConfigPtr &config) const
{
    if (!config) {
        qCWarning(lcConfig) << "No config object, tiling config not saved";
        return;
    }

    KConfigGroup group = config->group(QString(ConfigKeys::TilingGroup));
    group.writeEntry(QString(ConfigKeys::OuterGap), outerGap);
    group.writeEntry(QString(ConfigKeys::InnerGap), innerGap);
    group.writeEntry(QString(ConfigKeys::UnmapPolicy), unmapPolicyToString(unmapPolicy));
    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to sync tiling config to" << config->name();
    }
}

} // namespace Tessera
