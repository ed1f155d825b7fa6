// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "PartitionNode.h"
#include "core/geometryutils.h"
#include "core/logging.h"
#include "core/window.h"
#include <QtMath>
#include <numeric>

namespace Tessera {

namespace {
int scaled(int value, int from, int to)
{
    if (from <= 0) {
        return 0;
    }
    return qRound((static_cast<qreal>(value) / from) * to);
}
} // anonymous namespace

// =============================================================================
// GroupData
// =============================================================================

GroupData GroupData::create(Orientation orientation, const QRect &geometry)
{
    GroupData group;
    group.orientation = orientation;
    group.geometry = geometry;
    const int length = GeometryUtils::lengthAlong(geometry, orientation);
    group.sizes = {length / 2, length / 2};
    group.marker = std::make_shared<GroupMarker>();
    return group;
}

int GroupData::length() const
{
    return GeometryUtils::lengthAlong(geometry, orientation);
}

int GroupData::sum() const
{
    return std::accumulate(sizes.cbegin(), sizes.cend(), 0);
}

void GroupData::addChild(int index)
{
    Q_ASSERT(index >= 0 && index <= sizes.size());

    const int total = length();
    const int equal = total / (sizes.size() + 1);
    const int remainder = total - equal;

    for (int &size : sizes) {
        size = scaled(size, total, remainder);
    }
    sizes.insert(index, total - sum());
}

void GroupData::removeChild(int index)
{
    Q_ASSERT(index >= 0 && index < sizes.size());

    const int total = length();
    const int old = sizes.takeAt(index);
    if (sizes.isEmpty()) {
        return;
    }

    // Shares are relative to what the remaining siblings hold together
    const int remaining = sum();
    for (int &size : sizes) {
        size += scaled(size, remaining, old);
    }
    absorbDrift(total);
}

void GroupData::updateGeometry(const QRect &newGeometry)
{
    rescale(length(), GeometryUtils::lengthAlong(newGeometry, orientation));
    geometry = newGeometry;
}

void GroupData::setOrientation(Orientation newOrientation)
{
    if (newOrientation == orientation) {
        return;
    }
    rescale(length(), GeometryUtils::lengthAlong(geometry, newOrientation));
    orientation = newOrientation;
}

void GroupData::rescale(int previousLength, int newLength)
{
    if (previousLength == newLength || sizes.isEmpty()) {
        return;
    }

    if (previousLength <= 0) {
        // Nothing to scale from, split evenly
        const int equal = newLength / sizes.size();
        std::fill(sizes.begin(), sizes.end(), equal);
    } else {
        for (int &size : sizes) {
            size = scaled(size, previousLength, newLength);
        }
    }
    absorbDrift(newLength);
}

void GroupData::absorbDrift(int length)
{
    const int drift = length - sum();
    if (drift != 0) {
        sizes.last() += drift;
    }
}

// =============================================================================
// PartitionNode
// =============================================================================

PartitionNode::PartitionNode(GroupData group)
    : m_data(std::move(group))
{
}

PartitionNode::PartitionNode(LeafData leaf)
    : m_data(std::move(leaf))
{
}

bool PartitionNode::isGroup() const
{
    return std::holds_alternative<GroupData>(m_data);
}

bool PartitionNode::isLeaf() const
{
    return std::holds_alternative<LeafData>(m_data);
}

GroupData &PartitionNode::group()
{
    if (!isGroup()) {
        qFatal("PartitionNode::group() called on a leaf");
    }
    return std::get<GroupData>(m_data);
}

const GroupData &PartitionNode::group() const
{
    if (!isGroup()) {
        qFatal("PartitionNode::group() called on a leaf");
    }
    return std::get<GroupData>(m_data);
}

LeafData &PartitionNode::leaf()
{
    if (!isLeaf()) {
        qFatal("PartitionNode::leaf() called on a group");
    }
    return std::get<LeafData>(m_data);
}

const LeafData &PartitionNode::leaf() const
{
    if (!isLeaf()) {
        qFatal("PartitionNode::leaf() called on a group");
    }
    return std::get<LeafData>(m_data);
}

QRect PartitionNode::geometry() const
{
    return isGroup() ? group().geometry : leaf().geometry;
}

void PartitionNode::updateGeometry(const QRect &geometry)
{
    if (isGroup()) {
        group().updateGeometry(geometry);
    } else {
        leaf().geometry = geometry;
    }
}

Window *PartitionNode::window() const
{
    return isLeaf() ? leaf().window.data() : nullptr;
}

} // namespace Tessera
