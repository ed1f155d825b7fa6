// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>

#include "tiling/TilingLayout.h"
#include "mocks.h"

using namespace Tessera;

/**
 * @brief Unit tests for directional focus navigation
 *
 * The grid fixture is built on a 1000x600 output without gaps:
 *
 *   +-----+-----+
 *   |  a  |  b  |
 *   +-----+-----+
 *   |  d  |  c  |
 *   +-----+-----+
 *
 * as V[ H[a, d], H[b, c] ].
 */
class TestFocusNavigation : public QObject
{
    Q_OBJECT

private:
    struct Grid {
        MockOutput output{QStringLiteral("DP-1"), QRect(0, 0, 1000, 600)};
        MockSeat seat{&output};
        MockWindow a{QStringLiteral("a")};
        MockWindow b{QStringLiteral("b")};
        MockWindow c{QStringLiteral("c")};
        MockWindow d{QStringLiteral("d")};
        TilingLayout layout;

        Grid()
            : layout(TilingConfig{0, 0, TilingConfig::UnmapPolicy::MergeIntoFirst})
        {
            layout.mapOutput(&output, QPoint(0, 0));
            layout.map(&a, &seat, {});
            layout.map(&b, &seat, {&a});
            layout.map(&c, &seat, {&b});
            layout.map(&d, &seat, {&a});
        }

        Window *focusFrom(Window *from, FocusDirection direction)
        {
            const std::optional<FocusTarget> target = layout.nextFocus(direction, &seat, {from});
            if (!target || !target->isWindow()) {
                return nullptr;
            }
            return target->window();
        }
    };

private Q_SLOTS:
    void testGrid_layout()
    {
        Grid grid;
        QCOMPARE(*grid.layout.elementGeometry(&grid.a), QRect(0, 0, 500, 300));
        QCOMPARE(*grid.layout.elementGeometry(&grid.d), QRect(0, 300, 500, 300));
        QCOMPARE(*grid.layout.elementGeometry(&grid.b), QRect(500, 0, 500, 300));
        QCOMPARE(*grid.layout.elementGeometry(&grid.c), QRect(500, 300, 500, 300));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Directional moves
    // ═══════════════════════════════════════════════════════════════════════════

    void testSiblingWithinGroup()
    {
        Grid grid;
        QCOMPARE(grid.focusFrom(&grid.a, FocusDirection::Down), &grid.d);
        QCOMPARE(grid.focusFrom(&grid.d, FocusDirection::Up), &grid.a);
        QCOMPARE(grid.focusFrom(&grid.b, FocusDirection::Down), &grid.c);
        QCOMPARE(grid.focusFrom(&grid.c, FocusDirection::Up), &grid.b);
    }

    void testClimbsToCrossGroups()
    {
        Grid grid;
        // Origin is the facing edge midpoint, the closest child wins
        QCOMPARE(grid.focusFrom(&grid.a, FocusDirection::Right), &grid.b);
        QCOMPARE(grid.focusFrom(&grid.d, FocusDirection::Right), &grid.c);
        QCOMPARE(grid.focusFrom(&grid.b, FocusDirection::Left), &grid.a);
        QCOMPARE(grid.focusFrom(&grid.c, FocusDirection::Left), &grid.d);
    }

    void testEdgesYieldNothing()
    {
        Grid grid;
        QCOMPARE(grid.focusFrom(&grid.a, FocusDirection::Up), nullptr);
        QCOMPARE(grid.focusFrom(&grid.a, FocusDirection::Left), nullptr);
        QCOMPARE(grid.focusFrom(&grid.c, FocusDirection::Down), nullptr);
        QCOMPARE(grid.focusFrom(&grid.c, FocusDirection::Right), nullptr);
        QVERIFY(!grid.layout.nextFocus(FocusDirection::Right, &grid.seat, {&grid.b}).has_value());
    }

    void testSameAxisGroupEnteredFromNearEnd()
    {
        MockOutput output(QStringLiteral("DP-1"), QRect(0, 0, 1000, 600));
        MockSeat seat(&output);
        MockWindow a(QStringLiteral("a")), b(QStringLiteral("b")), d(QStringLiteral("d"));
        TilingLayout layout(TilingConfig{0, 0, TilingConfig::UnmapPolicy::MergeIntoFirst});
        layout.mapOutput(&output, QPoint(0, 0));

        // V[ V[a, d], b ]
        layout.map(&a, &seat, {});
        layout.map(&b, &seat, {&a});
        layout.map(&d, &seat, {&a});
        layout.updateOrientation(Orientation::Vertical, &seat, {&a});
        QCOMPARE(*layout.elementGeometry(&a), QRect(0, 0, 250, 600));
        QCOMPARE(*layout.elementGeometry(&d), QRect(250, 0, 250, 600));

        const std::optional<FocusTarget> left = layout.nextFocus(FocusDirection::Left, &seat, {&b});
        QVERIFY(left.has_value());
        QCOMPARE(left->window(), &d);

        const std::optional<FocusTarget> right = layout.nextFocus(FocusDirection::Right, &seat, {&a});
        QVERIFY(right.has_value());
        QCOMPARE(right->window(), &d);

        const std::optional<FocusTarget> onward = layout.nextFocus(FocusDirection::Right, &seat, {&d});
        QVERIFY(onward.has_value());
        QCOMPARE(onward->window(), &b);
    }

    void testFocusStackSkipsUntiledWindows()
    {
        Grid grid;
        MockWindow floating(QStringLiteral("floating"));
        const std::optional<FocusTarget> target =
            grid.layout.nextFocus(FocusDirection::Up, &grid.seat, {&floating, nullptr, &grid.c, &grid.a});
        QVERIFY(target.has_value());
        QCOMPARE(target->window(), &grid.b);
    }

    void testNothingFocused()
    {
        Grid grid;
        QVERIFY(!grid.layout.nextFocus(FocusDirection::Left, &grid.seat, {}).has_value());

        MockOutput stranger(QStringLiteral("HDMI-1"), QRect(0, 0, 800, 600));
        MockSeat elsewhere(&stranger);
        QVERIFY(!grid.layout.nextFocus(FocusDirection::Left, &elsewhere, {&grid.b}).has_value());
    }

    void testWindowHandlesFocusItself()
    {
        Grid grid;
        grid.a.handlesFocus = true;

        QVERIFY(!grid.layout.nextFocus(FocusDirection::Right, &grid.seat, {&grid.a}).has_value());
        QCOMPARE(grid.a.focusRequests, 1);
        QCOMPARE(grid.a.lastFocusRequest, FocusDirection::Right);
        QCOMPARE(grid.b.focusRequests, 0);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Out
    // ═══════════════════════════════════════════════════════════════════════════

    void testOut_rootLeafYieldsNothing()
    {
        MockOutput output(QStringLiteral("DP-1"), QRect(0, 0, 1000, 600));
        MockSeat seat(&output);
        MockWindow a(QStringLiteral("a"));
        TilingLayout layout;
        layout.mapOutput(&output, QPoint(0, 0));
        layout.map(&a, &seat, {});

        QVERIFY(!layout.nextFocus(FocusDirection::Out, &seat, {&a}).has_value());
    }

    void testOut_yieldsEnclosingGroup()
    {
        Grid grid;
        const std::optional<FocusTarget> target = grid.layout.nextFocus(FocusDirection::Out, &grid.seat, {&grid.c});
        QVERIFY(target.has_value());
        QVERIFY(target->isGroup());
        QVERIFY(!target->isWindow());
        QCOMPARE(target->window(), nullptr);

        const WindowGroup &group = target->group();
        const PartitionTree *tree = grid.layout.tree(&grid.output);
        QCOMPARE(group.node, *tree->parent(*grid.c.tilingNode()));
        QCOMPARE(group.output.data(), static_cast<Output *>(&grid.output));
        QVERIFY(group.isAlive());
    }

    void testOut_groupExpiresWhenCollapsed()
    {
        Grid grid;
        const std::optional<FocusTarget> target = grid.layout.nextFocus(FocusDirection::Out, &grid.seat, {&grid.c});
        QVERIFY(target.has_value());
        QVERIFY(target->group().isAlive());

        // Removing b collapses H[b, c] into c
        QVERIFY(grid.layout.unmap(&grid.b));
        QVERIFY(!target->group().isAlive());
    }

    void testOut_groupExpiresWithOutput()
    {
        MockSeat seat;
        MockWindow a(QStringLiteral("a")), b(QStringLiteral("b"));
        TilingLayout layout;
        auto *output = new MockOutput(QStringLiteral("DP-1"), QRect(0, 0, 1000, 600));
        seat.active = output;
        layout.mapOutput(output, QPoint(0, 0));
        layout.map(&a, &seat, {});
        layout.map(&b, &seat, {&a});

        const std::optional<FocusTarget> target = layout.nextFocus(FocusDirection::Out, &seat, {&a});
        QVERIFY(target.has_value());
        QVERIFY(target->group().isAlive());

        delete output;
        QVERIFY(!target->group().isAlive());
    }

    void testOut_groupExpiresWhenOutputUnmapped()
    {
        MockOutput left(QStringLiteral("DP-1"), QRect(0, 0, 1000, 600));
        MockOutput right(QStringLiteral("DP-2"), QRect(0, 0, 1000, 600));
        MockSeat seat(&right);
        MockWindow a(QStringLiteral("a")), b(QStringLiteral("b"));
        TilingLayout layout(TilingConfig{0, 0, TilingConfig::UnmapPolicy::MergeIntoFirst});
        layout.mapOutput(&left, QPoint(0, 0));
        layout.mapOutput(&right, QPoint(1000, 0));
        layout.map(&a, &seat, {});
        layout.map(&b, &seat, {&a});

        const std::optional<FocusTarget> target = layout.nextFocus(FocusDirection::Out, &seat, {&a});
        QVERIFY(target.has_value());
        QVERIFY(target->group().isAlive());

        // The tree moves onto the empty left output, the right output lives on
        layout.unmapOutput(&right);
        QVERIFY(layout.isTiled(&a));
        QCOMPARE(layout.outputForElement(&a), static_cast<Output *>(&left));
        QVERIFY(!target->group().isAlive());
        QVERIFY(layoutInvariantsHold(layout));
    }

    void testTarget_windowDestroyed()
    {
        Grid grid;
        auto *e = new MockWindow(QStringLiteral("e"));
        // c's slot is wider than tall, e lands to its right
        grid.layout.map(e, &grid.seat, {&grid.c});

        const std::optional<FocusTarget> target = grid.layout.nextFocus(FocusDirection::Right, &grid.seat, {&grid.c});
        QVERIFY(target.has_value());
        QVERIFY(target->isWindow());
        QCOMPARE(target->window(), e);

        delete e;
        QVERIFY(target->isWindow());
        QCOMPARE(target->window(), nullptr);
    }
};

QTEST_MAIN(TestFocusNavigation)
#include "test_focus_navigation.moc"
