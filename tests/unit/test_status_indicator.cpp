// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>

#include "fakehost.h"
#include "panels/PanelRegistry.h"
#include "panels/PanelStatusIndicator.h"

using namespace PanelDock;

/**
 * @brief Unit tests for PanelStatusIndicator
 */
class TestStatusIndicator : public QObject
{
    Q_OBJECT

private:
    static PanelStatusIndicator::Style plainStyle()
    {
        PanelStatusIndicator::Style style;
        style.separator = QStringLiteral("|");
        style.activeMarker = QStringLiteral("+");
        style.inactiveMarker = QStringLiteral("-");
        style.defaultIcon = QStringLiteral("?");
        return style;
    }

private Q_SLOTS:
    void testStatus_allInactiveInRegistrationOrder()
    {
        FakeHost host;
        PanelRegistry registry;
        PanelConfig tree = makePanel(&host, QStringLiteral("tree"), Edge::Left);
        tree.icon = QStringLiteral("T");
        registry.registerPanel(tree);
        registry.registerPanel(makePanel(&host, QStringLiteral("terminal"), Edge::Bottom));

        PanelStatusIndicator indicator(&registry);
        indicator.setStyle(plainStyle());

        QCOMPARE(indicator.statusText(), QStringLiteral("-T|-?"));
    }

    void testStatus_activePanelPerEdge()
    {
        FakeHost host;
        PanelRegistry registry;
        registry.registerPanel(makePanel(&host, QStringLiteral("tree"), Edge::Left));
        registry.registerPanel(makePanel(&host, QStringLiteral("outline"), Edge::Left));
        registry.registerPanel(makePanel(&host, QStringLiteral("terminal"), Edge::Bottom));

        PanelStatusIndicator indicator(&registry);
        PanelStatusIndicator::Style style = plainStyle();
        style.showNames = true;
        indicator.setStyle(style);
        QSignalSpy spy(&indicator, &PanelStatusIndicator::statusChanged);

        indicator.setActivePanel(Edge::Left, QStringLiteral("outline"));
        indicator.setActivePanel(Edge::Bottom, QStringLiteral("terminal"));
        QCOMPARE(indicator.statusText(), QStringLiteral("-? tree|+? outline|+? terminal"));
        QCOMPARE(indicator.activePanel(Edge::Left), QStringLiteral("outline"));
        QCOMPARE(spy.count(), 2);

        indicator.setActivePanel(Edge::Left, QString());
        QCOMPARE(indicator.statusText(), QStringLiteral("-? tree|-? outline|+? terminal"));
        QVERIFY(indicator.activePanel(Edge::Left).isEmpty());
        QCOMPARE(spy.count(), 3);
        QCOMPARE(spy.last().first().toString(), indicator.statusText());
    }

    void testStatus_edgeFilter()
    {
        FakeHost host;
        PanelRegistry registry;
        registry.registerPanel(makePanel(&host, QStringLiteral("tree"), Edge::Left));
        registry.registerPanel(makePanel(&host, QStringLiteral("terminal"), Edge::Bottom));

        PanelStatusIndicator indicator(&registry);
        PanelStatusIndicator::Style style = plainStyle();
        style.showNames = true;
        style.edgeFilter = Edge::Bottom;
        indicator.setStyle(style);

        QCOMPARE(indicator.statusText(), QStringLiteral("-? terminal"));
    }

    void testStatus_refreshesOnRegistration()
    {
        FakeHost host;
        PanelRegistry registry;
        PanelStatusIndicator indicator(&registry);
        indicator.setStyle(plainStyle());
        QVERIFY(indicator.statusText().isEmpty());
        QSignalSpy spy(&indicator, &PanelStatusIndicator::statusChanged);

        registry.registerPanel(makePanel(&host, QStringLiteral("tree"), Edge::Left));

        QCOMPARE(spy.count(), 1);
        QCOMPARE(indicator.statusText(), QStringLiteral("-?"));
    }

    void testStatus_defaultStyle()
    {
        FakeHost host;
        PanelRegistry registry;
        registry.registerPanel(makePanel(&host, QStringLiteral("tree"), Edge::Left));
        PanelStatusIndicator indicator(&registry);

        indicator.setActivePanel(Edge::Left, QStringLiteral("tree"));
        QCOMPARE(indicator.statusText(), QStringLiteral("%#PanelDockActive#") + indicator.style().defaultIcon);
    }
};

QTEST_MAIN(TestStatusIndicator)
#include "test_status_indicator.moc"
