// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>

#include "fakehost.h"
#include "panels/ExclusivityController.h"
#include "panels/PanelManager.h"
#include "panels/PanelRegistry.h"
#include "panels/PanelStatusIndicator.h"

using namespace PanelDock;

/**
 * @brief Unit tests for PanelManager
 *
 * Tests cover:
 * - Bulk setup with invalid entries
 * - Forwarded control surface
 * - Host event reconciliation
 * - Status indicator wiring
 */
class TestPanelManager : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testSetup_registersValidPanelsAndReportsFirstError()
    {
        FakeHost host;
        FakeScheduler scheduler(&host);
        PanelManager manager(&host, &scheduler);

        PanelConfig broken = makePanel(&host, QStringLiteral("broken"), Edge::Invalid);
        const QList<PanelConfig> panels = {makePanel(&host, QStringLiteral("tree"), Edge::Left), broken,
                                           makePanel(&host, QStringLiteral("terminal"), Edge::Bottom)};

        GlobalConfig config;
        config.leftWidth = 25;
        QCOMPARE(manager.setup(config, panels), PanelError::InvalidConfig);

        QCOMPARE(manager.listPanels(), (QStringList{QStringLiteral("tree"), QStringLiteral("terminal")}));
        QCOMPARE(manager.config().leftWidth, qreal(25));
    }

    void testControlSurface_forwardsToController()
    {
        FakeHost host;
        FakeScheduler scheduler(&host);
        PanelManager manager(&host, &scheduler);
        manager.setup(GlobalConfig(), {makePanel(&host, QStringLiteral("A"), Edge::Left),
                                       makePanel(&host, QStringLiteral("B"), Edge::Left),
                                       makePanel(&host, QStringLiteral("T"), Edge::Top)});
        QSignalSpy spy(&manager, &PanelManager::activePanelChanged);

        QCOMPARE(manager.open(QStringLiteral("A")), PanelError::None);
        QCOMPARE(manager.switchTo(QStringLiteral("B")), PanelError::None);
        QCOMPARE(manager.controller()->edgeState(Edge::Left), QStringList{QStringLiteral("B")});

        QCOMPARE(manager.toggle(QStringLiteral("T")), PanelError::None);
        QVERIFY(manager.isPanel(host.findByType(QStringLiteral("T"))));

        QCOMPARE(manager.closeSideExcept(Edge::Left, QStringLiteral("B")), PanelError::None);
        QCOMPARE(manager.closeSide(Edge::Left), PanelError::None);
        QCOMPARE(manager.close(QStringLiteral("T")), PanelError::None);
        QCOMPARE(manager.closeAll(), PanelError::None);
        QCOMPARE(host.windowCount(), 0);

        QCOMPARE(manager.open(QStringLiteral("missing")), PanelError::UnknownPanel);
        QVERIFY(spy.count() >= 4);
        QCOMPARE(manager.completePanelNames(QStringLiteral("A")), QStringList{QStringLiteral("A")});
    }

    void testRegisterPanel_afterSetup()
    {
        FakeHost host;
        FakeScheduler scheduler(&host);
        PanelManager manager(&host, &scheduler);

        QCOMPARE(manager.registerPanel(makePanel(&host, QStringLiteral("tree"), Edge::Left)), PanelError::None);
        QCOMPARE(manager.registry()->count(), 1);
    }

    void testHandleWindowShown_laysOutExternalPanelWindow()
    {
        FakeHost host;
        FakeScheduler scheduler(&host);
        PanelManager manager(&host, &scheduler);
        manager.setup(GlobalConfig(), {makePanel(&host, QStringLiteral("tree"), Edge::Left)});

        const WindowHandle code = host.addWindow(QStringLiteral("code"));
        const WindowHandle tree = host.addWindow(QStringLiteral("tree"));

        manager.handleWindowShown(code);
        QVERIFY(host.moves.isEmpty());

        host.setCurrentWindow(tree);
        manager.handleWindowShown();
        QCOMPARE(host.window(tree).movedTo, Edge::Left);
        QVERIFY(host.window(tree).mappings.contains(QStringLiteral("q")));
    }

    void testHandleWindowEntered_closesViewWhenEnabled()
    {
        FakeHost host;
        FakeScheduler scheduler(&host);
        PanelManager manager(&host, &scheduler);
        host.addWindow(QStringLiteral("tree"));

        manager.setup(GlobalConfig(), {makePanel(&host, QStringLiteral("tree"), Edge::Left)});
        manager.handleWindowEntered();
        QCOMPARE(host.quitCalls, 0);

        GlobalConfig config;
        config.closeViewWhenOnlyPanelsRemain = true;
        manager.setup(config, {});
        manager.handleWindowEntered();
        QCOMPARE(host.quitCalls, 1);
    }

    void testStatusIndicator_followsConfig()
    {
        FakeHost host;
        FakeScheduler scheduler(&host);
        PanelManager manager(&host, &scheduler);
        QVERIFY(manager.statusIndicator() == nullptr);

        GlobalConfig config;
        config.statusIndicator = true;
        manager.setup(config, {makePanel(&host, QStringLiteral("tree"), Edge::Left)});
        QVERIFY(manager.statusIndicator() != nullptr);

        manager.open(QStringLiteral("tree"));
        QCOMPARE(manager.statusIndicator()->activePanel(Edge::Left), QStringLiteral("tree"));

        config.statusIndicator = false;
        manager.setup(config, {});
        QVERIFY(manager.statusIndicator() == nullptr);
    }

    void testDefaultScheduler_created()
    {
        FakeHost host;
        PanelManager manager(&host);
        manager.setup(GlobalConfig(), {makePanel(&host, QStringLiteral("tree"), Edge::Left)});

        // No close is pending, so the event loop scheduler is never entered
        QCOMPARE(manager.toggle(QStringLiteral("tree")), PanelError::None);
        QCOMPARE(manager.toggle(QStringLiteral("tree")), PanelError::None);
        QCOMPARE(host.windowCount(), 0);
    }
};

QTEST_MAIN(TestPanelManager)
#include "test_panel_manager.moc"
