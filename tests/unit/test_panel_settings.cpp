// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QFile>
#include <QTemporaryDir>

#include <KConfig>
#include <KSharedConfig>

#include "fakehost.h"
#include "config/panelsettings.h"
#include "core/constants.h"
#include "panels/PanelRegistry.h"

using namespace PanelDock;

/**
 * @brief Unit tests for PanelSettings
 *
 * Each test writes a config file into a temporary directory and loads it
 * through KSharedConfig in SimpleConfig mode, so no global or cascading
 * configuration is picked up.
 */
class TestPanelSettings : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir m_dir;

    PanelSettings writeSettings(const QByteArray& contents)
    {
        const QString path = m_dir.filePath(QStringLiteral("paneldockrc-%1").arg(++m_fileCounter));
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            qFatal("Cannot write test config");
        }
        file.write(contents);
        file.close();
        return PanelSettings(KSharedConfig::openConfig(path, KConfig::SimpleConfig));
    }

    int m_fileCounter = 0;

private Q_SLOTS:
    void initTestCase()
    {
        QVERIFY(m_dir.isValid());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Global config
    // ═══════════════════════════════════════════════════════════════════════════

    void testGlobal_emptyFileGivesDefaults()
    {
        const PanelSettings settings = writeSettings(QByteArray());
        QCOMPARE(settings.loadGlobalConfig(), GlobalConfig());
    }

    void testGlobal_readsGeneralAndOptions()
    {
        const PanelSettings settings = writeSettings(
            "[General]\n"
            "LeftWidth=30\n"
            "BottomHeight=0.25\n"
            "Move=false\n"
            "CloseViewWhenOnlyPanelsRemain=true\n"
            "StatusIndicator=true\n"
            "PollIntervalMs=50\n"
            "CloseTimeoutMs=3000\n"
            "\n"
            "[Options]\n"
            "number=true\n"
            "signcolumn=yes\n");

        const GlobalConfig config = settings.loadGlobalConfig();
        QCOMPARE(config.leftWidth, qreal(30));
        QCOMPARE(config.bottomHeight, qreal(0.25));
        QCOMPARE(config.rightWidth, qreal(40));
        QVERIFY(!config.move);
        QVERIFY(config.closeViewWhenOnlyPanelsRemain);
        QVERIFY(config.statusIndicator);
        QCOMPARE(config.pollIntervalMs, 50);
        QCOMPARE(config.closeTimeoutMs, 3000);

        QCOMPARE(config.defaultOptions.value(QStringLiteral("number")), QVariant(true));
        QCOMPARE(config.defaultOptions.value(QStringLiteral("signcolumn")), QVariant(QStringLiteral("yes")));
        QCOMPARE(config.defaultOptions.value(QStringLiteral("bufhidden")).toString(), QStringLiteral("hide"));
    }

    void testGlobal_invalidValuesFallBack()
    {
        const PanelSettings settings = writeSettings(
            "[General]\n"
            "LeftWidth=-3\n"
            "RightWidth=inf\n"
            "TopHeight=nan\n"
            "BottomHeight=1e12\n"
            "PollIntervalMs=0\n"
            "CloseTimeoutMs=100000\n");

        const GlobalConfig config = settings.loadGlobalConfig();
        QCOMPARE(config.leftWidth, PanelDefaults::LeftWidth);
        QCOMPARE(config.rightWidth, PanelDefaults::RightWidth);
        QCOMPARE(config.topHeight, PanelDefaults::TopHeight);
        QCOMPARE(config.bottomHeight, PanelDefaults::BottomHeight);
        QCOMPARE(config.pollIntervalMs, PanelDefaults::PollIntervalMs);
        QCOMPARE(config.closeTimeoutMs, PanelDefaults::CloseTimeoutMs);
    }

    void testReload_picksUpFileChanges()
    {
        const QString path = m_dir.filePath(QStringLiteral("paneldockrc-reload"));
        const auto writeFile = [&path](const QByteArray& contents) {
            QFile file(path);
            QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
            file.write(contents);
        };

        writeFile("[General]\nLeftWidth=30\n");
        PanelSettings settings(KSharedConfig::openConfig(path, KConfig::SimpleConfig));
        QCOMPARE(settings.loadGlobalConfig().leftWidth, qreal(30));

        writeFile("[General]\nLeftWidth=55\n");
        settings.reload();
        QCOMPARE(settings.loadGlobalConfig().leftWidth, qreal(55));
    }

    void testParseOptionValue()
    {
        QCOMPARE(PanelSettings::parseOptionValue(QStringLiteral("true")), QVariant(true));
        QCOMPARE(PanelSettings::parseOptionValue(QStringLiteral("False")), QVariant(false));
        QCOMPARE(PanelSettings::parseOptionValue(QStringLiteral("0")), QVariant(QStringLiteral("0")));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Panels
    // ═══════════════════════════════════════════════════════════════════════════

    void testPanels_readsAllFields()
    {
        FakeHost host;
        const PanelSettings settings = writeSettings(
            "[Panel][tree]\n"
            "Edge=left\n"
            "Size=0.2\n"
            "Move=false\n"
            "Icon=T\n"
            "OpenCommand=FileTreeOpen\n"
            "CloseCommand=FileTreeClose\n"
            "MatchContentType=filetree\n"
            "ExemptFrom=^outline$,git\n"
            "\n"
            "[Panel][tree][Options]\n"
            "number=true\n");

        const QList<PanelConfig> panels = settings.loadPanels(&host);
        QCOMPARE(panels.size(), 1);

        const PanelConfig& tree = panels.first();
        QCOMPARE(tree.name, QStringLiteral("tree"));
        QCOMPARE(tree.edge, Edge::Left);
        QVERIFY(tree.size.has_value());
        QCOMPARE(*tree.size, qreal(0.2));
        QVERIFY(tree.moveOverride.has_value());
        QVERIFY(!*tree.moveOverride);
        QCOMPARE(tree.icon, QStringLiteral("T"));
        QCOMPARE(tree.openAction.kind(), PanelAction::Kind::Command);
        QCOMPARE(tree.openAction.commandText(), QStringLiteral("FileTreeOpen"));
        QCOMPARE(tree.closeAction.commandText(), QStringLiteral("FileTreeClose"));
        QCOMPARE(tree.exemptFrom, (QStringList{QStringLiteral("^outline$"), QStringLiteral("git")}));
        QCOMPARE(tree.optionOverrides.value(QStringLiteral("number")), QVariant(true));
    }

    void testPanels_optionalFieldsUnset()
    {
        FakeHost host;
        const PanelSettings settings = writeSettings(
            "[Panel][terminal]\n"
            "Edge=bottom\n"
            "OpenCommand=TermOpen\n"
            "MatchContentType=terminal\n");

        const PanelConfig terminal = settings.loadPanels(&host).first();
        QVERIFY(!terminal.size.has_value());
        QVERIFY(!terminal.moveOverride.has_value());
        QVERIFY(terminal.closeAction.isNull());
        QVERIFY(terminal.optionOverrides.isEmpty());
        QVERIFY(terminal.exemptFrom.isEmpty());
    }

    void testPanels_nonFiniteSizeIgnored()
    {
        FakeHost host;
        const PanelSettings settings = writeSettings(
            "[Panel][huge]\n"
            "Edge=left\n"
            "Size=1e12\n"
            "OpenCommand=HugeOpen\n"
            "MatchContentType=huge\n"
            "\n"
            "[Panel][tree]\n"
            "Edge=left\n"
            "Size=inf\n"
            "OpenCommand=FileTreeOpen\n"
            "MatchContentType=filetree\n");

        const QList<PanelConfig> panels = settings.loadPanels(&host);
        QCOMPARE(panels.size(), 2);
        for (const PanelConfig& panel : panels) {
            QVERIFY2(!panel.size.has_value(), qPrintable(panel.name));
        }
    }

    void testPanels_predicateFromMatchRules()
    {
        FakeHost host;
        const PanelSettings settings = writeSettings(
            "[Panel][docs]\n"
            "Edge=right\n"
            "OpenCommand=DocsOpen\n"
            "MatchContentType=help,man\n"
            "MatchContentName=\\\\.txt$\n");

        const PanelConfig docs = settings.loadPanels(&host).first();
        QVERIFY(docs.predicate);

        const WindowHandle helpTxt = host.addWindow(QStringLiteral("help"), QStringLiteral("intro.txt"));
        const WindowHandle manTxt = host.addWindow(QStringLiteral("man"), QStringLiteral("ls.txt"));
        const WindowHandle helpOther = host.addWindow(QStringLiteral("help"), QStringLiteral("intro.md"));
        const WindowHandle code = host.addWindow(QStringLiteral("code"), QStringLiteral("main.txt"));

        QVERIFY(docs.predicate(helpTxt));
        QVERIFY(docs.predicate(manTxt));
        QVERIFY(!docs.predicate(helpOther));
        QVERIFY(!docs.predicate(code));
    }

    void testPanels_sortedByName()
    {
        FakeHost host;
        const PanelSettings settings = writeSettings(
            "[Panel][zeta]\n"
            "Edge=left\n"
            "OpenCommand=Z\n"
            "MatchContentType=z\n"
            "\n"
            "[Panel][alpha]\n"
            "Edge=right\n"
            "OpenCommand=A\n"
            "MatchContentType=a\n");

        const QList<PanelConfig> panels = settings.loadPanels(&host);
        QCOMPARE(panels.size(), 2);
        QCOMPARE(panels.at(0).name, QStringLiteral("alpha"));
        QCOMPARE(panels.at(1).name, QStringLiteral("zeta"));
    }

    void testPanels_invalidEntriesFailRegistration()
    {
        FakeHost host;
        const PanelSettings settings = writeSettings(
            "[Panel][noedge]\n"
            "OpenCommand=X\n"
            "MatchContentType=x\n"
            "\n"
            "[Panel][nomatch]\n"
            "Edge=left\n"
            "OpenCommand=Y\n"
            "\n"
            "[Panel][badregex]\n"
            "Edge=left\n"
            "OpenCommand=Z\n"
            "MatchContentName=(\n"
            "\n"
            "[Panel][good]\n"
            "Edge=top\n"
            "OpenCommand=G\n"
            "MatchContentType=g\n");

        const QList<PanelConfig> panels = settings.loadPanels(&host);
        QCOMPARE(panels.size(), 4);

        PanelRegistry registry;
        int accepted = 0;
        for (const PanelConfig& panel : panels) {
            if (registry.registerPanel(panel) == PanelError::None) {
                ++accepted;
            }
        }
        QCOMPARE(accepted, 1);
        QCOMPARE(registry.panelNames(), QStringList{QStringLiteral("good")});
    }
};

QTEST_MAIN(TestPanelSettings)
#include "test_panel_settings.moc"
