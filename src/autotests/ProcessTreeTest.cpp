/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "ProcessTreeTest.h"

// Qt
#include <QCoreApplication>
#include <QDir>
#include <QProcess>
#include <QTest>

// AutoResume
#include "../resume/ProcessTree.h"

#include <unistd.h>

using namespace AutoResume;

void ProcessTreeTest::testParseStatParentPid_data()
{
    QTest::addColumn<QString>("statLine");
    QTest::addColumn<qint64>("ppid");

    QTest::newRow("plain") << QStringLiteral("1234 (bash) S 1000 1234 1234 34816") << qint64(1000);
    QTest::newRow("space in comm") << QStringLiteral("42 (tmux: server) S 1 42 42 0") << qint64(1);
    QTest::newRow("paren in comm") << QStringLiteral("77 (weird) name) R 55 77 77 0") << qint64(55);
    QTest::newRow("truncated") << QStringLiteral("77 (x) S") << qint64(0);
    QTest::newRow("garbage") << QStringLiteral("no parens here") << qint64(0);
}

void ProcessTreeTest::testParseStatParentPid()
{
    QFETCH(QString, statLine);
    QFETCH(qint64, ppid);

    QCOMPARE(ProcessTree::parseStatParentPid(statLine), ppid);
}

void ProcessTreeTest::testIsRunning()
{
    if (!QDir(QStringLiteral("/proc/self")).exists()) {
        QSKIP("/proc not available");
    }

    QVERIFY(ProcessTree::isRunning(QCoreApplication::applicationPid()));
    QVERIFY(!ProcessTree::isRunning(0));
    QVERIFY(!ProcessTree::isRunning(-5));
}

void ProcessTreeTest::testParentPid()
{
    if (!QDir(QStringLiteral("/proc/self")).exists()) {
        QSKIP("/proc not available");
    }

    QCOMPARE(ProcessTree::parentPid(QCoreApplication::applicationPid()), qint64(getppid()));
}

void ProcessTreeTest::testAncestryStartsAtPidAndEndsAtInit()
{
    if (!QDir(QStringLiteral("/proc/self")).exists()) {
        QSKIP("/proc not available");
    }

    const qint64 self = QCoreApplication::applicationPid();
    const QList<qint64> chain = ProcessTree::ancestry(self);

    QVERIFY(chain.size() >= 2);
    QCOMPARE(chain.first(), self);
    QCOMPARE(chain.at(1), qint64(getppid()));
    // Either init, or a pid whose parent is outside our pid namespace
    QVERIFY(chain.last() == 1 || ProcessTree::parentPid(chain.last()) == 0);
}

void ProcessTreeTest::testAncestryOfInvalidPid()
{
    QVERIFY(ProcessTree::ancestry(0).isEmpty());
}

void ProcessTreeTest::testCommandLine()
{
    if (!QDir(QStringLiteral("/proc/self")).exists()) {
        QSKIP("/proc not available");
    }

    const QString cmdline = ProcessTree::commandLine(QCoreApplication::applicationPid());
    QVERIFY(cmdline.contains(QStringLiteral("ProcessTreeTest")));
    QVERIFY(!cmdline.contains(QChar(0)));
    QVERIFY(ProcessTree::commandLine(0).isEmpty());
}

void ProcessTreeTest::testChildrenIncludesSpawnedProcess()
{
    if (!QDir(QStringLiteral("/proc/self")).exists()) {
        QSKIP("/proc not available");
    }

    QProcess child;
    child.start(QStringLiteral("sleep"), {QStringLiteral("5")});
    if (!child.waitForStarted(3000)) {
        QSKIP("sleep not available");
    }

    const QList<qint64> kids = ProcessTree::children(QCoreApplication::applicationPid());
    QVERIFY(kids.contains(child.processId()));
    QCOMPARE(ProcessTree::parentPid(child.processId()), QCoreApplication::applicationPid());

    child.kill();
    child.waitForFinished(3000);
}

void ProcessTreeTest::testFindClaudePidNotFound()
{
    QCOMPARE(ProcessTree::findClaudePid(0), qint64(0));

    QProcess child;
    child.start(QStringLiteral("sleep"), {QStringLiteral("5")});
    if (!child.waitForStarted(3000)) {
        QSKIP("sleep not available");
    }

    QCOMPARE(ProcessTree::findClaudePid(child.processId(), 0), qint64(0));

    child.kill();
    child.waitForFinished(3000);
}

QTEST_GUILESS_MAIN(ProcessTreeTest)

#include "moc_ProcessTreeTest.cpp"
