/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRANSCRIPTVERIFIERTEST_H
#define TRANSCRIPTVERIFIERTEST_H

#include <QObject>

namespace AutoResume
{

class TranscriptVerifierTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    // Method selection
    void testMethodKnownTranscript();
    void testMethodScan();
    void testMethodNone();

    // Detection of activity
    void testCheckUnchanged();
    void testCheckGrowth();
    void testCheckNewSessionFile();
    void testCheckMissingTranscriptCreated();

    // Polling
    void testVerifiedWhileRunning();
    void testWindowExpires();
    void testNoneFinishesImmediately();
    void testCancelSuppressesFinished();
};

}

#endif // TRANSCRIPTVERIFIERTEST_H
