/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TranscriptVerifier.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

namespace AutoResume
{

namespace
{
const QString MethodTranscript = QStringLiteral("transcript");
const QString MethodScan = QStringLiteral("transcript-scan");
const QString MethodNone = QStringLiteral("none");
}

TranscriptVerifier::TranscriptVerifier(QObject *parent)
    : QObject(parent)
    , m_pollTimer(new QTimer(this))
{
    m_pollTimer->setInterval(1000);
    connect(m_pollTimer, &QTimer::timeout, this, &TranscriptVerifier::poll);
}

TranscriptVerifier::~TranscriptVerifier() = default;

QString TranscriptVerifier::defaultTranscriptRoot()
{
    return QDir::homePath() + QStringLiteral("/.claude/projects");
}

void TranscriptVerifier::setWindow(qint64 windowMs)
{
    m_windowMs = qMax<qint64>(0, windowMs);
}

qint64 TranscriptVerifier::window() const
{
    return m_windowMs;
}

void TranscriptVerifier::setPollInterval(int intervalMs)
{
    m_pollTimer->setInterval(qMax(10, intervalMs));
}

void TranscriptVerifier::setTranscriptRoot(const QString &root)
{
    m_transcriptRoot = root;
}

QString TranscriptVerifier::transcriptRoot() const
{
    return m_transcriptRoot.isEmpty() ? defaultTranscriptRoot() : m_transcriptRoot;
}

bool TranscriptVerifier::isRunning() const
{
    return m_pollTimer->isActive();
}

QString TranscriptVerifier::method() const
{
    return m_method;
}

QHash<QString, qint64> TranscriptVerifier::snapshot() const
{
    QHash<QString, qint64> sizes;

    if (m_method == MethodTranscript) {
        const QFileInfo info(m_transcriptPath);
        sizes.insert(m_transcriptPath, info.exists() ? info.size() : 0);
        return sizes;
    }

    if (m_method == MethodScan) {
        QDirIterator it(transcriptRoot(), {QStringLiteral("*.jsonl")}, QDir::Files, QDirIterator::Subdirectories);
        while (it.hasNext()) {
            it.next();
            sizes.insert(it.filePath(), it.fileInfo().size());
        }
    }
    return sizes;
}

void TranscriptVerifier::prepare(const QString &transcriptPath)
{
    cancel();

    m_transcriptPath = transcriptPath;
    if (!transcriptPath.isEmpty()) {
        // The file may not exist yet; growth from 0 still counts
        m_method = MethodTranscript;
    } else if (QFileInfo(transcriptRoot()).isDir()) {
        m_method = MethodScan;
    } else {
        m_method = MethodNone;
    }

    m_baseline = snapshot();
    m_prepared = true;
    qDebug() << "TranscriptVerifier::prepare() - Method" << m_method << "watching" << m_baseline.size() << "files";
}

void TranscriptVerifier::start(const QDateTime &deliveredAt)
{
    if (!m_prepared) {
        prepare(m_transcriptPath);
    }

    m_deliveredAt = deliveredAt.isValid() ? deliveredAt : QDateTime::currentDateTimeUtc();
    m_startedAt = QDateTime::currentDateTimeUtc();

    if (m_method == MethodNone) {
        qWarning() << "TranscriptVerifier::start() - No transcript to watch under" << transcriptRoot();
        VerificationResult result;
        result.method = MethodNone;
        result.checkedAt = m_startedAt;
        finish(result);
        return;
    }

    m_pollTimer->start();
}

void TranscriptVerifier::cancel()
{
    m_pollTimer->stop();
    m_prepared = false;
}

VerificationResult TranscriptVerifier::check() const
{
    VerificationResult result;
    result.method = m_method;
    result.checkedAt = QDateTime::currentDateTimeUtc();
    result.elapsedMs = m_startedAt.isValid() ? m_startedAt.msecsTo(result.checkedAt) : 0;

    const QHash<QString, qint64> current = snapshot();
    for (auto it = current.cbegin(); it != current.cend(); ++it) {
        const auto base = m_baseline.constFind(it.key());
        if (base != m_baseline.cend()) {
            if (it.value() > base.value()) {
                result.verified = true;
                result.transcriptPath = it.key();
                result.newBytes = it.value() - base.value();
                return result;
            }
            continue;
        }

        // A session file that appeared after delivery, e.g. a fresh conversation
        const QFileInfo info(it.key());
        if (info.size() > 0 && info.lastModified().toUTC() >= m_deliveredAt.addSecs(-1)) {
            result.verified = true;
            result.transcriptPath = it.key();
            result.newBytes = info.size();
            return result;
        }
    }
    return result;
}

void TranscriptVerifier::poll()
{
    VerificationResult result = check();
    if (result.verified) {
        qDebug() << "TranscriptVerifier::poll() - Activity in" << result.transcriptPath << "+" << result.newBytes << "bytes";
        finish(result);
        return;
    }

    if (result.elapsedMs >= m_windowMs) {
        qWarning() << "TranscriptVerifier::poll() - No activity within" << m_windowMs << "ms";
        finish(result);
    }
}

void TranscriptVerifier::finish(const VerificationResult &result)
{
    m_pollTimer->stop();
    m_prepared = false;
    Q_EMIT finished(result);
}

} // namespace AutoResume

#include "moc_TranscriptVerifier.cpp"
