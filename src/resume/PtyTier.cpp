/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PtyTier.h"
#include "ProcessTree.h"

#include <QDebug>
#include <QFile>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace AutoResume
{

PtyTier::PtyTier(QObject *parent)
    : DeliveryTier(parent)
{
}

PtyTier::~PtyTier() = default;

QString PtyTier::name() const
{
    return Tier::Pty;
}

QString PtyTier::resolveDevice(qint64 pid)
{
    const QList<qint64> chain = ProcessTree::ancestry(pid);
    for (qint64 candidate : chain) {
        const QString device = ProcessTree::terminalDevice(candidate);
        if (!device.isEmpty()) {
            return device;
        }
    }
    return QString();
}

bool PtyTier::injectInput(const QString &device, const QByteArray &bytes, QString *error)
{
#ifdef TIOCSTI
    const QByteArray path = QFile::encodeName(device);
    const int fd = ::open(path.constData(), O_WRONLY | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        if (error) {
            *error = QStringLiteral("open %1: %2").arg(device, QString::fromLocal8Bit(std::strerror(errno)));
        }
        return false;
    }

    bool ok = true;
    for (const char c : bytes) {
        if (::ioctl(fd, TIOCSTI, &c) < 0) {
            if (error) {
                *error = QStringLiteral("TIOCSTI on %1: %2").arg(device, QString::fromLocal8Bit(std::strerror(errno)));
            }
            ok = false;
            break;
        }
    }
    ::close(fd);
    return ok;
#else
    Q_UNUSED(device)
    Q_UNUSED(bytes)
    if (error) {
        *error = QStringLiteral("terminal input injection not supported on this platform");
    }
    return false;
#endif
}

void PtyTier::deliver(const DeliveryRequest &request, Done done)
{
    TierOutcome outcome = makeOutcome();

    if (request.sourcePid <= 0) {
        outcome.error = QStringLiteral("no source pid");
        done(outcome);
        return;
    }

    const QString device = resolveDevice(request.sourcePid);
    if (device.isEmpty()) {
        outcome.error = QStringLiteral("no terminal for pid %1").arg(request.sourcePid);
        done(outcome);
        return;
    }

    outcome.discovered.append({device, request.sourcePid, ProcessTree::commandLine(request.sourcePid)});

    QString error;
    const bool sent = injectInput(device, buildResumeBytes(request.resumeText, request.menuSelection), &error);
    outcome.results.append({Tier::Pty, device, sent, error});
    outcome.success = sent;
    if (!sent) {
        qWarning() << "PtyTier::deliver() -" << error;
        outcome.error = error;
    }
    done(outcome);
}

} // namespace AutoResume

#include "moc_PtyTier.cpp"
