/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PTYTIER_H
#define PTYTIER_H

#include "DeliveryTier.h"

namespace AutoResume
{

/**
 * Pushes the resume bytes into the input queue of the terminal that the
 * detecting Claude process reads from.
 *
 * Needs a known source PID. Uses TIOCSTI, which recent kernels restrict;
 * when the ioctl is refused the tier fails and the next one runs.
 */
class AUTORESUME_EXPORT PtyTier : public DeliveryTier
{
    Q_OBJECT

public:
    explicit PtyTier(QObject *parent = nullptr);
    ~PtyTier() override;

    QString name() const override;
    void deliver(const DeliveryRequest &request, Done done) override;

    /**
     * Terminal of pid or its nearest ancestor that has one
     */
    static QString resolveDevice(qint64 pid);

    /**
     * Inject bytes into device's input queue. Returns false and fills
     * error on failure.
     */
    static bool injectInput(const QString &device, const QByteArray &bytes, QString *error);
};

} // namespace AutoResume

#endif // PTYTIER_H
