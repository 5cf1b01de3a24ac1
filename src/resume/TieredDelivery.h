/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TIEREDDELIVERY_H
#define TIEREDDELIVERY_H

#include "autoresume_export.h"

#include "DeliveryTypes.h"

#include <QList>
#include <QObject>

#include <functional>
#include <memory>

namespace AutoResume
{

class DeliveryTier;
struct ResumeConfig;

/**
 * TieredDelivery runs delivery tiers in priority order until one succeeds.
 *
 * A tier succeeds when at least one of its targets accepted the text; the
 * remaining tiers are then skipped. A tier that throws, or does not report
 * within the tier timeout, counts as failed and the next one runs. A tier
 * that timed out is cancelled first.
 */
class AUTORESUME_EXPORT TieredDelivery : public QObject
{
    Q_OBJECT

public:
    using Done = std::function<void(const DeliveryAttempt &)>;

    explicit TieredDelivery(QObject *parent = nullptr);
    ~TieredDelivery() override;

    /**
     * tmux, then pty, then xdotool, with command timeouts from config. The
     * tier timeout is sized so that all three fit in the delivery watchdog.
     */
    static TieredDelivery *createDefault(const ResumeConfig &config, QObject *parent = nullptr);

    /**
     * Append a tier. Takes ownership.
     */
    void addTier(DeliveryTier *tier);
    QList<DeliveryTier *> tiers() const;

    void setTierTimeout(int timeoutMs);
    int tierTimeout() const;

    void deliverResume(const DeliveryRequest &request, Done done);

Q_SIGNALS:
    void tierFinished(const QString &tier, bool success, const QString &error);

private:
    struct Pass;

    void runTier(const std::shared_ptr<Pass> &pass);
    void tierReported(const std::shared_ptr<Pass> &pass, const TierOutcome &outcome);
    void finishPass(const std::shared_ptr<Pass> &pass);

    QList<DeliveryTier *> m_tiers;
    int m_tierTimeoutMs = 60 * 1000;
};

} // namespace AutoResume

#endif // TIEREDDELIVERY_H
