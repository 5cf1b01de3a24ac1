/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TieredDelivery.h"
#include "DeliveryTier.h"
#include "PtyTier.h"
#include "ResumeConfig.h"
#include "TmuxManager.h"
#include "TmuxTier.h"
#include "XdotoolTier.h"

#include <QDebug>
#include <QPointer>
#include <QTimer>

#include <exception>

namespace AutoResume
{

struct TieredDelivery::Pass {
    DeliveryRequest request;
    Done done;
    DeliveryAttempt attempt;
    QStringList errors;
    int index = 0;
    bool finished = false;
};

TieredDelivery::TieredDelivery(QObject *parent)
    : QObject(parent)
{
}

TieredDelivery::~TieredDelivery() = default;

TieredDelivery *TieredDelivery::createDefault(const ResumeConfig &config, QObject *parent)
{
    auto *delivery = new TieredDelivery(parent);

    auto *tmux = new TmuxTier(delivery);
    tmux->tmuxManager()->setCommandTimeout(config.commandTimeoutMs);
    delivery->addTier(tmux);

    delivery->addTier(new PtyTier(delivery));

    auto *xdotool = new XdotoolTier(delivery);
    xdotool->setCommandTimeout(config.commandTimeoutMs);
    delivery->addTier(xdotool);

    // Every tier must get its turn before the attempt watchdog fires
    const int tierCount = static_cast<int>(delivery->tiers().size());
    delivery->setTierTimeout(config.deliveryWatchdogMs / 10 * 9 / tierCount);
    return delivery;
}

void TieredDelivery::addTier(DeliveryTier *tier)
{
    if (!tier || m_tiers.contains(tier)) {
        return;
    }
    tier->setParent(this);
    m_tiers.append(tier);
}

QList<DeliveryTier *> TieredDelivery::tiers() const
{
    return m_tiers;
}

void TieredDelivery::setTierTimeout(int timeoutMs)
{
    m_tierTimeoutMs = qMax(1, timeoutMs);
}

int TieredDelivery::tierTimeout() const
{
    return m_tierTimeoutMs;
}

void TieredDelivery::deliverResume(const DeliveryRequest &request, Done done)
{
    auto pass = std::make_shared<Pass>();
    pass->request = request;
    pass->done = std::move(done);

    qDebug() << "TieredDelivery::deliverResume() - Delivering" << request.resumeText << "source pid:" << request.sourcePid;
    runTier(pass);
}

void TieredDelivery::runTier(const std::shared_ptr<Pass> &pass)
{
    if (pass->index >= m_tiers.size()) {
        finishPass(pass);
        return;
    }

    QPointer<DeliveryTier> tier = m_tiers.at(pass->index);
    const QString tierName = tier->name();
    pass->attempt.tiersAttempted.append(tierName);

    auto reported = std::make_shared<bool>(false);
    auto *timer = new QTimer(this);
    timer->setSingleShot(true);

    QPointer<TieredDelivery> guard(this);
    auto report = [this, guard, pass, reported, timer](const TierOutcome &outcome) {
        if (*reported || !guard) {
            return;
        }
        *reported = true;
        timer->stop();
        timer->deleteLater();
        tierReported(pass, outcome);
    };

    connect(timer, &QTimer::timeout, this, [report, tier, tierName, this]() {
        qWarning() << "TieredDelivery::runTier() - Tier" << tierName << "did not report within" << m_tierTimeoutMs << "ms";
        // Keep it from typing into a session while the next tier injects
        if (tier) {
            tier->cancel();
        }
        TierOutcome outcome;
        outcome.tier = tierName;
        outcome.error = QStringLiteral("timed out");
        report(outcome);
    });
    timer->start(m_tierTimeoutMs);

    try {
        tier->deliver(pass->request, report);
    } catch (const std::exception &e) {
        if (*reported) {
            // Thrown from further down the chain, not by this tier
            throw;
        }
        qWarning() << "TieredDelivery::runTier() - Tier" << tierName << "threw:" << e.what();
        TierOutcome outcome;
        outcome.tier = tierName;
        outcome.error = QString::fromUtf8(e.what());
        report(outcome);
    } catch (...) {
        if (*reported) {
            throw;
        }
        qWarning() << "TieredDelivery::runTier() - Tier" << tierName << "threw an unknown exception";
        TierOutcome outcome;
        outcome.tier = tierName;
        outcome.error = QStringLiteral("unknown exception");
        report(outcome);
    }
}

void TieredDelivery::tierReported(const std::shared_ptr<Pass> &pass, const TierOutcome &outcome)
{
    if (pass->finished) {
        return;
    }

    pass->attempt.targets.append(outcome.results);
    Q_EMIT tierFinished(outcome.tier, outcome.success, outcome.error);

    if (outcome.success) {
        pass->attempt.success = true;
        pass->attempt.tier = outcome.tier;
        if (outcome.failedCount() > 0) {
            qWarning() << "TieredDelivery::tierReported() - Tier" << outcome.tier << "reached" << outcome.sentCount() << "of"
                       << outcome.results.size() << "targets";
        }
        finishPass(pass);
        return;
    }

    qDebug() << "TieredDelivery::tierReported() - Tier" << outcome.tier << "failed:" << outcome.error;
    pass->errors.append(QStringLiteral("%1: %2").arg(outcome.tier, outcome.error));
    ++pass->index;
    runTier(pass);
}

void TieredDelivery::finishPass(const std::shared_ptr<Pass> &pass)
{
    if (pass->finished) {
        return;
    }
    pass->finished = true;

    if (!pass->attempt.success) {
        if (pass->attempt.noTargets()) {
            pass->attempt.error = QStringLiteral("no delivery targets found");
        } else {
            pass->attempt.error = QStringLiteral("all delivery tiers failed");
        }
        if (!pass->errors.isEmpty()) {
            pass->attempt.error += QStringLiteral(" (%1)").arg(pass->errors.join(QStringLiteral("; ")));
        }
        qWarning() << "TieredDelivery::finishPass() -" << pass->attempt.error;
    } else {
        qDebug() << "TieredDelivery::finishPass() - Delivered via" << pass->attempt.tier << "after" << pass->attempt.tiersAttempted;
    }

    if (pass->done) {
        pass->done(pass->attempt);
    }
}

} // namespace AutoResume

#include "moc_TieredDelivery.cpp"
