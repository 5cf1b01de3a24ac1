/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TmuxTier.h"
#include "TmuxManager.h"

#include <QDebug>
#include <QPointer>

#include <memory>

namespace AutoResume
{

TmuxTier::TmuxTier(QObject *parent)
    : DeliveryTier(parent)
    , m_tmux(new TmuxManager(this))
{
}

TmuxTier::~TmuxTier() = default;

QString TmuxTier::name() const
{
    return Tier::Tmux;
}

TmuxManager *TmuxTier::tmuxManager() const
{
    return m_tmux;
}

void TmuxTier::cancel()
{
    ++m_generation;
    m_tmux->cancelAll();
}

void TmuxTier::deliver(const DeliveryRequest &request, Done done)
{
    if (!TmuxManager::isAvailable()) {
        TierOutcome outcome = makeOutcome();
        outcome.error = QStringLiteral("tmux not installed");
        done(outcome);
        return;
    }

    QPointer<TmuxTier> guard(this);
    const QList<KeyStep> steps = buildResumeSequence(request.resumeText, request.menuSelection);

    const quint64 generation = m_generation;
    m_tmux->findClaudePanesAsync(request.sourcePid, [this, guard, generation, steps, done](bool ok, const QList<DeliveryTarget> &targets) {
        if (!guard || generation != m_generation) {
            return;
        }

        auto outcome = std::make_shared<TierOutcome>(makeOutcome());
        outcome->discovered = targets;

        if (targets.isEmpty()) {
            outcome->error = ok ? QStringLiteral("no tmux pane running Claude") : QStringLiteral("tmux list-panes failed");
            done(*outcome);
            return;
        }

        // Panes are independent; send to all of them at once
        auto remaining = std::make_shared<int>(targets.size());
        for (const DeliveryTarget &target : targets) {
            m_tmux->sendSequenceAsync(target.target, steps, [outcome, remaining, target, done](bool sent, const QString &error) {
                outcome->results.append({Tier::Tmux, target.target, sent, error});
                qDebug() << "TmuxTier::deliver() -" << target.target << (sent ? "sent" : "failed") << error;
                if (--(*remaining) > 0) {
                    return;
                }
                outcome->success = outcome->sentCount() > 0;
                if (!outcome->success) {
                    outcome->error = QStringLiteral("send-keys failed for all %1 panes").arg(outcome->results.size());
                }
                done(*outcome);
            });
        }
    });
}

} // namespace AutoResume

#include "moc_TmuxTier.cpp"
