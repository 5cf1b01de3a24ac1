/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXTIER_H
#define TMUXTIER_H

#include "DeliveryTier.h"

namespace AutoResume
{

class TmuxManager;

/**
 * Types the resume sequence into every tmux pane running Claude
 */
class AUTORESUME_EXPORT TmuxTier : public DeliveryTier
{
    Q_OBJECT

public:
    explicit TmuxTier(QObject *parent = nullptr);
    ~TmuxTier() override;

    QString name() const override;
    void deliver(const DeliveryRequest &request, Done done) override;
    void cancel() override;

    TmuxManager *tmuxManager() const;

private:
    TmuxManager *m_tmux = nullptr;
    quint64 m_generation = 0;
};

} // namespace AutoResume

#endif // TMUXTIER_H
