/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef DELIVERYTIER_H
#define DELIVERYTIER_H

#include "autoresume_export.h"

#include "DeliveryTypes.h"

#include <QObject>

#include <functional>

namespace AutoResume
{

/**
 * One mechanism for getting keystrokes into a Claude session.
 *
 * deliver() discovers its own targets and reports exactly once through
 * done, possibly synchronously. Implementations may throw from deliver()
 * itself; TieredDelivery treats that as a failed tier.
 */
class AUTORESUME_EXPORT DeliveryTier : public QObject
{
    Q_OBJECT

public:
    using Done = std::function<void(const TierOutcome &)>;

    explicit DeliveryTier(QObject *parent = nullptr);
    ~DeliveryTier() override;

    virtual QString name() const = 0;
    virtual void deliver(const DeliveryRequest &request, Done done) = 0;

    /**
     * Stop whatever the last deliver() still has in flight. Called when
     * the tier ran out of time; a report arriving afterwards is ignored.
     */
    virtual void cancel();

protected:
    TierOutcome makeOutcome() const;
};

} // namespace AutoResume

#endif // DELIVERYTIER_H
