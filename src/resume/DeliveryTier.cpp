/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "DeliveryTier.h"

namespace AutoResume
{

DeliveryTier::DeliveryTier(QObject *parent)
    : QObject(parent)
{
}

DeliveryTier::~DeliveryTier() = default;

void DeliveryTier::cancel()
{
}

TierOutcome DeliveryTier::makeOutcome() const
{
    TierOutcome outcome;
    outcome.tier = name();
    return outcome;
}

} // namespace AutoResume

#include "moc_DeliveryTier.cpp"
