/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef XDOTOOLTIER_H
#define XDOTOOLTIER_H

#include "DeliveryTier.h"

#include <memory>

namespace AutoResume
{

class CommandRunner;

/**
 * Last resort: activate terminal emulator windows on the X display and
 * synthesize typing with xdotool
 */
class AUTORESUME_EXPORT XdotoolTier : public DeliveryTier
{
    Q_OBJECT

public:
    explicit XdotoolTier(QObject *parent = nullptr);
    ~XdotoolTier() override;

    QString name() const override;
    void deliver(const DeliveryRequest &request, Done done) override;
    void cancel() override;

    void setCommandTimeout(int timeoutMs);

    /**
     * Window classes searched for
     */
    static QString terminalClassPattern();

    static QStringList parseWindowIds(const QString &output);

private:
    void typeInto(const QStringList &windows, int index, const QString &text, std::shared_ptr<TierOutcome> outcome, Done done);

    CommandRunner *m_runner = nullptr;
    // Bumped by cancel(); window loops started earlier stop
    quint64 m_generation = 0;
};

} // namespace AutoResume

#endif // XDOTOOLTIER_H
