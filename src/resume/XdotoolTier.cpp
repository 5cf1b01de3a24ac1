/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "XdotoolTier.h"
#include "CommandRunner.h"

#include <QDebug>
#include <QPointer>

#include <memory>

namespace AutoResume
{

namespace
{
const QString xdotool = QStringLiteral("xdotool");
}

XdotoolTier::XdotoolTier(QObject *parent)
    : DeliveryTier(parent)
    , m_runner(new CommandRunner(this))
{
}

XdotoolTier::~XdotoolTier() = default;

QString XdotoolTier::name() const
{
    return Tier::Xdotool;
}

void XdotoolTier::setCommandTimeout(int timeoutMs)
{
    m_runner->setTimeout(timeoutMs);
}

QString XdotoolTier::terminalClassPattern()
{
    return QStringLiteral("gnome-terminal|konsole|xterm|terminator|alacritty|kitty");
}

QStringList XdotoolTier::parseWindowIds(const QString &output)
{
    QStringList ids;
    const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        bool ok = false;
        const QString id = line.trimmed();
        id.toULongLong(&ok);
        if (ok && !ids.contains(id)) {
            ids.append(id);
        }
    }
    return ids;
}

void XdotoolTier::cancel()
{
    ++m_generation;
    m_runner->cancelAll();
}

void XdotoolTier::deliver(const DeliveryRequest &request, Done done)
{
    if (qEnvironmentVariableIsEmpty("DISPLAY")) {
        TierOutcome outcome = makeOutcome();
        outcome.error = QStringLiteral("no X display");
        done(outcome);
        return;
    }
    if (!CommandRunner::isAvailable(xdotool)) {
        TierOutcome outcome = makeOutcome();
        outcome.error = QStringLiteral("xdotool not installed");
        done(outcome);
        return;
    }

    // Focus moves between windows, so there is no menu dismissal here:
    // just the prompt followed by Return
    const QString text = request.resumeText.isEmpty() ? QStringLiteral("continue") : request.resumeText;

    QPointer<XdotoolTier> guard(this);
    const quint64 generation = m_generation;
    m_runner->run(xdotool,
                  {QStringLiteral("search"), QStringLiteral("--class"), terminalClassPattern()},
                  [this, guard, generation, text, done](const CommandResult &result) {
                      if (!guard || generation != m_generation) {
                          return;
                      }
                      auto outcome = std::make_shared<TierOutcome>(makeOutcome());
                      // search exits 1 when nothing matched
                      const QStringList windows = parseWindowIds(result.output);
                      for (const QString &window : windows) {
                          outcome->discovered.append({window, 0, QString()});
                      }
                      if (windows.isEmpty()) {
                          outcome->error = result.timedOut ? QStringLiteral("xdotool search timed out") : QStringLiteral("no terminal windows found");
                          done(*outcome);
                          return;
                      }
                      typeInto(windows, 0, text, outcome, done);
                  });
}

void XdotoolTier::typeInto(const QStringList &windows, int index, const QString &text, std::shared_ptr<TierOutcome> outcome, Done done)
{
    if (index >= windows.size()) {
        outcome->success = outcome->sentCount() > 0;
        if (!outcome->success) {
            outcome->error = QStringLiteral("xdotool failed for all %1 windows").arg(windows.size());
        }
        done(*outcome);
        return;
    }

    const QString window = windows.at(index);
    QPointer<XdotoolTier> guard(this);
    const quint64 generation = m_generation;

    // Windows are handled one at a time since each activation steals focus
    auto fail = [this, guard, generation, windows, index, text, outcome, done, window](const CommandResult &result) {
        if (!guard || generation != m_generation) {
            return;
        }
        outcome->results.append({Tier::Xdotool, window, false, result.errorOutput.trimmed()});
        typeInto(windows, index + 1, text, outcome, done);
    };

    m_runner->run(xdotool, {QStringLiteral("windowactivate"), QStringLiteral("--sync"), window}, [=](const CommandResult &activated) {
        if (!guard || generation != m_generation) {
            return;
        }
        if (!activated.ok()) {
            fail(activated);
            return;
        }
        m_runner->run(xdotool, {QStringLiteral("type"), QStringLiteral("--clearmodifiers"), text}, [=](const CommandResult &typed) {
            if (!guard || generation != m_generation) {
                return;
            }
            if (!typed.ok()) {
                fail(typed);
                return;
            }
            m_runner->run(xdotool, {QStringLiteral("key"), QStringLiteral("Return")}, [=](const CommandResult &entered) {
                if (!guard || generation != m_generation) {
                    return;
                }
                if (!entered.ok()) {
                    fail(entered);
                    return;
                }
                qDebug() << "XdotoolTier::deliver() - Typed into window" << window;
                outcome->results.append({Tier::Xdotool, window, true, QString()});
                typeInto(windows, index + 1, text, outcome, done);
            });
        });
    });
}

} // namespace AutoResume

#include "moc_XdotoolTier.cpp"
