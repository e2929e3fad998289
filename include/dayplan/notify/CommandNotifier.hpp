#pragma once

#include <QStringList>

#include "dayplan/notify/Notifier.hpp"

namespace dayplan {
namespace notify {

// Runs an external program (notify-send by default) with title and body
// appended to its arguments.
class CommandNotifier : public Notifier
{
public:
    explicit CommandNotifier(QStringList command = { QStringLiteral("notify-send") });

    void notify(const QString &title, const QString &body, const QDateTime &fireTime) override;

    QStringList command() const;
    QStringList argumentsFor(const QString &title, const QString &body) const;

private:
    QStringList m_command;
};

} // namespace notify
} // namespace dayplan
