#include "dayplan/notify/CommandNotifier.hpp"

#include "dayplan/core/Logging.hpp"

#include <QProcess>

namespace dayplan {
namespace notify {

CommandNotifier::CommandNotifier(QStringList command)
    : m_command(std::move(command))
{
}

void CommandNotifier::notify(const QString &title, const QString &body, const QDateTime &fireTime)
{
    if (m_command.isEmpty()) {
        qCWarning(DAYPLAN_SCHEDULER_LOG) << "No notifier command configured, dropping" << title;
        return;
    }
    if (!QProcess::startDetached(m_command.first(), argumentsFor(title, body))) {
        qCWarning(DAYPLAN_SCHEDULER_LOG) << "Failed to start notifier" << m_command.first() << "for" << title;
        return;
    }
    qCDebug(DAYPLAN_SCHEDULER_LOG) << "Notified" << title << "due at" << fireTime;
}

QStringList CommandNotifier::command() const
{
    return m_command;
}

QStringList CommandNotifier::argumentsFor(const QString &title, const QString &body) const
{
    QStringList arguments = m_command.mid(1);
    arguments << title << body;
    return arguments;
}

} // namespace notify
} // namespace dayplan
