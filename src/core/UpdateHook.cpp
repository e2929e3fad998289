#include "dayplan/core/UpdateHook.hpp"

#include "dayplan/core/Logging.hpp"

#include <QProcess>

namespace dayplan {
namespace core {

UpdateHook::UpdateHook(QObject *parent)
    : QObject(parent)
{
    m_timer.setSingleShot(true);
    m_timer.setInterval(2000);
    connect(&m_timer, &QTimer::timeout, this, &UpdateHook::runNow);
}

void UpdateHook::setCommand(const QStringList &command)
{
    m_command = command;
    if (m_command.isEmpty()) {
        m_timer.stop();
    }
}

void UpdateHook::setDelay(int milliseconds)
{
    m_timer.setInterval(qMax(0, milliseconds));
}

QStringList UpdateHook::command() const
{
    return m_command;
}

bool UpdateHook::isEnabled() const
{
    return !m_command.isEmpty();
}

bool UpdateHook::isPending() const
{
    return m_timer.isActive();
}

void UpdateHook::schedule()
{
    if (!isEnabled()) {
        return;
    }
    qCDebug(DAYPLAN_HOOK_LOG) << "Post-update hook due in" << m_timer.interval() << "ms";
    m_timer.start();
}

void UpdateHook::runNow()
{
    m_timer.stop();
    if (!isEnabled()) {
        return;
    }
    const QString program = m_command.first();
    if (!QProcess::startDetached(program, m_command.mid(1))) {
        qCWarning(DAYPLAN_HOOK_LOG) << "Failed to start post-update hook" << program;
        emit startFailed(program);
        return;
    }
    qCDebug(DAYPLAN_HOOK_LOG) << "Started post-update hook" << m_command;
    emit triggered(m_command);
}

} // namespace core
} // namespace dayplan
