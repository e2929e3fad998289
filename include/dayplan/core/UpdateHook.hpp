#pragma once

#include <QObject>
#include <QStringList>
#include <QTimer>

namespace dayplan {
namespace core {

// Runs a user command once the calendar files have been quiet for a delay.
// Changes arriving before the delay expires restart it.
class UpdateHook : public QObject
{
    Q_OBJECT

public:
    explicit UpdateHook(QObject *parent = nullptr);

    void setCommand(const QStringList &command);
    void setDelay(int milliseconds);

    QStringList command() const;
    bool isEnabled() const;
    bool isPending() const;

public slots:
    void schedule();
    void runNow();

signals:
    void triggered(const QStringList &command);
    void startFailed(const QString &program);

private:
    QStringList m_command;
    QTimer m_timer;
};

} // namespace core
} // namespace dayplan
