#pragma once

#include <QDateTime>
#include <QString>

namespace dayplan {
namespace notify {

// Delivers one pre-rendered notification. Called from the scheduler thread;
// implementations must not block for long.
class Notifier
{
public:
    virtual ~Notifier() = default;

    virtual void notify(const QString &title, const QString &body, const QDateTime &fireTime) = 0;
};

} // namespace notify
} // namespace dayplan
