#pragma once

#include <QSettings>
#include <QString>
#include <QStringList>
#include <QTimeZone>

namespace dayplan {
namespace core {

struct Settings
{
    QString calendarDirectory;
    QString cachePath;
    QString defaultGroup = QStringLiteral("personal");
    // Empty means the system zone.
    QString displayTimeZone;

    int snapMinutes = 15;
    int minimumDurationSeconds = 60;
    int undoLimit = 100;

    bool notifierEnabled = true;
    int notifierMaxWaitSeconds = 60;
    QStringList notifierCommand = { QStringLiteral("notify-send") };
    // Notifications are swallowed while a process with one of these names runs.
    QStringList notifierBlacklistProcesses;

    QStringList postUpdateCommand;
    int postUpdateDelayMs = 2000;

    // Missing keys keep their defaults, out-of-range values are clamped.
    static Settings load(QSettings &settings);
    void save(QSettings &settings) const;

    static QString defaultCalendarDirectory();
    static QString defaultCachePath();

    QTimeZone displayZone() const;
};

} // namespace core
} // namespace dayplan
