#include "dayplan/core/Settings.hpp"

#include "dayplan/data/Event.hpp"

#include <QDir>
#include <QProcess>
#include <QStandardPaths>
#include <algorithm>

namespace dayplan {
namespace core {

namespace {
int clampedInt(const QSettings &settings, const QString &key, int fallback, int minimum, int maximum)
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    if (!ok) {
        return fallback;
    }
    return std::clamp(value, minimum, maximum);
}

QStringList commandList(const QSettings &settings, const QString &key, const QStringList &fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    const QVariant value = settings.value(key);
    if (value.type() == QVariant::StringList || value.type() == QVariant::List) {
        return value.toStringList();
    }
    return QProcess::splitCommand(value.toString());
}

QStringList nameList(const QSettings &settings, const QString &key)
{
    const QVariant value = settings.value(key);
    QStringList names;
    const QStringList raw = value.type() == QVariant::StringList || value.type() == QVariant::List
        ? value.toStringList()
        : value.toString().split(QLatin1Char(','));
    for (const QString &name : raw) {
        if (!name.trimmed().isEmpty()) {
            names << name.trimmed();
        }
    }
    return names;
}
} // namespace

Settings Settings::load(QSettings &settings)
{
    Settings result;
    result.calendarDirectory = settings.value(QStringLiteral("calendar/directory"), defaultCalendarDirectory()).toString();
    result.cachePath = settings.value(QStringLiteral("calendar/cachePath"), defaultCachePath()).toString();
    result.defaultGroup = data::normalizeGroup(settings.value(QStringLiteral("calendar/defaultGroup"), result.defaultGroup).toString());
    result.displayTimeZone = settings.value(QStringLiteral("calendar/displayTimeZone")).toString();

    result.snapMinutes = clampedInt(settings, QStringLiteral("editing/snapMinutes"), result.snapMinutes, 1, 1440);
    result.minimumDurationSeconds = clampedInt(settings, QStringLiteral("editing/minimumDurationSeconds"), result.minimumDurationSeconds, 1, 24 * 3600);
    result.undoLimit = clampedInt(settings, QStringLiteral("editing/undoLimit"), result.undoLimit, 1, 10000);

    result.notifierEnabled = settings.value(QStringLiteral("notifier/enabled"), result.notifierEnabled).toBool();
    result.notifierMaxWaitSeconds = clampedInt(settings, QStringLiteral("notifier/maxWaitSeconds"), result.notifierMaxWaitSeconds, 1, 3600);
    result.notifierCommand = commandList(settings, QStringLiteral("notifier/command"), result.notifierCommand);
    result.notifierBlacklistProcesses = nameList(settings, QStringLiteral("notifier/blacklistProcesses"));

    result.postUpdateCommand = commandList(settings, QStringLiteral("hooks/postUpdateCommand"), result.postUpdateCommand);
    result.postUpdateDelayMs = clampedInt(settings, QStringLiteral("hooks/postUpdateDelayMs"), result.postUpdateDelayMs, 0, 10 * 60 * 1000);
    return result;
}

void Settings::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("calendar/directory"), calendarDirectory);
    settings.setValue(QStringLiteral("calendar/cachePath"), cachePath);
    settings.setValue(QStringLiteral("calendar/defaultGroup"), defaultGroup);
    settings.setValue(QStringLiteral("calendar/displayTimeZone"), displayTimeZone);
    settings.setValue(QStringLiteral("editing/snapMinutes"), snapMinutes);
    settings.setValue(QStringLiteral("editing/minimumDurationSeconds"), minimumDurationSeconds);
    settings.setValue(QStringLiteral("editing/undoLimit"), undoLimit);
    settings.setValue(QStringLiteral("notifier/enabled"), notifierEnabled);
    settings.setValue(QStringLiteral("notifier/maxWaitSeconds"), notifierMaxWaitSeconds);
    settings.setValue(QStringLiteral("notifier/command"), notifierCommand);
    settings.setValue(QStringLiteral("notifier/blacklistProcesses"), notifierBlacklistProcesses);
    settings.setValue(QStringLiteral("hooks/postUpdateCommand"), postUpdateCommand);
    settings.setValue(QStringLiteral("hooks/postUpdateDelayMs"), postUpdateDelayMs);
}

QString Settings::defaultCalendarDirectory()
{
    return QDir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)).filePath(QStringLiteral("calendars"));
}

QString Settings::defaultCachePath()
{
    return QDir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)).filePath(QStringLiteral("cache.sqlite"));
}

QTimeZone Settings::displayZone() const
{
    if (displayTimeZone.isEmpty()) {
        return QTimeZone::systemTimeZone();
    }
    const QTimeZone zone(displayTimeZone.toUtf8());
    return zone.isValid() ? zone : QTimeZone::systemTimeZone();
}

} // namespace core
} // namespace dayplan
