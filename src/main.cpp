#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTimer>

#include "dayplan/core/AppContext.hpp"
#include "dayplan/core/Logging.hpp"
#include "dayplan/core/Settings.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Dayplan"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("dayplan.org"));
    QCoreApplication::setApplicationName(QStringLiteral("dayplan"));

    QCoreApplication app(argc, argv);

    QSettings settings;
    const dayplan::core::Settings config = dayplan::core::Settings::load(settings);

    dayplan::core::AppContext context(config);
    const auto report = context.open();
    for (const auto &error : report.errors) {
        qCWarning(DAYPLAN_PERSISTENCE_LOG) << error.toString();
    }
    context.startScheduler();

    // Picks up edits made by other programs in the calendar directory.
    QTimer refreshTimer;
    refreshTimer.setInterval(60 * 1000);
    QObject::connect(&refreshTimer, &QTimer::timeout, &context, [&context]() {
        const auto refreshed = context.refresh();
        for (const auto &error : refreshed.errors) {
            qCWarning(DAYPLAN_PERSISTENCE_LOG) << error.toString();
        }
    });
    refreshTimer.start();

    return app.exec();
}
