#include "launcher_service.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QLoggingCategory>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("vanta-service"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    if (qEnvironmentVariable("VANTA_LOG_DEBUG") == QLatin1String("1")) {
        QLoggingCategory::setFilterRules(QStringLiteral("vanta.*.debug=true"));
    }

    vanta::LauncherService service;
    service.initialize();
    return service.run();
}
