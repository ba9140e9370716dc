#include "AppSettings.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

AppSettings AppSettings::load()
{
    AppSettings result;

    QSettings settings("TekaStory", "App");
    result.resourceDir = settings.value("resourceDir", defaultResourceDir()).toString();
    result.logDir = settings.value("logDir", defaultLogDir()).toString();
    result.exportDpi = clampDpi(settings.value("exportDpi", DEFAULT_EXPORT_DPI).toInt());

    const QString envDir = qEnvironmentVariable("TEKASTORY_RESOURCE_DIR");
    if (!envDir.isEmpty()) {
        result.resourceDir = envDir;
    }

#ifdef TEKASTORY_DEBUG
    qDebug() << "[AppSettings] resourceDir:" << result.resourceDir
             << "logDir:" << result.logDir << "dpi:" << result.exportDpi;
#endif
    return result;
}

void AppSettings::save() const
{
    QSettings settings("TekaStory", "App");
    settings.setValue("resourceDir", resourceDir);
    settings.setValue("logDir", logDir);
    settings.setValue("exportDpi", clampDpi(exportDpi));
}

QStringList AppSettings::candidateResourceDirs()
{
    QStringList dirs;
    if (QCoreApplication::instance()) {
        dirs << QDir(QCoreApplication::applicationDirPath()).filePath(QStringLiteral("resources"));
    }
    dirs << QStringLiteral("/usr/share/tekastory")
         << QStringLiteral("/usr/local/share/tekastory");
    return dirs;
}

QString AppSettings::defaultResourceDir()
{
    const QStringList candidates = candidateResourceDirs();
    for (const QString& dir : candidates) {
        if (QDir(dir).exists(QStringLiteral("fonts"))) {
            return dir;
        }
    }
    return candidates.first();
}

QString AppSettings::defaultLogDir()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
}

int AppSettings::clampDpi(int dpi)
{
    return qBound(MIN_EXPORT_DPI, dpi, MAX_EXPORT_DPI);
}
