#include "ErrorLog.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QMutexLocker>
#include <QObject>
#include <QTextStream>

static const char* const SEPARATOR = "-----------------------------------------";

ErrorLog::ErrorLog(const QString& logDir)
    : m_logDir(logDir)
{
}

void ErrorLog::setLogDir(const QString& logDir)
{
    QMutexLocker locker(&m_mutex);
    m_logDir = logDir;
}

QString ErrorLog::logDir() const
{
    QMutexLocker locker(&m_mutex);
    return m_logDir;
}

QString ErrorLog::logFilePath() const
{
    QMutexLocker locker(&m_mutex);
    if (m_logDir.isEmpty()) {
        return QString();
    }
    return QDir(m_logDir).filePath(QLatin1String(FileName));
}

QString ErrorLog::formatEntry(const QDateTime& timestampUtc, const QString& context,
                              const QString& message, const QString& rootCause)
{
    const QString stack = rootCause.trimmed().isEmpty() ? QStringLiteral("No stack available")
                                                        : rootCause;
    QString entry;
    entry += QLatin1Char('\n');
    entry += QLatin1String(SEPARATOR) + QLatin1Char('\n');
    entry += QStringLiteral("Timestamp: ") + timestampUtc.toUTC().toString(Qt::ISODateWithMs) + QLatin1Char('\n');
    entry += QStringLiteral("Context: ") + context + QLatin1Char('\n');
    entry += QStringLiteral("Error: ") + message + QLatin1Char('\n');
    entry += QStringLiteral("Stack: ") + stack + QLatin1Char('\n');
    entry += QLatin1String(SEPARATOR) + QStringLiteral("\n\n");
    return entry;
}

bool ErrorLog::record(const QString& context, const QString& message, const QString& rootCause)
{
    const QString entry = formatEntry(QDateTime::currentDateTimeUtc(), context, message, rootCause);

    QMutexLocker locker(&m_mutex);

    if (m_logDir.isEmpty()) {
        qWarning().noquote() << "[ErrorLog]" << entry;
        return false;
    }

    QDir dir(m_logDir);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qWarning() << "[ErrorLog] Cannot create log directory" << m_logDir;
        qWarning().noquote() << entry;
        return false;
    }

    QFile file(dir.filePath(QLatin1String(FileName)));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "[ErrorLog] Cannot open log file:" << file.errorString();
        qWarning().noquote() << entry;
        return false;
    }

    QTextStream out(&file);
    out << entry;
    out.flush();
    file.close();

#ifdef TEKASTORY_DEBUG
    qDebug() << "[ErrorLog] Recorded:" << context << "-" << message;
#endif
    return true;
}

QString ErrorLog::userNotice(const QString& context, const QString& message) const
{
    const QString path = logFilePath();
    if (path.isEmpty()) {
        return QObject::tr("An error occurred: %1.\n\nError: %2").arg(context, message);
    }
    return QObject::tr("An error occurred: %1. A detailed error log ('%2') has been saved to %3.\n\nError: %4")
        .arg(context, QLatin1String(FileName), QDir::toNativeSeparators(logDir()), message);
}
