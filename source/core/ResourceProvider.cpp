#include "ResourceProvider.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QMutexLocker>
#include <QObject>
#include <QRegularExpression>

BundledResourceProvider::BundledResourceProvider(const QString& rootDir)
    : m_rootDir(QDir::cleanPath(rootDir))
{
}

std::optional<QByteArray> BundledResourceProvider::fetch(const QString& path,
                                                         QString* errorMessage) const
{
    auto fail = [errorMessage](const QString& message) -> std::optional<QByteArray> {
        if (errorMessage) {
            *errorMessage = message;
        }
        return std::nullopt;
    };

    // Resource paths are relative to the root; refuse anything that climbs out
    const QString relative = QDir::cleanPath(path).remove(QRegularExpression(QStringLiteral("^/+")));
    if (relative.isEmpty() || relative.startsWith(QLatin1String(".."))) {
        return fail(QObject::tr("Invalid resource path: %1").arg(path));
    }

    const QString filePath = m_rootDir + QLatin1Char('/') + relative;
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return fail(QObject::tr("Failed to read resource %1: %2")
                        .arg(filePath, file.errorString()));
    }

    QByteArray bytes = file.readAll();
    file.close();

#ifdef TEKASTORY_DEBUG
    qDebug() << "[BundledResourceProvider] Fetched" << path << "(" << bytes.size() << "bytes)";
#endif
    return bytes;
}

// ============================================================================
// MemoryResourceProvider
// ============================================================================

void MemoryResourceProvider::insert(const QString& path, const QByteArray& bytes)
{
    QMutexLocker locker(&m_mutex);
    m_resources.insert(path, bytes);
}

void MemoryResourceProvider::remove(const QString& path)
{
    QMutexLocker locker(&m_mutex);
    m_resources.remove(path);
}

std::optional<QByteArray> MemoryResourceProvider::fetch(const QString& path,
                                                        QString* errorMessage) const
{
    QMutexLocker locker(&m_mutex);
    m_fetchCounts[path]++;

    auto it = m_resources.constFind(path);
    if (it == m_resources.constEnd()) {
        if (errorMessage) {
            *errorMessage = QObject::tr("Resource not available: %1").arg(path);
        }
        return std::nullopt;
    }
    return it.value();
}

int MemoryResourceProvider::fetchCount(const QString& path) const
{
    QMutexLocker locker(&m_mutex);
    return m_fetchCounts.value(path, 0);
}

int MemoryResourceProvider::fetchCountWithPrefix(const QString& prefix) const
{
    QMutexLocker locker(&m_mutex);
    int total = 0;
    for (auto it = m_fetchCounts.constBegin(); it != m_fetchCounts.constEnd(); ++it) {
        if (it.key().startsWith(prefix)) {
            total += it.value();
        }
    }
    return total;
}
