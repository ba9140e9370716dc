// ============================================================================
// AssetStore - Implementation
// ============================================================================

#include "AssetStore.h"

#include <QDebug>
#include <QMimeDatabase>
#include <QMutexLocker>
#include <QUuid>

#include <algorithm>

QString AssetStore::registerAsset(const QByteArray& bytes, const QString& originalName)
{
    const QString extension = fileExtension(originalName);

    AssetRecord rec;
    rec.bytes = bytes;
    rec.mimeHint = mimeHintFor(originalName);

    QMutexLocker locker(&m_mutex);

    // A v4 UUID collision is not expected, but a key must never overwrite
    do {
        rec.key = QUuid::createUuid().toString(QUuid::WithoutBraces) + extension;
    } while (m_records.contains(rec.key));

    m_records.insert(rec.key, rec);

#ifdef TEKASTORY_DEBUG
    qDebug() << "[AssetStore] Registered" << rec.key << "(" << bytes.size() << "bytes,"
             << rec.mimeHint << ")";
#endif
    return rec.key;
}

std::optional<QByteArray> AssetStore::resolve(const QString& key) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_records.constFind(key);
    if (it == m_records.constEnd()) {
        return std::nullopt;
    }
    return it->bytes;
}

std::optional<AssetRecord> AssetStore::record(const QString& key) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_records.constFind(key);
    if (it == m_records.constEnd()) {
        return std::nullopt;
    }
    return *it;
}

void AssetStore::put(const QString& key, const QByteArray& bytes)
{
    if (key.isEmpty()) {
        qWarning() << "[AssetStore] Ignoring put() with an empty key";
        return;
    }

    AssetRecord rec;
    rec.key = key;
    rec.bytes = bytes;
    rec.mimeHint = mimeHintFor(key);

    QMutexLocker locker(&m_mutex);
    m_records.insert(key, rec);
}

void AssetStore::clear()
{
    QMutexLocker locker(&m_mutex);
    m_records.clear();
}

QStringList AssetStore::keys() const
{
    QStringList result;
    {
        QMutexLocker locker(&m_mutex);
        result = m_records.keys();
    }
    std::sort(result.begin(), result.end());
    return result;
}

bool AssetStore::contains(const QString& key) const
{
    QMutexLocker locker(&m_mutex);
    return m_records.contains(key);
}

int AssetStore::count() const
{
    QMutexLocker locker(&m_mutex);
    return m_records.size();
}

qint64 AssetStore::totalBytes() const
{
    QMutexLocker locker(&m_mutex);
    qint64 total = 0;
    for (const AssetRecord& rec : m_records) {
        total += rec.bytes.size();
    }
    return total;
}

QString AssetStore::fileExtension(const QString& fileName)
{
    const int lastDot = fileName.lastIndexOf(QLatin1Char('.'));
    if (lastDot < 1 || lastDot == fileName.size() - 1) {
        return QString();
    }
    return fileName.mid(lastDot);
}

QString AssetStore::mimeHintFor(const QString& fileName)
{
    static const QMimeDatabase db;
    const QMimeType type = db.mimeTypeForFile(fileName, QMimeDatabase::MatchExtension);
    if (!type.isValid() || type.isDefault()) {
        return QStringLiteral("application/octet-stream");
    }
    return type.name();
}
