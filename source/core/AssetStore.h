#pragma once

// ============================================================================
// AssetStore - In-memory registry of image bytes keyed by opaque identifiers
// ============================================================================
// Every picture a project uses (panel images, backgrounds, logos) lives here
// once, under a key of the form "<uuid><.ext>". The key doubles as the file
// name inside a .tekastory package (assets/<key>).
//
// The store is session scoped: the engine owns one instance, replaces it
// wholesale on load and clears it on reset. Records are never mutated after
// registration, only replaced by put().
// ============================================================================

#include <QByteArray>
#include <QHash>
#include <QMutex>
#include <QString>
#include <QStringList>

#include <optional>

/**
 * @brief One registered asset.
 */
struct AssetRecord {
    QString key;            ///< "<uuid><.ext>"
    QByteArray bytes;       ///< Raw file content as registered
    QString mimeHint;       ///< Derived from the extension, e.g. "image/png"
};

/**
 * @brief Content registry for project images.
 *
 * Thread Safety: all methods may be called from several threads. Key
 * generation uses random UUIDs (no shared counter); the map itself is
 * guarded by a mutex.
 */
class AssetStore {
public:
    AssetStore() = default;

    AssetStore(const AssetStore&) = delete;
    AssetStore& operator=(const AssetStore&) = delete;

    /**
     * @brief Register bytes under a fresh key.
     * @param bytes File content
     * @param originalName Source file name; only its extension is kept
     * @return The new key (never collides with an existing one)
     */
    QString registerAsset(const QByteArray& bytes, const QString& originalName);

    /**
     * @brief Look up the bytes for a key.
     * @return The bytes, or std::nullopt when the key is unknown.
     */
    std::optional<QByteArray> resolve(const QString& key) const;

    /**
     * @brief Full record for a key (bytes + mime hint).
     */
    std::optional<AssetRecord> record(const QString& key) const;

    /**
     * @brief Insert or replace bytes under a predetermined key.
     *
     * Used when restoring a store from a package, where keys come from the
     * archive entry names.
     */
    void put(const QString& key, const QByteArray& bytes);

    void clear();

    /// All keys, sorted.
    QStringList keys() const;

    bool contains(const QString& key) const;
    int count() const;
    qint64 totalBytes() const;

    /**
     * @brief Extension of a file name including the dot.
     *
     * Empty when there is no dot, when the dot is the first character
     * (".hidden") or when it is the last one ("name.").
     */
    static QString fileExtension(const QString& fileName);

    /**
     * @brief MIME type guessed from a file name or key, e.g. "image/jpeg".
     */
    static QString mimeHintFor(const QString& fileName);

private:
    mutable QMutex m_mutex;
    QHash<QString, AssetRecord> m_records;
};
