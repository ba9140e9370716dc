#pragma once

// ============================================================================
// ResourceProvider - Byte-fetch capability for bundled resources
// ============================================================================
// The engine never touches the filesystem for built-in content directly.
// Default backgrounds, the default logo and the embedded fonts are requested
// by path ("/images/default_BG.png", "/fonts/Oswald-Bold.ttf") through this
// interface, so hosts and tests can supply their own bytes.
// ============================================================================

#include <QByteArray>
#include <QHash>
#include <QMutex>
#include <QString>

#include <optional>

/**
 * @brief Abstract source of bundled resource bytes.
 *
 * Implementations must be safe to call from several threads at once
 * (panel images are fetched concurrently).
 */
class ResourceProvider {
public:
    virtual ~ResourceProvider() = default;

    /**
     * @brief Fetch the bytes of a bundled resource.
     * @param path Resource path starting with '/', e.g. "/fonts/OpenSans-Bold.ttf"
     * @param errorMessage Receives a description on failure (may be nullptr)
     * @return The bytes, or std::nullopt on failure.
     */
    virtual std::optional<QByteArray> fetch(const QString& path,
                                            QString* errorMessage = nullptr) const = 0;
};

/**
 * @brief ResourceProvider reading from an installed resource directory.
 *
 * "/images/default_BG.png" resolves to "<rootDir>/images/default_BG.png".
 */
class BundledResourceProvider : public ResourceProvider {
public:
    explicit BundledResourceProvider(const QString& rootDir);

    std::optional<QByteArray> fetch(const QString& path,
                                    QString* errorMessage = nullptr) const override;

    const QString& rootDir() const { return m_rootDir; }

private:
    QString m_rootDir;
};

/**
 * @brief ResourceProvider serving bytes registered in memory.
 *
 * Used by hosts that embed their resources, and by the test suites. Every
 * fetch is counted per path, successful or not.
 */
class MemoryResourceProvider : public ResourceProvider {
public:
    MemoryResourceProvider() = default;

    void insert(const QString& path, const QByteArray& bytes);
    void remove(const QString& path);

    std::optional<QByteArray> fetch(const QString& path,
                                    QString* errorMessage = nullptr) const override;

    /// Number of fetch() calls made for a path.
    int fetchCount(const QString& path) const;

    /// Number of fetch() calls made for paths starting with prefix.
    int fetchCountWithPrefix(const QString& prefix) const;

private:
    mutable QMutex m_mutex;
    QHash<QString, QByteArray> m_resources;
    mutable QHash<QString, int> m_fetchCounts;
};
