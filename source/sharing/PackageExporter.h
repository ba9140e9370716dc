#pragma once

// ============================================================================
// PackageExporter - Serialize a project into a .tekastory package
// ============================================================================
// Writes the manifest and every image the project references into one ZIP
// byte stream. Bundled default pictures (placeholders) are materialized into
// the AssetStore first, so the package is self-contained and can be opened
// without the resource directory.
// ============================================================================

#include "../core/ProjectSnapshot.h"
#include "../core/StoryErrors.h"

#include <QByteArray>
#include <QDateTime>
#include <QString>
#include <QStringList>

class AssetStore;
class ResourceProvider;

/**
 * @brief Builds .tekastory packages in memory.
 *
 * Usage:
 * @code
 * auto result = PackageExporter::exportPackage(snapshot, store, &provider);
 * if (result.success) {
 *     file.write(result.packageData);
 * }
 * @endcode
 */
class PackageExporter {
public:
    /**
     * @brief Result of an export operation.
     */
    struct ExportResult {
        bool success = false;               ///< True if the package was produced
        ErrorKind error = ErrorKind::None;  ///< Failure category if success is false
        QString errorMessage;               ///< Error description if success is false
        QByteArray packageData;             ///< The ZIP bytes
        ProjectSnapshot snapshot;           ///< Rewritten copy (placeholders → keys)
        int assetCount = 0;                 ///< Number of assets/ entries written
        QStringList warnings;               ///< Degraded references (materialization/resolution)
    };

    /**
     * @brief Serialize a snapshot and the assets it references.
     *
     * Steps:
     * 1. Copy the snapshot (the caller's copy is never touched).
     * 2. Materialize placeholders: fetch each bundled default once, register
     *    it in the store, point the references at the new key. A failed
     *    fetch leaves the reference empty and records a warning.
     * 3. Empty explicit references whose key is not in the store (warning).
     * 4. Write project.json without display-only fields.
     * 5. Write assets/<key> for the distinct reachable keys only.
     *
     * @param snapshot Project to save
     * @param store Session store; receives materialized defaults
     * @param provider Source of bundled defaults (nullptr: placeholders become empty)
     */
    static ExportResult exportPackage(const ProjectSnapshot& snapshot, AssetStore& store,
                                      const ResourceProvider* provider);

    /**
     * @brief Manifest bytes for a snapshot (indented UTF-8 JSON).
     */
    static QByteArray manifestJson(const ProjectSnapshot& snapshot);

    /**
     * @brief Distinct explicit keys reachable from a snapshot, in visiting order.
     */
    static QStringList reachableKeys(const ProjectSnapshot& snapshot);

    /**
     * @brief File name suggested for saving, e.g. "my_story_project-260118-0930.tekastory".
     */
    static QString suggestedFileName(const QString& projectTitle,
                                     const QDateTime& when = QDateTime::currentDateTime());
};
