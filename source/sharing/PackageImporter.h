#pragma once

// ============================================================================
// PackageImporter - Read a .tekastory package back into memory
// ============================================================================
// Restores the project snapshot from project.json and a fresh AssetStore from
// the assets/ entries (entry name == key, no regeneration). The caller's own
// store is never touched: the engine swaps the new store in only when the
// import succeeded.
// ============================================================================

#include "../core/AssetStore.h"
#include "../core/ProjectSnapshot.h"
#include "../core/StoryErrors.h"

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <memory>

/**
 * @brief Parses .tekastory packages.
 *
 * Usage:
 * @code
 * auto result = PackageImporter::importPackage(file.readAll());
 * if (result.success) {
 *     session.replaceStore(std::move(result.store));
 *     editor.setSnapshot(result.snapshot);
 * }
 * @endcode
 */
class PackageImporter {
public:
    /**
     * @brief Result of an import operation.
     */
    struct ImportResult {
        bool success = false;               ///< True if the package was read
        ErrorKind error = ErrorKind::None;  ///< Failure category if success is false
        QString errorMessage;               ///< Error description if success is false
        ProjectSnapshot snapshot;           ///< Hydrated snapshot
        std::unique_ptr<AssetStore> store;  ///< Freshly populated store (null on failure)
        QStringList warnings;               ///< References that could not be hydrated
    };

    /**
     * @brief Read a package.
     *
     * Fails with ErrorKind::Validation when the data is not a ZIP archive,
     * when project.json is missing, or when it is not a JSON object.
     */
    static ImportResult importPackage(const QByteArray& packageData);

    /**
     * @brief Fill displaySource for every reference in a snapshot.
     *
     * Explicit keys found in the store get "asset:<key>"; missing keys turn
     * the reference empty and add a warning. Placeholders keep their bundled
     * path.
     */
    static void hydrate(ProjectSnapshot& snapshot, const AssetStore& store,
                        QStringList* warnings = nullptr);

    /**
     * @brief List the entry names of a package (empty if unreadable).
     */
    static QStringList listEntries(const QByteArray& packageData);
};
