#include "PackageExporter.h"
#include "PackageFormat.h"
#include "../core/AssetStore.h"
#include "../core/ResourceProvider.h"

#include <QDebug>
#include <QHash>
#include <QJsonDocument>
#include <QObject>
#include <QRegularExpression>
#include <QSet>

#include <cstring>

// miniz - cross-platform ZIP library (MIT license)
#include "miniz.h"

// ============================================================================
// PackageExporter Implementation
// ============================================================================

PackageExporter::ExportResult PackageExporter::exportPackage(
    const ProjectSnapshot& snapshot,
    AssetStore& store,
    const ResourceProvider* provider)
{
    ExportResult result;

    // ===== Step 1: Work on a copy =====
    ProjectSnapshot savable = snapshot;

    // ===== Step 2 + 3: Materialize placeholders, drop dangling keys =====

    // One fetch per bundled resource, even when several references use it.
    // A failed fetch is cached too (as an empty key).
    QHash<int, QString> materialized;

    auto materialize = [&](AssetReference::DefaultAsset asset) -> QString {
        const int cacheKey = static_cast<int>(asset);
        auto it = materialized.constFind(cacheKey);
        if (it != materialized.constEnd()) {
            return it.value();
        }

        const QString path = AssetReference::bundledPath(asset);
        QString fetchError;
        std::optional<QByteArray> bytes;
        if (provider) {
            bytes = provider->fetch(path, &fetchError);
        } else {
            fetchError = QObject::tr("No resource provider available");
        }

        QString key;
        if (bytes) {
            key = store.registerAsset(*bytes, AssetReference::bundledFileName(asset));
#ifdef TEKASTORY_DEBUG
            qDebug() << "PackageExporter: Materialized" << path << "as" << key;
#endif
        } else {
            const QString warning = QObject::tr("Failed to fetch default asset %1: %2")
                                        .arg(path, fetchError);
            qWarning() << "PackageExporter:" << warning;
            result.warnings.append(warning);
        }
        materialized.insert(cacheKey, key);
        return key;
    };

    savable.forEachReference([&](AssetReference& ref) {
        if (ref.isPlaceholder()) {
            const QString key = materialize(ref.defaultAsset());
            if (key.isEmpty()) {
                ref.clear();
            } else {
                ref = AssetReference::explicitKey(key);
                ref.displaySource = QStringLiteral("asset:") + key;
            }
        } else if (ref.isExplicit() && !store.contains(ref.key())) {
            const QString warning = QObject::tr("Asset not found in store: %1").arg(ref.key());
            qWarning() << "PackageExporter:" << warning;
            result.warnings.append(warning);
            ref.clear();
        }
    });

    // ===== Step 4 + 5: Manifest and reachable keys =====
    const QByteArray manifest = manifestJson(savable);
    const QStringList keys = reachableKeys(savable);

    // ===== Step 6: Write the ZIP =====
    mz_zip_archive zipArchive;
    memset(&zipArchive, 0, sizeof(zipArchive));

    if (!mz_zip_writer_init_heap(&zipArchive, 0, 0)) {
        result.error = ErrorKind::Io;
        result.errorMessage = QObject::tr("Failed to create ZIP archive");
        return result;
    }

    auto cleanupOnError = [&](const QString& message) {
        mz_zip_writer_end(&zipArchive);
        result.error = ErrorKind::Io;
        result.errorMessage = message;
    };

    if (!mz_zip_writer_add_mem(&zipArchive, PackageFormat::ManifestEntry,
                               manifest.constData(), manifest.size(),
                               MZ_BEST_COMPRESSION)) {
        cleanupOnError(QObject::tr("Failed to add %1 to archive")
                           .arg(QLatin1String(PackageFormat::ManifestEntry)));
        return result;
    }

    for (const QString& key : keys) {
        // Keys were validated above, so a miss here means a concurrent clear()
        std::optional<QByteArray> bytes = store.resolve(key);
        if (!bytes) {
            cleanupOnError(QObject::tr("Asset disappeared while saving: %1").arg(key));
            return result;
        }

        const QByteArray entryName = (QLatin1String(PackageFormat::AssetsPrefix) + key).toUtf8();

        // Images are already compressed, so store them as-is
        if (!mz_zip_writer_add_mem(&zipArchive, entryName.constData(),
                                   bytes->constData(), bytes->size(),
                                   MZ_NO_COMPRESSION)) {
            cleanupOnError(QObject::tr("Failed to add asset to archive: %1").arg(key));
            return result;
        }
    }

    void* zipData = nullptr;
    size_t zipSize = 0;
    if (!mz_zip_writer_finalize_heap_archive(&zipArchive, &zipData, &zipSize)) {
        cleanupOnError(QObject::tr("Failed to finalize ZIP archive"));
        return result;
    }

    result.packageData = QByteArray(static_cast<const char*>(zipData), static_cast<int>(zipSize));
    mz_free(zipData);
    mz_zip_writer_end(&zipArchive);

    result.success = true;
    result.snapshot = savable;
    result.assetCount = keys.size();

#ifdef TEKASTORY_DEBUG
    qDebug() << "PackageExporter: Package built:" << result.packageData.size() << "bytes,"
             << result.assetCount << "assets," << result.warnings.size() << "warnings";
#endif
    return result;
}

QByteArray PackageExporter::manifestJson(const ProjectSnapshot& snapshot)
{
    return QJsonDocument(snapshot.toJson()).toJson(QJsonDocument::Indented);
}

QStringList PackageExporter::reachableKeys(const ProjectSnapshot& snapshot)
{
    QStringList keys;
    QSet<QString> seen;
    snapshot.visitReferences([&](const AssetReference& ref) {
        if (ref.isExplicit() && !seen.contains(ref.key())) {
            seen.insert(ref.key());
            keys.append(ref.key());
        }
    });
    return keys;
}

QString PackageExporter::suggestedFileName(const QString& projectTitle, const QDateTime& when)
{
    static const QRegularExpression unsafe(QStringLiteral("[^a-z0-9]"),
                                           QRegularExpression::CaseInsensitiveOption);
    QString base = QString(projectTitle).replace(unsafe, QStringLiteral("_")).toLower();
    if (base.isEmpty()) {
        base = QStringLiteral("story");
    }
    return base + QLatin1Char('-') + when.toString(QStringLiteral("yyMMdd-HHmm"))
         + QLatin1String(PackageFormat::FileExtension);
}
