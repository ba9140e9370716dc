#include "PackageImporter.h"
#include "PackageFormat.h"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QObject>

#include <cstring>

// miniz - cross-platform ZIP library (MIT license)
#include "miniz.h"

// ============================================================================
// PackageImporter Implementation
// ============================================================================

PackageImporter::ImportResult PackageImporter::importPackage(const QByteArray& packageData)
{
    ImportResult result;

    if (packageData.isEmpty()) {
        result.error = ErrorKind::Validation;
        result.errorMessage = QObject::tr("Package is empty");
        return result;
    }

    mz_zip_archive zipArchive;
    memset(&zipArchive, 0, sizeof(zipArchive));

    if (!mz_zip_reader_init_mem(&zipArchive, packageData.constData(),
                                static_cast<size_t>(packageData.size()), 0)) {
        result.error = ErrorKind::Validation;
        result.errorMessage = QObject::tr("Not a valid TekaStory package (unreadable ZIP data)");
        return result;
    }

    // ===== Step 1 + 2: Fresh store from assets/ =====
    auto store = std::make_unique<AssetStore>();
    QByteArray manifest;
    bool hasManifest = false;

    const QString assetsPrefix = QLatin1String(PackageFormat::AssetsPrefix);
    const int numFiles = static_cast<int>(mz_zip_reader_get_num_files(&zipArchive));

    for (int i = 0; i < numFiles; i++) {
        mz_zip_archive_file_stat fileStat;
        if (!mz_zip_reader_file_stat(&zipArchive, i, &fileStat)) {
            continue;
        }
        if (mz_zip_reader_is_file_a_directory(&zipArchive, i)) {
            continue;
        }

        const QString entryName = QString::fromUtf8(fileStat.m_filename);
        const bool isManifest = (entryName == QLatin1String(PackageFormat::ManifestEntry));
        const bool isAsset = entryName.startsWith(assetsPrefix)
                          && entryName.size() > assetsPrefix.size();
        if (!isManifest && !isAsset) {
#ifdef TEKASTORY_DEBUG
            qDebug() << "PackageImporter: Ignoring entry" << entryName;
#endif
            continue;
        }

        QByteArray content(static_cast<int>(fileStat.m_uncomp_size), Qt::Uninitialized);
        if (!mz_zip_reader_extract_to_mem(&zipArchive, i, content.data(),
                                          static_cast<size_t>(content.size()), 0)) {
            qWarning() << "PackageImporter: Failed to extract" << entryName;
            if (isManifest) {
                mz_zip_reader_end(&zipArchive);
                result.error = ErrorKind::Validation;
                result.errorMessage = QObject::tr("Failed to read %1 from package")
                                          .arg(entryName);
                return result;
            }
            result.warnings.append(QObject::tr("Failed to extract asset: %1").arg(entryName));
            continue;
        }

        if (isManifest) {
            manifest = content;
            hasManifest = true;
        } else {
            store->put(entryName.mid(assetsPrefix.size()), content);
        }
    }

    mz_zip_reader_end(&zipArchive);

    // ===== Step 3: Manifest =====
    if (!hasManifest) {
        result.error = ErrorKind::Validation;
        result.errorMessage = QObject::tr("Invalid project file: %1 not found.")
                                  .arg(QLatin1String(PackageFormat::ManifestEntry));
        return result;
    }

    QJsonParseError parseError;
    const QJsonDocument jsonDoc = QJsonDocument::fromJson(manifest, &parseError);
    if (parseError.error != QJsonParseError::NoError || !jsonDoc.isObject()) {
        result.error = ErrorKind::Validation;
        result.errorMessage = QObject::tr("Invalid %1: %2")
                                  .arg(QLatin1String(PackageFormat::ManifestEntry),
                                       parseError.error != QJsonParseError::NoError
                                           ? parseError.errorString()
                                           : QObject::tr("not a JSON object"));
        return result;
    }

    ProjectSnapshot snapshot = ProjectSnapshot::fromJson(jsonDoc.object());

    // ===== Step 4: Files written before projectTitle existed =====
    if (snapshot.projectTitle.trimmed().isEmpty()) {
        snapshot.projectTitle = snapshot.titlePage.header.trimmed().isEmpty()
                                    ? ProjectSnapshot::fallbackTitle()
                                    : snapshot.titlePage.header;
    }

    // ===== Step 5: Hydrate =====
    hydrate(snapshot, *store, &result.warnings);

    result.success = true;
    result.snapshot = snapshot;
    result.store = std::move(store);

#ifdef TEKASTORY_DEBUG
    qDebug() << "PackageImporter: Imported" << result.snapshot.projectTitle
             << "with" << result.snapshot.panels.size() << "panels and"
             << result.store->count() << "assets";
#endif
    return result;
}

void PackageImporter::hydrate(ProjectSnapshot& snapshot, const AssetStore& store,
                              QStringList* warnings)
{
    snapshot.forEachReference([&](AssetReference& ref) {
        switch (ref.kind()) {
            case AssetReference::Kind::Explicit:
                if (store.contains(ref.key())) {
                    ref.displaySource = QStringLiteral("asset:") + ref.key();
                } else {
                    const QString warning = QObject::tr("Referenced asset missing from package: %1")
                                                .arg(ref.key());
                    qWarning() << "PackageImporter:" << warning;
                    if (warnings) {
                        warnings->append(warning);
                    }
                    ref.clear();
                }
                break;
            case AssetReference::Kind::Default:
                ref.displaySource = AssetReference::bundledPath(ref.defaultAsset());
                break;
            case AssetReference::Kind::Empty:
                ref.displaySource.clear();
                break;
        }
    });
}

QStringList PackageImporter::listEntries(const QByteArray& packageData)
{
    QStringList entries;

    mz_zip_archive zipArchive;
    memset(&zipArchive, 0, sizeof(zipArchive));
    if (!mz_zip_reader_init_mem(&zipArchive, packageData.constData(),
                                static_cast<size_t>(packageData.size()), 0)) {
        return entries;
    }

    const int numFiles = static_cast<int>(mz_zip_reader_get_num_files(&zipArchive));
    for (int i = 0; i < numFiles; i++) {
        mz_zip_archive_file_stat fileStat;
        if (mz_zip_reader_file_stat(&zipArchive, i, &fileStat)) {
            entries.append(QString::fromUtf8(fileStat.m_filename));
        }
    }

    mz_zip_reader_end(&zipArchive);
    return entries;
}
