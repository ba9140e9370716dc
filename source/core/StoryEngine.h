#pragma once

// ============================================================================
// StoryEngine - Session facade over the packaging and rendering pipelines
// ============================================================================
// Owns the session AssetStore and the ResourceProvider and exposes the three
// engine operations:
//   saveArchive(snapshot)    -> .tekastory bytes
//   loadArchive(bytes)       -> snapshot (store replaced on success only)
//   exportDocument(snapshot) -> PDF bytes
//
// Only one of these runs at a time; a call made while another is in flight
// is rejected with ErrorKind::Busy. Every failure is appended to the
// diagnostic ErrorLog.
// ============================================================================

#include "AssetStore.h"
#include "ErrorLog.h"
#include "ProjectSnapshot.h"
#include "StoryErrors.h"
#include "../pdf/StoryPdfExporter.h"
#include "../sharing/PackageExporter.h"

#include <QObject>
#include <QString>
#include <QStringList>

#include <atomic>
#include <memory>

class ResourceProvider;

/**
 * @brief Result of StoryEngine::loadArchive().
 */
struct LoadResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    QString errorMessage;
    ProjectSnapshot snapshot;           ///< Hydrated snapshot
    QStringList warnings;
};

class StoryEngine : public QObject {
    Q_OBJECT

public:
    /**
     * @param provider Source of bundled fonts and default images (owned)
     * @param logDir Directory of the diagnostic log (empty: qWarning only)
     */
    explicit StoryEngine(std::unique_ptr<ResourceProvider> provider,
                         const QString& logDir = QString(),
                         QObject* parent = nullptr);
    ~StoryEngine() override;

    // ===== Session =====

    /**
     * @brief Start a fresh project: clears the store, returns the default snapshot.
     */
    ProjectSnapshot resetProject(int panelCount = ProjectSnapshot::DEFAULT_PANEL_COUNT);

    /**
     * @brief Register an uploaded image in the session store.
     * @return The new asset key
     */
    QString registerAsset(const QByteArray& bytes, const QString& originalName);

    AssetStore& assetStore() { return *m_store; }
    const AssetStore& assetStore() const { return *m_store; }
    const ResourceProvider* resourceProvider() const { return m_provider.get(); }

    ErrorLog& errorLog() { return m_errorLog; }

    void setExportDpi(int dpi) { m_exportDpi = dpi; }
    int exportDpi() const { return m_exportDpi; }

    bool isBusy() const { return m_busy.load(); }

    // ===== Operations =====

    /**
     * @brief Serialize the project and every image it references.
     *
     * Placeholders are materialized into the session store first.
     */
    PackageExporter::ExportResult saveArchive(const ProjectSnapshot& snapshot);

    /**
     * @brief Read a package. The session store is replaced only on success.
     */
    LoadResult loadArchive(const QByteArray& packageData);

    /**
     * @brief Render the project to PDF bytes.
     */
    PdfExportResult exportDocument(const ProjectSnapshot& snapshot);

signals:
    void busyChanged(bool busy);
    void exportProgress(int current, int total);

    /**
     * @brief Emitted after a failed operation with a plain-language notice.
     */
    void operationFailed(const QString& notice);

private:
    bool acquire();
    void release();
    void reportFailure(const QString& context, ErrorKind kind, const QString& message);

    std::unique_ptr<ResourceProvider> m_provider;
    std::unique_ptr<AssetStore> m_store;
    ErrorLog m_errorLog;
    int m_exportDpi = 150;
    std::atomic<bool> m_busy{false};
};
