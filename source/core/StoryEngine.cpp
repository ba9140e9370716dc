#include "StoryEngine.h"
#include "ResourceProvider.h"
#include "../sharing/PackageImporter.h"

#include <QDebug>

StoryEngine::StoryEngine(std::unique_ptr<ResourceProvider> provider,
                         const QString& logDir, QObject* parent)
    : QObject(parent)
    , m_provider(std::move(provider))
    , m_store(std::make_unique<AssetStore>())
    , m_errorLog(logDir)
{
}

StoryEngine::~StoryEngine() = default;

// ============================================================================
// Busy guard
// ============================================================================

bool StoryEngine::acquire()
{
    if (m_busy.exchange(true)) {
        return false;
    }
    emit busyChanged(true);
    return true;
}

void StoryEngine::release()
{
    m_busy = false;
    emit busyChanged(false);
}

void StoryEngine::reportFailure(const QString& context, ErrorKind kind, const QString& message)
{
    qWarning() << "[StoryEngine]" << context << ":" << message;
    m_errorLog.record(context, message, QStringLiteral("ErrorKind: ") + errorKindName(kind));
    emit operationFailed(m_errorLog.userNotice(context, message));
}

// ============================================================================
// Session
// ============================================================================

ProjectSnapshot StoryEngine::resetProject(int panelCount)
{
    m_store->clear();
    return ProjectSnapshot::createDefault(panelCount);
}

QString StoryEngine::registerAsset(const QByteArray& bytes, const QString& originalName)
{
    return m_store->registerAsset(bytes, originalName);
}

// ============================================================================
// Operations
// ============================================================================

PackageExporter::ExportResult StoryEngine::saveArchive(const ProjectSnapshot& snapshot)
{
    const QString context = tr("Failed to save project");

    if (!acquire()) {
        PackageExporter::ExportResult busy;
        busy.error = ErrorKind::Busy;
        busy.errorMessage = tr("Another operation is in progress");
        return busy;
    }

    PackageExporter::ExportResult result =
        PackageExporter::exportPackage(snapshot, *m_store, m_provider.get());

    for (const QString& warning : result.warnings) {
        qWarning() << "[StoryEngine] Save:" << warning;
    }
    if (!result.success) {
        reportFailure(context, result.error, result.errorMessage);
    }

    release();
    return result;
}

LoadResult StoryEngine::loadArchive(const QByteArray& packageData)
{
    LoadResult result;
    const QString context = tr("Failed to load project");

    if (!acquire()) {
        result.error = ErrorKind::Busy;
        result.errorMessage = tr("Another operation is in progress");
        return result;
    }

    PackageImporter::ImportResult imported = PackageImporter::importPackage(packageData);
    if (!imported.success) {
        result.error = imported.error;
        result.errorMessage = imported.errorMessage;
        reportFailure(context, result.error, result.errorMessage);
        release();
        return result;
    }

    // Replace the session store wholesale
    m_store = std::move(imported.store);

    result.success = true;
    result.snapshot = imported.snapshot;
    result.warnings = imported.warnings;

    qDebug() << "[StoryEngine] Loaded" << result.snapshot.projectTitle << "with"
             << m_store->count() << "assets";

    release();
    return result;
}

PdfExportResult StoryEngine::exportDocument(const ProjectSnapshot& snapshot)
{
    const QString context = tr("Failed to export PDF");

    if (!acquire()) {
        PdfExportResult busy;
        busy.error = ErrorKind::Busy;
        busy.errorMessage = tr("Another operation is in progress");
        return busy;
    }

    StoryPdfExporter exporter;
    exporter.setAssetStore(m_store.get());
    exporter.setResourceProvider(m_provider.get());
    connect(&exporter, &StoryPdfExporter::progressUpdated, this, &StoryEngine::exportProgress);

    PdfExportOptions options;
    options.dpi = m_exportDpi;

    PdfExportResult result = exporter.exportPdf(snapshot, options);

    for (const QString& warning : result.warnings) {
        qWarning() << "[StoryEngine] Export:" << warning;
    }
    if (!result.success) {
        reportFailure(context, result.error, result.errorMessage);
    }

    release();
    return result;
}
