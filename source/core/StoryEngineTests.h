#pragma once

// ============================================================================
// StoryEngine Unit Tests
// ============================================================================
// Run with: tekastory --test-engine
//
// Covers the facade (busy guard, signals, export through the session store),
// the diagnostic ErrorLog, the file-backed ResourceProvider and settings.
// ============================================================================

#include "AppSettings.h"
#include "ErrorLog.h"
#include "ResourceProvider.h"
#include "StoryEngine.h"
#include "../pdf/StoryPdfExporterTests.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <memory>

namespace StoryEngineTests {

/**
 * @brief Provider that starts a second engine operation from inside a fetch.
 */
class ReentrantProvider : public MemoryResourceProvider {
public:
    std::optional<QByteArray> fetch(const QString& path,
                                    QString* errorMessage = nullptr) const override
    {
        if (engine && !nestedAttempted) {
            nestedAttempted = true;
            nestedError = engine->loadArchive(QByteArray("nested")).error;
        }
        return MemoryResourceProvider::fetch(path, errorMessage);
    }

    StoryEngine* engine = nullptr;
    mutable bool nestedAttempted = false;
    mutable ErrorKind nestedError = ErrorKind::None;
};

/**
 * @brief A second operation while one is running is rejected as Busy.
 */
inline bool testBusyGuard()
{
    qDebug() << "=== Test: Busy Guard ===";
    bool success = true;

    auto provider = std::make_unique<ReentrantProvider>();
    provider->insert(AssetReference::bundledPath(AssetReference::DefaultAsset::Background),
                     PackageTests::pngBytes(8, 8, Qt::black));
    ReentrantProvider* rawProvider = provider.get();

    StoryEngine engine(std::move(provider));
    rawProvider->engine = &engine;

    QVector<bool> busyStates;
    QObject::connect(&engine, &StoryEngine::busyChanged,
                     [&busyStates](bool busy) { busyStates.append(busy); });

    auto saved = engine.saveArchive(engine.resetProject(1));

    {
        if (!rawProvider->nestedAttempted || rawProvider->nestedError != ErrorKind::Busy) {
            qDebug() << "FAIL: Nested load was not rejected as busy";
            success = false;
        } else {
            qDebug() << "  - Nested operation rejected: OK";
        }
    }

    {
        if (!saved.success || engine.isBusy() || busyStates != QVector<bool>({true, false})) {
            qDebug() << "FAIL: Outer save should complete and release the guard";
            success = false;
        } else {
            qDebug() << "  - Outer operation completes, guard released: OK";
        }
    }

    return success;
}

/**
 * @brief Failures land in tekastory-errors.log and reach the front end.
 */
inline bool testErrorLog()
{
    qDebug() << "=== Test: Error Log ===";
    bool success = true;

    {
        const QDateTime when(QDate(2026, 1, 18), QTime(10, 42, 7, 113), Qt::UTC);
        const QString entry = ErrorLog::formatEntry(when, "Failed to save project",
                                                    "disk full", QString());
        if (!entry.contains("Timestamp: 2026-01-18T10:42:07.113Z\n")
            || !entry.contains("Context: Failed to save project\n")
            || !entry.contains("Error: disk full\n")
            || !entry.contains("Stack: No stack available\n")
            || !entry.startsWith("\n-----")) {
            qDebug() << "FAIL: Unexpected entry format:" << entry;
            success = false;
        } else {
            qDebug() << "  - Entry format: OK";
        }
    }

    QTemporaryDir tempDir;
    if (!tempDir.isValid()) {
        qDebug() << "FAIL: Cannot create temporary directory";
        return false;
    }
    const QString logDir = tempDir.filePath("logs");

    StoryEngine engine(std::make_unique<MemoryResourceProvider>(), logDir);
    QStringList notices;
    QObject::connect(&engine, &StoryEngine::operationFailed,
                     [&notices](const QString& notice) { notices.append(notice); });

    engine.loadArchive(QByteArray("not a package"));
    engine.loadArchive(QByteArray());

    {
        QFile file(QDir(logDir).filePath(ErrorLog::FileName));
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            qDebug() << "FAIL: Log file not written in" << logDir;
            success = false;
        } else {
            const QString content = QString::fromUtf8(file.readAll());
            if (content.count("Context: Failed to load project") != 2
                || !content.contains("Stack: ErrorKind: validation")) {
                qDebug() << "FAIL: Log content" << content;
                success = false;
            } else {
                qDebug() << "  - Failures appended to the log file: OK";
            }
        }
    }

    {
        if (notices.size() != 2 || !notices.first().contains(ErrorLog::FileName)) {
            qDebug() << "FAIL: operationFailed notices" << notices;
            success = false;
        } else {
            qDebug() << "  - Notice names the log file: OK";
        }
    }

    {
        ErrorLog unconfigured;
        if (unconfigured.record("context", "message") || !unconfigured.logFilePath().isEmpty()) {
            qDebug() << "FAIL: Log without directory should only warn";
            success = false;
        } else {
            qDebug() << "  - No directory: falls back to warnings: OK";
        }
    }

    return success;
}

/**
 * @brief Export through the engine uses the session store and settings.
 */
inline bool testEngineExport()
{
    qDebug() << "=== Test: Engine Export ===";
    bool success = true;

    StoryEngine engine(StoryPdfExporterTests::makeRenderProvider());
    engine.setExportDpi(72);

    ProjectSnapshot snapshot = engine.resetProject(7);
    const QString key = engine.registerAsset(PackageTests::pngBytes(64, 36, Qt::magenta), "frame.png");
    snapshot.panels[6].image = AssetReference::explicitKey(key);

    int lastProgress = 0;
    int progressTotal = 0;
    QObject::connect(&engine, &StoryEngine::exportProgress, [&](int current, int total) {
        lastProgress = current;
        progressTotal = total;
    });

    const PdfExportResult result = engine.exportDocument(snapshot);
    if (!result.success || !result.warnings.isEmpty()) {
        qDebug() << "FAIL: Engine export failed:" << result.errorMessage << result.warnings;
        return false;
    }

    {
        if (StoryPdfExporterTests::inspectPdf(result.pdfData).first != 4
            || lastProgress != 4 || progressTotal != 4) {
            qDebug() << "FAIL: Expected 4 pages and progress 4/4, got" << lastProgress << progressTotal;
            success = false;
        } else {
            qDebug() << "  - Export via engine: OK";
        }
    }

    return success;
}

/**
 * @brief Resource directory access and settings helpers.
 */
inline bool testResourcesAndSettings()
{
    qDebug() << "=== Test: Resources and Settings ===";
    bool success = true;

    QTemporaryDir tempDir;
    if (!tempDir.isValid()) {
        qDebug() << "FAIL: Cannot create temporary directory";
        return false;
    }
    QDir(tempDir.path()).mkpath("fonts");
    {
        QFile file(tempDir.filePath("fonts/Test.ttf"));
        if (file.open(QIODevice::WriteOnly)) {
            file.write("font-bytes");
        }
    }

    BundledResourceProvider provider(tempDir.path());

    {
        auto bytes = provider.fetch("/fonts/Test.ttf");
        if (!bytes || *bytes != QByteArray("font-bytes")) {
            qDebug() << "FAIL: Bundled resource not read";
            success = false;
        } else {
            qDebug() << "  - Reads files under the root: OK";
        }
    }

    {
        QString error;
        if (provider.fetch("/fonts/Missing.ttf", &error) || error.isEmpty()
            || provider.fetch("../outside.txt") || provider.fetch(QString())) {
            qDebug() << "FAIL: Missing or escaping paths must fail";
            success = false;
        } else {
            qDebug() << "  - Missing and escaping paths rejected: OK";
        }
    }

    {
        if (AppSettings::clampDpi(10) != AppSettings::MIN_EXPORT_DPI
            || AppSettings::clampDpi(5000) != AppSettings::MAX_EXPORT_DPI
            || AppSettings::clampDpi(200) != 200) {
            qDebug() << "FAIL: clampDpi()";
            success = false;
        } else {
            qDebug() << "  - clampDpi(): OK";
        }
    }

    return success;
}

/**
 * @brief Run all StoryEngine tests.
 */
inline bool runAllTests()
{
    qDebug() << "";
    qDebug() << "========================================";
    qDebug() << "Running StoryEngine Tests";
    qDebug() << "========================================";

    bool allPassed = true;

    allPassed &= testBusyGuard();
    allPassed &= testErrorLog();
    allPassed &= testEngineExport();
    allPassed &= testResourcesAndSettings();

    qDebug() << "";
    if (allPassed) {
        qDebug() << "✅ All StoryEngine tests passed!";
    } else {
        qDebug() << "❌ Some StoryEngine tests failed!";
    }
    qDebug() << "";

    return allPassed;
}

} // namespace StoryEngineTests
