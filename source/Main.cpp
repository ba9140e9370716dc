// ============================================================================
// TekaStory - Main Entry Point
// ============================================================================

#include <QCoreApplication>
#include <QLocale>
#include <QSettings>
#include <QStandardPaths>
#include <QTranslator>

#include "cli/CliParser.h"

// Test includes
#include "cli/CliHandlerTests.h"
#include "core/AssetStoreTests.h"
#include "core/StoryEngineTests.h"
#include "pdf/ImageFitTests.h"
#include "pdf/StoryPdfExporterTests.h"
#include "sharing/PackageTests.h"
#include "text/ScriptLayoutTests.h"

// ============================================================================
// Translation Loading
// ============================================================================

static void loadTranslations(QCoreApplication& app, QTranslator& translator)
{
    QSettings settings("TekaStory", "App");
    bool useSystemLanguage = settings.value("useSystemLanguage", true).toBool();

    QString langCode;
    if (useSystemLanguage) {
        langCode = QLocale::system().name().section('_', 0, 0);
    } else {
        langCode = settings.value("languageOverride", "en").toString();
    }

    QStringList translationPaths = {
        QCoreApplication::applicationDirPath(),
        QCoreApplication::applicationDirPath() + "/translations",
        "/usr/share/tekastory/translations",
        "/usr/local/share/tekastory/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                               "tekastory/translations", QStandardPaths::LocateDirectory)
    };

    for (const QString& path : translationPaths) {
        if (!path.isEmpty() && translator.load(path + "/app_" + langCode + ".qm")) {
            app.installTranslator(&translator);
            break;
        }
    }
}

// ============================================================================
// Test Runners
// ============================================================================

static int runTests(const QString& testType)
{
    bool success = false;

    if (testType == "assetstore") {
        success = AssetStoreTests::runAllTests();
    } else if (testType == "layout") {
        success = ScriptLayoutTests::runAllTests();
    } else if (testType == "imagefit") {
        success = ImageFitTests::runAllTests();
    } else if (testType == "package") {
        success = PackageTests::runAllTests();
    } else if (testType == "pdf") {
        success = StoryPdfExporterTests::runAllTests();
    } else if (testType == "engine") {
        success = StoryEngineTests::runAllTests();
    } else if (testType == "cli") {
        success = CliHandlerTests::runAllTests();
    }

    return success ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("TekaStory");
    app.setApplicationName("App");
    app.setApplicationVersion(TEKASTORY_VERSION);

    QTranslator translator;
    loadTranslations(app, translator);

    // ========== Test Commands ==========
    static const char* const TEST_PREFIX = "--test-";
    if (argc == 2 && qstrncmp(argv[1], TEST_PREFIX, qstrlen(TEST_PREFIX)) == 0) {
        return runTests(QString::fromLocal8Bit(argv[1] + qstrlen(TEST_PREFIX)));
    }

    // ========== Command Line Tool ==========
    return Cli::run(app, argc, argv);
}
