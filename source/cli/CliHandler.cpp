#include "CliHandler.h"
#include "../core/AppSettings.h"
#include "../core/ResourceProvider.h"
#include "../core/StoryEngine.h"
#include "../pdf/StoryPdfExporter.h"
#include "../sharing/PackageExporter.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QTextStream>

#include <memory>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 * 
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Helper Functions
// =============================================================================

static void reportError(const QString& message)
{
    QTextStream err(stderr);
    err << QCoreApplication::translate("CLI", "Error: ") << message << "\n";
}

static void reportWarnings(const QStringList& warnings)
{
    QTextStream err(stderr);
    for (const QString& warning : warnings) {
        err << QCoreApplication::translate("CLI", "Warning: ") << warning << "\n";
    }
}

static bool readFile(const QString& path, QByteArray* data)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        reportError(QCoreApplication::translate("CLI", "Cannot read %1: %2")
                        .arg(QDir::toNativeSeparators(path), file.errorString()));
        return false;
    }
    *data = file.readAll();
    return true;
}

static bool writeFile(const QString& path, const QByteArray& data, bool overwrite)
{
    if (QFileInfo::exists(path) && !overwrite) {
        reportError(QCoreApplication::translate("CLI",
            "%1 already exists. Use --overwrite to replace it.")
            .arg(QDir::toNativeSeparators(path)));
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        reportError(QCoreApplication::translate("CLI", "Cannot write %1: %2")
                        .arg(QDir::toNativeSeparators(path), file.errorString()));
        return false;
    }
    if (file.write(data) != data.size()) {
        reportError(QCoreApplication::translate("CLI", "Failed to write %1: %2")
                        .arg(QDir::toNativeSeparators(path), file.errorString()));
        file.close();
        file.remove();
        return false;
    }
    file.close();
    return true;
}

/**
 * @brief Engine configured from AppSettings, --resources and --dpi.
 */
static std::unique_ptr<StoryEngine> createEngine(const QCommandLineParser& parser)
{
    AppSettings settings = AppSettings::load();

    if (parser.isSet(QStringLiteral("resources"))) {
        settings.resourceDir = parser.value(QStringLiteral("resources"));
    }

    auto engine = std::make_unique<StoryEngine>(
        std::make_unique<BundledResourceProvider>(settings.resourceDir), settings.logDir);
    engine->setExportDpi(settings.exportDpi);
    return engine;
}

QStringList splitScripts(const QString& content)
{
    static const QRegularExpression separator(QStringLiteral("^\\s*---\\s*$"));

    QStringList scripts;
    QStringList current;

    auto flush = [&]() {
        while (!current.isEmpty() && current.first().trimmed().isEmpty()) {
            current.removeFirst();
        }
        while (!current.isEmpty() && current.last().trimmed().isEmpty()) {
            current.removeLast();
        }
        scripts.append(current.join(QLatin1Char('\n')));
        current.clear();
    };

    QString normalized = content;
    normalized.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    const QStringList lines = normalized.split(QLatin1Char('\n'));
    for (const QString& line : lines) {
        if (separator.match(line).hasMatch()) {
            flush();
        } else {
            current.append(line);
        }
    }
    flush();

    // A trailing separator leaves one empty script behind
    if (scripts.size() > 1 && scripts.last().isEmpty()) {
        scripts.removeLast();
    }
    return scripts;
}

QString resolveOutputPath(const QString& requested, const QString& suggestedName)
{
    if (requested.isEmpty()) {
        return QDir::current().absoluteFilePath(suggestedName);
    }

    const QString absolute = QDir::cleanPath(QDir::current().absoluteFilePath(requested));
    if (QFileInfo(absolute).isDir()) {
        return QDir(absolute).absoluteFilePath(suggestedName);
    }
    return absolute;
}

// =============================================================================
// New Handler
// =============================================================================

int handleNew(const QCommandLineParser& parser)
{
    const QStringList imagePaths = parser.positionalArguments();

    // Read inputs before touching the engine
    QVector<QByteArray> images;
    for (const QString& path : imagePaths) {
        QByteArray bytes;
        if (!readFile(path, &bytes)) {
            return ExitCode::IoError;
        }
        images.append(bytes);
    }

    QStringList scripts;
    if (parser.isSet(QStringLiteral("script-file"))) {
        QByteArray scriptData;
        if (!readFile(parser.value(QStringLiteral("script-file")), &scriptData)) {
            return ExitCode::IoError;
        }
        scripts = splitScripts(QString::fromUtf8(scriptData));
    }

    std::unique_ptr<StoryEngine> engine = createEngine(parser);

    const int panelCount = images.isEmpty() ? ProjectSnapshot::DEFAULT_PANEL_COUNT
                                            : images.size();
    ProjectSnapshot snapshot = engine->resetProject(panelCount);

    for (int i = 0; i < images.size(); ++i) {
        const QString key = engine->registerAsset(images[i], QFileInfo(imagePaths[i]).fileName());
        snapshot.panels[i].image = AssetReference::explicitKey(key);
    }

    QStringList notes;
    for (int i = 0; i < scripts.size(); ++i) {
        if (i >= snapshot.panels.size()) {
            notes.append(QCoreApplication::translate("CLI",
                "%1 scripts for %2 panels; extra scripts ignored")
                .arg(scripts.size()).arg(snapshot.panels.size()));
            break;
        }
        if (scripts[i].count(QLatin1Char('\n')) >= ProjectSnapshot::MAX_SCRIPT_LINES) {
            notes.append(QCoreApplication::translate("CLI",
                "Script of panel %1 has more than %2 lines; the PDF shows the first %2")
                .arg(i + 1).arg(ProjectSnapshot::MAX_SCRIPT_LINES));
        }
        snapshot.panels[i].script = scripts[i];
    }

    if (parser.isSet(QStringLiteral("title"))) {
        snapshot.projectTitle = parser.value(QStringLiteral("title"));
    }
    if (parser.isSet(QStringLiteral("header"))) {
        snapshot.titlePage.header = parser.value(QStringLiteral("header"));
    }
    if (parser.isSet(QStringLiteral("subheader"))) {
        snapshot.titlePage.subHeader = parser.value(QStringLiteral("subheader"))
                                           .replace(QStringLiteral("\\n"), QStringLiteral("\n"));
    }

    PackageExporter::ExportResult result = engine->saveArchive(snapshot);
    reportWarnings(notes);
    reportWarnings(result.warnings);
    if (!result.success) {
        reportError(result.errorMessage);
        return ExitCode::Failure;
    }

    const QString outputPath = resolveOutputPath(
        parser.value(QStringLiteral("output")),
        PackageExporter::suggestedFileName(snapshot.projectTitle));
    if (!writeFile(outputPath, result.packageData, parser.isSet(QStringLiteral("overwrite")))) {
        return ExitCode::IoError;
    }

    QTextStream out(stdout);
    out << QCoreApplication::translate("CLI", "Saved %1 (%2 panels, %3 assets)")
               .arg(QDir::toNativeSeparators(outputPath))
               .arg(result.snapshot.panels.size())
               .arg(result.assetCount)
        << "\n";
    return ExitCode::Success;
}

// =============================================================================
// Export PDF Handler
// =============================================================================

int handleExportPdf(const QCommandLineParser& parser)
{
    const QStringList inputs = parser.positionalArguments();
    if (inputs.size() != 1) {
        reportError(QCoreApplication::translate("CLI",
            "Exactly one package expected. Use 'tekastory export-pdf --help' for usage."));
        return ExitCode::InvalidArgs;
    }

    std::unique_ptr<StoryEngine> engine = createEngine(parser);

    if (parser.isSet(QStringLiteral("dpi"))) {
        bool dpiOk = false;
        const int dpi = parser.value(QStringLiteral("dpi")).toInt(&dpiOk);
        if (!dpiOk || dpi <= 0) {
            reportError(QCoreApplication::translate("CLI", "Invalid --dpi value: %1")
                            .arg(parser.value(QStringLiteral("dpi"))));
            return ExitCode::InvalidArgs;
        }
        engine->setExportDpi(AppSettings::clampDpi(dpi));
    }

    QByteArray packageData;
    if (!readFile(inputs.first(), &packageData)) {
        return ExitCode::IoError;
    }

    LoadResult loaded = engine->loadArchive(packageData);
    if (!loaded.success) {
        reportError(loaded.errorMessage);
        return ExitCode::Failure;
    }
    reportWarnings(loaded.warnings);

    PdfExportResult result = engine->exportDocument(loaded.snapshot);
    reportWarnings(result.warnings);
    if (!result.success) {
        reportError(result.errorMessage);
        return ExitCode::Failure;
    }

    const QString outputPath = resolveOutputPath(
        parser.value(QStringLiteral("output")),
        StoryPdfExporter::suggestedFileName(loaded.snapshot.projectTitle));
    if (!writeFile(outputPath, result.pdfData, parser.isSet(QStringLiteral("overwrite")))) {
        return ExitCode::IoError;
    }

    QTextStream out(stdout);
    out << QCoreApplication::translate("CLI", "Exported %1 (%2 pages)")
               .arg(QDir::toNativeSeparators(outputPath))
               .arg(result.pagesExported)
        << "\n";
    return ExitCode::Success;
}

// =============================================================================
// Info Handler
// =============================================================================

int handleInfo(const QCommandLineParser& parser)
{
    const QStringList inputs = parser.positionalArguments();
    if (inputs.size() != 1) {
        reportError(QCoreApplication::translate("CLI",
            "Exactly one package expected. Use 'tekastory info --help' for usage."));
        return ExitCode::InvalidArgs;
    }

    QByteArray packageData;
    if (!readFile(inputs.first(), &packageData)) {
        return ExitCode::IoError;
    }

    std::unique_ptr<StoryEngine> engine = createEngine(parser);
    LoadResult loaded = engine->loadArchive(packageData);
    if (!loaded.success) {
        reportError(loaded.errorMessage);
        return ExitCode::Failure;
    }

    const ProjectSnapshot& snapshot = loaded.snapshot;
    const AssetStore& store = engine->assetStore();
    const QStringList keys = store.keys();
    const int panelPages = StoryPdfExporter::chunkPanels(snapshot.panels).size();

    QTextStream out(stdout);

    if (parser.isSet(QStringLiteral("json"))) {
        QJsonArray assets;
        for (const QString& key : keys) {
            const std::optional<AssetRecord> record = store.record(key);
            QJsonObject asset;
            asset["key"] = key;
            asset["bytes"] = record ? static_cast<qint64>(record->bytes.size()) : 0;
            asset["mime"] = record ? record->mimeHint : QString();
            assets.append(asset);
        }

        QJsonObject obj;
        obj["projectTitle"] = snapshot.projectTitle;
        obj["header"] = snapshot.titlePage.header;
        obj["panelCount"] = static_cast<int>(snapshot.panels.size());
        obj["pageCount"] = panelPages + 2;
        obj["mirrorTitlePage"] = snapshot.endPage.mirrorTitlePage;
        obj["assets"] = assets;
        obj["warnings"] = QJsonArray::fromStringList(loaded.warnings);

        out << QJsonDocument(obj).toJson(QJsonDocument::Indented);
        return ExitCode::Success;
    }

    out << QCoreApplication::translate("CLI", "Title:    %1").arg(snapshot.projectTitle) << "\n";
    out << QCoreApplication::translate("CLI", "Header:   %1").arg(snapshot.titlePage.header) << "\n";
    out << QCoreApplication::translate("CLI", "Panels:   %1 (%2 PDF pages)")
               .arg(snapshot.panels.size()).arg(panelPages + 2) << "\n";
    out << QCoreApplication::translate("CLI", "End page: %1")
               .arg(snapshot.endPage.mirrorTitlePage
                        ? QCoreApplication::translate("CLI", "mirrors title page")
                        : QCoreApplication::translate("CLI", "own design")) << "\n";
    out << QCoreApplication::translate("CLI", "Assets:   %1 (%2 KB)")
               .arg(keys.size()).arg(store.totalBytes() / 1024) << "\n";
    for (const QString& key : keys) {
        out << "  " << key << "\n";
    }
    reportWarnings(loaded.warnings);
    return ExitCode::Success;
}

} // namespace Cli
