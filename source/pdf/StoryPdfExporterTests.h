#pragma once

// ============================================================================
// StoryPdfExporter Unit Tests
// ============================================================================
// Run with: tekastory --test-pdf
//
// Fonts are served from MuPDF's built-in base-14 faces and images are
// generated with QImage, so the tests need no resource directory. Exported
// documents are reopened with MuPDF to check page count and metadata.
// ============================================================================

#include "StoryPdfExporter.h"
#include "FontRegistry.h"
#include "ImageFitTests.h"
#include "../core/AssetStore.h"
#include "../core/ResourceProvider.h"
#include "../sharing/PackageTests.h"

#include <QDebug>
#include <QPair>
#include <QVector>

#include <memory>

extern "C" {
#include <mupdf/fitz.h>
}

namespace StoryPdfExporterTests {

using PackageTests::pngBytes;

/**
 * @brief Bytes of a MuPDF built-in font.
 */
inline QByteArray base14FontBytes(const char* name)
{
    fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!ctx) {
        return QByteArray();
    }
    int len = 0;
    const unsigned char* data = fz_lookup_base14_font(ctx, name, &len);
    QByteArray bytes;
    if (data && len > 0) {
        bytes = QByteArray(reinterpret_cast<const char*>(data), len);
    }
    fz_drop_context(ctx);
    return bytes;
}

/**
 * @brief Provider with all five faces and both default images.
 */
inline std::unique_ptr<MemoryResourceProvider> makeRenderProvider()
{
    auto provider = PackageTests::makeDefaultsProvider();
    const QByteArray regular = base14FontBytes("Helvetica");
    const QByteArray bold = base14FontBytes("Helvetica-Bold");
    for (FontRegistry::Face face : FontRegistry::allFaces()) {
        const bool isBold = face == FontRegistry::Face::OswaldBold
                         || face == FontRegistry::Face::OpenSansBold;
        provider->insert(FontRegistry::fontPath(face), isBold ? bold : regular);
    }
    return provider;
}

/**
 * @brief Page count and Info title of a PDF (-1 pages if it cannot be opened).
 */
inline QPair<int, QString> inspectPdf(const QByteArray& pdfData)
{
    QPair<int, QString> info(-1, QString());
    fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!ctx) {
        return info;
    }

    fz_stream* stream = nullptr;
    fz_document* doc = nullptr;
    fz_var(stream);
    fz_var(doc);

    fz_try(ctx) {
        fz_register_document_handlers(ctx);
        stream = fz_open_memory(ctx, reinterpret_cast<const unsigned char*>(pdfData.constData()),
                                static_cast<size_t>(pdfData.size()));
        doc = fz_open_document_with_stream(ctx, "application/pdf", stream);
        info.first = fz_count_pages(ctx, doc);

        char title[256] = {0};
        if (fz_lookup_metadata(ctx, doc, FZ_META_INFO_TITLE, title, sizeof(title)) > 0) {
            info.second = QString::fromUtf8(title);
        }
    }
    fz_always(ctx) {
        fz_drop_document(ctx, doc);
        fz_drop_stream(ctx, stream);
    }
    fz_catch(ctx) {
        info.first = -1;
    }

    fz_drop_context(ctx);
    return info;
}

/**
 * @brief Test page chunking, grid cells and file naming.
 */
inline bool testPageLayout()
{
    qDebug() << "=== Test: Page Layout ===";
    bool success = true;

    {
        QVector<Panel> panels;
        for (int i = 0; i < 13; ++i) {
            panels.append(Panel::create());
        }
        const auto chunks = StoryPdfExporter::chunkPanels(panels);
        const bool sizesOk = chunks.size() == 3 && chunks[0].size() == 6
                          && chunks[1].size() == 6 && chunks[2].size() == 1;
        const bool orderOk = sizesOk && chunks[1][0].id == panels[6].id
                          && chunks[2][0].id == panels[12].id;
        if (!sizesOk || !orderOk) {
            qDebug() << "FAIL: 13 panels should chunk as 6/6/1 in order";
            success = false;
        } else {
            qDebug() << "  - 13 panels chunked 6/6/1: OK";
        }

        if (!StoryPdfExporter::chunkPanels(QVector<Panel>()).isEmpty()) {
            qDebug() << "FAIL: No panels should give no panel pages";
            success = false;
        } else {
            qDebug() << "  - No panels, no panel pages: OK";
        }
    }

    {
        const QRectF first = StoryPdfExporter::panelCellRect(0);
        const QRectF last = StoryPdfExporter::panelCellRect(5);
        const QRectF fourth = StoryPdfExporter::panelCellRect(3);
        const bool ok = ImageFitTests::nearlyEqual(first.x(), 40) && ImageFitTests::nearlyEqual(first.y(), 40)
                     && ImageFitTests::nearlyEqual(first.height(), 334)
                     && ImageFitTests::nearlyEqual(last.right(), 984)
                     && ImageFitTests::nearlyEqual(last.bottom(), 728)
                     && ImageFitTests::nearlyEqual(fourth.x(), 40)
                     && ImageFitTests::nearlyEqual(fourth.y(), 394);
        if (!ok) {
            qDebug() << "FAIL: Grid cells" << first << fourth << last;
            success = false;
        } else {
            qDebug() << "  - 3x2 grid inside 40 unit margins: OK";
        }
    }

    {
        const QDate date(2026, 1, 18);
        if (StoryPdfExporter::suggestedFileName("Harbour Launch", date) != "harbour_launch-260118.pdf"
            || StoryPdfExporter::suggestedFileName(QString(), date) != "storyboard-260118.pdf") {
            qDebug() << "FAIL: suggestedFileName()";
            success = false;
        } else {
            qDebug() << "  - suggestedFileName(): OK";
        }
    }

    return success;
}

/**
 * @brief Test end page mirroring.
 */
inline bool testResolveEndPage()
{
    qDebug() << "=== Test: Resolve End Page ===";
    bool success = true;

    ProjectSnapshot snapshot = ProjectSnapshot::createDefault(1);
    snapshot.titlePage.background = AssetReference::explicitKey("title-bg.jpg");
    Logo titleLogo;
    titleLogo.reference = AssetReference::explicitKey("brand.png");
    titleLogo.size = Logo::Size::L;
    titleLogo.position = Logo::Position::TopRight;
    snapshot.titlePage.logo = titleLogo;
    snapshot.endPage.background = AssetReference::explicitKey("stale-end-bg.jpg");
    snapshot.endPage.mirrorTitlePage = true;

    {
        snapshot.endPage.logo.reset();
        const EndPage resolved = StoryPdfExporter::resolveEndPage(snapshot);
        if (!resolved.logo || resolved.logo->reference != titleLogo.reference
            || resolved.logo->size != Logo::Size::L
            || resolved.logo->position != Logo::Position::BottomCenter
            || resolved.background != snapshot.titlePage.background) {
            qDebug() << "FAIL: Mirrored end page without own logo";
            success = false;
        } else {
            qDebug() << "  - Title logo placed at the end page default anchor: OK";
        }
    }

    {
        Logo endLogo;
        endLogo.reference = AssetReference::explicitKey("other.png");
        endLogo.position = Logo::Position::TopLeft;
        endLogo.size = Logo::Size::S;
        snapshot.endPage.logo = endLogo;
        const EndPage resolved = StoryPdfExporter::resolveEndPage(snapshot);
        if (!resolved.logo || resolved.logo->reference != titleLogo.reference
            || resolved.logo->position != Logo::Position::TopLeft
            || resolved.logo->size != Logo::Size::L) {
            qDebug() << "FAIL: Mirrored logo should keep the end page position only";
            success = false;
        } else {
            qDebug() << "  - End page position kept, image and size mirrored: OK";
        }
    }

    {
        snapshot.titlePage.logo.reset();
        const EndPage resolved = StoryPdfExporter::resolveEndPage(snapshot);
        if (resolved.logo) {
            qDebug() << "FAIL: No title logo should mean no end logo";
            success = false;
        } else {
            qDebug() << "  - No title logo, no end logo: OK";
        }
    }

    {
        snapshot.endPage.mirrorTitlePage = false;
        const EndPage resolved = StoryPdfExporter::resolveEndPage(snapshot);
        if (resolved != snapshot.endPage) {
            qDebug() << "FAIL: Unmirrored end page should be used as is";
            success = false;
        } else {
            qDebug() << "  - Mirroring off keeps own data: OK";
        }
    }

    return success;
}

/**
 * @brief Test a full export of a 13-panel project.
 */
inline bool testExportDocument()
{
    qDebug() << "=== Test: Export Document ===";
    bool success = true;

    auto provider = makeRenderProvider();
    AssetStore store;
    const QString wideKey = store.registerAsset(pngBytes(320, 120, Qt::darkGreen), "wide.png");
    const QString tallKey = store.registerAsset(pngBytes(90, 200, Qt::darkRed), "tall.png");

    ProjectSnapshot snapshot = ProjectSnapshot::createDefault(13);
    snapshot.projectTitle = "Harbour Launch";
    snapshot.titlePage.header = "Harbour Launch";
    snapshot.panels[0].image = AssetReference::explicitKey(wideKey);
    snapshot.panels[0].script = "Open on the pier at dawn. [Slow push in] Gulls circle overhead.";
    snapshot.panels[7].image = AssetReference::explicitKey(tallKey);
    snapshot.panels[12].script = "1\n2\n3\n4\n5\n6\n7\n8";
    snapshot.endPage.text = "Thank you";

    StoryPdfExporter exporter;
    exporter.setAssetStore(&store);
    exporter.setResourceProvider(provider.get());

    QVector<QPair<int, int>> progress;
    QObject::connect(&exporter, &StoryPdfExporter::progressUpdated,
                     [&progress](int current, int total) { progress.append(qMakePair(current, total)); });

    PdfExportOptions options;
    options.dpi = 96;
    const PdfExportResult result = exporter.exportPdf(snapshot, options);

    if (!result.success) {
        qDebug() << "FAIL: Export failed:" << result.errorMessage;
        return false;
    }

    {
        if (result.pagesExported != 5 || result.panelPages != 3) {
            qDebug() << "FAIL: Expected 5 pages (3 panel pages), got"
                     << result.pagesExported << result.panelPages;
            success = false;
        } else {
            qDebug() << "  - Title + 3 panel pages + end page: OK";
        }
    }

    {
        const QPair<int, QString> info = inspectPdf(result.pdfData);
        if (info.first != 5 || info.second != "Harbour Launch") {
            qDebug() << "FAIL: Reopened document has" << info.first << "pages, title" << info.second;
            success = false;
        } else {
            qDebug() << "  - Output reopens with 5 pages and Info title: OK";
        }
    }

    {
        if (provider->fetchCountWithPrefix("/fonts/") != FontRegistry::FACE_COUNT) {
            qDebug() << "FAIL: Fonts fetched" << provider->fetchCountWithPrefix("/fonts/") << "times";
            success = false;
        } else {
            qDebug() << "  - Each face fetched once: OK";
        }
    }

    {
        if (progress.isEmpty() || progress.first() != qMakePair(1, 5)
            || progress.last() != qMakePair(5, 5)) {
            qDebug() << "FAIL: Progress signals" << progress.size();
            success = false;
        } else {
            qDebug() << "  - Progress reported per page: OK";
        }
    }

    {
        if (!result.warnings.isEmpty() || exporter.isExporting()) {
            qDebug() << "FAIL: Unexpected warnings" << result.warnings;
            success = false;
        } else {
            qDebug() << "  - No warnings, exporter idle: OK";
        }
    }

    return success;
}

/**
 * @brief A key missing from the store blanks the image with a warning.
 */
inline bool testMissingAssetWarns()
{
    qDebug() << "=== Test: Missing Asset Warns ===";
    bool success = true;

    auto provider = makeRenderProvider();
    AssetStore store;

    ProjectSnapshot snapshot = ProjectSnapshot::createDefault(2);
    snapshot.panels[1].image = AssetReference::explicitKey("gone.png");
    snapshot.titlePage.logo->reference = AssetReference::explicitKey("gone-logo.png");

    StoryPdfExporter exporter;
    exporter.setAssetStore(&store);
    exporter.setResourceProvider(provider.get());
    const PdfExportResult result = exporter.exportPdf(snapshot);

    if (!result.success) {
        qDebug() << "FAIL: Missing key should not abort the export:" << result.errorMessage;
        return false;
    }

    bool panelWarning = false;
    bool logoWarning = false;
    for (const QString& warning : result.warnings) {
        panelWarning |= warning.startsWith("Panel 2 image left blank") && warning.contains("gone.png");
        logoWarning |= warning.startsWith("Logo left blank");
    }
    if (!panelWarning || !logoWarning || inspectPdf(result.pdfData).first != 3) {
        qDebug() << "FAIL: Expected panel and logo warnings, got" << result.warnings;
        success = false;
    } else {
        qDebug() << "  - Blank regions reported as warnings: OK";
    }

    return success;
}

/**
 * @brief Fetch and decode errors abort the export with the failing step.
 */
inline bool testFailFast()
{
    qDebug() << "=== Test: Fail Fast ===";
    bool success = true;

    {
        auto provider = makeRenderProvider();
        provider->insert(AssetReference::bundledPath(AssetReference::DefaultAsset::Background),
                         QByteArray("not an image"));
        AssetStore store;

        StoryPdfExporter exporter;
        exporter.setAssetStore(&store);
        exporter.setResourceProvider(provider.get());
        const PdfExportResult result = exporter.exportPdf(ProjectSnapshot::createDefault(3));

        if (result.success || result.error != ErrorKind::Render || !result.pdfData.isEmpty()
            || !result.errorMessage.startsWith("Failed at Title Page step")) {
            qDebug() << "FAIL: Undecodable background:" << result.errorMessage;
            success = false;
        } else {
            qDebug() << "  - Title page failure aborts:" << result.errorMessage;
        }
    }

    {
        auto provider = makeRenderProvider();
        AssetStore store;
        const QString brokenKey = store.registerAsset(QByteArray("broken"), "broken.png");

        ProjectSnapshot snapshot = ProjectSnapshot::createDefault(9);
        snapshot.panels[7].image = AssetReference::explicitKey(brokenKey);

        StoryPdfExporter exporter;
        exporter.setAssetStore(&store);
        exporter.setResourceProvider(provider.get());
        const PdfExportResult result = exporter.exportPdf(snapshot);

        if (result.success || !result.pdfData.isEmpty()
            || !result.errorMessage.startsWith("Failed at Panel Page 2 step: Panel 8")) {
            qDebug() << "FAIL: Undecodable panel image:" << result.errorMessage;
            success = false;
        } else {
            qDebug() << "  - Panel page failure names page and panel: OK";
        }

        if (exporter.isExporting()) {
            qDebug() << "FAIL: Exporter still busy after a failure";
            success = false;
        }
    }

    {
        auto provider = makeRenderProvider();
        provider->remove(FontRegistry::fontPath(FontRegistry::Face::OpenSansBold));
        AssetStore store;

        StoryPdfExporter exporter;
        exporter.setAssetStore(&store);
        exporter.setResourceProvider(provider.get());
        const PdfExportResult result = exporter.exportPdf(ProjectSnapshot::createDefault(1));

        if (result.success || !result.errorMessage.startsWith("Failed at Font Registration step")) {
            qDebug() << "FAIL: Missing font:" << result.errorMessage;
            success = false;
        } else {
            qDebug() << "  - Missing font aborts before any page: OK";
        }
    }

    return success;
}

/**
 * @brief Run all StoryPdfExporter tests.
 */
inline bool runAllTests()
{
    qDebug() << "";
    qDebug() << "========================================";
    qDebug() << "Running StoryPdfExporter Tests";
    qDebug() << "========================================";

    bool allPassed = true;

    allPassed &= testPageLayout();
    allPassed &= testResolveEndPage();
    allPassed &= testExportDocument();
    allPassed &= testMissingAssetWarns();
    allPassed &= testFailFast();

    qDebug() << "";
    if (allPassed) {
        qDebug() << "✅ All StoryPdfExporter tests passed!";
    } else {
        qDebug() << "❌ Some StoryPdfExporter tests failed!";
    }
    qDebug() << "";

    return allPassed;
}

} // namespace StoryPdfExporterTests
