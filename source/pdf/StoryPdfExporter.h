#pragma once

// ============================================================================
// StoryPdfExporter - Storyboard PDF renderer using MuPDF
// ============================================================================
// Lays a project out on fixed landscape pages:
// - Page 1:     title page (cover-fit background, overlay, header, logo)
// - Pages 2..N: panel grids, 6 panels per page (3 columns × 2 rows)
// - Last page:  end page (own data, or mirrored from the title page)
//
// Layout is done in page units (1024 × 768, 1 unit = 0.75 pt) and written as
// raw PDF content streams. Fonts are embedded through FontRegistry, images
// are decoded with Qt, downsampled for the target DPI and embedded as
// JPEG or PNG XObjects.
//
// The export is fail-fast: a fetch or decode error on any page aborts the
// whole document and no bytes are returned. A key missing from the store
// only blanks the affected region and adds a warning.
// ============================================================================

#include "../core/ProjectSnapshot.h"
#include "../core/StoryErrors.h"

#include <QByteArray>
#include <QDate>
#include <QImage>
#include <QObject>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QStringList>
#include <QVector>

#include <atomic>
#include <memory>

class AssetStore;
class FontRegistry;
class ResourceProvider;

// Forward declarations for MuPDF types (avoid exposing mupdf headers in public API)
struct fz_context;
struct pdf_document;

/**
 * @brief Export options for PDF generation.
 */
struct PdfExportOptions {
    int dpi = 150;                  ///< Target resolution for embedded images
    QString producer;               ///< Info /Producer (defaults to "TekaStory <version>")
};

/**
 * @brief Result of a PDF export operation.
 */
struct PdfExportResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    QString errorMessage;           ///< "Failed at <Page> step: <cause>" on render errors
    QByteArray pdfData;             ///< Complete document (empty on failure)
    int pagesExported = 0;          ///< Title + panel pages + end page
    int panelPages = 0;
    QStringList warnings;           ///< Blank regions caused by missing assets
};

/**
 * @brief Renders a ProjectSnapshot to PDF bytes.
 *
 * Thread Safety: one export at a time per instance. Panel images of a page
 * are fetched and decoded concurrently; all writes to the output document
 * happen on the calling thread.
 *
 * Usage:
 * @code
 * StoryPdfExporter exporter;
 * exporter.setAssetStore(&store);
 * exporter.setResourceProvider(&provider);
 *
 * PdfExportResult result = exporter.exportPdf(snapshot);
 * if (!result.success) {
 *     qWarning() << "Export failed:" << result.errorMessage;
 * }
 * @endcode
 */
class StoryPdfExporter : public QObject {
    Q_OBJECT

public:
    // ===== Page geometry (page units) =====
    static constexpr qreal PAGE_WIDTH = 1024.0;
    static constexpr qreal PAGE_HEIGHT = 768.0;
    static constexpr qreal PAGE_MARGIN = 40.0;
    static constexpr int PANELS_PER_PAGE = 6;
    static constexpr int GRID_COLUMNS = 3;
    static constexpr int GRID_ROWS = 2;
    static constexpr qreal GRID_GAP = 20.0;

    explicit StoryPdfExporter(QObject* parent = nullptr);
    ~StoryPdfExporter() override;

    // Disable copy (MuPDF context is not copyable)
    StoryPdfExporter(const StoryPdfExporter&) = delete;
    StoryPdfExporter& operator=(const StoryPdfExporter&) = delete;

    /**
     * @brief Store used to resolve explicit asset keys (must outlive the export).
     */
    void setAssetStore(const AssetStore* store);

    /**
     * @brief Provider for fonts and bundled default images (must outlive the export).
     */
    void setResourceProvider(const ResourceProvider* provider);

    /**
     * @brief Render the snapshot.
     *
     * Blocking. Connect to progressUpdated() for UI updates.
     */
    PdfExportResult exportPdf(const ProjectSnapshot& snapshot,
                              const PdfExportOptions& options = PdfExportOptions());

    bool isExporting() const { return m_isExporting.load(); }

    /**
     * @brief End page configuration actually rendered.
     *
     * Without mirroring this is the end page itself. With mirroring the title
     * background is used, and the title logo (image and size) is placed at the
     * end page's own logo position, bottom-center when the end page has no
     * logo. No title logo means no end logo.
     */
    static EndPage resolveEndPage(const ProjectSnapshot& snapshot);

    /**
     * @brief Split panels into pages of PANELS_PER_PAGE, keeping source order.
     */
    static QVector<QVector<Panel>> chunkPanels(const QVector<Panel>& panels);

    /**
     * @brief Cell rectangle of a grid slot (0..5, row-major) in page units.
     */
    static QRectF panelCellRect(int slot);

    /**
     * @brief Compress an image for PDF embedding with optional downsampling.
     * @param image Source image
     * @param hasAlpha Whether image has transparency (PNG) or not (JPEG q85)
     * @param displaySizePt Display size in PDF points (72 DPI)
     * @param targetDpi Target resolution for downsampling
     * @return Compressed image data, or empty on failure.
     */
    static QByteArray compressImage(const QImage& image, bool hasAlpha,
                                    const QSizeF& displaySizePt, int targetDpi);

    /**
     * @brief File name suggested for the PDF, e.g. "my_story_project-260118.pdf".
     */
    static QString suggestedFileName(const QString& projectTitle,
                                     const QDate& date = QDate::currentDate());

signals:
    /**
     * @brief Emitted when a page starts.
     * @param current Page being drawn (1-based)
     * @param total Total number of pages
     */
    void progressUpdated(int current, int total);

private:
    struct LoadedImage;
    class PageCanvas;

    bool initContext();
    void cleanup();

    LoadedImage loadReference(const AssetReference& ref) const;

    bool drawTitlePage(const TitlePage& page, QString* error);
    bool drawPanelPage(const QVector<Panel>& panels, int chunkIndex, QString* error);
    bool drawEndPage(const EndPage& page, QString* error);

    bool drawCoverBackground(PageCanvas& canvas, const AssetReference& background, QString* error);
    bool drawLogo(PageCanvas& canvas, const Logo& logo, QString* error);
    bool drawPanel(PageCanvas& canvas, const Panel& panel, int number,
                   const QRectF& cell, const LoadedImage& image, QString* error);

    bool writeMetadata(const QString& title, const QString& producer);
    bool saveToBuffer(QByteArray* out);

    const AssetStore* m_store = nullptr;
    const ResourceProvider* m_provider = nullptr;

    PdfExportOptions m_options;
    QStringList m_warnings;
    std::atomic<bool> m_isExporting{false};

    // MuPDF state (only valid during export)
    fz_context* m_ctx = nullptr;
    pdf_document* m_outputDoc = nullptr;
    std::unique_ptr<FontRegistry> m_fonts;
};
