// ============================================================================
// StoryPdfExporter - Storyboard PDF renderer using MuPDF
// ============================================================================

#include "StoryPdfExporter.h"
#include "FontRegistry.h"
#include "ImageFit.h"
#include "StoryTheme.h"
#include "../core/AssetStore.h"
#include "../core/ResourceProvider.h"
#include "../text/ScriptLayout.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QBuffer>
#include <QDebug>
#include <QFuture>
#include <QImageReader>
#include <QPainter>
#include <QRegularExpression>
#include <QtConcurrent/QtConcurrentRun>

#include <cstdio>

// Page units (96 DPI canvas) to PDF points (72 DPI)
static constexpr float UNIT_TO_PT = 72.0f / 96.0f;

// Bezier control distance for quarter circles
static constexpr float KAPPA = 0.5523f;

static constexpr qreal PANEL_PADDING = 10.0;
static constexpr qreal SCRIPT_BOX_PADDING = 10.0;
static constexpr qreal SCRIPT_LINE_HEIGHT = 14.0;

static QByteArray num(qreal value)
{
    return QByteArray::number(value, 'f', 3);
}

static QByteArray colorOp(QRgb color, const char* op)
{
    return num(qRed(color) / 255.0) + ' ' + num(qGreen(color) / 255.0) + ' '
         + num(qBlue(color) / 255.0) + ' ' + op + '\n';
}

// ============================================================================
// LoadedImage
// ============================================================================

struct StoryPdfExporter::LoadedImage {
    enum class Status {
        None,       ///< Reference is empty, nothing to draw
        Ready,
        Missing,    ///< Explicit key not in the store (blank region)
        Failed      ///< Fetch or decode error (aborts the export)
    };

    Status status = Status::None;
    QImage image;
    QString message;
};

// ============================================================================
// PageCanvas - one output page being assembled
// ============================================================================
// Takes page units with a top-left origin and writes PDF operators in points
// with the PDF bottom-left origin. Vector operators are collected in memory;
// MuPDF is only touched for image XObjects and when the page is finished.

class StoryPdfExporter::PageCanvas {
public:
    PageCanvas(fz_context* ctx, pdf_document* doc, const FontRegistry* fonts, int dpi)
        : m_ctx(ctx), m_doc(doc), m_fonts(fonts), m_dpi(dpi)
    {
    }

    ~PageCanvas()
    {
        if (m_resources) {
            pdf_drop_obj(m_ctx, m_resources);
        }
    }

    PageCanvas(const PageCanvas&) = delete;
    PageCanvas& operator=(const PageCanvas&) = delete;

    bool begin(QString* error)
    {
        fz_try(m_ctx) {
            m_resources = pdf_new_dict(m_ctx, m_doc, 4);
            pdf_obj* fontDict = pdf_dict_put_dict(m_ctx, m_resources, PDF_NAME(Font),
                                                  FontRegistry::FACE_COUNT);
            for (FontRegistry::Face face : FontRegistry::allFaces()) {
                pdf_dict_puts(m_ctx, fontDict, FontRegistry::resourceName(face).constData(),
                              m_fonts->fontObject(face));
            }
        }
        fz_catch(m_ctx) {
            *error = QObject::tr("Failed to create page resources: %1")
                         .arg(QString::fromUtf8(fz_caught_message(m_ctx)));
            return false;
        }
        return true;
    }

    static float pt(qreal units) { return static_cast<float>(units) * UNIT_TO_PT; }
    static float pdfY(qreal units) { return pt(PAGE_HEIGHT - units); }

    void fillRect(const QRectF& rect, QRgb color)
    {
        m_ops += "q\n" + colorOp(color, "rg") + rectPath(rect) + "f\nQ\n";
    }

    void strokeRect(const QRectF& rect, QRgb color, qreal lineWidth)
    {
        m_ops += "q\n" + colorOp(color, "RG") + num(pt(lineWidth)) + " w\n"
               + rectPath(rect) + "S\nQ\n";
    }

    void roundedRect(const QRectF& rect, qreal radius, QRgb fill, QRgb stroke, qreal lineWidth)
    {
        const float x = pt(rect.left());
        const float y = pdfY(rect.bottom());
        const float w = pt(rect.width());
        const float h = pt(rect.height());
        const float r = qMin(pt(radius), qMin(w, h) / 2.0f);
        const float k = r * KAPPA;

        QByteArray path;
        path += num(x + r) + ' ' + num(y) + " m\n";
        path += num(x + w - r) + ' ' + num(y) + " l\n";
        path += num(x + w - r + k) + ' ' + num(y) + ' ' + num(x + w) + ' ' + num(y + r - k)
              + ' ' + num(x + w) + ' ' + num(y + r) + " c\n";
        path += num(x + w) + ' ' + num(y + h - r) + " l\n";
        path += num(x + w) + ' ' + num(y + h - r + k) + ' ' + num(x + w - r + k) + ' ' + num(y + h)
              + ' ' + num(x + w - r) + ' ' + num(y + h) + " c\n";
        path += num(x + r) + ' ' + num(y + h) + " l\n";
        path += num(x + r - k) + ' ' + num(y + h) + ' ' + num(x) + ' ' + num(y + h - r + k)
              + ' ' + num(x) + ' ' + num(y + h - r) + " c\n";
        path += num(x) + ' ' + num(y + r) + " l\n";
        path += num(x) + ' ' + num(y + r - k) + ' ' + num(x + r - k) + ' ' + num(y)
              + ' ' + num(x + r) + ' ' + num(y) + " c\nh\n";

        m_ops += "q\n" + colorOp(fill, "rg") + colorOp(stroke, "RG")
               + num(pt(lineWidth)) + " w\n" + path + "B\nQ\n";
    }

    /**
     * @brief Fill the whole page with a translucent colour.
     */
    bool overlay(QRgb color, float opacity, QString* error)
    {
        char gsName[16];
        snprintf(gsName, sizeof(gsName), "GS%d", ++m_stateCount);

        fz_try(m_ctx) {
            pdf_obj* extGState = pdf_dict_get(m_ctx, m_resources, PDF_NAME(ExtGState));
            if (!extGState) {
                extGState = pdf_dict_put_dict(m_ctx, m_resources, PDF_NAME(ExtGState), 2);
            }
            pdf_obj* state = pdf_new_dict(m_ctx, m_doc, 2);
            pdf_dict_put_real(m_ctx, state, PDF_NAME(ca), opacity);
            pdf_dict_put_real(m_ctx, state, PDF_NAME(CA), opacity);
            pdf_dict_puts_drop(m_ctx, extGState, gsName, state);
        }
        fz_catch(m_ctx) {
            *error = QObject::tr("Failed to create overlay: %1")
                         .arg(QString::fromUtf8(fz_caught_message(m_ctx)));
            return false;
        }

        m_ops += QByteArray("q\n/") + gsName + " gs\n" + colorOp(color, "rg")
               + rectPath(QRectF(0, 0, PAGE_WIDTH, PAGE_HEIGHT)) + "f\nQ\n";
        return true;
    }

    /**
     * @brief Draw a single-line string with its baseline origin at (x, baseline).
     */
    void text(FontRegistry::Face face, float sizePt, QRgb color,
              const QString& str, qreal x, qreal baseline)
    {
        if (str.isEmpty()) {
            return;
        }
        m_ops += "BT\n/" + FontRegistry::resourceName(face) + ' ' + num(sizePt) + " Tf\n"
               + colorOp(color, "rg")
               + num(pt(x)) + ' ' + num(pdfY(baseline)) + " Td\n"
               + FontRegistry::encodeText(str) + " Tj\nET\n";
    }

    /// Advance width in page units.
    qreal textWidth(FontRegistry::Face face, float sizePt, const QString& str) const
    {
        return m_fonts->measure(face, str, sizePt) / UNIT_TO_PT;
    }

    /**
     * @brief Embed an image and draw it into target, optionally clipped.
     */
    bool drawImage(const QImage& image, const QRectF& target, const QRectF& clip, QString* error)
    {
        if (image.isNull() || target.width() <= 0 || target.height() <= 0) {
            return true;
        }

        const QSizeF displaySizePt(pt(target.width()), pt(target.height()));
        const QByteArray compressed = StoryPdfExporter::compressImage(
            image, image.hasAlphaChannel(), displaySizePt, m_dpi);
        if (compressed.isEmpty()) {
            *error = QObject::tr("Failed to encode image for embedding");
            return false;
        }

        char imgName[16];
        snprintf(imgName, sizeof(imgName), "Im%d", ++m_imageCount);

        fz_buffer* imgBuf = nullptr;
        fz_image* fzImage = nullptr;

        fz_try(m_ctx) {
            imgBuf = fz_new_buffer_from_copied_data(m_ctx,
                reinterpret_cast<const unsigned char*>(compressed.constData()),
                static_cast<size_t>(compressed.size()));
            fzImage = fz_new_image_from_buffer(m_ctx, imgBuf);

            pdf_obj* imgXObj = pdf_add_image(m_ctx, m_doc, fzImage);

            pdf_obj* xobjectDict = pdf_dict_get(m_ctx, m_resources, PDF_NAME(XObject));
            if (!xobjectDict) {
                xobjectDict = pdf_dict_put_dict(m_ctx, m_resources, PDF_NAME(XObject), 4);
            }
            pdf_dict_puts_drop(m_ctx, xobjectDict, imgName, imgXObj);
        }
        fz_always(m_ctx) {
            fz_drop_image(m_ctx, fzImage);
            fz_drop_buffer(m_ctx, imgBuf);
        }
        fz_catch(m_ctx) {
            *error = QObject::tr("Failed to embed image: %1")
                         .arg(QString::fromUtf8(fz_caught_message(m_ctx)));
            return false;
        }

        m_ops += "q\n";
        if (!clip.isNull()) {
            m_ops += rectPath(clip) + "W n\n";
        }
        m_ops += num(displaySizePt.width()) + " 0 0 " + num(displaySizePt.height()) + ' '
               + num(pt(target.left())) + ' ' + num(pdfY(target.bottom())) + " cm\n"
               + '/' + imgName + " Do\nQ\n";

#ifdef TEKASTORY_DEBUG
        qDebug() << "[StoryPdfExporter] Image" << imgName << "at" << target
                 << "(" << compressed.size() << "bytes)";
#endif
        return true;
    }

    /**
     * @brief Append the page to the document.
     */
    bool finish(QString* error)
    {
        fz_buffer* contents = nullptr;
        pdf_obj* pageObj = nullptr;

        fz_try(m_ctx) {
            contents = fz_new_buffer_from_copied_data(m_ctx,
                reinterpret_cast<const unsigned char*>(m_ops.constData()),
                static_cast<size_t>(m_ops.size()));
            const fz_rect mediabox = fz_make_rect(0, 0, pt(PAGE_WIDTH), pt(PAGE_HEIGHT));
            pageObj = pdf_add_page(m_ctx, m_doc, mediabox, 0, m_resources, contents);
            pdf_insert_page(m_ctx, m_doc, -1, pageObj);
        }
        fz_always(m_ctx) {
            pdf_drop_obj(m_ctx, pageObj);
            fz_drop_buffer(m_ctx, contents);
        }
        fz_catch(m_ctx) {
            *error = QObject::tr("Failed to add page: %1")
                         .arg(QString::fromUtf8(fz_caught_message(m_ctx)));
            return false;
        }
        return true;
    }

private:
    static QByteArray rectPath(const QRectF& rect)
    {
        return num(pt(rect.left())) + ' ' + num(pdfY(rect.bottom())) + ' '
             + num(pt(rect.width())) + ' ' + num(pt(rect.height())) + " re\n";
    }

    fz_context* m_ctx = nullptr;
    pdf_document* m_doc = nullptr;
    const FontRegistry* m_fonts = nullptr;
    int m_dpi = 150;

    pdf_obj* m_resources = nullptr;
    QByteArray m_ops;
    int m_imageCount = 0;
    int m_stateCount = 0;
};

// ============================================================================
// Construction / Destruction
// ============================================================================

StoryPdfExporter::StoryPdfExporter(QObject* parent)
    : QObject(parent)
{
}

StoryPdfExporter::~StoryPdfExporter()
{
    cleanup();
}

void StoryPdfExporter::setAssetStore(const AssetStore* store)
{
    m_store = store;
}

void StoryPdfExporter::setResourceProvider(const ResourceProvider* provider)
{
    m_provider = provider;
}

// ============================================================================
// Main Export Function
// ============================================================================

PdfExportResult StoryPdfExporter::exportPdf(const ProjectSnapshot& snapshot,
                                            const PdfExportOptions& options)
{
    PdfExportResult result;

    if (m_isExporting.exchange(true)) {
        result.error = ErrorKind::Busy;
        result.errorMessage = tr("An export is already in progress");
        return result;
    }

    if (!m_provider) {
        result.error = ErrorKind::Render;
        result.errorMessage = tr("No resource provider set");
        m_isExporting = false;
        return result;
    }

    m_options = options;
    m_warnings.clear();

    const QVector<QVector<Panel>> chunks = chunkPanels(snapshot.panels);
    const int totalPages = chunks.size() + 2;

    qDebug() << "[StoryPdfExporter] Starting export:" << snapshot.panels.size() << "panels on"
             << totalPages << "pages at" << options.dpi << "DPI";

    auto fail = [&](ErrorKind kind, const QString& message) {
        qWarning() << "[StoryPdfExporter]" << message;
        result.error = kind;
        result.errorMessage = message;
        result.pdfData.clear();
        result.warnings = m_warnings;
        cleanup();
        m_isExporting = false;
        return result;
    };

    if (!initContext()) {
        return fail(ErrorKind::Render, tr("Failed to initialize PDF engine"));
    }

    // ===== Fonts =====
    m_fonts = std::make_unique<FontRegistry>(m_ctx, m_outputDoc);
    QString error;
    if (!m_fonts->registerAll(*m_provider, &error)) {
        return fail(ErrorKind::Render, tr("Failed at Font Registration step: %1").arg(error));
    }

    // ===== Title page =====
    emit progressUpdated(1, totalPages);
    if (!drawTitlePage(snapshot.titlePage, &error)) {
        return fail(ErrorKind::Render, tr("Failed at Title Page step: %1").arg(error));
    }
    result.pagesExported++;

    // ===== Panel pages =====
    for (int i = 0; i < chunks.size(); ++i) {
        emit progressUpdated(i + 2, totalPages);
        if (!drawPanelPage(chunks[i], i, &error)) {
            return fail(ErrorKind::Render,
                        tr("Failed at Panel Page %1 step: %2").arg(i + 1).arg(error));
        }
        result.pagesExported++;
        result.panelPages++;
    }

    // ===== End page =====
    emit progressUpdated(totalPages, totalPages);
    if (!drawEndPage(resolveEndPage(snapshot), &error)) {
        return fail(ErrorKind::Render, tr("Failed at End Page step: %1").arg(error));
    }
    result.pagesExported++;

    const QString producer = options.producer.isEmpty()
        ? QStringLiteral("TekaStory ") + QStringLiteral(TEKASTORY_VERSION)
        : options.producer;
    if (!writeMetadata(snapshot.projectTitle, producer)) {
        qWarning() << "[StoryPdfExporter] Failed to write metadata (non-fatal)";
    }

    QByteArray pdfData;
    if (!saveToBuffer(&pdfData)) {
        return fail(ErrorKind::Render, tr("Failed to write PDF document"));
    }

    cleanup();
    result.success = true;
    result.pdfData = pdfData;
    result.warnings = m_warnings;
    m_isExporting = false;

    qDebug() << "[StoryPdfExporter] Export complete:" << result.pagesExported << "pages,"
             << (result.pdfData.size() / 1024) << "KB," << result.warnings.size() << "warnings";
    return result;
}

// ============================================================================
// Layout helpers
// ============================================================================

EndPage StoryPdfExporter::resolveEndPage(const ProjectSnapshot& snapshot)
{
    EndPage resolved = snapshot.endPage;
    if (!resolved.mirrorTitlePage) {
        return resolved;
    }

    resolved.background = snapshot.titlePage.background;
    if (snapshot.titlePage.logo) {
        Logo logo = *snapshot.titlePage.logo;
        logo.position = snapshot.endPage.logo ? snapshot.endPage.logo->position
                                              : Logo::Position::BottomCenter;
        resolved.logo = logo;
    } else {
        resolved.logo.reset();
    }
    return resolved;
}

QVector<QVector<Panel>> StoryPdfExporter::chunkPanels(const QVector<Panel>& panels)
{
    QVector<QVector<Panel>> chunks;
    for (int i = 0; i < panels.size(); i += PANELS_PER_PAGE) {
        chunks.append(panels.mid(i, PANELS_PER_PAGE));
    }
    return chunks;
}

QRectF StoryPdfExporter::panelCellRect(int slot)
{
    const qreal contentWidth = PAGE_WIDTH - 2 * PAGE_MARGIN;
    const qreal contentHeight = PAGE_HEIGHT - 2 * PAGE_MARGIN;
    const qreal cellWidth = (contentWidth - (GRID_COLUMNS - 1) * GRID_GAP) / GRID_COLUMNS;
    const qreal cellHeight = (contentHeight - (GRID_ROWS - 1) * GRID_GAP) / GRID_ROWS;

    const int col = slot % GRID_COLUMNS;
    const int row = slot / GRID_COLUMNS;
    return QRectF(PAGE_MARGIN + col * (cellWidth + GRID_GAP),
                  PAGE_MARGIN + row * (cellHeight + GRID_GAP),
                  cellWidth, cellHeight);
}

QString StoryPdfExporter::suggestedFileName(const QString& projectTitle, const QDate& date)
{
    static const QRegularExpression unsafe(QStringLiteral("[^a-z0-9]"),
                                           QRegularExpression::CaseInsensitiveOption);
    QString base = QString(projectTitle).replace(unsafe, QStringLiteral("_")).toLower();
    if (base.isEmpty()) {
        base = QStringLiteral("storyboard");
    }
    return base + QLatin1Char('-') + date.toString(QStringLiteral("yyMMdd"))
         + QStringLiteral(".pdf");
}

// ============================================================================
// Image loading
// ============================================================================

StoryPdfExporter::LoadedImage StoryPdfExporter::loadReference(const AssetReference& ref) const
{
    LoadedImage loaded;
    QByteArray bytes;
    QString source;

    switch (ref.kind()) {
        case AssetReference::Kind::Empty:
            return loaded;

        case AssetReference::Kind::Explicit: {
            std::optional<QByteArray> resolved = m_store ? m_store->resolve(ref.key())
                                                         : std::nullopt;
            if (!resolved) {
                loaded.status = LoadedImage::Status::Missing;
                loaded.message = tr("asset not found: %1").arg(ref.key());
                return loaded;
            }
            bytes = *resolved;
            source = ref.key();
            break;
        }

        case AssetReference::Kind::Default: {
            source = AssetReference::bundledPath(ref.defaultAsset());
            QString fetchError;
            std::optional<QByteArray> fetched = m_provider->fetch(source, &fetchError);
            if (!fetched) {
                loaded.status = LoadedImage::Status::Failed;
                loaded.message = tr("Failed to fetch %1: %2").arg(source, fetchError);
                return loaded;
            }
            bytes = *fetched;
            break;
        }
    }

    QBuffer buffer;
    buffer.setData(bytes);
    buffer.open(QIODevice::ReadOnly);

    QImageReader reader(&buffer);
    reader.setAutoTransform(true);
    QImage image = reader.read();
    if (image.isNull()) {
        loaded.status = LoadedImage::Status::Failed;
        loaded.message = tr("Failed to decode image %1: %2").arg(source, reader.errorString());
        return loaded;
    }

    loaded.status = LoadedImage::Status::Ready;
    loaded.image = image;
    return loaded;
}

// ============================================================================
// Page drawing
// ============================================================================

bool StoryPdfExporter::drawCoverBackground(PageCanvas& canvas, const AssetReference& background,
                                           QString* error)
{
    const LoadedImage loaded = loadReference(background);
    switch (loaded.status) {
        case LoadedImage::Status::None:
            return true;
        case LoadedImage::Status::Missing:
            m_warnings.append(tr("Background left blank: %1").arg(loaded.message));
            return true;
        case LoadedImage::Status::Failed:
            *error = loaded.message;
            return false;
        case LoadedImage::Status::Ready:
            break;
    }

    const QRectF page(0, 0, PAGE_WIDTH, PAGE_HEIGHT);
    const QRectF target = ImageFit::cover(loaded.image.size(), page);
    return canvas.drawImage(loaded.image, target, page, error);
}

bool StoryPdfExporter::drawLogo(PageCanvas& canvas, const Logo& logo, QString* error)
{
    const LoadedImage loaded = loadReference(logo.reference);
    switch (loaded.status) {
        case LoadedImage::Status::None:
            return true;
        case LoadedImage::Status::Missing:
            m_warnings.append(tr("Logo left blank: %1").arg(loaded.message));
            return true;
        case LoadedImage::Status::Failed:
            *error = loaded.message;
            return false;
        case LoadedImage::Status::Ready:
            break;
    }

    const QSizeF extent = ImageFit::logoSize(loaded.image.size(), logo.size);
    if (extent.isEmpty()) {
        return true;
    }
    const QPointF topLeft = ImageFit::logoPosition(logo.position, extent,
                                                   QSizeF(PAGE_WIDTH, PAGE_HEIGHT),
                                                   PAGE_MARGIN / 2);
    return canvas.drawImage(loaded.image, QRectF(topLeft, extent), QRectF(), error);
}

bool StoryPdfExporter::drawTitlePage(const TitlePage& page, QString* error)
{
    PageCanvas canvas(m_ctx, m_outputDoc, m_fonts.get(), m_options.dpi);
    if (!canvas.begin(error)) {
        return false;
    }

    if (!drawCoverBackground(canvas, page.background, error)) {
        return false;
    }
    if (!canvas.overlay(StoryTheme::OverlayBase, StoryTheme::OverlayOpacity, error)) {
        return false;
    }

    canvas.text(FontRegistry::Face::OswaldBold, StoryTheme::TitleSize, StoryTheme::TextLight,
                page.header.toUpper(), PAGE_MARGIN, PAGE_HEIGHT / 2 - 30);

    const QStringList subLines = page.subHeader.toUpper().split(QLatin1Char('\n'));
    const qreal lineStep = StoryTheme::SubTitleSize * StoryTheme::SubTitleLineFactor;
    qreal baseline = PAGE_HEIGHT / 2 + 50;
    for (const QString& line : subLines) {
        canvas.text(FontRegistry::Face::OswaldLight, StoryTheme::SubTitleSize,
                    StoryTheme::Border, line, PAGE_MARGIN, baseline);
        baseline += lineStep;
    }

    if (page.logo && !drawLogo(canvas, *page.logo, error)) {
        return false;
    }

    return canvas.finish(error);
}

bool StoryPdfExporter::drawPanelPage(const QVector<Panel>& panels, int chunkIndex, QString* error)
{
    // Fetch and decode this page's images concurrently
    QVector<QFuture<LoadedImage>> futures;
    futures.reserve(panels.size());
    for (const Panel& panel : panels) {
        const AssetReference ref = panel.image;
        futures.append(QtConcurrent::run([this, ref]() { return loadReference(ref); }));
    }
    for (QFuture<LoadedImage>& future : futures) {
        future.waitForFinished();
    }

    PageCanvas canvas(m_ctx, m_outputDoc, m_fonts.get(), m_options.dpi);
    if (!canvas.begin(error)) {
        return false;
    }

    for (int i = 0; i < panels.size(); ++i) {
        const int number = chunkIndex * PANELS_PER_PAGE + i + 1;
        const LoadedImage loaded = futures[i].result();

        if (loaded.status == LoadedImage::Status::Failed) {
            *error = tr("Panel %1: %2").arg(number).arg(loaded.message);
            return false;
        }
        if (loaded.status == LoadedImage::Status::Missing) {
            m_warnings.append(tr("Panel %1 image left blank: %2").arg(number).arg(loaded.message));
        }

        if (!drawPanel(canvas, panels[i], number, panelCellRect(i), loaded, error)) {
            *error = tr("Panel %1: %2").arg(number).arg(*error);
            return false;
        }
    }

#ifdef TEKASTORY_DEBUG
    qDebug() << "[StoryPdfExporter] Panel page" << chunkIndex + 1 << "with" << panels.size() << "panels";
#endif

    return canvas.finish(error);
}

bool StoryPdfExporter::drawPanel(PageCanvas& canvas, const Panel& panel, int number,
                                 const QRectF& cell, const LoadedImage& image, QString* error)
{
    const qreal contentX = cell.left() + PANEL_PADDING;
    const qreal contentY = cell.top() + PANEL_PADDING;
    const qreal contentWidth = cell.width() - 2 * PANEL_PADDING;

    // Card
    canvas.roundedRect(cell, 6, StoryTheme::Surface, StoryTheme::Border, 0.5);

    canvas.text(FontRegistry::Face::OpenSansBold, StoryTheme::PanelNumberSize,
                StoryTheme::TextSubtle, QStringLiteral("%1").arg(number, 2, 10, QLatin1Char('0')),
                contentX + 5, contentY + 12);

    // 16:9 image box, frame drawn over the image
    const QRectF imageBox(contentX, contentY + 25, contentWidth, contentWidth * 9.0 / 16.0);
    canvas.fillRect(imageBox, StoryTheme::SurfaceMuted);
    if (image.status == LoadedImage::Status::Ready) {
        const QRectF target = ImageFit::contain(image.image.size(), imageBox);
        if (!canvas.drawImage(image.image, target, QRectF(), error)) {
            return false;
        }
    }
    canvas.strokeRect(imageBox, StoryTheme::PanelBorder, 1);

    // Script
    const qreal labelBaseline = imageBox.bottom() + 12;
    canvas.text(FontRegistry::Face::OpenSansRegular, StoryTheme::ScriptLabelSize,
                StoryTheme::TextMedium, QLatin1String(StoryTheme::ScriptLabel),
                contentX, labelBaseline);

    ScriptLayout::LayoutBox box;
    box.left = contentX;
    box.top = labelBaseline + 4;
    box.width = contentWidth;
    box.height = cell.bottom() - PANEL_PADDING - box.top;
    box.padding = SCRIPT_BOX_PADDING;
    box.fontSize = StoryTheme::ScriptSize;
    box.lineHeight = SCRIPT_LINE_HEIGHT;

    canvas.roundedRect(QRectF(box.left, box.top, box.width, box.height), 4,
                       StoryTheme::Background, StoryTheme::BorderMuted, 0.5);

    auto faceFor = [](ScriptLayout::RunStyle style) {
        return style == ScriptLayout::RunStyle::Emphasis ? FontRegistry::Face::OpenSansBold
                                                         : FontRegistry::Face::OpenSansRegular;
    };

    const ScriptLayout::MeasureFn measure = [&](const QString& str, ScriptLayout::RunStyle style) {
        return canvas.textWidth(faceFor(style), StoryTheme::ScriptSize, str);
    };

    const QVector<ScriptLayout::PlacedFragment> fragments =
        ScriptLayout::layoutScript(panel.script, box, measure, ProjectSnapshot::MAX_SCRIPT_LINES);
    for (const ScriptLayout::PlacedFragment& fragment : fragments) {
        const QRgb color = fragment.style == ScriptLayout::RunStyle::Emphasis ? StoryTheme::Accent
                                                                               : StoryTheme::Text;
        canvas.text(faceFor(fragment.style), StoryTheme::ScriptSize, color,
                    fragment.text, fragment.x, fragment.baseline);
    }

    return true;
}

bool StoryPdfExporter::drawEndPage(const EndPage& page, QString* error)
{
    PageCanvas canvas(m_ctx, m_outputDoc, m_fonts.get(), m_options.dpi);
    if (!canvas.begin(error)) {
        return false;
    }

    if (!drawCoverBackground(canvas, page.background, error)) {
        return false;
    }
    if (!canvas.overlay(StoryTheme::OverlayBase, StoryTheme::OverlayOpacity, error)) {
        return false;
    }

    const QString endText = page.text.trimmed().toUpper();
    if (page.showText && !endText.isEmpty()) {
        const qreal width = canvas.textWidth(FontRegistry::Face::OswaldBold,
                                             StoryTheme::TitleSize, endText);
        canvas.text(FontRegistry::Face::OswaldBold, StoryTheme::TitleSize, StoryTheme::TextLight,
                    endText, (PAGE_WIDTH - width) / 2, PAGE_HEIGHT / 2);
    }

    if (page.logo && !drawLogo(canvas, *page.logo, error)) {
        return false;
    }

    return canvas.finish(error);
}

// ============================================================================
// Image compression
// ============================================================================

QByteArray StoryPdfExporter::compressImage(const QImage& image, bool hasAlpha,
                                           const QSizeF& displaySizePt, int targetDpi)
{
    if (image.isNull()) {
        return QByteArray();
    }

    QImage workImage = image;

    if (displaySizePt.width() > 0 && displaySizePt.height() > 0 && targetDpi > 0) {
        // Pixels needed at target DPI (display size is in 72 DPI points)
        const int requiredWidth = qMax(1, qRound(displaySizePt.width() / 72.0 * targetDpi));
        const int requiredHeight = qMax(1, qRound(displaySizePt.height() / 72.0 * targetDpi));

        // Never upsample
        if (image.width() > requiredWidth || image.height() > requiredHeight) {
            const qreal scale = qMin(static_cast<qreal>(requiredWidth) / image.width(),
                                     static_cast<qreal>(requiredHeight) / image.height());
            const int newWidth = qMax(1, qRound(image.width() * scale));
            const int newHeight = qMax(1, qRound(image.height() * scale));

#ifdef TEKASTORY_DEBUG
            qDebug() << "[StoryPdfExporter] Downsampling image from"
                     << image.width() << "x" << image.height()
                     << "to" << newWidth << "x" << newHeight;
#endif
            workImage = image.scaled(newWidth, newHeight, Qt::KeepAspectRatio,
                                     Qt::SmoothTransformation);
        }
    }

    QByteArray result;
    QBuffer buffer(&result);
    buffer.open(QIODevice::WriteOnly);

    if (hasAlpha) {
        if (!workImage.save(&buffer, "PNG")) {
            qWarning() << "[StoryPdfExporter] Failed to compress image as PNG";
            return QByteArray();
        }
    } else {
        QImage opaqueImage = workImage;
        if (opaqueImage.hasAlphaChannel()) {
            // Composite on white, JPEG has no alpha
            QImage rgb(opaqueImage.size(), QImage::Format_RGB888);
            rgb.fill(Qt::white);
            QPainter painter(&rgb);
            painter.drawImage(0, 0, opaqueImage);
            painter.end();
            opaqueImage = rgb;
        } else if (opaqueImage.format() != QImage::Format_RGB888 &&
                   opaqueImage.format() != QImage::Format_RGB32) {
            opaqueImage = opaqueImage.convertToFormat(QImage::Format_RGB888);
        }

        if (!opaqueImage.save(&buffer, "JPEG", 85)) {
            qWarning() << "[StoryPdfExporter] Failed to compress image as JPEG";
            return QByteArray();
        }
    }

    buffer.close();
    return result;
}

// ============================================================================
// MuPDF lifecycle and output
// ============================================================================

bool StoryPdfExporter::initContext()
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "[StoryPdfExporter] Failed to create MuPDF context";
        return false;
    }

    fz_try(m_ctx) {
        m_outputDoc = pdf_create_document(m_ctx);
    }
    fz_catch(m_ctx) {
        qWarning() << "[StoryPdfExporter] Failed to create output PDF:" << fz_caught_message(m_ctx);
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        return false;
    }

#ifdef TEKASTORY_DEBUG
    qDebug() << "[StoryPdfExporter] Context initialized";
#endif
    return true;
}

void StoryPdfExporter::cleanup()
{
    // Fonts reference the context and the document
    m_fonts.reset();

    if (m_outputDoc) {
        pdf_drop_document(m_ctx, m_outputDoc);
        m_outputDoc = nullptr;
    }

    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

bool StoryPdfExporter::writeMetadata(const QString& title, const QString& producer)
{
    if (!m_outputDoc || !m_ctx) {
        return false;
    }

    const QByteArray titleUtf8 = title.toUtf8();
    const QByteArray producerUtf8 = producer.toUtf8();

    fz_try(m_ctx) {
        pdf_obj* trailer = pdf_trailer(m_ctx, m_outputDoc);
        pdf_obj* info = pdf_dict_get(m_ctx, trailer, PDF_NAME(Info));
        if (!info) {
            info = pdf_add_new_dict(m_ctx, m_outputDoc, 4);
            pdf_dict_put_drop(m_ctx, trailer, PDF_NAME(Info), info);
        }
        pdf_dict_put_text_string(m_ctx, info, PDF_NAME(Title), titleUtf8.constData());
        pdf_dict_put_text_string(m_ctx, info, PDF_NAME(Producer), producerUtf8.constData());
    }
    fz_catch(m_ctx) {
        qWarning() << "[StoryPdfExporter] Failed to write metadata:" << fz_caught_message(m_ctx);
        return false;
    }

    return true;
}

bool StoryPdfExporter::saveToBuffer(QByteArray* out)
{
    if (!m_outputDoc || !m_ctx || !out) {
        return false;
    }

    fz_buffer* buffer = nullptr;
    fz_output* output = nullptr;
    bool ok = true;

    fz_try(m_ctx) {
        buffer = fz_new_buffer(m_ctx, 64 * 1024);
        output = fz_new_output_with_buffer(m_ctx, buffer);

        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = 1;
        opts.do_compress_images = 1;
        opts.do_compress_fonts = 1;

        pdf_write_document(m_ctx, m_outputDoc, output, &opts);
        fz_close_output(m_ctx, output);
    }
    fz_always(m_ctx) {
        fz_drop_output(m_ctx, output);
    }
    fz_catch(m_ctx) {
        qWarning() << "[StoryPdfExporter] Failed to write document:" << fz_caught_message(m_ctx);
        ok = false;
    }

    if (ok) {
        unsigned char* data = nullptr;
        const size_t length = fz_buffer_storage(m_ctx, buffer, &data);
        *out = QByteArray(reinterpret_cast<const char*>(data), static_cast<int>(length));
    }
    fz_drop_buffer(m_ctx, buffer);
    return ok;
}
