#pragma once

// ============================================================================
// FontRegistry - Fonts embedded into an exported storyboard
// ============================================================================
// Five faces from two families are used: Oswald (Bold, Light, Regular) for
// title/end page text and Open Sans (Regular, Bold) for panels. Each face is
// fetched through the ResourceProvider ("/fonts/<file>.ttf") and embedded
// into the output document exactly once per export.
//
// Text is written with WinAnsi (Windows-1252) encoded simple fonts; the
// registry also measures strings from the embedded glyph advances so the
// word-wrap sees the same widths the viewer will draw.
// ============================================================================

#include <QByteArray>
#include <QString>
#include <QVector>

class ResourceProvider;

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;
struct fz_font;
struct pdf_document;
struct pdf_obj;

class FontRegistry {
public:
    enum class Face {
        OswaldBold,
        OswaldLight,
        OswaldRegular,
        OpenSansRegular,
        OpenSansBold
    };

    static constexpr int FACE_COUNT = 5;

    /**
     * @param ctx MuPDF context of the export (must outlive the registry)
     * @param doc Output document receiving the font objects
     */
    FontRegistry(fz_context* ctx, pdf_document* doc);
    ~FontRegistry();

    FontRegistry(const FontRegistry&) = delete;
    FontRegistry& operator=(const FontRegistry&) = delete;

    /**
     * @brief Fetch and embed all faces.
     *
     * Calling it again after a successful registration does nothing.
     *
     * @return false with errorMessage set if a face could not be fetched or loaded.
     */
    bool registerAll(const ResourceProvider& provider, QString* errorMessage);

    bool isRegistered() const { return m_registered; }

    /// Resource name used in content streams ("F1" ... "F5").
    static QByteArray resourceName(Face face);

    /// Provider path of a face, e.g. "/fonts/Oswald-Bold.ttf".
    static QString fontPath(Face face);

    static QVector<Face> allFaces();

    /// Indirect font object for the page /Font dictionary.
    pdf_obj* fontObject(Face face) const;

    /**
     * @brief Advance width of text in PDF points.
     */
    float measure(Face face, const QString& text, float fontSizePt) const;

    /**
     * @brief Encode text as a PDF literal string "(...)" for Tj.
     *
     * Characters outside Windows-1252 are replaced with '?'.
     */
    static QByteArray encodeText(const QString& text);

    /// Windows-1252 byte for a Unicode code point, or '?' if unmappable.
    static unsigned char winAnsiFromUnicode(char32_t ucs);

    /// Unicode code point shown for a Windows-1252 byte.
    static char32_t unicodeFromWinAnsi(unsigned char code);

private:
    fz_context* m_ctx = nullptr;
    pdf_document* m_doc = nullptr;
    bool m_registered = false;

    fz_font* m_fonts[FACE_COUNT] = {};
    pdf_obj* m_fontObjects[FACE_COUNT] = {};
};
