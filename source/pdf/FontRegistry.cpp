// ============================================================================
// FontRegistry - Implementation
// ============================================================================

#include "FontRegistry.h"
#include "../core/ResourceProvider.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QObject>

#include <cstdio>

struct FaceInfo {
    const char* fileName;
    const char* resourceName;
};

// Indexed by FontRegistry::Face
static const FaceInfo FACES[FontRegistry::FACE_COUNT] = {
    { "Oswald-Bold.ttf",      "F1" },
    { "Oswald-Light.ttf",     "F2" },
    { "Oswald-Regular.ttf",   "F3" },
    { "OpenSans-Regular.ttf", "F4" },
    { "OpenSans-Bold.ttf",    "F5" },
};

// Unicode code points of Windows-1252 bytes 0x80-0x9F (0 = undefined)
static const char32_t WIN_ANSI_HIGH[32] = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178
};

// ============================================================================
// Construction / Destruction
// ============================================================================

FontRegistry::FontRegistry(fz_context* ctx, pdf_document* doc)
    : m_ctx(ctx)
    , m_doc(doc)
{
}

FontRegistry::~FontRegistry()
{
    if (!m_ctx) {
        return;
    }
    for (int i = 0; i < FACE_COUNT; ++i) {
        if (m_fontObjects[i]) {
            pdf_drop_obj(m_ctx, m_fontObjects[i]);
        }
        if (m_fonts[i]) {
            fz_drop_font(m_ctx, m_fonts[i]);
        }
    }
}

// ============================================================================
// Registration
// ============================================================================

bool FontRegistry::registerAll(const ResourceProvider& provider, QString* errorMessage)
{
    if (m_registered) {
        return true;
    }
    if (!m_ctx || !m_doc) {
        if (errorMessage) {
            *errorMessage = QObject::tr("PDF engine not initialized");
        }
        return false;
    }

    for (Face face : allFaces()) {
        const int index = static_cast<int>(face);
        const QString path = fontPath(face);

        QString fetchError;
        std::optional<QByteArray> bytes = provider.fetch(path, &fetchError);
        if (!bytes || bytes->isEmpty()) {
            if (errorMessage) {
                *errorMessage = QObject::tr("Failed to load font %1: %2")
                                    .arg(path, bytes ? QObject::tr("empty file") : fetchError);
            }
            return false;
        }

        fz_buffer* fontBuf = nullptr;
        bool ok = true;

        fz_try(m_ctx) {
            fontBuf = fz_new_buffer_from_copied_data(m_ctx,
                reinterpret_cast<const unsigned char*>(bytes->constData()),
                static_cast<size_t>(bytes->size()));
            m_fonts[index] = fz_new_font_from_buffer(m_ctx, FACES[index].fileName, fontBuf, 0, 0);
            m_fontObjects[index] = pdf_add_simple_font(m_ctx, m_doc, m_fonts[index],
                                                       PDF_SIMPLE_ENCODING_LATIN);
        }
        fz_always(m_ctx) {
            fz_drop_buffer(m_ctx, fontBuf);
        }
        fz_catch(m_ctx) {
            qWarning() << "[FontRegistry] Failed to embed" << path << ":" << fz_caught_message(m_ctx);
            if (errorMessage) {
                *errorMessage = QObject::tr("Failed to embed font %1: %2")
                                    .arg(path, QString::fromUtf8(fz_caught_message(m_ctx)));
            }
            ok = false;
        }

        if (!ok) {
            return false;
        }

#ifdef TEKASTORY_DEBUG
        qDebug() << "[FontRegistry] Embedded" << path << "as" << FACES[index].resourceName
                 << "(" << bytes->size() << "bytes)";
#endif
    }

    m_registered = true;
    return true;
}

QByteArray FontRegistry::resourceName(Face face)
{
    return QByteArray(FACES[static_cast<int>(face)].resourceName);
}

QString FontRegistry::fontPath(Face face)
{
    return QStringLiteral("/fonts/") + QLatin1String(FACES[static_cast<int>(face)].fileName);
}

QVector<FontRegistry::Face> FontRegistry::allFaces()
{
    return { Face::OswaldBold, Face::OswaldLight, Face::OswaldRegular,
             Face::OpenSansRegular, Face::OpenSansBold };
}

pdf_obj* FontRegistry::fontObject(Face face) const
{
    return m_fontObjects[static_cast<int>(face)];
}

// ============================================================================
// Measurement and Encoding
// ============================================================================

float FontRegistry::measure(Face face, const QString& text, float fontSizePt) const
{
    fz_font* font = m_fonts[static_cast<int>(face)];
    if (!font || text.isEmpty()) {
        return 0.0f;
    }

    float advance = 0.0f;
    const QVector<uint> codePoints = text.toUcs4();

    fz_try(m_ctx) {
        for (uint ucs : codePoints) {
            // Measure the glyph that will actually be shown after encoding
            const char32_t shown = unicodeFromWinAnsi(winAnsiFromUnicode(ucs));
            const int gid = fz_encode_character(m_ctx, font, static_cast<int>(shown));
            advance += fz_advance_glyph(m_ctx, font, gid, 0);
        }
    }
    fz_catch(m_ctx) {
        qWarning() << "[FontRegistry] Failed to measure text:" << fz_caught_message(m_ctx);
        return 0.0f;
    }

    return advance * fontSizePt;
}

QByteArray FontRegistry::encodeText(const QString& text)
{
    QByteArray out;
    out.reserve(text.size() + 2);
    out.append('(');

    const QVector<uint> codePoints = text.toUcs4();
    for (uint ucs : codePoints) {
        const unsigned char code = winAnsiFromUnicode(ucs);
        if (code == '(' || code == ')' || code == '\\') {
            out.append('\\');
            out.append(static_cast<char>(code));
        } else if (code < 0x20 || code >= 0x7F) {
            char escaped[5];
            snprintf(escaped, sizeof(escaped), "\\%03o", code);
            out.append(escaped);
        } else {
            out.append(static_cast<char>(code));
        }
    }

    out.append(')');
    return out;
}

unsigned char FontRegistry::winAnsiFromUnicode(char32_t ucs)
{
    if (ucs < 0x80 || (ucs >= 0xA0 && ucs <= 0xFF)) {
        return static_cast<unsigned char>(ucs);
    }
    for (int i = 0; i < 32; ++i) {
        if (WIN_ANSI_HIGH[i] != 0 && WIN_ANSI_HIGH[i] == ucs) {
            return static_cast<unsigned char>(0x80 + i);
        }
    }
    return '?';
}

char32_t FontRegistry::unicodeFromWinAnsi(unsigned char code)
{
    if (code >= 0x80 && code < 0xA0) {
        const char32_t mapped = WIN_ANSI_HIGH[code - 0x80];
        return mapped ? mapped : U'?';
    }
    return code;
}
