#pragma once

// ============================================================================
// AppSettings - Persistent configuration of the TekaStory engine
// ============================================================================
// Stored with QSettings("TekaStory", "App"):
//   resourceDir  - root holding images/ and fonts/
//   logDir       - directory of tekastory-errors.log
//   exportDpi    - target resolution for images embedded into PDFs
//
// The TEKASTORY_RESOURCE_DIR environment variable overrides resourceDir.
// Command line flags override both (applied by the caller).
// ============================================================================

#include <QString>
#include <QStringList>

struct AppSettings {
    static constexpr int DEFAULT_EXPORT_DPI = 150;
    static constexpr int MIN_EXPORT_DPI = 36;
    static constexpr int MAX_EXPORT_DPI = 600;

    QString resourceDir;
    QString logDir;
    int exportDpi = DEFAULT_EXPORT_DPI;

    /**
     * @brief Load stored values, then apply the environment override.
     *
     * Missing values fall back to defaults: the first existing candidate
     * resource directory, the app-local data location for logs and 150 DPI.
     */
    static AppSettings load();

    /// Write resourceDir, logDir and exportDpi back to QSettings.
    void save() const;

    /**
     * @brief Resource directories tried in order when none is configured:
     *        <app dir>/resources, /usr/share/tekastory, /usr/local/share/tekastory.
     */
    static QStringList candidateResourceDirs();

    static QString defaultResourceDir();
    static QString defaultLogDir();

    /// Clamp a DPI value into [MIN_EXPORT_DPI, MAX_EXPORT_DPI].
    static int clampDpi(int dpi);
};
