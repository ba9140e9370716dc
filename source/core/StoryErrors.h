#pragma once

// ============================================================================
// StoryErrors - Error classification shared by the engine components
// ============================================================================
// Results are reported through result structs (success + errorMessage).
// ErrorKind tells the caller which category a failure (or warning) belongs
// to, so the CLI and the engine facade can react without parsing messages.
// ============================================================================

#include <QString>

/**
 * @brief Category of a failure reported by the engine.
 */
enum class ErrorKind {
    None,               ///< No error
    Validation,         ///< Package is unreadable or has no/invalid manifest
    AssetResolution,    ///< A referenced key is missing from the AssetStore
    Materialization,    ///< A bundled default resource could not be fetched
    Render,             ///< A page failed to draw; the export is aborted
    Io,                 ///< Read/write failure at the filesystem boundary
    Busy                ///< Another save/load/export is already running
};

/**
 * @brief Human-readable name of an ErrorKind (used in logs and JSON output).
 */
inline QString errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None:            return QStringLiteral("none");
        case ErrorKind::Validation:      return QStringLiteral("validation");
        case ErrorKind::AssetResolution: return QStringLiteral("asset-resolution");
        case ErrorKind::Materialization: return QStringLiteral("materialization");
        case ErrorKind::Render:          return QStringLiteral("render");
        case ErrorKind::Io:              return QStringLiteral("io");
        case ErrorKind::Busy:            return QStringLiteral("busy");
    }
    return QString();
}
