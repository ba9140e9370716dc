#pragma once

// ============================================================================
// PackageFormat - Layout of a .tekastory package
// ============================================================================
// A package is a ZIP archive with:
// - project.json        the manifest (ProjectSnapshot::toJson)
// - assets/<key>        one entry per referenced AssetStore key
// Nothing else is written; unknown entries are ignored on import.
// ============================================================================

namespace PackageFormat {

constexpr const char* ManifestEntry = "project.json";
constexpr const char* AssetsPrefix = "assets/";
constexpr const char* FileExtension = ".tekastory";

} // namespace PackageFormat
