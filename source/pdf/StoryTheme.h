#pragma once

// ============================================================================
// StoryTheme - Colours, fonts and sizes of the exported storyboard
// ============================================================================

#include <QRgb>

namespace StoryTheme {

// ===== Colours =====
constexpr QRgb Surface      = qRgb(0xFF, 0xFF, 0xFF);   ///< Panel card fill
constexpr QRgb SurfaceMuted = qRgb(0xE2, 0xE8, 0xF0);   ///< Empty image box
constexpr QRgb Background   = qRgb(0xF1, 0xF5, 0xF9);   ///< Script box fill
constexpr QRgb Border       = qRgb(0xCB, 0xD5, 0xE1);   ///< Card border, subheader text
constexpr QRgb BorderMuted  = qRgb(0x94, 0xA3, 0xB8);   ///< Script box border
constexpr QRgb PanelBorder  = qRgb(0x1E, 0x29, 0x3B);   ///< Image box frame
constexpr QRgb Text         = qRgb(0x1E, 0x29, 0x3B);   ///< Plain script text
constexpr QRgb TextMedium   = qRgb(0x47, 0x55, 0x69);   ///< "Script" label
constexpr QRgb TextSubtle   = qRgb(0x94, 0xA3, 0xB8);   ///< Panel number
constexpr QRgb TextLight    = qRgb(0xFF, 0xFF, 0xFF);   ///< Text on dark backgrounds
constexpr QRgb Accent       = qRgb(0x4F, 0x46, 0xE5);   ///< [Bracketed] directions
constexpr QRgb OverlayBase  = qRgb(0x00, 0x00, 0x00);

constexpr float OverlayOpacity = 0.7f;

// ===== Font sizes (points) =====
constexpr float TitleSize       = 72.0f;
constexpr float SubTitleSize    = 36.0f;
constexpr float PanelNumberSize = 14.0f;
constexpr float ScriptLabelSize = 10.0f;
constexpr float ScriptSize      = 13.0f;

constexpr float SubTitleLineFactor = 1.15f;

constexpr const char* ScriptLabel = "Script";

} // namespace StoryTheme
