#pragma once

// ============================================================================
// ScriptLayout - Rich word-wrap for panel scripts
// ============================================================================
// Panel scripts are plain text with [bracketed] stage directions. The
// renderer draws plain text in the body colour and bracketed text bold in the
// accent colour, wrapping words greedily inside the script box.
//
// Everything here is pure: text measurement is injected as a callback, so
// the layout can be tested without fonts or a PDF document.
// ============================================================================

#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>

namespace ScriptLayout {

/**
 * @brief Style of a run of script text.
 */
enum class RunStyle {
    Plain,      ///< Regular weight, text colour
    Emphasis    ///< Bracketed direction: bold, accent colour, brackets removed
};

/**
 * @brief Contiguous text sharing one style.
 */
struct Run {
    RunStyle style = RunStyle::Plain;
    QString text;

    bool operator==(const Run& other) const { return style == other.style && text == other.text; }
};

/**
 * @brief Geometry of the script box, in page units.
 *
 * The first baseline sits at top + padding + fontSize - 4; text stops once a
 * baseline would pass top + height - padding.
 */
struct LayoutBox {
    qreal left = 0;
    qreal top = 0;
    qreal width = 0;
    qreal height = 0;
    qreal padding = 10;
    qreal fontSize = 13;        ///< Only used for the first baseline offset
    qreal lineHeight = 14;

    qreal lineStartX() const { return left + padding; }
    qreal maxTextWidth() const { return width - 2 * padding; }
    qreal firstBaseline() const { return top + padding + fontSize - 4; }
    qreal lastBaseline() const { return top + height - padding; }
};

/**
 * @brief A piece of text placed at a position (baseline origin).
 */
struct PlacedFragment {
    QString text;               ///< May start with a single separating space
    RunStyle style = RunStyle::Plain;
    qreal x = 0;
    qreal baseline = 0;
    int line = 0;               ///< 0-based visual line index
};

/**
 * @brief Width of text in page units for a given style.
 */
using MeasureFn = std::function<qreal(const QString& text, RunStyle style)>;

/**
 * @brief Keep at most maxLines newline-separated source lines.
 */
QString truncateLines(const QString& script, int maxLines = 6);

/**
 * @brief Split a script into plain and emphasis runs.
 *
 * Emphasis spans are the shortest "[...]" matches (they may cross newlines).
 * Brackets are removed from emphasis text. Empty plain gaps are dropped.
 */
QVector<Run> tokenize(const QString& script);

/**
 * @brief Greedy word-wrap of runs into a box.
 *
 * The cursor carries across runs, so a style change never breaks a line.
 * A '\n' breaks the line. Words are split on single spaces; a word after the
 * line start is measured with its leading space and moves to the next line
 * when it would pass the right edge. Once a baseline leaves the box nothing
 * more is placed (silent truncation).
 */
QVector<PlacedFragment> layout(const QVector<Run>& runs, const LayoutBox& box,
                               const MeasureFn& measure);

/**
 * @brief truncateLines() + tokenize() + layout().
 */
QVector<PlacedFragment> layoutScript(const QString& script, const LayoutBox& box,
                                     const MeasureFn& measure, int maxLines = 6);

/**
 * @brief Visible text of each line (fragments of a line concatenated).
 */
QStringList lineTexts(const QVector<PlacedFragment>& fragments);

} // namespace ScriptLayout
