#pragma once

// ============================================================================
// ScriptLayout Unit Tests
// ============================================================================
// Run with: tekastory --test-layout
//
// Text is measured with a fixed 10 units per character, so every expected
// position can be worked out by hand.
// ============================================================================

#include "ScriptLayout.h"

#include <QDebug>

namespace ScriptLayoutTests {

using namespace ScriptLayout;

inline qreal fixedMeasure(const QString& text, RunStyle)
{
    return text.size() * 10.0;
}

/// Box with a 60 unit text width (x 10..70) and six baselines (19 ... 89).
inline LayoutBox testBox(qreal height = 100)
{
    LayoutBox box;
    box.left = 0;
    box.top = 0;
    box.width = 80;
    box.height = height;
    box.padding = 10;
    box.fontSize = 13;
    box.lineHeight = 14;
    return box;
}

/**
 * @brief Test tokenizing into plain and emphasis runs.
 */
inline bool testTokenize()
{
    qDebug() << "=== Test: Tokenize ===";
    bool success = true;

    {
        const QVector<Run> runs = tokenize("Open on [wide shot] city");
        const QVector<Run> expected = {
            {RunStyle::Plain, "Open on "},
            {RunStyle::Emphasis, "wide shot"},
            {RunStyle::Plain, " city"},
        };
        if (runs != expected) {
            qDebug() << "FAIL: Unexpected runs for mixed script, count" << runs.size();
            success = false;
        } else {
            qDebug() << "  - Brackets removed from emphasis: OK";
        }
    }

    {
        const QVector<Run> runs = tokenize("[first][second]");
        if (runs.size() != 2 || runs[0].text != "first" || runs[1].text != "second"
            || runs[0].style != RunStyle::Emphasis) {
            qDebug() << "FAIL: Adjacent emphasis spans not split";
            success = false;
        } else {
            qDebug() << "  - Shortest match per span: OK";
        }
    }

    {
        const QVector<Run> runs = tokenize("[cut\nto] black");
        if (runs.size() != 2 || runs[0].text != "cut\nto" || runs[0].style != RunStyle::Emphasis) {
            qDebug() << "FAIL: Emphasis across newline not recognised";
            success = false;
        } else {
            qDebug() << "  - Emphasis may cross newlines: OK";
        }
    }

    {
        const QVector<Run> runs = tokenize("unclosed [bracket");
        if (runs.size() != 1 || runs[0].style != RunStyle::Plain
            || runs[0].text != "unclosed [bracket") {
            qDebug() << "FAIL: Unclosed bracket should stay plain";
            success = false;
        } else {
            qDebug() << "  - Unclosed bracket is plain text: OK";
        }
    }

    {
        if (!tokenize(QString()).isEmpty()) {
            qDebug() << "FAIL: Empty script produced runs";
            success = false;
        } else {
            qDebug() << "  - Empty script has no runs: OK";
        }
    }

    return success;
}

/**
 * @brief Test greedy wrapping at the right edge.
 */
inline bool testWordWrap()
{
    qDebug() << "=== Test: Word Wrap ===";
    bool success = true;

    const LayoutBox box = testBox();

    {
        const auto placed = layout(tokenize("aaaa bbbb"), box, fixedMeasure);
        const QStringList lines = lineTexts(placed);
        if (lines != QStringList({"aaaa", "bbbb"})) {
            qDebug() << "FAIL: Expected two lines, got" << lines;
            success = false;
        } else if (placed.size() != 2 || placed[1].x != 10 || placed[1].baseline != 33) {
            qDebug() << "FAIL: Wrapped word misplaced";
            success = false;
        } else {
            qDebug() << "  - Word moves to next line without its space: OK";
        }
    }

    {
        const auto placed = layout(tokenize("aa bb"), box, fixedMeasure);
        const QStringList lines = lineTexts(placed);
        if (lines != QStringList({"aa bb"}) || placed.size() != 2 || placed[1].x != 30) {
            qDebug() << "FAIL: Words that fit should share a line, got" << lines;
            success = false;
        } else {
            qDebug() << "  - Fitting words share a line: OK";
        }
    }

    {
        // A single word wider than the box is placed anyway
        const auto placed = layout(tokenize("abcdefghij"), box, fixedMeasure);
        if (placed.size() != 1 || placed[0].line != 0 || placed[0].x != 10) {
            qDebug() << "FAIL: Overlong first word should stay on the first line";
            success = false;
        } else {
            qDebug() << "  - Overlong word at line start not wrapped: OK";
        }
    }

    {
        const auto placed = layout(tokenize("[Pan] left"), box, fixedMeasure);
        bool bracketSeen = false;
        for (const PlacedFragment& fragment : placed) {
            bracketSeen |= fragment.text.contains('[') || fragment.text.contains(']');
        }
        if (placed.isEmpty() || placed[0].style != RunStyle::Emphasis
            || placed[0].text != "Pan" || bracketSeen
            || placed.last().style != RunStyle::Plain) {
            qDebug() << "FAIL: Emphasis run not placed with its style";
            success = false;
        } else {
            qDebug() << "  - Style kept per fragment, cursor carried across runs: OK";
        }
    }

    return success;
}

/**
 * @brief Test explicit newlines and the six-line cap.
 */
inline bool testLineBreaksAndTruncation()
{
    qDebug() << "=== Test: Line Breaks and Truncation ===";
    bool success = true;

    const LayoutBox box = testBox();

    {
        const QStringList lines = lineTexts(layout(tokenize("a\n\nb"), box, fixedMeasure));
        if (lines != QStringList({"a", "", "b"})) {
            qDebug() << "FAIL: Blank line not kept:" << lines;
            success = false;
        } else {
            qDebug() << "  - Newlines break lines, blank lines kept: OK";
        }
    }

    {
        const QString script = "1\n2\n3\n4\n5\n6\n7";
        if (truncateLines(script, 6) != "1\n2\n3\n4\n5\n6") {
            qDebug() << "FAIL: truncateLines did not keep six lines";
            success = false;
        } else if (truncateLines("1\n2", 6) != "1\n2") {
            qDebug() << "FAIL: Short script changed by truncateLines";
            success = false;
        } else {
            qDebug() << "  - truncateLines(): OK";
        }

        const QStringList lines = lineTexts(layoutScript(script, box, fixedMeasure));
        if (lines != QStringList({"1", "2", "3", "4", "5", "6"})) {
            qDebug() << "FAIL: Seven-line script rendered as" << lines;
            success = false;
        } else {
            qDebug() << "  - Seventh line dropped: OK";
        }
    }

    return success;
}

/**
 * @brief Test that text stops once a baseline leaves the box.
 */
inline bool testVerticalOverflow()
{
    qDebug() << "=== Test: Vertical Overflow ===";
    bool success = true;

    {
        // Height 40: last allowed baseline is 30, so only baseline 19 fits
        const LayoutBox shortBox = testBox(40);
        const auto placed = layout(tokenize("one\ntwo\nthree"), shortBox, fixedMeasure);
        if (lineTexts(placed) != QStringList({"one"})) {
            qDebug() << "FAIL: Lines past the box were placed";
            success = false;
        } else {
            qDebug() << "  - Explicit lines stop at the box bottom: OK";
        }
    }

    {
        const LayoutBox shortBox = testBox(40);
        const auto placed = layout(tokenize("aaaa bbbb cccc [dddd]"), shortBox, fixedMeasure);
        bool allInside = true;
        for (const PlacedFragment& fragment : placed) {
            allInside &= fragment.baseline <= shortBox.lastBaseline();
        }
        if (placed.size() != 1 || !allInside) {
            qDebug() << "FAIL: Wrapped words past the box were placed:" << placed.size();
            success = false;
        } else {
            qDebug() << "  - Wrapping stops silently: OK";
        }
    }

    return success;
}

/**
 * @brief Run all ScriptLayout tests.
 */
inline bool runAllTests()
{
    qDebug() << "";
    qDebug() << "========================================";
    qDebug() << "Running ScriptLayout Tests";
    qDebug() << "========================================";

    bool allPassed = true;

    allPassed &= testTokenize();
    allPassed &= testWordWrap();
    allPassed &= testLineBreaksAndTruncation();
    allPassed &= testVerticalOverflow();

    qDebug() << "";
    if (allPassed) {
        qDebug() << "✅ All ScriptLayout tests passed!";
    } else {
        qDebug() << "❌ Some ScriptLayout tests failed!";
    }
    qDebug() << "";

    return allPassed;
}

} // namespace ScriptLayoutTests
