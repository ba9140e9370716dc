#include "ScriptLayout.h"

#include <QRegularExpression>

namespace ScriptLayout {

QString truncateLines(const QString& script, int maxLines)
{
    if (maxLines <= 0) {
        return QString();
    }
    QStringList lines = script.split(QLatin1Char('\n'));
    if (lines.size() <= maxLines) {
        return script;
    }
    return lines.mid(0, maxLines).join(QLatin1Char('\n'));
}

QVector<Run> tokenize(const QString& script)
{
    static const QRegularExpression emphasisPattern(QStringLiteral("\\[[\\s\\S]*?\\]"));

    QVector<Run> runs;
    auto appendRun = [&runs](RunStyle style, const QString& text) {
        runs.append(Run{style, text});
    };

    int pos = 0;
    QRegularExpressionMatchIterator it = emphasisPattern.globalMatch(script);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        if (match.capturedStart() > pos) {
            appendRun(RunStyle::Plain, script.mid(pos, match.capturedStart() - pos));
        }
        const QString span = match.captured();
        appendRun(RunStyle::Emphasis, span.mid(1, span.size() - 2));
        pos = match.capturedEnd();
    }
    if (pos < script.size()) {
        appendRun(RunStyle::Plain, script.mid(pos));
    }
    return runs;
}

QVector<PlacedFragment> layout(const QVector<Run>& runs, const LayoutBox& box,
                               const MeasureFn& measure)
{
    QVector<PlacedFragment> placed;

    const qreal lineStart = box.lineStartX();
    const qreal rightEdge = lineStart + box.maxTextWidth();

    qreal cursorX = lineStart;
    qreal cursorY = box.firstBaseline();
    int line = 0;

    auto inBounds = [&]() { return cursorY <= box.lastBaseline(); };
    auto newLine = [&]() {
        cursorY += box.lineHeight;
        cursorX = lineStart;
        ++line;
    };
    auto place = [&](const QString& text, RunStyle style, qreal width) {
        if (!text.isEmpty()) {
            placed.append(PlacedFragment{text, style, cursorX, cursorY, line});
        }
        cursorX += width;
    };

    for (const Run& run : runs) {
        if (!inBounds()) {
            break;
        }

        const QStringList lines = run.text.split(QLatin1Char('\n'));
        for (int i = 0; i < lines.size() && inBounds(); ++i) {
            const QStringList words = lines[i].split(QLatin1Char(' '));
            for (const QString& word : words) {
                if (!inBounds()) {
                    break;
                }

                const bool atLineStart = (cursorX == lineStart);
                QString wordWithSpace = word;
                if (!atLineStart) {
                    wordWithSpace.prepend(QLatin1Char(' '));
                }
                const qreal wordWidth = measure(wordWithSpace, run.style);

                if (cursorX > lineStart && cursorX + wordWidth > rightEdge) {
                    newLine();
                    if (!inBounds()) {
                        break;
                    }
                    // Wrapped words start the line without the separator
                    place(word, run.style, measure(word, run.style));
                } else {
                    place(wordWithSpace, run.style, wordWidth);
                }
            }

            if (i < lines.size() - 1) {
                newLine();
            }
        }
    }

    return placed;
}

QVector<PlacedFragment> layoutScript(const QString& script, const LayoutBox& box,
                                     const MeasureFn& measure, int maxLines)
{
    return layout(tokenize(truncateLines(script, maxLines)), box, measure);
}

QStringList lineTexts(const QVector<PlacedFragment>& fragments)
{
    QStringList result;
    int currentLine = -1;
    for (const PlacedFragment& fragment : fragments) {
        while (currentLine < fragment.line) {
            result.append(QString());
            ++currentLine;
        }
        result.last() += fragment.text;
    }
    return result;
}

} // namespace ScriptLayout
