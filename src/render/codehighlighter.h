/*
 * codehighlighter.h: KSyntaxHighlighting adapter for code-block runs
 *
 * Runs the light default theme over the code and returns each formatted
 * span as a run font overlay (colour, bold, italic) plus an optional
 * background shading.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_CODEHIGHLIGHTER_H
#define SHELFDOCX_CODEHIGHLIGHTER_H

#include "docxfont.h"

#include <QColor>
#include <QList>
#include <QString>

#include <KSyntaxHighlighting/AbstractHighlighter>
#include <KSyntaxHighlighting/Definition>
#include <KSyntaxHighlighting/Format>
#include <KSyntaxHighlighting/Repository>
#include <KSyntaxHighlighting/State>
#include <KSyntaxHighlighting/Theme>

class CodeHighlighter : public KSyntaxHighlighting::AbstractHighlighter
{
public:
    struct Span {
        int start = 0;          // UTF-16 offset into the code
        int length = 0;
        Docx::Font font;
        QColor background;
    };

    CodeHighlighter();

    // Empty when the language is unknown
    QList<Span> highlight(const QString &code, const QString &language);

protected:
    void applyFormat(int offset, int length,
                     const KSyntaxHighlighting::Format &format) override;

private:
    // By name ("Python"), then by extension ("py")
    KSyntaxHighlighting::Definition definitionFor(const QString &language) const;

    KSyntaxHighlighting::Repository *m_repo = nullptr;
    QList<Span> m_spans;
    int m_lineOffset = 0;
};

#endif // SHELFDOCX_CODEHIGHLIGHTER_H
