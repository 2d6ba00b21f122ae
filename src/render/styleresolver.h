/*
 * styleresolver.h: Inline style token -> run formatting
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_STYLERESOLVER_H
#define SHELFDOCX_STYLERESOLVER_H

#include "docxfont.h"
#include "shelfmodel.h"

#include <QColor>
#include <QString>

struct FormattingInstruction {
    enum class Action {
        None,       // unknown token, run passes through
        Format,     // overlay font / shading
        Hyperlink,  // turn the run into a hyperlink run
        Image,      // replace the marker glyph with an inline picture
        Invalid     // recognised token with unusable payload
    };

    Action action = Action::None;
    Docx::Font font;
    QColor shading;
    QString href;
    Shelf::ImageDescriptor image;
    QString problem;    // Invalid only
};

class StyleResolver
{
public:
    static FormattingInstruction resolve(const Shelf::StyleToken &token);

    // The glyph an IMG range sits on
    static QString imageMarker();
};

#endif // SHELFDOCX_STYLERESOLVER_H
