/*
 * stylemerger.h: Copies character properties from a template document
 * onto the paragraph styles of a rendered document
 *
 * The template is sampled per paragraph style name: the font of the last
 * run of the last top-level paragraph using a style becomes that style's
 * sample. Every produced paragraph whose style has a sample gets the
 * listed attributes copied onto its style font, set or unset. Text and
 * runs are never touched.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_STYLEMERGER_H
#define SHELFDOCX_STYLEMERGER_H

#include <QHash>
#include <QString>
#include <QStringList>

#include "docxdocument.h"

class ErrorSink;

class StyleMerger
{
public:
    // italic, math, no_proof, web_hidden, strike, subscript, rtl, size,
    // color.rgb, shadow, highlight_color, hidden, cs_bold, name
    static QStringList defaultAttributes();

    explicit StyleMerger(const QStringList &attributes = defaultAttributes());

    // Returns the number of produced styles that received attributes.
    // Unknown attribute paths are reported and skipped.
    int merge(Docx::Document &produced, const Docx::Document &templateDocument,
              ErrorSink *errors = nullptr) const;

    static QHash<QString, Docx::Font> sampleFonts(const Docx::Document &templateDocument);

    const QStringList &attributes() const { return m_attributes; }

private:
    QStringList m_attributes;
};

#endif // SHELFDOCX_STYLEMERGER_H
