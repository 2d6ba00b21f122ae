/*
 * textrunbuilder.h: Block text + style/entity ranges -> run descriptors
 *
 * Produces exactly one descriptor per code point of the block text.
 * Ranges are applied in ascending offset order (stable for ties), so on
 * conflicting scalar attributes the last applied range wins. Adjacent
 * descriptors with identical formatting are merged later, when the
 * dispatcher emits them into a paragraph.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_TEXTRUNBUILDER_H
#define SHELFDOCX_TEXTRUNBUILDER_H

#include "docxfont.h"
#include "shelfmodel.h"

#include <QColor>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

class ErrorSink;

struct RunDescriptor {
    QString text;       // one code point; empty once an image consumed its marker
    Docx::Font font;
    QColor shading;
    QString href;
    std::optional<Shelf::ImageDescriptor> image;

    // Same formatting and target, so the two can share one sink run
    bool canMergeWith(const RunDescriptor &other) const;
};

class TextRunBuilder
{
public:
    explicit TextRunBuilder(const Docx::Font &baseFont = Docx::Font());

    QList<RunDescriptor> build(const QString &text,
                               const QList<Shelf::StyleRange> &inlineStyleRanges,
                               const QList<Shelf::EntityRange> &entityRanges,
                               const Shelf::EntityMap &entityMap,
                               const QList<Shelf::StyleRange> &trailingRanges = {},
                               ErrorSink *errors = nullptr,
                               const QString &context = QString()) const;

    // LINK and IMG entities become style ranges; other entity types are dropped
    static QList<Shelf::StyleRange> foldEntities(const QList<Shelf::EntityRange> &entityRanges,
                                                 const Shelf::EntityMap &entityMap);

    // Stable by offset
    static void sortRanges(QList<Shelf::StyleRange> &ranges);

    // Surrogate pairs stay together
    static QStringList codePoints(const QString &text);

    const Docx::Font &baseFont() const { return m_baseFont; }

private:
    Docx::Font m_baseFont;
};

#endif // SHELFDOCX_TEXTRUNBUILDER_H
