/*
 * docxwriter.h: Serializes a Docx::Document to an OOXML package
 *
 * Produces [Content_Types].xml, package and document relationships,
 * core/app properties, document.xml, styles.xml, numbering.xml and the
 * embedded media, zipped with ArchiveWriter.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_DOCXWRITER_H
#define SHELFDOCX_DOCXWRITER_H

#include <QByteArray>
#include <QColor>
#include <QList>
#include <QSet>
#include <QString>

class QXmlStreamWriter;

namespace Docx {

class Document;
class Font;
class Paragraph;
class Table;
struct Cell;
struct Picture;
struct Run;
struct Style;
class StyleRegistry;

class Writer
{
public:
    static QString contentType();

    Writer();

    // Empty on failure
    QByteArray write(const Document &document);
    bool writeToFile(const Document &document, const QString &path);

private:
    struct Relationship {
        QString id;
        QString type;
        QString target;
        bool external = false;
    };

    struct MediaFile {
        QString path;       // inside the package, e.g. word/media/image1.png
        QByteArray data;
    };

    void reset();

    QByteArray contentTypesXml() const;
    QByteArray packageRelsXml() const;
    QByteArray coreXml(const Document &document) const;
    QByteArray appXml() const;
    QByteArray documentXml(const Document &document);
    QByteArray documentRelsXml() const;
    QByteArray stylesXml(const Document &document) const;
    QByteArray numberingXml() const;

    void writeParagraph(QXmlStreamWriter &xml, const Paragraph &paragraph);
    void writeRun(QXmlStreamWriter &xml, const Run &run);
    void writeText(QXmlStreamWriter &xml, const QString &text);
    void writeDrawing(QXmlStreamWriter &xml, const Picture &picture);
    void writeTable(QXmlStreamWriter &xml, const Table &table);
    void writeCell(QXmlStreamWriter &xml, const Cell &cell, int gridWidth);
    static void writeRunProperties(QXmlStreamWriter &xml, const Font &font,
                                   const QColor &shading = QColor());
    static void writeStyle(QXmlStreamWriter &xml, const Style &style);
    static void writeSectionProperties(QXmlStreamWriter &xml);

    QString addRelationship(const QString &type, const QString &target, bool external);

    QList<Relationship> m_relationships;
    QList<MediaFile> m_media;
    QSet<QString> m_mediaExtensions;
    int m_pictureCount = 0;
    const StyleRegistry *m_styles = nullptr;
};

} // namespace Docx

#endif // SHELFDOCX_DOCXWRITER_H
