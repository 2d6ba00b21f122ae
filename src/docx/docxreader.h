/*
 * docxreader.h: Loads a .docx package into a Docx::Document
 *
 * Reads what style merging and round-trip checks need: the style sheet
 * (names, ids, run properties), top-level paragraphs with their style
 * names and runs, and tables with their cell text.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_DOCXREADER_H
#define SHELFDOCX_DOCXREADER_H

#include "docxdocument.h"

#include <QByteArray>
#include <QHash>
#include <QString>

#include <optional>

class QXmlStreamReader;

namespace Docx {

class Reader
{
public:
    std::optional<Document> read(const QByteArray &package);
    std::optional<Document> readFile(const QString &path);

    QString errorString() const { return m_error; }

private:
    bool readStyles(const QByteArray &xml, Document &document);
    bool readBody(const QByteArray &xml, Document &document);
    void readParagraph(QXmlStreamReader &xml, Paragraph &paragraph);
    void readRun(QXmlStreamReader &xml, Paragraph &paragraph, const QString &href);
    void readTable(QXmlStreamReader &xml, Document &document);
    static Font readRunProperties(QXmlStreamReader &xml);

    QHash<QString, QString> m_styleNames;   // style id -> name
    QHash<QString, QString> m_relTargets;   // relationship id -> target
    QString m_error;
};

} // namespace Docx

#endif // SHELFDOCX_DOCXREADER_H
