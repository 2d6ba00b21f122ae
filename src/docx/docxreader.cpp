#include "docxreader.h"
#include "docxarchive.h"

#include <QDebug>
#include <QFile>
#include <QXmlStreamReader>

namespace Docx {

namespace {

const QString kNsW = QStringLiteral("http://schemas.openxmlformats.org/wordprocessingml/2006/main");
const QString kNsR = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships");

bool isW(const QXmlStreamReader &xml, const char *name)
{
    return xml.namespaceUri() == kNsW && xml.name() == QLatin1String(name);
}

QString wAttribute(const QXmlStreamReader &xml, const char *name)
{
    return xml.attributes().value(kNsW, QLatin1String(name)).toString();
}

// Absent w:val means "on"
bool toggleValue(const QXmlStreamReader &xml)
{
    if (!xml.attributes().hasAttribute(kNsW, QLatin1String("val")))
        return true;
    const QString v = wAttribute(xml, "val");
    return !(v == QLatin1String("0") || v == QLatin1String("false") || v == QLatin1String("off"));
}

Style::Type styleType(const QString &value)
{
    if (value == QLatin1String("character"))
        return Style::Type::Character;
    if (value == QLatin1String("table"))
        return Style::Type::Table;
    return Style::Type::Paragraph;
}

QHash<QString, QString> readRelationshipTargets(const QByteArray &bytes)
{
    QHash<QString, QString> targets;
    QXmlStreamReader xml(bytes);
    while (!xml.atEnd()) {
        xml.readNext();
        if (xml.isStartElement() && xml.name() == QLatin1String("Relationship")) {
            targets.insert(xml.attributes().value(QLatin1String("Id")).toString(),
                           xml.attributes().value(QLatin1String("Target")).toString());
        }
    }
    return targets;
}

} // namespace

std::optional<Document> Reader::readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        qWarning() << "Reader:" << m_error;
        return std::nullopt;
    }
    return read(file.readAll());
}

std::optional<Document> Reader::read(const QByteArray &package)
{
    m_error.clear();
    m_styleNames.clear();
    m_relTargets.clear();

    ArchiveReader archive;
    if (!archive.open(package)) {
        m_error = QStringLiteral("not a zip package");
        return std::nullopt;
    }

    const auto body = archive.read(QStringLiteral("word/document.xml"));
    if (!body) {
        m_error = QStringLiteral("package has no word/document.xml");
        qWarning() << "Reader:" << m_error;
        return std::nullopt;
    }

    Document document;

    if (const auto styles = archive.read(QStringLiteral("word/styles.xml"))) {
        if (!readStyles(*styles, document))
            return std::nullopt;
    }
    if (const auto rels = archive.read(QStringLiteral("word/_rels/document.xml.rels")))
        m_relTargets = readRelationshipTargets(*rels);

    if (!readBody(*body, document))
        return std::nullopt;

    return std::optional<Document>(std::move(document));
}

bool Reader::readStyles(const QByteArray &bytes, Document &document)
{
    QXmlStreamReader xml(bytes);
    if (!xml.readNextStartElement() || !isW(xml, "styles")) {
        m_error = QStringLiteral("styles.xml: unexpected root element");
        qWarning() << "Reader:" << m_error;
        return false;
    }

    while (xml.readNextStartElement()) {
        if (!isW(xml, "style")) {
            xml.skipCurrentElement();
            continue;
        }

        const QString id = wAttribute(xml, "styleId");
        const Style::Type type = styleType(wAttribute(xml, "type"));
        const bool isDefault = wAttribute(xml, "default") == QLatin1String("1");
        QString name;
        QString basedOn;
        Font font;

        while (xml.readNextStartElement()) {
            if (isW(xml, "name")) {
                name = wAttribute(xml, "val");
                xml.skipCurrentElement();
            } else if (isW(xml, "basedOn")) {
                basedOn = wAttribute(xml, "val");
                xml.skipCurrentElement();
            } else if (isW(xml, "rPr")) {
                font = readRunProperties(xml);
            } else {
                xml.skipCurrentElement();
            }
        }

        if (name.isEmpty())
            name = id;
        if (name.isEmpty())
            continue;

        Style &style = document.styles().getOrCreate(name, type);
        style.id = id.isEmpty() ? style.id : id;
        style.type = type;
        style.basedOn = basedOn;
        style.font = font;
        style.isDefault = isDefault;
        m_styleNames.insert(style.id, style.name);
    }

    if (xml.hasError()) {
        m_error = QStringLiteral("styles.xml: %1").arg(xml.errorString());
        qWarning() << "Reader:" << m_error;
        return false;
    }
    return true;
}

bool Reader::readBody(const QByteArray &bytes, Document &document)
{
    QXmlStreamReader xml(bytes);
    if (!xml.readNextStartElement() || !isW(xml, "document")) {
        m_error = QStringLiteral("document.xml: unexpected root element");
        qWarning() << "Reader:" << m_error;
        return false;
    }

    while (xml.readNextStartElement()) {
        if (!isW(xml, "body")) {
            xml.skipCurrentElement();
            continue;
        }
        while (xml.readNextStartElement()) {
            if (isW(xml, "p")) {
                Paragraph &paragraph = document.addParagraph();
                readParagraph(xml, paragraph);
            } else if (isW(xml, "tbl")) {
                readTable(xml, document);
            } else {
                xml.skipCurrentElement();
            }
        }
    }

    if (xml.hasError()) {
        m_error = QStringLiteral("document.xml: %1").arg(xml.errorString());
        qWarning() << "Reader:" << m_error;
        return false;
    }
    return true;
}

void Reader::readParagraph(QXmlStreamReader &xml, Paragraph &paragraph)
{
    while (xml.readNextStartElement()) {
        if (isW(xml, "pPr")) {
            while (xml.readNextStartElement()) {
                if (isW(xml, "pStyle")) {
                    const QString id = wAttribute(xml, "val");
                    paragraph.setStyleName(m_styleNames.value(id, id));
                    xml.skipCurrentElement();
                } else if (isW(xml, "jc")) {
                    const QString v = wAttribute(xml, "val");
                    if (v == QLatin1String("center"))
                        paragraph.setAlignment(Alignment::Center);
                    else if (v == QLatin1String("right") || v == QLatin1String("end"))
                        paragraph.setAlignment(Alignment::Right);
                    else if (v == QLatin1String("both"))
                        paragraph.setAlignment(Alignment::Justify);
                    else
                        paragraph.setAlignment(Alignment::Left);
                    xml.skipCurrentElement();
                } else if (isW(xml, "rPr")) {
                    paragraph.markFont() = readRunProperties(xml);
                } else {
                    xml.skipCurrentElement();
                }
            }
        } else if (isW(xml, "r")) {
            readRun(xml, paragraph, QString());
        } else if (isW(xml, "hyperlink")) {
            const QString rid = xml.attributes().value(kNsR, QLatin1String("id")).toString();
            const QString href = m_relTargets.value(rid, rid);
            while (xml.readNextStartElement()) {
                if (isW(xml, "r"))
                    readRun(xml, paragraph, href);
                else
                    xml.skipCurrentElement();
            }
        } else {
            xml.skipCurrentElement();
        }
    }
}

void Reader::readRun(QXmlStreamReader &xml, Paragraph &paragraph, const QString &href)
{
    Font font;
    QString text;
    bool pageBreak = false;

    while (xml.readNextStartElement()) {
        if (isW(xml, "rPr")) {
            font = readRunProperties(xml);
        } else if (isW(xml, "t")) {
            text += xml.readElementText();
        } else if (isW(xml, "tab")) {
            text += QLatin1Char('\t');
            xml.skipCurrentElement();
        } else if (isW(xml, "br")) {
            if (wAttribute(xml, "type") == QLatin1String("page"))
                pageBreak = true;
            else
                text += QLatin1Char('\n');
            xml.skipCurrentElement();
        } else {
            xml.skipCurrentElement();
        }
    }

    if (pageBreak && text.isEmpty()) {
        paragraph.addPageBreak();
        return;
    }

    Run &run = href.isEmpty() ? paragraph.addRun(text) : paragraph.addHyperlinkRun(href, text);
    run.font = font;
    if (pageBreak)
        paragraph.addPageBreak();
}

void Reader::readTable(QXmlStreamReader &xml, Document &document)
{
    QString styleName;
    QList<QList<Cell>> rows;

    while (xml.readNextStartElement()) {
        if (isW(xml, "tblPr")) {
            while (xml.readNextStartElement()) {
                if (isW(xml, "tblStyle")) {
                    const QString id = wAttribute(xml, "val");
                    styleName = m_styleNames.value(id, id);
                }
                xml.skipCurrentElement();
            }
        } else if (isW(xml, "tr")) {
            QList<Cell> cells;
            while (xml.readNextStartElement()) {
                if (!isW(xml, "tc")) {
                    xml.skipCurrentElement();
                    continue;
                }
                Cell cell;
                cell.paragraphs.clear();
                while (xml.readNextStartElement()) {
                    if (isW(xml, "p")) {
                        cell.paragraphs.append(Paragraph());
                        readParagraph(xml, cell.paragraphs.last());
                    } else {
                        xml.skipCurrentElement();
                    }
                }
                if (cell.paragraphs.isEmpty())
                    cell.paragraphs.append(Paragraph());
                cells.append(cell);
            }
            rows.append(cells);
        } else {
            xml.skipCurrentElement();
        }
    }

    int columns = 1;
    for (const auto &row : std::as_const(rows))
        columns = qMax(columns, static_cast<int>(row.size()));

    Table &table = document.addTable(0, columns);
    table.setStyleName(styleName);
    for (int r = 0; r < rows.size(); ++r) {
        table.addRow();
        for (int c = 0; c < rows.at(r).size(); ++c)
            table.cell(r, c) = rows.at(r).at(c);
    }
}

Font Reader::readRunProperties(QXmlStreamReader &xml)
{
    Font font;
    while (xml.readNextStartElement()) {
        if (isW(xml, "rFonts")) {
            const QString ascii = wAttribute(xml, "ascii");
            if (!ascii.isEmpty())
                font.setName(ascii);
        } else if (isW(xml, "b")) {
            font.setBold(toggleValue(xml));
        } else if (isW(xml, "bCs")) {
            font.setCsBold(toggleValue(xml));
        } else if (isW(xml, "i")) {
            font.setItalic(toggleValue(xml));
        } else if (isW(xml, "strike")) {
            font.setStrike(toggleValue(xml));
        } else if (isW(xml, "shadow")) {
            font.setShadow(toggleValue(xml));
        } else if (isW(xml, "noProof")) {
            font.setNoProof(toggleValue(xml));
        } else if (isW(xml, "vanish")) {
            font.setHidden(toggleValue(xml));
        } else if (isW(xml, "webHidden")) {
            font.setWebHidden(toggleValue(xml));
        } else if (isW(xml, "color")) {
            const QString v = wAttribute(xml, "val");
            if (!v.isEmpty() && v != QLatin1String("auto"))
                font.setColor(QColor(QLatin1Char('#') + v));
        } else if (isW(xml, "sz")) {
            bool ok = false;
            const int halfPoints = wAttribute(xml, "val").toInt(&ok);
            if (ok)
                font.setSize(halfPoints / 2.0);
        } else if (isW(xml, "highlight")) {
            font.setHighlight(wAttribute(xml, "val"));
        } else if (isW(xml, "u")) {
            font.setUnderline(wAttribute(xml, "val") != QLatin1String("none"));
        } else if (isW(xml, "vertAlign")) {
            font.setSubscript(wAttribute(xml, "val") == QLatin1String("subscript"));
        } else if (isW(xml, "rtl")) {
            font.setRtl(toggleValue(xml));
        } else if (isW(xml, "oMath")) {
            font.setMath(toggleValue(xml));
        }
        xml.skipCurrentElement();
    }
    return font;
}

} // namespace Docx
