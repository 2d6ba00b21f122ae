#include "docxwriter.h"
#include "docxarchive.h"
#include "docxdocument.h"
#include "docxutils.h"

#include <QDateTime>
#include <QDebug>
#include <QSaveFile>
#include <QXmlStreamWriter>

#include <type_traits>

namespace Docx {

namespace {

const QString kNsW = QStringLiteral("http://schemas.openxmlformats.org/wordprocessingml/2006/main");
const QString kNsR = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships");
const QString kNsWp = QStringLiteral("http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing");
const QString kNsA = QStringLiteral("http://schemas.openxmlformats.org/drawingml/2006/main");
const QString kNsPic = QStringLiteral("http://schemas.openxmlformats.org/drawingml/2006/picture");
const QString kNsPackageRels = QStringLiteral("http://schemas.openxmlformats.org/package/2006/relationships");

const QString kRelOfficeDocument = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument");
const QString kRelCoreProperties = QStringLiteral("http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties");
const QString kRelExtendedProperties = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships/extended-properties");
const QString kRelStyles = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles");
const QString kRelNumbering = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships/numbering");
const QString kRelImage = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships/image");
const QString kRelHyperlink = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink");

// Body width of an A4 page with 1" margins, in twips
constexpr int kBodyWidthTwips = 9026;

void writeVal(QXmlStreamWriter &xml, const QString &element, const QString &value)
{
    xml.writeEmptyElement(element);
    xml.writeAttribute(QStringLiteral("w:val"), value);
}

void writeToggle(QXmlStreamWriter &xml, const QString &element, bool on)
{
    xml.writeEmptyElement(element);
    if (!on)
        xml.writeAttribute(QStringLiteral("w:val"), QStringLiteral("0"));
}

QString alignmentValue(Alignment alignment)
{
    switch (alignment) {
    case Alignment::Left:
        return QStringLiteral("left");
    case Alignment::Center:
        return QStringLiteral("center");
    case Alignment::Right:
        return QStringLiteral("right");
    case Alignment::Justify:
        return QStringLiteral("both");
    }
    return QStringLiteral("left");
}

QString borderElement(BorderEdge edge)
{
    switch (edge) {
    case BorderEdge::Top:
        return QStringLiteral("w:top");
    case BorderEdge::Start:
        return QStringLiteral("w:start");
    case BorderEdge::Bottom:
        return QStringLiteral("w:bottom");
    case BorderEdge::End:
        return QStringLiteral("w:end");
    case BorderEdge::InsideH:
        return QStringLiteral("w:insideH");
    case BorderEdge::InsideV:
        return QStringLiteral("w:insideV");
    }
    return QStringLiteral("w:top");
}

QString imageContentType(const QString &extension)
{
    if (extension == QLatin1String("jpg") || extension == QLatin1String("jpeg"))
        return QStringLiteral("image/jpeg");
    if (extension == QLatin1String("gif"))
        return QStringLiteral("image/gif");
    if (extension == QLatin1String("bmp"))
        return QStringLiteral("image/bmp");
    return QStringLiteral("image/png");
}

void startPart(QXmlStreamWriter &xml)
{
    xml.setAutoFormatting(false);
    xml.writeStartDocument(QStringLiteral("1.0"), true);
}

} // namespace

QString Writer::contentType()
{
    return QStringLiteral("application/vnd.openxmlformats-officedocument.wordprocessingml.document");
}

Writer::Writer() = default;

void Writer::reset()
{
    m_relationships.clear();
    m_media.clear();
    m_mediaExtensions.clear();
    m_pictureCount = 0;
    addRelationship(kRelStyles, QStringLiteral("styles.xml"), false);
    addRelationship(kRelNumbering, QStringLiteral("numbering.xml"), false);
}

QString Writer::addRelationship(const QString &type, const QString &target, bool external)
{
    Relationship rel;
    rel.id = QStringLiteral("rId%1").arg(m_relationships.size() + 1);
    rel.type = type;
    rel.target = target;
    rel.external = external;
    m_relationships.append(rel);
    return rel.id;
}

QByteArray Writer::write(const Document &document)
{
    reset();

    // document.xml first: it registers hyperlinks and media
    const QByteArray body = documentXml(document);

    ArchiveWriter archive;
    bool ok = archive.addFile(QStringLiteral("[Content_Types].xml"), contentTypesXml())
        && archive.addFile(QStringLiteral("_rels/.rels"), packageRelsXml())
        && archive.addFile(QStringLiteral("docProps/core.xml"), coreXml(document))
        && archive.addFile(QStringLiteral("docProps/app.xml"), appXml())
        && archive.addFile(QStringLiteral("word/document.xml"), body)
        && archive.addFile(QStringLiteral("word/styles.xml"), stylesXml(document))
        && archive.addFile(QStringLiteral("word/numbering.xml"), numberingXml())
        && archive.addFile(QStringLiteral("word/_rels/document.xml.rels"), documentRelsXml());

    for (const auto &media : std::as_const(m_media)) {
        if (!ok)
            break;
        ok = archive.addFile(media.path, media.data);
    }

    if (!ok) {
        qWarning() << "Writer: failed to assemble package";
        return {};
    }
    return archive.finish();
}

bool Writer::writeToFile(const Document &document, const QString &path)
{
    const QByteArray bytes = write(document);
    if (bytes.isEmpty())
        return false;

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Writer: cannot open" << path << file.errorString();
        return false;
    }
    file.write(bytes);
    return file.commit();
}

// --- Package parts ---

QByteArray Writer::contentTypesXml() const
{
    QByteArray out;
    QXmlStreamWriter xml(&out);
    startPart(xml);
    xml.writeStartElement(QStringLiteral("Types"));
    xml.writeDefaultNamespace(QStringLiteral("http://schemas.openxmlformats.org/package/2006/content-types"));

    xml.writeEmptyElement(QStringLiteral("Default"));
    xml.writeAttribute(QStringLiteral("Extension"), QStringLiteral("rels"));
    xml.writeAttribute(QStringLiteral("ContentType"),
                       QStringLiteral("application/vnd.openxmlformats-package.relationships+xml"));
    xml.writeEmptyElement(QStringLiteral("Default"));
    xml.writeAttribute(QStringLiteral("Extension"), QStringLiteral("xml"));
    xml.writeAttribute(QStringLiteral("ContentType"), QStringLiteral("application/xml"));

    QStringList extensions(m_mediaExtensions.cbegin(), m_mediaExtensions.cend());
    extensions.sort();
    for (const auto &ext : std::as_const(extensions)) {
        xml.writeEmptyElement(QStringLiteral("Default"));
        xml.writeAttribute(QStringLiteral("Extension"), ext);
        xml.writeAttribute(QStringLiteral("ContentType"), imageContentType(ext));
    }

    const QList<QPair<QString, QString>> overrides = {
        {QStringLiteral("/word/document.xml"),
         QStringLiteral("application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml")},
        {QStringLiteral("/word/styles.xml"),
         QStringLiteral("application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml")},
        {QStringLiteral("/word/numbering.xml"),
         QStringLiteral("application/vnd.openxmlformats-officedocument.wordprocessingml.numbering+xml")},
        {QStringLiteral("/docProps/core.xml"),
         QStringLiteral("application/vnd.openxmlformats-package.core-properties+xml")},
        {QStringLiteral("/docProps/app.xml"),
         QStringLiteral("application/vnd.openxmlformats-officedocument.extended-properties+xml")},
    };
    for (const auto &o : overrides) {
        xml.writeEmptyElement(QStringLiteral("Override"));
        xml.writeAttribute(QStringLiteral("PartName"), o.first);
        xml.writeAttribute(QStringLiteral("ContentType"), o.second);
    }

    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

QByteArray Writer::packageRelsXml() const
{
    QByteArray out;
    QXmlStreamWriter xml(&out);
    startPart(xml);
    xml.writeStartElement(QStringLiteral("Relationships"));
    xml.writeDefaultNamespace(kNsPackageRels);

    const QList<QPair<QString, QString>> rels = {
        {kRelOfficeDocument, QStringLiteral("word/document.xml")},
        {kRelCoreProperties, QStringLiteral("docProps/core.xml")},
        {kRelExtendedProperties, QStringLiteral("docProps/app.xml")},
    };
    int id = 1;
    for (const auto &rel : rels) {
        xml.writeEmptyElement(QStringLiteral("Relationship"));
        xml.writeAttribute(QStringLiteral("Id"), QStringLiteral("rId%1").arg(id++));
        xml.writeAttribute(QStringLiteral("Type"), rel.first);
        xml.writeAttribute(QStringLiteral("Target"), rel.second);
    }

    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

QByteArray Writer::coreXml(const Document &document) const
{
    const QString now = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);

    QByteArray out;
    QXmlStreamWriter xml(&out);
    startPart(xml);
    xml.writeStartElement(QStringLiteral("cp:coreProperties"));
    xml.writeAttribute(QStringLiteral("xmlns:cp"),
                       QStringLiteral("http://schemas.openxmlformats.org/package/2006/metadata/core-properties"));
    xml.writeAttribute(QStringLiteral("xmlns:dc"), QStringLiteral("http://purl.org/dc/elements/1.1/"));
    xml.writeAttribute(QStringLiteral("xmlns:dcterms"), QStringLiteral("http://purl.org/dc/terms/"));
    xml.writeAttribute(QStringLiteral("xmlns:xsi"), QStringLiteral("http://www.w3.org/2001/XMLSchema-instance"));

    xml.writeTextElement(QStringLiteral("dc:title"), DocxUtils::xmlSafe(document.title()));
    xml.writeTextElement(QStringLiteral("dc:creator"), DocxUtils::xmlSafe(document.author()));
    xml.writeTextElement(QStringLiteral("cp:lastModifiedBy"), DocxUtils::xmlSafe(document.author()));
    xml.writeTextElement(QStringLiteral("cp:revision"), QStringLiteral("1"));
    for (const auto &tag : {QStringLiteral("dcterms:created"), QStringLiteral("dcterms:modified")}) {
        xml.writeStartElement(tag);
        xml.writeAttribute(QStringLiteral("xsi:type"), QStringLiteral("dcterms:W3CDTF"));
        xml.writeCharacters(now);
        xml.writeEndElement();
    }

    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

QByteArray Writer::appXml() const
{
    QByteArray out;
    QXmlStreamWriter xml(&out);
    startPart(xml);
    xml.writeStartElement(QStringLiteral("Properties"));
    xml.writeDefaultNamespace(QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/extended-properties"));
    xml.writeTextElement(QStringLiteral("Application"), QStringLiteral("ShelfDocx"));
    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

QByteArray Writer::documentRelsXml() const
{
    QByteArray out;
    QXmlStreamWriter xml(&out);
    startPart(xml);
    xml.writeStartElement(QStringLiteral("Relationships"));
    xml.writeDefaultNamespace(kNsPackageRels);
    for (const auto &rel : m_relationships) {
        xml.writeEmptyElement(QStringLiteral("Relationship"));
        xml.writeAttribute(QStringLiteral("Id"), rel.id);
        xml.writeAttribute(QStringLiteral("Type"), rel.type);
        xml.writeAttribute(QStringLiteral("Target"), DocxUtils::xmlSafe(rel.target));
        if (rel.external)
            xml.writeAttribute(QStringLiteral("TargetMode"), QStringLiteral("External"));
    }
    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

// --- document.xml ---

QByteArray Writer::documentXml(const Document &document)
{
    QByteArray out;
    QXmlStreamWriter xml(&out);
    startPart(xml);
    xml.writeStartElement(QStringLiteral("w:document"));
    xml.writeAttribute(QStringLiteral("xmlns:w"), kNsW);
    xml.writeAttribute(QStringLiteral("xmlns:r"), kNsR);
    xml.writeAttribute(QStringLiteral("xmlns:wp"), kNsWp);
    xml.writeAttribute(QStringLiteral("xmlns:a"), kNsA);
    xml.writeAttribute(QStringLiteral("xmlns:pic"), kNsPic);
    xml.writeStartElement(QStringLiteral("w:body"));

    m_styles = &document.styles();
    for (const auto &element : document.body()) {
        std::visit([&](const auto &ptr) {
            using T = std::decay_t<decltype(*ptr)>;
            if constexpr (std::is_same_v<T, Paragraph>)
                writeParagraph(xml, *ptr);
            else if constexpr (std::is_same_v<T, Table>)
                writeTable(xml, *ptr);
        }, element);
    }
    m_styles = nullptr;

    writeSectionProperties(xml);
    xml.writeEndElement(); // body
    xml.writeEndElement(); // document
    xml.writeEndDocument();
    return out;
}

void Writer::writeSectionProperties(QXmlStreamWriter &xml)
{
    xml.writeStartElement(QStringLiteral("w:sectPr"));
    xml.writeEmptyElement(QStringLiteral("w:pgSz"));
    xml.writeAttribute(QStringLiteral("w:w"), QStringLiteral("11906"));
    xml.writeAttribute(QStringLiteral("w:h"), QStringLiteral("16838"));
    xml.writeEmptyElement(QStringLiteral("w:pgMar"));
    for (const auto &side : {QStringLiteral("w:top"), QStringLiteral("w:right"),
                             QStringLiteral("w:bottom"), QStringLiteral("w:left")})
        xml.writeAttribute(side, QStringLiteral("1440"));
    xml.writeAttribute(QStringLiteral("w:header"), QStringLiteral("708"));
    xml.writeAttribute(QStringLiteral("w:footer"), QStringLiteral("708"));
    xml.writeAttribute(QStringLiteral("w:gutter"), QStringLiteral("0"));
    xml.writeEndElement();
}

void Writer::writeParagraph(QXmlStreamWriter &xml, const Paragraph &paragraph)
{
    xml.writeStartElement(QStringLiteral("w:p"));

    QString styleId;
    if (const Style *style = m_styles ? m_styles->style(paragraph.styleName()) : nullptr)
        styleId = style->isDefault ? QString() : style->id;
    else if (paragraph.styleName().compare(QLatin1String("Normal"), Qt::CaseInsensitive) != 0)
        styleId = DocxUtils::styleId(paragraph.styleName());

    const bool hasProps = !styleId.isEmpty() || paragraph.alignment().has_value()
        || !paragraph.markFont().isEmpty();
    if (hasProps) {
        xml.writeStartElement(QStringLiteral("w:pPr"));
        if (!styleId.isEmpty())
            writeVal(xml, QStringLiteral("w:pStyle"), styleId);
        if (paragraph.alignment())
            writeVal(xml, QStringLiteral("w:jc"), alignmentValue(*paragraph.alignment()));
        if (!paragraph.markFont().isEmpty())
            writeRunProperties(xml, paragraph.markFont());
        xml.writeEndElement();
    }

    for (const auto &run : paragraph.runs())
        writeRun(xml, run);

    xml.writeEndElement();
}

void Writer::writeRun(QXmlStreamWriter &xml, const Run &run)
{
    switch (run.kind) {
    case Run::Kind::Text:
        xml.writeStartElement(QStringLiteral("w:r"));
        writeRunProperties(xml, run.font, run.shading);
        writeText(xml, run.text);
        xml.writeEndElement();
        break;

    case Run::Kind::Hyperlink: {
        const QString rid = addRelationship(kRelHyperlink, run.href, true);
        xml.writeStartElement(QStringLiteral("w:hyperlink"));
        xml.writeAttribute(QStringLiteral("r:id"), rid);
        xml.writeAttribute(QStringLiteral("w:history"), QStringLiteral("1"));
        xml.writeStartElement(QStringLiteral("w:r"));
        writeRunProperties(xml, run.font, run.shading);
        writeText(xml, run.text);
        xml.writeEndElement();
        xml.writeEndElement();
        break;
    }

    case Run::Kind::Picture:
        xml.writeStartElement(QStringLiteral("w:r"));
        writeRunProperties(xml, run.font, run.shading);
        writeDrawing(xml, run.picture);
        xml.writeEndElement();
        break;

    case Run::Kind::PageBreak:
        xml.writeStartElement(QStringLiteral("w:r"));
        xml.writeEmptyElement(QStringLiteral("w:br"));
        xml.writeAttribute(QStringLiteral("w:type"), QStringLiteral("page"));
        xml.writeEndElement();
        break;

    case Run::Kind::Field: {
        auto fieldChar = [&xml](const QString &type) {
            xml.writeStartElement(QStringLiteral("w:r"));
            xml.writeEmptyElement(QStringLiteral("w:fldChar"));
            xml.writeAttribute(QStringLiteral("w:fldCharType"), type);
            xml.writeEndElement();
        };
        fieldChar(QStringLiteral("begin"));
        xml.writeStartElement(QStringLiteral("w:r"));
        xml.writeStartElement(QStringLiteral("w:instrText"));
        xml.writeAttribute(QStringLiteral("xml:space"), QStringLiteral("preserve"));
        xml.writeCharacters(DocxUtils::xmlSafe(run.instruction));
        xml.writeEndElement();
        xml.writeEndElement();
        fieldChar(QStringLiteral("separate"));
        xml.writeStartElement(QStringLiteral("w:r"));
        writeRunProperties(xml, run.font, run.shading);
        writeText(xml, run.text);
        xml.writeEndElement();
        fieldChar(QStringLiteral("end"));
        break;
    }
    }
}

void Writer::writeText(QXmlStreamWriter &xml, const QString &text)
{
    QString pending;
    auto flush = [&]() {
        if (pending.isEmpty())
            return;
        xml.writeStartElement(QStringLiteral("w:t"));
        xml.writeAttribute(QStringLiteral("xml:space"), QStringLiteral("preserve"));
        xml.writeCharacters(pending);
        xml.writeEndElement();
        pending.clear();
    };

    // Vertical tab is Word's soft line break
    for (QChar ch : DocxUtils::xmlSafe(QString(text).replace(QChar(0x0B), QLatin1Char('\n')))) {
        if (ch == QLatin1Char('\n') || ch == QLatin1Char('\r')) {
            flush();
            xml.writeEmptyElement(QStringLiteral("w:br"));
        } else if (ch == QLatin1Char('\t')) {
            flush();
            xml.writeEmptyElement(QStringLiteral("w:tab"));
        } else {
            pending.append(ch);
        }
    }
    flush();
}

void Writer::writeDrawing(QXmlStreamWriter &xml, const Picture &picture)
{
    const int index = ++m_pictureCount;
    const QString ext = picture.extension.isEmpty() ? QStringLiteral("png")
                                                    : picture.extension.toLower();
    const QString fileName = QStringLiteral("image%1.%2").arg(index).arg(ext);

    MediaFile media;
    media.path = QStringLiteral("word/media/") + fileName;
    media.data = picture.data;
    m_media.append(media);
    m_mediaExtensions.insert(ext);
    const QString rid = addRelationship(kRelImage, QStringLiteral("media/") + fileName, false);

    const QString cx = QString::number(picture.width);
    const QString cy = QString::number(picture.height);

    xml.writeStartElement(QStringLiteral("w:drawing"));
    xml.writeStartElement(QStringLiteral("wp:inline"));
    for (const auto &dist : {QStringLiteral("distT"), QStringLiteral("distB"),
                             QStringLiteral("distL"), QStringLiteral("distR")})
        xml.writeAttribute(dist, QStringLiteral("0"));

    xml.writeEmptyElement(QStringLiteral("wp:extent"));
    xml.writeAttribute(QStringLiteral("cx"), cx);
    xml.writeAttribute(QStringLiteral("cy"), cy);

    xml.writeEmptyElement(QStringLiteral("wp:docPr"));
    xml.writeAttribute(QStringLiteral("id"), QString::number(index));
    xml.writeAttribute(QStringLiteral("name"), QStringLiteral("Picture %1").arg(index));

    xml.writeStartElement(QStringLiteral("wp:cNvGraphicFramePr"));
    xml.writeEmptyElement(QStringLiteral("a:graphicFrameLocks"));
    xml.writeAttribute(QStringLiteral("noChangeAspect"), QStringLiteral("1"));
    xml.writeEndElement();

    xml.writeStartElement(QStringLiteral("a:graphic"));
    xml.writeStartElement(QStringLiteral("a:graphicData"));
    xml.writeAttribute(QStringLiteral("uri"), kNsPic);
    xml.writeStartElement(QStringLiteral("pic:pic"));

    xml.writeStartElement(QStringLiteral("pic:nvPicPr"));
    xml.writeEmptyElement(QStringLiteral("pic:cNvPr"));
    xml.writeAttribute(QStringLiteral("id"), QStringLiteral("0"));
    xml.writeAttribute(QStringLiteral("name"), fileName);
    xml.writeEmptyElement(QStringLiteral("pic:cNvPicPr"));
    xml.writeEndElement();

    xml.writeStartElement(QStringLiteral("pic:blipFill"));
    xml.writeEmptyElement(QStringLiteral("a:blip"));
    xml.writeAttribute(QStringLiteral("r:embed"), rid);
    xml.writeStartElement(QStringLiteral("a:stretch"));
    xml.writeEmptyElement(QStringLiteral("a:fillRect"));
    xml.writeEndElement();
    xml.writeEndElement();

    xml.writeStartElement(QStringLiteral("pic:spPr"));
    xml.writeStartElement(QStringLiteral("a:xfrm"));
    xml.writeEmptyElement(QStringLiteral("a:off"));
    xml.writeAttribute(QStringLiteral("x"), QStringLiteral("0"));
    xml.writeAttribute(QStringLiteral("y"), QStringLiteral("0"));
    xml.writeEmptyElement(QStringLiteral("a:ext"));
    xml.writeAttribute(QStringLiteral("cx"), cx);
    xml.writeAttribute(QStringLiteral("cy"), cy);
    xml.writeEndElement();
    xml.writeStartElement(QStringLiteral("a:prstGeom"));
    xml.writeAttribute(QStringLiteral("prst"), QStringLiteral("rect"));
    xml.writeEmptyElement(QStringLiteral("a:avLst"));
    xml.writeEndElement();
    xml.writeEndElement(); // spPr

    xml.writeEndElement(); // pic:pic
    xml.writeEndElement(); // graphicData
    xml.writeEndElement(); // graphic
    xml.writeEndElement(); // inline
    xml.writeEndElement(); // drawing
}

void Writer::writeRunProperties(QXmlStreamWriter &xml, const Font &font, const QColor &shading)
{
    if (font.isEmpty() && !shading.isValid())
        return;

    // Element order follows CT_RPr
    xml.writeStartElement(QStringLiteral("w:rPr"));
    if (font.hasName()) {
        xml.writeEmptyElement(QStringLiteral("w:rFonts"));
        xml.writeAttribute(QStringLiteral("w:ascii"), font.name());
        xml.writeAttribute(QStringLiteral("w:hAnsi"), font.name());
        xml.writeAttribute(QStringLiteral("w:cs"), font.name());
        xml.writeAttribute(QStringLiteral("w:eastAsia"), font.name());
    }
    if (font.hasBold())
        writeToggle(xml, QStringLiteral("w:b"), font.bold());
    if (font.hasCsBold())
        writeToggle(xml, QStringLiteral("w:bCs"), font.csBold());
    if (font.hasItalic())
        writeToggle(xml, QStringLiteral("w:i"), font.italic());
    if (font.hasStrike())
        writeToggle(xml, QStringLiteral("w:strike"), font.strike());
    if (font.hasShadow())
        writeToggle(xml, QStringLiteral("w:shadow"), font.shadow());
    if (font.hasNoProof())
        writeToggle(xml, QStringLiteral("w:noProof"), font.noProof());
    if (font.hasHidden())
        writeToggle(xml, QStringLiteral("w:vanish"), font.hidden());
    if (font.hasWebHidden())
        writeToggle(xml, QStringLiteral("w:webHidden"), font.webHidden());
    if (font.hasColor())
        writeVal(xml, QStringLiteral("w:color"), DocxUtils::hexColor(font.color()));
    if (font.hasSize()) {
        const QString halfPoints = QString::number(DocxUtils::toHalfPoints(font.size()));
        writeVal(xml, QStringLiteral("w:sz"), halfPoints);
        writeVal(xml, QStringLiteral("w:szCs"), halfPoints);
    }
    if (font.hasHighlight())
        writeVal(xml, QStringLiteral("w:highlight"), font.highlight());
    if (font.hasUnderline())
        writeVal(xml, QStringLiteral("w:u"),
                 font.underline() ? QStringLiteral("single") : QStringLiteral("none"));
    if (shading.isValid()) {
        xml.writeEmptyElement(QStringLiteral("w:shd"));
        xml.writeAttribute(QStringLiteral("w:val"), QStringLiteral("clear"));
        xml.writeAttribute(QStringLiteral("w:color"), QStringLiteral("auto"));
        xml.writeAttribute(QStringLiteral("w:fill"), DocxUtils::hexColor(shading));
    }
    if (font.hasSubscript() && font.subscript())
        writeVal(xml, QStringLiteral("w:vertAlign"), QStringLiteral("subscript"));
    if (font.hasRtl())
        writeToggle(xml, QStringLiteral("w:rtl"), font.rtl());
    if (font.hasMath())
        writeToggle(xml, QStringLiteral("w:oMath"), font.math());
    xml.writeEndElement();
}

void Writer::writeTable(QXmlStreamWriter &xml, const Table &table)
{
    // Grid: fixed columns keep their width, the rest share what is left
    QList<int> grid;
    int fixed = 0;
    int autoColumns = 0;
    for (int c = 0; c < table.columnCount(); ++c) {
        const int w = table.columnWidth(c);
        if (w > 0)
            fixed += w;
        else
            ++autoColumns;
    }
    const int autoWidth = autoColumns > 0
        ? qMax(360, (kBodyWidthTwips - table.indent() - fixed) / autoColumns) : 0;
    for (int c = 0; c < table.columnCount(); ++c) {
        const int w = table.columnWidth(c);
        grid.append(w > 0 ? w : autoWidth);
    }

    xml.writeStartElement(QStringLiteral("w:tbl"));

    xml.writeStartElement(QStringLiteral("w:tblPr"));
    if (!table.styleName().isEmpty()) {
        const Style *style = m_styles ? m_styles->style(table.styleName()) : nullptr;
        writeVal(xml, QStringLiteral("w:tblStyle"),
                 style ? style->id : DocxUtils::styleId(table.styleName()));
    }
    xml.writeEmptyElement(QStringLiteral("w:tblW"));
    xml.writeAttribute(QStringLiteral("w:w"), QStringLiteral("0"));
    xml.writeAttribute(QStringLiteral("w:type"), QStringLiteral("auto"));
    if (table.indent() != 0) {
        xml.writeEmptyElement(QStringLiteral("w:tblInd"));
        xml.writeAttribute(QStringLiteral("w:w"), QString::number(table.indent()));
        xml.writeAttribute(QStringLiteral("w:type"), QStringLiteral("dxa"));
    }
    if (!table.autofit()) {
        xml.writeEmptyElement(QStringLiteral("w:tblLayout"));
        xml.writeAttribute(QStringLiteral("w:type"), QStringLiteral("fixed"));
    }
    xml.writeEmptyElement(QStringLiteral("w:tblLook"));
    xml.writeAttribute(QStringLiteral("w:val"), QStringLiteral("04A0"));
    xml.writeEndElement(); // tblPr

    xml.writeStartElement(QStringLiteral("w:tblGrid"));
    for (int w : std::as_const(grid)) {
        xml.writeEmptyElement(QStringLiteral("w:gridCol"));
        xml.writeAttribute(QStringLiteral("w:w"), QString::number(w));
    }
    xml.writeEndElement();

    for (int r = 0; r < table.rowCount(); ++r) {
        xml.writeStartElement(QStringLiteral("w:tr"));
        const auto &cells = table.row(r);
        for (int c = 0; c < cells.size(); ++c)
            writeCell(xml, cells.at(c), grid.value(c, autoWidth));
        xml.writeEndElement();
    }

    xml.writeEndElement(); // tbl
}

void Writer::writeCell(QXmlStreamWriter &xml, const Cell &cell, int gridWidth)
{
    xml.writeStartElement(QStringLiteral("w:tc"));

    // Element order follows CT_TcPr
    xml.writeStartElement(QStringLiteral("w:tcPr"));
    xml.writeEmptyElement(QStringLiteral("w:tcW"));
    xml.writeAttribute(QStringLiteral("w:w"), QString::number(cell.width > 0 ? cell.width : gridWidth));
    xml.writeAttribute(QStringLiteral("w:type"), QStringLiteral("dxa"));
    if (!cell.borders.isEmpty()) {
        xml.writeStartElement(QStringLiteral("w:tcBorders"));
        for (auto it = cell.borders.constBegin(); it != cell.borders.constEnd(); ++it) {
            xml.writeEmptyElement(borderElement(it.key()));
            xml.writeAttribute(QStringLiteral("w:val"), it.value().value);
            xml.writeAttribute(QStringLiteral("w:sz"), QString::number(it.value().size));
            xml.writeAttribute(QStringLiteral("w:space"), QString::number(it.value().space));
            xml.writeAttribute(QStringLiteral("w:color"), DocxUtils::hexColor(it.value().color));
        }
        xml.writeEndElement();
    }
    if (cell.shading.isValid()) {
        xml.writeEmptyElement(QStringLiteral("w:shd"));
        xml.writeAttribute(QStringLiteral("w:val"), QStringLiteral("clear"));
        xml.writeAttribute(QStringLiteral("w:color"), QStringLiteral("auto"));
        xml.writeAttribute(QStringLiteral("w:fill"), DocxUtils::hexColor(cell.shading));
    }
    xml.writeEndElement(); // tcPr

    if (cell.paragraphs.isEmpty()) {
        xml.writeEmptyElement(QStringLiteral("w:p"));
    } else {
        for (const auto &p : cell.paragraphs)
            writeParagraph(xml, p);
    }

    xml.writeEndElement(); // tc
}

// --- styles.xml ---

void Writer::writeStyle(QXmlStreamWriter &xml, const Style &style)
{
    xml.writeStartElement(QStringLiteral("w:style"));
    switch (style.type) {
    case Style::Type::Paragraph:
        xml.writeAttribute(QStringLiteral("w:type"), QStringLiteral("paragraph"));
        break;
    case Style::Type::Character:
        xml.writeAttribute(QStringLiteral("w:type"), QStringLiteral("character"));
        break;
    case Style::Type::Table:
        xml.writeAttribute(QStringLiteral("w:type"), QStringLiteral("table"));
        break;
    }
    if (style.isDefault)
        xml.writeAttribute(QStringLiteral("w:default"), QStringLiteral("1"));
    if (style.custom)
        xml.writeAttribute(QStringLiteral("w:customStyle"), QStringLiteral("1"));
    xml.writeAttribute(QStringLiteral("w:styleId"), style.id);

    writeVal(xml, QStringLiteral("w:name"), style.name);
    if (!style.basedOn.isEmpty() && style.basedOn != style.id)
        writeVal(xml, QStringLiteral("w:basedOn"), style.basedOn);
    xml.writeEmptyElement(QStringLiteral("w:qFormat"));

    if (style.numId > 0) {
        xml.writeStartElement(QStringLiteral("w:pPr"));
        xml.writeStartElement(QStringLiteral("w:numPr"));
        writeVal(xml, QStringLiteral("w:ilvl"), QString::number(style.level));
        writeVal(xml, QStringLiteral("w:numId"), QString::number(style.numId));
        xml.writeEndElement();
        xml.writeEndElement();
    }

    if (style.type != Style::Type::Table)
        writeRunProperties(xml, style.font);

    if (style.type == Style::Type::Table) {
        xml.writeStartElement(QStringLiteral("w:tblPr"));
        xml.writeStartElement(QStringLiteral("w:tblBorders"));
        for (const auto &edge : {QStringLiteral("w:top"), QStringLiteral("w:start"),
                                 QStringLiteral("w:bottom"), QStringLiteral("w:end"),
                                 QStringLiteral("w:insideH"), QStringLiteral("w:insideV")}) {
            xml.writeEmptyElement(edge);
            xml.writeAttribute(QStringLiteral("w:val"), QStringLiteral("single"));
            xml.writeAttribute(QStringLiteral("w:sz"), QStringLiteral("4"));
            xml.writeAttribute(QStringLiteral("w:space"), QStringLiteral("0"));
            xml.writeAttribute(QStringLiteral("w:color"), QStringLiteral("auto"));
        }
        xml.writeEndElement();
        xml.writeEndElement();
    }

    xml.writeEndElement();
}

QByteArray Writer::stylesXml(const Document &document) const
{
    QByteArray out;
    QXmlStreamWriter xml(&out);
    startPart(xml);
    xml.writeStartElement(QStringLiteral("w:styles"));
    xml.writeAttribute(QStringLiteral("xmlns:w"), kNsW);

    xml.writeStartElement(QStringLiteral("w:docDefaults"));
    xml.writeStartElement(QStringLiteral("w:rPrDefault"));
    Font defaults;
    defaults.setName(QStringLiteral("Calibri"));
    defaults.setSize(11.0);
    writeRunProperties(xml, defaults);
    xml.writeEndElement();
    xml.writeEndElement();

    const auto styles = document.styles().styles();
    for (const Style *style : styles)
        writeStyle(xml, *style);

    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

// --- numbering.xml ---

QByteArray Writer::numberingXml() const
{
    QByteArray out;
    QXmlStreamWriter xml(&out);
    startPart(xml);
    xml.writeStartElement(QStringLiteral("w:numbering"));
    xml.writeAttribute(QStringLiteral("xmlns:w"), kNsW);

    static const QString bullets[] = {
        QStringLiteral("•"), QStringLiteral("o"), QStringLiteral("▪")
    };

    // abstractNum 0: bullets, abstractNum 1: decimal
    for (int abstractId = 0; abstractId < 2; ++abstractId) {
        const bool bullet = abstractId == 0;
        xml.writeStartElement(QStringLiteral("w:abstractNum"));
        xml.writeAttribute(QStringLiteral("w:abstractNumId"), QString::number(abstractId));
        writeVal(xml, QStringLiteral("w:multiLevelType"), QStringLiteral("hybridMultilevel"));
        for (int level = 0; level < StyleRegistry::MaxListLevel; ++level) {
            xml.writeStartElement(QStringLiteral("w:lvl"));
            xml.writeAttribute(QStringLiteral("w:ilvl"), QString::number(level));
            writeVal(xml, QStringLiteral("w:start"), QStringLiteral("1"));
            writeVal(xml, QStringLiteral("w:numFmt"),
                     bullet ? QStringLiteral("bullet") : QStringLiteral("decimal"));
            writeVal(xml, QStringLiteral("w:lvlText"),
                     bullet ? bullets[level % 3]
                            : QLatin1Char('%') + QString::number(level + 1) + QLatin1Char('.'));
            writeVal(xml, QStringLiteral("w:lvlJc"), QStringLiteral("left"));
            xml.writeStartElement(QStringLiteral("w:pPr"));
            xml.writeEmptyElement(QStringLiteral("w:ind"));
            xml.writeAttribute(QStringLiteral("w:left"), QString::number(720 * (level + 1)));
            xml.writeAttribute(QStringLiteral("w:hanging"), QStringLiteral("360"));
            xml.writeEndElement();
            xml.writeEndElement(); // lvl
        }
        xml.writeEndElement(); // abstractNum
    }

    const QList<QPair<int, int>> nums = {
        {StyleRegistry::BulletNumId, 0},
        {StyleRegistry::DecimalNumId, 1},
    };
    for (const auto &num : nums) {
        xml.writeStartElement(QStringLiteral("w:num"));
        xml.writeAttribute(QStringLiteral("w:numId"), QString::number(num.first));
        writeVal(xml, QStringLiteral("w:abstractNumId"), QString::number(num.second));
        xml.writeEndElement();
    }

    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

} // namespace Docx
