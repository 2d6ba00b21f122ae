#include "blockdispatcher.h"
#include "blobfetcher.h"
#include "codehighlighter.h"
#include "docxutils.h"
#include "markdowntable.h"
#include "videolinks.h"

#include <QDebug>

#include <vector>

BlockDispatcher::BlockDispatcher(Docx::Document &document, StructuralTracker &tracker,
                                 ErrorSink &errors, const RenderSettings &settings,
                                 BlobFetcher *fetcher)
    : m_document(document)
    , m_tracker(tracker)
    , m_errors(errors)
    , m_settings(settings)
    , m_fetcher(fetcher)
    , m_pictures(fetcher, settings)
    , m_runBuilder(baseFont())
{
}

BlockDispatcher::~BlockDispatcher() = default;

void BlockDispatcher::beginArticle(const Shelf::EntityMap &entityMap, int docVersion)
{
    m_entityMap = &entityMap;
    m_tracker.reset(docVersion);
}

Docx::Font BlockDispatcher::baseFont() const
{
    Docx::Font font;
    font.setSize(m_settings.fontSize);
    font.setName(m_settings.fontFamily);
    font.setColor(m_settings.textColor);
    return font;
}

BlockDispatcher::QuoteVariant BlockDispatcher::quoteVariant(const QString &style)
{
    if (style == QLatin1String("warning"))
        return {QStringLiteral("Blockquote Warning"), QStringLiteral("\U0001F6A8"),
                QColor(192, 80, 77), QColor(0xFF, 0xD9, 0xD9), QColor(0xFF, 0x00, 0x00)};
    if (style == QLatin1String("question"))
        return {QStringLiteral("Blockquote Question"), QStringLiteral("❓"),
                QColor(128, 100, 162), QColor(0xE7, 0xFD, 0xF8), QColor(0x00, 0xCC, 0x00)};
    return {QStringLiteral("Blockquote"), QStringLiteral("ℹ️"),
            QColor(79, 129, 189), QColor(0xEA, 0xEE, 0xF2), QColor(0x40, 0x40, 0x40)};
}

Docx::Alignment BlockDispatcher::alignmentFor(const QString &align)
{
    if (align == QLatin1String("left"))
        return Docx::Alignment::Left;
    if (align == QLatin1String("right"))
        return Docx::Alignment::Right;
    return Docx::Alignment::Center;
}

// --- Dispatch ---

bool BlockDispatcher::dispatch(const QList<Shelf::Block> &blocks, int index)
{
    const Shelf::Block &block = blocks.at(index);
    ++m_dispatchCount;

    if (block.type != Shelf::BlockType::OrderedListItem)
        m_tracker.endOrderedList();

    m_tracker.enterDepth(block.depth);
    bool ok = true;
    switch (block.type) {
    case Shelf::BlockType::Unstyled:
        ok = isBlockLink(block) ? handleBlockLink(block) : handleUnstyled(block);
        break;
    case Shelf::BlockType::HeaderTwo:
    case Shelf::BlockType::HeaderThree:
        ok = handleHeader(block);
        break;
    case Shelf::BlockType::HeaderStep:
        ok = handleHeaderStep(block);
        break;
    case Shelf::BlockType::OrderedListItem:
    case Shelf::BlockType::UnorderedListItem:
        ok = handleListItem(block);
        break;
    case Shelf::BlockType::Figure:
        ok = handleFigure(block);
        break;
    case Shelf::BlockType::MdTable:
        ok = handleMarkdownTable(block);
        break;
    case Shelf::BlockType::Dictionary:
        ok = handleDictionary(blocks, index);
        break;
    case Shelf::BlockType::Cell:
        ok = handleCell(blocks, index);
        break;
    case Shelf::BlockType::Blockquote:
        ok = handleBlockquote(block);
        break;
    case Shelf::BlockType::CodeBlock:
        ok = handleCodeBlock(block);
        break;
    case Shelf::BlockType::Video:
        ok = handleVideo(block);
        break;
    case Shelf::BlockType::GistBlock:
        ok = handleGist(block);
        break;
    case Shelf::BlockType::Snippet:   // unresolved reference
    case Shelf::BlockType::Other:
        ok = handleFallback(block);
        break;
    }
    m_tracker.leaveDepth(block.depth);

    return ok;
}

Docx::Paragraph &BlockDispatcher::newParagraph(const QString &styleName)
{
    Docx::Paragraph &paragraph = m_document.addParagraph(styleName);
    Docx::Style &style = m_document.styles().getOrCreate(styleName);
    style.font.setName(m_settings.fontFamily);
    style.font.setColor(m_settings.textColor);
    if (styleName.compare(QLatin1String("Caption"), Qt::CaseInsensitive) == 0) {
        style.font.setSize(10);
        paragraph.setAlignment(Docx::Alignment::Center);
    }
    m_paragraph = &paragraph;
    return paragraph;
}

// --- Text emission ---

void BlockDispatcher::emitText(Docx::Paragraph &paragraph, const Shelf::Block &block,
                               const QList<Shelf::StyleRange> &trailingRanges)
{
    static const Shelf::EntityMap noEntities;
    const QList<RunDescriptor> runs =
        m_runBuilder.build(block.text, block.inlineStyleRanges, block.entityRanges,
                           m_entityMap ? *m_entityMap : noEntities, trailingRanges,
                           &m_errors, block.key);
    emitRuns(paragraph, runs, block.key);
}

void BlockDispatcher::emitRuns(Docx::Paragraph &paragraph, const QList<RunDescriptor> &runs,
                               const QString &context)
{
    int i = 0;
    while (i < runs.size()) {
        const RunDescriptor &first = runs.at(i);

        if (first.image) {
            if (!first.text.isEmpty()) {
                Docx::Run &run = paragraph.addRun(first.text);
                run.font = first.font;
            }
            auto loaded = m_pictures.load(first.image->src);
            if (auto *error = std::get_if<RenderError>(&loaded)) {
                RenderError reported = *error;
                reported.context = context + QLatin1Char(' ') + error->context;
                m_errors.report(reported);
            } else {
                Docx::Picture picture = std::get<Docx::Picture>(loaded);
                if (first.image->size > 0) {
                    const qint64 side = DocxUtils::inchesToEmu(first.image->size / m_settings.pixelsPerInch);
                    picture.width = side;
                    picture.height = side;
                } else {
                    picture.scaleToWidth(DocxUtils::cmToEmu(m_settings.imageMaxWidthCm));
                }
                Docx::Run &run = paragraph.addPicture(picture);
                run.font = first.font;
            }
            ++i;
            continue;
        }

        QString text = first.text;
        int next = i + 1;
        while (next < runs.size() && runs.at(next).canMergeWith(first)) {
            text += runs.at(next).text;
            ++next;
        }

        Docx::Run &run = first.href.isEmpty() ? paragraph.addRun(text)
                                              : paragraph.addHyperlinkRun(first.href, text);
        run.font = first.font;
        run.shading = first.shading;
        i = next;
    }
}

void BlockDispatcher::emitCode(Docx::Paragraph &paragraph, const QString &code,
                               const QString &language)
{
    Docx::Font codeFont;
    codeFont.setName(m_settings.codeFontFamily);
    codeFont.setSize(m_settings.codeFontSize);

    if (!m_highlighter)
        m_highlighter = std::make_unique<CodeHighlighter>();
    const QList<CodeHighlighter::Span> spans = m_highlighter->highlight(code, language);

    // Span index per UTF-16 position, -1 = plain
    std::vector<int> owner(static_cast<size_t>(code.size()), -1);
    for (int s = 0; s < spans.size(); ++s) {
        const int end = qMin(static_cast<int>(code.size()), spans.at(s).start + spans.at(s).length);
        for (int p = qMax(0, spans.at(s).start); p < end; ++p)
            owner[static_cast<size_t>(p)] = s;
    }

    int start = 0;
    while (start < code.size()) {
        const int span = owner[static_cast<size_t>(start)];
        int end = start + 1;
        while (end < code.size() && owner[static_cast<size_t>(end)] == span)
            ++end;

        Docx::Run &run = paragraph.addRun(code.mid(start, end - start));
        run.font = codeFont;
        if (span >= 0) {
            run.font.mergeFrom(spans.at(span).font);
            run.shading = spans.at(span).background;
        }
        start = end;
    }
}

// --- Pictures ---

bool BlockDispatcher::addPicture(const QString &source, const QString &label,
                                 Docx::Alignment alignment, PictureLoader::Frame frame,
                                 const QString &context)
{
    if (source.isEmpty())
        return true;

    m_tracker.closeTable();
    Docx::Paragraph &paragraph = newParagraph();
    paragraph.setAlignment(alignment);

    auto loaded = m_pictures.load(source, frame);
    if (auto *error = std::get_if<RenderError>(&loaded)) {
        RenderError reported = *error;
        reported.context = context;
        reported.message = QStringLiteral("%1: %2").arg(error->context, error->message);
        m_errors.report(reported);
        return false;
    }

    Docx::Picture picture = std::get<Docx::Picture>(loaded);
    picture.scaleToWidth(DocxUtils::cmToEmu(m_settings.imageMaxWidthCm));
    paragraph.addPicture(picture);

    // Inline data images carry no caption
    if (!label.isEmpty() && !source.startsWith(QLatin1String("data:"))) {
        Docx::Paragraph &caption = newParagraph(QStringLiteral("Caption"));
        Docx::Run &run = caption.addRun(label);
        run.font.setColor(m_settings.textColor);
        run.font.setBold(true);
    }
    return true;
}

// --- Handlers ---

bool BlockDispatcher::isBlockLink(const Shelf::Block &block) const
{
    if (!m_entityMap)
        return false;
    for (const auto &range : block.entityRanges) {
        auto it = m_entityMap->constFind(range.key);
        if (it != m_entityMap->constEnd()
            && it->data.value(QLatin1String("style")).toString() == QLatin1String("block"))
            return true;
    }
    return false;
}

bool BlockDispatcher::handleUnstyled(const Shelf::Block &block)
{
    m_tracker.closeTable();
    Docx::Paragraph &paragraph = newParagraph();
    emitText(paragraph, block);
    return true;
}

bool BlockDispatcher::handleBlockLink(const Shelf::Block &block)
{
    Docx::Paragraph &paragraph = newParagraph();

    QString href;
    for (const auto &range : block.entityRanges) {
        auto it = m_entityMap->constFind(range.key);
        if (it != m_entityMap->constEnd()
            && it->data.value(QLatin1String("style")).toString() == QLatin1String("block"))
            href = it->data.value(QLatin1String("href")).toString();
    }

    Docx::Font font;
    font.setItalic(true);
    font.setSize(m_settings.fontSize);
    font.setName(m_settings.fontFamily);

    Docx::Run &text = paragraph.addRun(block.text + QLatin1Char('\n'));
    text.font = font;
    text.font.setColor(m_settings.linkColor);

    Docx::Run &target = paragraph.addRun(href);
    target.font = font;
    return true;
}

bool BlockDispatcher::handleHeader(const Shelf::Block &block)
{
    Docx::Font font;
    font.setName(m_settings.fontFamily);
    font.setBold(true);

    Docx::Paragraph *paragraph = nullptr;
    if (block.type == Shelf::BlockType::HeaderTwo) {
        paragraph = &newParagraph(QStringLiteral("heading 1"));
        font.setSize(16);
        font.setColor(m_settings.headerColor);
    } else {
        paragraph = &newParagraph();
        font.setSize(12);
        font.setColor(m_settings.textColor);
    }

    Docx::Run &run = paragraph->addRun(block.text);
    run.font = font;
    return true;
}

bool BlockDispatcher::handleListItem(const Shelf::Block &block)
{
    const int depth = block.hasDepth ? block.depth : 1;

    QString styleName;
    if (block.type == Shelf::BlockType::OrderedListItem) {
        styleName = QStringLiteral("List Number %1").arg(StructuralTracker::orderedListLevel(depth));
        // Word joins adjacent lists; an empty paragraph keeps them apart
        if (m_tracker.enterOrderedList(styleName))
            newParagraph().addRun(QStringLiteral("\n"));
    } else {
        styleName = QStringLiteral("List Bullet %1").arg(StructuralTracker::unorderedListLevel(depth));
    }

    Docx::Paragraph &paragraph = newParagraph(styleName);
    emitText(paragraph, block);
    return true;
}

bool BlockDispatcher::handleFigure(const Shelf::Block &block)
{
    const int depth = block.data.value(QLatin1String("depth")).toInt(0);
    m_tracker.enterDepth(depth);
    const bool ok = addPicture(block.data.value(QLatin1String("src")).toString(),
                               block.data.value(QLatin1String("label")).toString(),
                               alignmentFor(block.data.value(QLatin1String("align")).toString()),
                               PictureLoader::Frame::Bordered, block.key);
    m_tracker.leaveDepth(depth);
    return ok;
}

bool BlockDispatcher::handleMarkdownTable(const Shelf::Block &block)
{
    MarkdownTableParser parser;
    const auto parsed = parser.parse(block.text);
    if (!parsed) {
        m_errors.report(RenderError::Kind::Block, block.key,
                        QStringLiteral("mdtable text holds no pipe table"));
        return false;
    }
    if (parsed->rows.isEmpty()) {
        qDebug() << "BlockDispatcher: mdtable" << block.key << "has no data rows";
        return true;
    }

    Docx::Table &table = m_document.addTable(0, parsed->columnCount);
    table.setStyleName(QStringLiteral("Table Grid"));

    table.addRow();
    for (int c = 0; c < parsed->header.size() && c < table.columnCount(); ++c)
        table.cell(0, c).setText(parsed->header.at(c));

    for (const auto &row : parsed->rows) {
        table.addRow();
        const int r = table.rowCount() - 1;
        for (int c = 0; c < row.size() && c < table.columnCount(); ++c)
            table.cell(r, c).setText(row.at(c));
    }
    return true;
}

bool BlockDispatcher::handleDictionary(const QList<Shelf::Block> &blocks, int index)
{
    Docx::Cell *cell = m_tracker.nextDictionaryCell(m_document, blocks, index);
    emitText(cell->paragraph(), blocks.at(index));
    return true;
}

bool BlockDispatcher::handleCell(const QList<Shelf::Block> &blocks, int index)
{
    const Shelf::Block &block = blocks.at(index);
    Docx::Cell *cell = m_tracker.nextTableCell(m_document, blocks, index);
    if (!cell) {
        m_errors.report(RenderError::Kind::Block, block.key,
                        QStringLiteral("cell without an open table"));
        return false;
    }
    emitText(cell->paragraph(), block);
    return true;
}

bool BlockDispatcher::handleBlockquote(const Shelf::Block &block)
{
    const QuoteVariant variant = quoteVariant(block.data.value(QLatin1String("style")).toString());

    m_tracker.closeTable();
    m_document.styles().getOrCreate(variant.styleName);
    newParagraph();

    Docx::Table &table = m_document.addTable(1, 2);
    table.setAutofit(false);
    table.setColumnWidth(0, DocxUtils::inchesToTwips(0.5));
    table.setColumnWidth(1, DocxUtils::inchesToTwips(6.0));
    table.setIndent(qMax(0, m_tracker.currentDepth() - 1) * 360);

    Docx::Cell &quote = table.cell(0, 0);
    quote.paragraph().setStyleName(variant.styleName);
    Docx::Run &icon = quote.paragraph().addRun(variant.icon);
    icon.font.setColor(variant.accent);
    icon.font.setSize(m_settings.fontSize);
    quote.borders.insert(Docx::BorderEdge::Start,
                         Docx::Border{QStringLiteral("single"), 12, variant.border, 0});
    quote.shading = variant.shading;

    Docx::Cell &text = table.cell(0, 1);
    text.paragraph().setStyleName(variant.styleName);
    text.shading = variant.shading;
    emitText(text.paragraph(), block);
    return true;
}

bool BlockDispatcher::handleHeaderStep(const Shelf::Block &block)
{
    Docx::Paragraph &paragraph = newParagraph();

    const QString prefix = QStringLiteral("%1. ").arg(m_tracker.nextHeaderStep());
    Shelf::StyleRange step;
    step.style = Shelf::StyleToken::named(QStringLiteral("header-step"));
    step.length = static_cast<int>(prefix.size());

    Shelf::Block number;
    number.key = block.key;
    number.text = prefix;
    number.inlineStyleRanges.append(step);
    emitText(paragraph, number);

    // The whole step text is set in the step style as well
    step.length = static_cast<int>(TextRunBuilder::codePoints(block.text).size());
    emitText(paragraph, block, QList<Shelf::StyleRange>{step});
    return true;
}

Docx::Table &BlockDispatcher::addBorderedCell(const QColor &borderColor)
{
    Docx::Table &table = m_document.addTable(1, 1);
    Docx::Cell &cell = table.cell(0, 0);
    cell.borders.insert(Docx::BorderEdge::Start,
                        Docx::Border{QStringLiteral("single"), 12, borderColor, 0});
    cell.paragraph().setStyleName(QStringLiteral("HTML Preformatted"));
    return table;
}

bool BlockDispatcher::handleCodeBlock(const Shelf::Block &block)
{
    newParagraph();

    const QString label = block.data.value(QLatin1String("label")).toString();
    const QString language = block.data.value(QLatin1String("type")).toString();

    Docx::Table &info = m_document.addTable(1, 2);
    const QString infoText[2] = {label, language};
    for (int c = 0; c < 2; ++c) {
        if (infoText[c].isEmpty())
            continue;
        Docx::Run &run = info.cell(0, c).paragraph().addRun(infoText[c]);
        run.font.setSize(m_settings.fontSize);
        run.font.setName(m_settings.fontFamily);
    }

    Docx::Table &code = addBorderedCell(m_settings.codeBorderColor);
    emitCode(code.cell(0, 0).paragraph(), block.text, language);
    return true;
}

bool BlockDispatcher::handleVideo(const Shelf::Block &block)
{
    const QString source = block.data.value(QLatin1String("src")).toString();
    if (source.isEmpty())
        return true;

    if (VideoLinks::providerFor(source) != VideoLinks::Provider::None) {
        if (!m_fetcher) {
            m_errors.report(RenderError::Kind::ExternalService, block.key,
                            QStringLiteral("no fetcher for the video thumbnail"));
        } else {
            auto thumbnail = VideoLinks::thumbnailFor(source, *m_fetcher);
            if (auto *error = std::get_if<RenderError>(&thumbnail)) {
                m_errors.report(*error);
            } else {
                // A missing thumbnail still leaves the caption
                addPicture(std::get<QUrl>(thumbnail).toString(), QString(),
                           Docx::Alignment::Center, PictureLoader::Frame::Bordered, block.key);
            }
        }
    } else {
        qDebug() << "BlockDispatcher: no thumbnail provider for" << source;
    }

    Docx::Paragraph &caption = newParagraph(QStringLiteral("Caption"));
    caption.addRun(block.data.value(QLatin1String("label")).toString()).font.setBold(true);
    caption.addRun(QStringLiteral("\n"));
    caption.addRun(source).font.setBold(true);
    return true;
}

bool BlockDispatcher::handleGist(const Shelf::Block &block)
{
    newParagraph();

    Docx::Table &table = addBorderedCell(m_settings.codeBorderColor);
    Docx::Run &run = table.cell(0, 0).paragraph().addRun(
        block.data.value(QLatin1String("src")).toString());
    run.font.setName(m_settings.codeFontFamily);
    run.font.setSize(m_settings.codeFontSize);
    return true;
}

bool BlockDispatcher::handleFallback(const Shelf::Block &block)
{
    if (block.text.isEmpty())
        return true;

    Docx::Paragraph &paragraph = m_paragraph ? *m_paragraph : newParagraph();
    emitText(paragraph, block);
    return true;
}
