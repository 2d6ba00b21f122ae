#include "docxexporter.h"
#include "blockdispatcher.h"
#include "docxreader.h"
#include "docxwriter.h"
#include "objectstore.h"
#include "snippetresolver.h"
#include "stylemerger.h"

#include <QDebug>

namespace {

RenderError storageError(const QString &context, const QString &message)
{
    RenderError error;
    error.kind = RenderError::Kind::Storage;
    error.context = context;
    error.message = message;
    return error;
}

} // namespace

DocxExporter::DocxExporter(const Shelf::Document &shelf, const RenderSettings &settings)
    : m_shelf(shelf)
    , m_settings(settings)
    , m_tracker(settings)
{
}

DocxExporter::~DocxExporter() = default;

void DocxExporter::setTemplate(Docx::Document templateDocument)
{
    m_template = std::move(templateDocument);
}

bool DocxExporter::loadTemplate(const QByteArray &package)
{
    Docx::Reader reader;
    std::optional<Docx::Document> loaded = reader.read(package);
    if (!loaded) {
        qWarning() << "DocxExporter: cannot load template:" << reader.errorString();
        return false;
    }
    m_template = std::move(loaded);
    return true;
}

QString DocxExporter::exportKey(const QString &shelfId, const QString &userId,
                                const QString &filename)
{
    return QStringLiteral("export/%1/%2/%3").arg(shelfId, userId, filename);
}

// --- Block source resolution ---

QList<Shelf::Block> DocxExporter::resolveBlocks(const Shelf::Article &article,
                                                Shelf::EntityMap &entityMap)
{
    QList<Shelf::Block> blocks;
    blocks.reserve(article.blocks.size());

    for (const auto &block : article.blocks) {
        if (block.type != Shelf::BlockType::Snippet) {
            blocks.append(block);
            continue;
        }

        const QString snippetId = Shelf::keyString(block.data.value(QLatin1String("src")));
        if (!m_snippets) {
            m_errors.report(RenderError::Kind::ExternalService, snippetId,
                            QStringLiteral("no snippet resolver configured"));
            continue;
        }

        const Result<ResolvedSnippet> resolved = m_snippets->resolveSnippet(snippetId);
        if (const auto *error = std::get_if<RenderError>(&resolved)) {
            m_errors.report(*error);
            continue;
        }

        const ResolvedSnippet &snippet = std::get<ResolvedSnippet>(resolved);
        blocks.append(snippet.includedBlocks());
        for (auto it = snippet.entityMap.constBegin(); it != snippet.entityMap.constEnd(); ++it) {
            if (!entityMap.contains(it.key()))
                entityMap.insert(it.key(), it.value());
        }
    }
    return blocks;
}

// --- Rendering ---

bool DocxExporter::render()
{
    m_document = Docx::Document();
    m_document.setTitle(m_shelf.name);
    m_document.setAuthor(m_shelf.requestUserId);
    m_errors.clear();
    m_dispatchCount = 0;

    BlockDispatcher dispatcher(m_document, m_tracker, m_errors, m_settings, m_fetcher);

    if (m_settings.includeTableOfContents)
        addTableOfContents(dispatcher);
    addTitlePage(dispatcher);

    for (const auto &book : std::as_const(m_shelf.books)) {
        addBookTitle(dispatcher, book.name);
        for (const auto &article : book.articles)
            renderArticle(dispatcher, article);
    }

    m_dispatchCount = dispatcher.dispatchCount();

    if (m_template) {
        StyleMerger merger;
        merger.merge(m_document, *m_template, &m_errors);
    }

    m_rendered = true;
    qDebug() << "DocxExporter: rendered" << m_shelf.books.size() << "books,"
             << m_dispatchCount << "blocks," << m_errors.count() << "errors";
    return !m_document.body().empty();
}

void DocxExporter::addTableOfContents(BlockDispatcher &dispatcher)
{
    Docx::Paragraph &paragraph = dispatcher.newParagraph();
    paragraph.addField(QStringLiteral("TOC \\o \"1-3\" \\h \\z \\u"),
                       QStringLiteral("Right-click to update field."));
    paragraph.addRun(QStringLiteral("\nUpdate the table of contents to list the document headings."));
}

void DocxExporter::addTitlePage(BlockDispatcher &dispatcher)
{
    Docx::Paragraph &title = dispatcher.newParagraph();
    Docx::Run &run = title.addRun(m_shelf.name);
    run.font.setName(m_settings.fontFamily);
    run.font.setSize(28);
    run.font.setColor(m_settings.headerColor);
    run.font.setBold(true);

    dispatcher.newParagraph();
}

void DocxExporter::addBookTitle(BlockDispatcher &dispatcher, const QString &name)
{
    // Joins the paragraph that is current when the book starts
    Docx::Paragraph *paragraph = dispatcher.currentParagraph();
    if (!paragraph)
        paragraph = &dispatcher.newParagraph();

    Docx::Run &run = paragraph->addRun(name);
    run.font.setName(m_settings.fontFamily);
    run.font.setSize(24);
    run.font.setColor(m_settings.textColor);
    run.font.setBold(true);
}

void DocxExporter::addArticleHeading(BlockDispatcher &dispatcher, const Shelf::Article &article)
{
    dispatcher.newParagraph();
    if (!article.icon.isEmpty())
        dispatcher.addPicture(article.icon, QString(), Docx::Alignment::Center,
                              PictureLoader::Frame::None, article.id);

    Docx::Font font;
    font.setName(m_settings.fontFamily);
    font.setColor(m_settings.textColor);
    font.setBold(true);

    Docx::Paragraph &name = dispatcher.newParagraph();
    name.addRun(QStringLiteral("\n"));
    Docx::Run &nameRun = name.addRun(article.name);
    nameRun.font = font;
    nameRun.font.setSize(18);
    name.setAlignment(Docx::Alignment::Center);

    Docx::Paragraph &description = dispatcher.newParagraph();
    Docx::Run &descriptionRun = description.addRun(article.description);
    descriptionRun.font = font;
    descriptionRun.font.setSize(12);
    description.setAlignment(Docx::Alignment::Center);

    Docx::Paragraph &spacer = dispatcher.newParagraph();
    spacer.markFont().setColor(m_settings.textColor);
    spacer.markFont().setSize(13);
    spacer.markFont().setName(m_settings.fontFamily);
}

void DocxExporter::renderArticle(BlockDispatcher &dispatcher, const Shelf::Article &article)
{
    Shelf::EntityMap entityMap = article.entityMap;
    QList<Shelf::Block> blocks = resolveBlocks(article, entityMap);

    dispatcher.beginArticle(entityMap, article.docVersion);
    addArticleHeading(dispatcher, article);

    if (StructuralTracker::isLegacyVersion(article.docVersion)) {
        const int rewrites = StructuralTracker::normalizeCellDepths(blocks);
        if (rewrites > 0)
            qDebug() << "DocxExporter: article" << article.name << "-" << rewrites
                     << "cell runs read as 3-column tables";
    }

    blocks.append(Shelf::Block::terminal());

    int failed = 0;
    for (int i = 0; i < blocks.size(); ++i) {
        if (!dispatcher.dispatch(blocks, i))
            ++failed;
    }

    if (Docx::Paragraph *last = dispatcher.currentParagraph())
        last->addPageBreak();
    dispatcher.endArticle();

    qDebug() << "DocxExporter: article" << article.name << "-" << blocks.size()
             << "blocks," << failed << "skipped";
}

// --- Output ---

QByteArray DocxExporter::documentBytes()
{
    if (!m_rendered)
        render();

    Docx::Writer writer;
    return writer.write(m_document);
}

Result<QUrl> DocxExporter::save(ObjectStore &store, const QString &bucket, const QString &shelfId,
                                const QString &userId, const QString &filename)
{
    const QString key = exportKey(shelfId, userId, filename);

    const QByteArray bytes = documentBytes();
    if (bytes.isEmpty()) {
        const RenderError error = storageError(key, QStringLiteral("document serialization failed"));
        m_errors.report(error);
        return error;
    }

    const Result<QUrl> stored = store.put(bucket, key, bytes, Docx::Writer::contentType(),
                                          QStringLiteral("private"));
    if (const auto *error = std::get_if<RenderError>(&stored)) {
        const RenderError reported = storageError(key, error->message);
        m_errors.report(reported);
        return reported;
    }

    const Result<QUrl> url = store.presignedGet(bucket, key, PresignedUrlSeconds);
    if (const auto *error = std::get_if<RenderError>(&url)) {
        const RenderError reported = storageError(key, error->message);
        m_errors.report(reported);
        return reported;
    }
    return url;
}
