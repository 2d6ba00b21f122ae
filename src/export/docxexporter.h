/*
 * docxexporter.h: Shelf model -> .docx document
 *
 * Drives the whole render: title page, then per book a title and per
 * article a heading, the article's blocks (snippets spliced in, legacy
 * cell depths normalized, a terminal block appended) and a page break.
 * An optional template document restyles the result afterwards.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_DOCXEXPORTER_H
#define SHELFDOCX_DOCXEXPORTER_H

#include <QByteArray>
#include <QList>
#include <QString>
#include <QUrl>

#include <optional>

#include "docxdocument.h"
#include "rendererror.h"
#include "rendersettings.h"
#include "shelfmodel.h"
#include "structuraltracker.h"

class BlobFetcher;
class BlockDispatcher;
class ObjectStore;
class SnippetResolver;

class DocxExporter
{
public:
    static constexpr int PresignedUrlSeconds = 900;

    explicit DocxExporter(const Shelf::Document &shelf,
                          const RenderSettings &settings = RenderSettings());
    ~DocxExporter();

    // Collaborators are optional and not owned
    void setBlobFetcher(BlobFetcher *fetcher) { m_fetcher = fetcher; }
    void setSnippetResolver(SnippetResolver *resolver) { m_snippets = resolver; }

    void setTemplate(Docx::Document templateDocument);
    // Loads a template from .docx bytes; false if the package is unreadable
    bool loadTemplate(const QByteArray &package);
    bool hasTemplate() const { return m_template.has_value(); }

    // Builds the document from scratch; false when nothing was produced
    bool render();

    Docx::Document &document() { return m_document; }
    const Docx::Document &document() const { return m_document; }

    // Serialized package, rendering first if needed; empty on failure
    QByteArray documentBytes();

    // Uploads to export/<shelf>/<user>/<filename> and returns a presigned
    // URL valid for PresignedUrlSeconds. Any failure is a Storage error.
    Result<QUrl> save(ObjectStore &store, const QString &bucket, const QString &shelfId,
                      const QString &userId, const QString &filename);

    static QString exportKey(const QString &shelfId, const QString &userId,
                             const QString &filename);

    // Article blocks with every snippet block replaced by the source
    // blocks it includes; entities of the sources are added to entityMap
    QList<Shelf::Block> resolveBlocks(const Shelf::Article &article, Shelf::EntityMap &entityMap);

    const ErrorSink &errors() const { return m_errors; }
    // Blocks dispatched by the last render, terminal blocks included
    int dispatchCount() const { return m_dispatchCount; }

private:
    void addTableOfContents(BlockDispatcher &dispatcher);
    void addTitlePage(BlockDispatcher &dispatcher);
    void addBookTitle(BlockDispatcher &dispatcher, const QString &name);
    void addArticleHeading(BlockDispatcher &dispatcher, const Shelf::Article &article);
    void renderArticle(BlockDispatcher &dispatcher, const Shelf::Article &article);

    Shelf::Document m_shelf;
    RenderSettings m_settings;
    BlobFetcher *m_fetcher = nullptr;
    SnippetResolver *m_snippets = nullptr;
    std::optional<Docx::Document> m_template;

    Docx::Document m_document;
    StructuralTracker m_tracker;
    ErrorSink m_errors;
    int m_dispatchCount = 0;
    bool m_rendered = false;
};

#endif // SHELFDOCX_DOCXEXPORTER_H
