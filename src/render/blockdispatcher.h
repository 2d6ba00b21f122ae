/*
 * blockdispatcher.h: Routes each block of the flat stream to its handler
 *
 * One handler per block type, chosen by an exhaustive switch over
 * Shelf::BlockType. Handlers create paragraphs, tables and pictures in
 * the document sink; multi-block structures are continued through the
 * StructuralTracker. A handler that fails reports to the ErrorSink and
 * returns false; the structural state is left as it was and the next
 * block is dispatched normally.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_BLOCKDISPATCHER_H
#define SHELFDOCX_BLOCKDISPATCHER_H

#include "docxdocument.h"
#include "pictureloader.h"
#include "rendererror.h"
#include "rendersettings.h"
#include "shelfmodel.h"
#include "structuraltracker.h"
#include "textrunbuilder.h"

#include <QColor>
#include <QList>
#include <QString>

#include <memory>

class BlobFetcher;
class CodeHighlighter;

class BlockDispatcher
{
public:
    // Blockquote variants selected by data.style
    struct QuoteVariant {
        QString styleName;
        QString icon;
        QColor accent;
        QColor shading;
        QColor border;
    };

    BlockDispatcher(Docx::Document &document, StructuralTracker &tracker, ErrorSink &errors,
                    const RenderSettings &settings = RenderSettings(),
                    BlobFetcher *fetcher = nullptr);
    ~BlockDispatcher();

    // Resets the tracker; the entity map must outlive the article
    void beginArticle(const Shelf::EntityMap &entityMap, int docVersion);
    // Drops the entity map; later blocks render without entities
    void endArticle() { m_entityMap = nullptr; }

    // Renders blocks[index]; false when the block was skipped
    bool dispatch(const QList<Shelf::Block> &blocks, int index);
    int dispatchCount() const { return m_dispatchCount; }

    // Body paragraph with the text defaults applied to its style
    Docx::Paragraph &newParagraph(const QString &styleName = QStringLiteral("Normal"));
    // Last body paragraph created, nullptr before the first
    Docx::Paragraph *currentParagraph() const { return m_paragraph; }

    // Picture paragraph plus an optional caption. Pictures wider than the
    // configured maximum are scaled down.
    bool addPicture(const QString &source, const QString &label, Docx::Alignment alignment,
                    PictureLoader::Frame frame, const QString &context);

    // Block text with its inline styles and entities as runs of paragraph
    void emitText(Docx::Paragraph &paragraph, const Shelf::Block &block,
                  const QList<Shelf::StyleRange> &trailingRanges = {});

    // Base run font: family, size and colour from the settings
    Docx::Font baseFont() const;

    static QuoteVariant quoteVariant(const QString &style);
    static Docx::Alignment alignmentFor(const QString &align);

private:
    bool handleUnstyled(const Shelf::Block &block);
    bool handleBlockLink(const Shelf::Block &block);
    bool handleHeader(const Shelf::Block &block);
    bool handleListItem(const Shelf::Block &block);
    bool handleFigure(const Shelf::Block &block);
    bool handleMarkdownTable(const Shelf::Block &block);
    bool handleDictionary(const QList<Shelf::Block> &blocks, int index);
    bool handleCell(const QList<Shelf::Block> &blocks, int index);
    bool handleBlockquote(const Shelf::Block &block);
    bool handleHeaderStep(const Shelf::Block &block);
    bool handleCodeBlock(const Shelf::Block &block);
    bool handleVideo(const Shelf::Block &block);
    bool handleGist(const Shelf::Block &block);
    bool handleFallback(const Shelf::Block &block);

    bool isBlockLink(const Shelf::Block &block) const;
    void emitRuns(Docx::Paragraph &paragraph, const QList<RunDescriptor> &runs,
                  const QString &context);
    void emitCode(Docx::Paragraph &paragraph, const QString &code, const QString &language);
    Docx::Table &addBorderedCell(const QColor &borderColor);

    Docx::Document &m_document;
    StructuralTracker &m_tracker;
    ErrorSink &m_errors;
    RenderSettings m_settings;
    BlobFetcher *m_fetcher;
    PictureLoader m_pictures;
    TextRunBuilder m_runBuilder;
    std::unique_ptr<CodeHighlighter> m_highlighter;

    const Shelf::EntityMap *m_entityMap = nullptr;
    Docx::Paragraph *m_paragraph = nullptr;
    int m_dispatchCount = 0;
};

#endif // SHELFDOCX_BLOCKDISPATCHER_H
