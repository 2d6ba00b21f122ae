#include <gtest/gtest.h>

#include "blockdispatcher.h"
#include "docxutils.h"
#include "styleresolver.h"
#include "testsupport.h"

using namespace TestSupport;
using Shelf::BlockType;

class BlockDispatcherTest : public ::testing::Test
{
protected:
    BlockDispatcherTest()
        : dispatcher(document, tracker, errors, settings, &fetcher)
    {
    }

    // Dispatches every block as one article; returns the number skipped
    int render(const QList<Shelf::Block> &blocks, int docVersion = 3)
    {
        dispatcher.beginArticle(entities, docVersion);
        int failed = 0;
        for (int i = 0; i < blocks.size(); ++i) {
            if (!dispatcher.dispatch(blocks, i))
                ++failed;
        }
        return failed;
    }

    Shelf::Block figure(const QString &src, const QString &label = QString(),
                        const QString &align = QString())
    {
        Shelf::Block b = block(BlockType::Figure, QString(), QStringLiteral("fig"));
        b.data.insert(QStringLiteral("src"), src);
        b.data.insert(QStringLiteral("label"), label);
        b.data.insert(QStringLiteral("align"), align);
        return b;
    }

    Docx::Document document;
    RenderSettings settings;
    StructuralTracker tracker{settings};
    ErrorSink errors;
    FakeBlobFetcher fetcher;
    Shelf::EntityMap entities;
    BlockDispatcher dispatcher;
};

TEST_F(BlockDispatcherTest, HeadingAndBoldParagraph)
{
    Shelf::Block hello = block(BlockType::Unstyled, QStringLiteral("Hello"));
    hello.inlineStyleRanges.append(styleRange(QStringLiteral("BOLD"), 0, 5));

    EXPECT_EQ(render({block(BlockType::HeaderTwo, QStringLiteral("Intro")), hello}), 0);

    const auto paragraphs = document.paragraphs();
    ASSERT_EQ(paragraphs.size(), 2);
    EXPECT_EQ(paragraphs.at(0)->styleName(), QStringLiteral("heading 1"));
    EXPECT_EQ(paragraphs.at(0)->text(), QStringLiteral("Intro"));
    EXPECT_DOUBLE_EQ(paragraphs.at(0)->runs().first().font.size(), 16.0);
    EXPECT_EQ(paragraphs.at(0)->runs().first().font.color(), settings.headerColor);

    ASSERT_EQ(paragraphs.at(1)->runs().size(), 1);
    EXPECT_EQ(paragraphs.at(1)->runs().first().text, QStringLiteral("Hello"));
    EXPECT_TRUE(paragraphs.at(1)->runs().first().font.bold());
    EXPECT_TRUE(errors.isEmpty());
}

TEST_F(BlockDispatcherTest, HeaderThreeIsBoldNormalText)
{
    render({block(BlockType::HeaderThree, QStringLiteral("Details"))});

    const auto paragraphs = document.paragraphs();
    ASSERT_EQ(paragraphs.size(), 1);
    EXPECT_EQ(paragraphs.first()->styleName(), QStringLiteral("Normal"));
    EXPECT_TRUE(paragraphs.first()->runs().first().font.bold());
    EXPECT_DOUBLE_EQ(paragraphs.first()->runs().first().font.size(), 12.0);
}

TEST_F(BlockDispatcherTest, AdjacentRunsAreCoalesced)
{
    Shelf::Block text = block(BlockType::Unstyled, QStringLiteral("plain bold plain"));
    text.inlineStyleRanges.append(styleRange(QStringLiteral("BOLD"), 6, 4));
    render({text});

    const auto &runs = document.paragraphs().first()->runs();
    ASSERT_EQ(runs.size(), 3);
    EXPECT_EQ(runs.at(0).text, QStringLiteral("plain "));
    EXPECT_EQ(runs.at(1).text, QStringLiteral("bold"));
    EXPECT_EQ(runs.at(2).text, QStringLiteral(" plain"));
    EXPECT_EQ(runs.at(0).font.name(), settings.fontFamily);
}

TEST_F(BlockDispatcherTest, LegacyCellsFormATable)
{
    EXPECT_EQ(render({blockAtDepth(BlockType::Cell, QStringLiteral("A"), 0),
                      blockAtDepth(BlockType::Cell, QStringLiteral("B"), 0),
                      blockAtDepth(BlockType::Cell, QStringLiteral("C"), 0)},
                     1),
              0);

    ASSERT_EQ(document.tables().size(), 1);
    const Docx::Table *table = document.tables().first();
    EXPECT_EQ(table->columnCount(), 2);
    EXPECT_EQ(table->rowCount(), 2);
    EXPECT_EQ(table->cell(0, 0).text(), QStringLiteral("A"));
    EXPECT_EQ(table->cell(0, 1).text(), QStringLiteral("B"));
    EXPECT_EQ(table->cell(1, 0).text(), QStringLiteral("C"));
    EXPECT_EQ(table->cell(1, 1).text(), QString());
}

TEST_F(BlockDispatcherTest, ParagraphClosesTable)
{
    render({blockAtDepth(BlockType::Cell, QStringLiteral("A"), 0),
            block(BlockType::Unstyled, QStringLiteral("between")),
            blockAtDepth(BlockType::Cell, QStringLiteral("B"), 0)},
           1);
    EXPECT_EQ(document.tables().size(), 2);
}

TEST_F(BlockDispatcherTest, OrphanCellIsReported)
{
    Shelf::Block cell = block(BlockType::Cell, QStringLiteral("lost"), QStringLiteral("c1"));
    EXPECT_EQ(render({cell, block(BlockType::Unstyled, QStringLiteral("after"))}), 1);

    EXPECT_EQ(errors.count(RenderError::Kind::Block), 1);
    EXPECT_EQ(errors.errors().first().context, QStringLiteral("c1"));
    EXPECT_TRUE(document.tables().isEmpty());
    ASSERT_EQ(document.paragraphs().size(), 1);
    EXPECT_EQ(document.paragraphs().first()->text(), QStringLiteral("after"));
}

TEST_F(BlockDispatcherTest, MarkdownTable)
{
    EXPECT_EQ(render({block(BlockType::MdTable, QStringLiteral("|h1|h2|\n|--|--|\n|a|b|\n"))}), 0);

    ASSERT_EQ(document.tables().size(), 1);
    const Docx::Table *table = document.tables().first();
    EXPECT_EQ(table->columnCount(), 2);
    EXPECT_EQ(table->rowCount(), 2);
    EXPECT_EQ(table->cell(0, 0).text(), QStringLiteral("h1"));
    EXPECT_EQ(table->cell(0, 1).text(), QStringLiteral("h2"));
    EXPECT_EQ(table->cell(1, 0).text(), QStringLiteral("a"));
    EXPECT_EQ(table->cell(1, 1).text(), QStringLiteral("b"));
    EXPECT_EQ(table->styleName(), QStringLiteral("Table Grid"));
}

TEST_F(BlockDispatcherTest, MarkdownTableWithoutRows)
{
    EXPECT_EQ(render({block(BlockType::MdTable, QStringLiteral("|h1|h2|\n|--|--|\n"))}), 0);
    EXPECT_TRUE(document.tables().isEmpty());
    EXPECT_TRUE(errors.isEmpty());
}

TEST_F(BlockDispatcherTest, MarkdownTextWithoutTable)
{
    EXPECT_EQ(render({block(BlockType::MdTable, QStringLiteral("just a sentence"), QStringLiteral("md"))}), 1);
    EXPECT_EQ(errors.count(RenderError::Kind::Block), 1);
    EXPECT_TRUE(document.tables().isEmpty());
}

TEST_F(BlockDispatcherTest, DictionaryTerms)
{
    render({block(BlockType::Dictionary, QStringLiteral("term")),
            block(BlockType::Dictionary, QStringLiteral("meaning")),
            block(BlockType::Dictionary, QStringLiteral("other"))});

    ASSERT_EQ(document.tables().size(), 1);
    const Docx::Table *table = document.tables().first();
    EXPECT_EQ(table->columnCount(), 3);
    EXPECT_EQ(table->cell(0, 0).text(), QStringLiteral("term"));
    EXPECT_EQ(table->cell(0, 1).text(), QString());
    EXPECT_EQ(table->cell(0, 2).text(), QStringLiteral("meaning"));
    EXPECT_EQ(table->cell(1, 0).text(), QStringLiteral("other"));
    EXPECT_EQ(table->cell(0, 0).shading, settings.dictionaryShading);
}

TEST_F(BlockDispatcherTest, OrderedListsAreSeparated)
{
    render({blockAtDepth(BlockType::OrderedListItem, QStringLiteral("one"), 0),
            blockAtDepth(BlockType::OrderedListItem, QStringLiteral("two"), 0),
            blockAtDepth(BlockType::OrderedListItem, QStringLiteral("nested"), 1)});

    const auto paragraphs = document.paragraphs();
    ASSERT_EQ(paragraphs.size(), 4);
    EXPECT_EQ(paragraphs.at(0)->styleName(), QStringLiteral("List Number 2"));
    EXPECT_EQ(paragraphs.at(1)->styleName(), QStringLiteral("List Number 2"));
    EXPECT_EQ(paragraphs.at(2)->styleName(), QStringLiteral("Normal"));
    EXPECT_EQ(paragraphs.at(2)->text(), QStringLiteral("\n"));
    EXPECT_EQ(paragraphs.at(3)->styleName(), QStringLiteral("List Number 3"));
    EXPECT_EQ(paragraphs.at(3)->text(), QStringLiteral("nested"));
    EXPECT_NE(document.styles().style(QStringLiteral("List Number 3")), nullptr);
}

TEST_F(BlockDispatcherTest, OtherBlocksEndTheOrderedList)
{
    render({blockAtDepth(BlockType::OrderedListItem, QStringLiteral("one"), 0),
            block(BlockType::Unstyled, QStringLiteral("break")),
            blockAtDepth(BlockType::OrderedListItem, QStringLiteral("again"), 1)});
    EXPECT_EQ(document.paragraphs().size(), 3);
}

TEST_F(BlockDispatcherTest, BulletDepthDefaultsToOne)
{
    render({block(BlockType::UnorderedListItem, QStringLiteral("no depth")),
            blockAtDepth(BlockType::UnorderedListItem, QStringLiteral("top"), 0),
            blockAtDepth(BlockType::UnorderedListItem, QStringLiteral("deep"), 5)});

    const auto paragraphs = document.paragraphs();
    ASSERT_EQ(paragraphs.size(), 3);
    EXPECT_EQ(paragraphs.at(0)->styleName(), QStringLiteral("List Bullet 3"));
    EXPECT_EQ(paragraphs.at(1)->styleName(), QStringLiteral("List Bullet 2"));
    EXPECT_EQ(paragraphs.at(2)->styleName(), QStringLiteral("List Bullet 7"));
}

TEST_F(BlockDispatcherTest, HeaderStepsAreNumbered)
{
    render({block(BlockType::HeaderStep, QStringLiteral("Install")),
            block(BlockType::HeaderStep, QStringLiteral("Configure"))});

    const auto paragraphs = document.paragraphs();
    ASSERT_EQ(paragraphs.size(), 2);
    EXPECT_EQ(paragraphs.at(0)->text(), QStringLiteral("1. Install"));
    EXPECT_EQ(paragraphs.at(1)->text(), QStringLiteral("2. Configure"));

    const auto &runs = paragraphs.at(0)->runs();
    ASSERT_EQ(runs.size(), 2);
    EXPECT_EQ(runs.at(0).text, QStringLiteral("1. "));
    for (const auto &run : runs) {
        EXPECT_TRUE(run.font.bold());
        EXPECT_DOUBLE_EQ(run.font.size(), 10.5);
    }
}

TEST_F(BlockDispatcherTest, WarningBlockquote)
{
    Shelf::Block quote = blockAtDepth(BlockType::Blockquote, QStringLiteral("Careful"), 1);
    quote.data.insert(QStringLiteral("style"), QStringLiteral("warning"));
    render({quote});

    ASSERT_EQ(document.tables().size(), 1);
    const Docx::Table *table = document.tables().first();
    EXPECT_EQ(table->columnCount(), 2);
    EXPECT_FALSE(table->autofit());
    EXPECT_EQ(table->indent(), 360);
    EXPECT_EQ(table->columnWidth(0), DocxUtils::inchesToTwips(0.5));

    const Docx::Cell &icon = table->cell(0, 0);
    EXPECT_EQ(icon.text(), QStringLiteral("\U0001F6A8"));
    EXPECT_EQ(icon.shading, QColor(0xFF, 0xD9, 0xD9));
    ASSERT_TRUE(icon.borders.contains(Docx::BorderEdge::Start));
    EXPECT_EQ(icon.borders.value(Docx::BorderEdge::Start).size, 12);
    EXPECT_EQ(icon.borders.value(Docx::BorderEdge::Start).color, QColor(0xFF, 0x00, 0x00));

    const Docx::Cell &text = table->cell(0, 1);
    EXPECT_EQ(text.text(), QStringLiteral("Careful"));
    EXPECT_EQ(text.paragraph().styleName(), QStringLiteral("Blockquote Warning"));
    EXPECT_NE(document.styles().style(QStringLiteral("Blockquote Warning")), nullptr);
}

TEST_F(BlockDispatcherTest, QuoteVariants)
{
    EXPECT_EQ(BlockDispatcher::quoteVariant(QStringLiteral("question")).styleName,
              QStringLiteral("Blockquote Question"));
    EXPECT_EQ(BlockDispatcher::quoteVariant(QStringLiteral("question")).border, QColor(0x00, 0xCC, 0x00));
    EXPECT_EQ(BlockDispatcher::quoteVariant(QString()).styleName, QStringLiteral("Blockquote"));
    EXPECT_EQ(BlockDispatcher::quoteVariant(QStringLiteral("anything")).shading, QColor(0xEA, 0xEE, 0xF2));
}

TEST_F(BlockDispatcherTest, CodeBlockInUnknownLanguage)
{
    Shelf::Block code = block(BlockType::CodeBlock, QStringLiteral("x = 1\ny = 2"));
    code.data.insert(QStringLiteral("label"), QStringLiteral("setup"));
    code.data.insert(QStringLiteral("type"), QStringLiteral("nosuchlang"));
    render({code});

    ASSERT_EQ(document.tables().size(), 2);
    const Docx::Table *info = document.tables().at(0);
    EXPECT_EQ(info->cell(0, 0).text(), QStringLiteral("setup"));
    EXPECT_EQ(info->cell(0, 1).text(), QStringLiteral("nosuchlang"));

    const Docx::Table *body = document.tables().at(1);
    const Docx::Paragraph &paragraph = body->cell(0, 0).paragraph();
    EXPECT_EQ(paragraph.styleName(), QStringLiteral("HTML Preformatted"));
    EXPECT_EQ(paragraph.text(), QStringLiteral("x = 1\ny = 2"));
    ASSERT_EQ(paragraph.runs().size(), 1);
    EXPECT_EQ(paragraph.runs().first().font.name(), settings.codeFontFamily);
    EXPECT_EQ(body->cell(0, 0).borders.value(Docx::BorderEdge::Start).color, settings.codeBorderColor);
}

TEST_F(BlockDispatcherTest, CodeBlockWithoutInfo)
{
    render({block(BlockType::CodeBlock, QStringLiteral("echo hi"))});

    ASSERT_EQ(document.tables().size(), 2);
    EXPECT_TRUE(document.tables().at(0)->cell(0, 0).paragraph().runs().isEmpty());
    EXPECT_TRUE(document.tables().at(0)->cell(0, 1).paragraph().runs().isEmpty());
}

TEST_F(BlockDispatcherTest, HighlightedCodeKeepsItsText)
{
    const QString source = QStringLiteral("def main():\n    return 1");
    Shelf::Block code = block(BlockType::CodeBlock, source);
    code.data.insert(QStringLiteral("type"), QStringLiteral("Python"));
    render({code});

    const Docx::Paragraph &paragraph = document.tables().at(1)->cell(0, 0).paragraph();
    EXPECT_EQ(paragraph.text(), source);
    EXPECT_GT(paragraph.runs().size(), 1);
}

TEST_F(BlockDispatcherTest, GistShowsItsSource)
{
    Shelf::Block gist = block(BlockType::GistBlock);
    gist.data.insert(QStringLiteral("src"), QStringLiteral("https://gist.github.com/u/1"));
    render({gist});

    ASSERT_EQ(document.tables().size(), 1);
    const Docx::Run &run = document.tables().first()->cell(0, 0).paragraph().runs().first();
    EXPECT_EQ(run.text, QStringLiteral("https://gist.github.com/u/1"));
    EXPECT_EQ(run.font.name(), settings.codeFontFamily);
}

TEST_F(BlockDispatcherTest, FigureWithCaption)
{
    fetcher.add(QStringLiteral("https://cdn.example.org/a.png"), pngBytes(100, 50));
    EXPECT_EQ(render({figure(QStringLiteral("https://cdn.example.org/a.png"),
                             QStringLiteral("Diagram"), QStringLiteral("left"))}),
              0);

    const auto paragraphs = document.paragraphs();
    ASSERT_EQ(paragraphs.size(), 2);
    EXPECT_EQ(paragraphs.at(0)->alignment().value_or(Docx::Alignment::Justify), Docx::Alignment::Left);
    ASSERT_EQ(paragraphs.at(0)->runs().size(), 1);

    const Docx::Run &picture = paragraphs.at(0)->runs().first();
    EXPECT_EQ(picture.kind, Docx::Run::Kind::Picture);
    EXPECT_EQ(picture.picture.pixelWidth, 102);     // 2% border
    EXPECT_EQ(picture.picture.pixelHeight, 52);
    EXPECT_EQ(picture.picture.width, DocxUtils::pixelsToEmu(102, PictureLoader::NaturalDpi));

    EXPECT_EQ(paragraphs.at(1)->styleName(), QStringLiteral("Caption"));
    EXPECT_EQ(paragraphs.at(1)->text(), QStringLiteral("Diagram"));
    EXPECT_EQ(paragraphs.at(1)->alignment().value_or(Docx::Alignment::Justify), Docx::Alignment::Center);
    EXPECT_TRUE(paragraphs.at(1)->runs().first().font.bold());
}

TEST_F(BlockDispatcherTest, WideFigureIsScaledToThePage)
{
    fetcher.add(QStringLiteral("https://cdn.example.org/wide.png"), pngBytes(1000, 100));
    render({figure(QStringLiteral("https://cdn.example.org/wide.png"))});

    const Docx::Picture &picture = document.paragraphs().first()->runs().first().picture;
    EXPECT_EQ(picture.width, DocxUtils::cmToEmu(settings.imageMaxWidthCm));
    EXPECT_LT(picture.height, DocxUtils::pixelsToEmu(120, PictureLoader::NaturalDpi));
    EXPECT_EQ(document.paragraphs().first()->alignment().value_or(Docx::Alignment::Justify), Docx::Alignment::Center);
}

TEST_F(BlockDispatcherTest, SvgFigureIsRasterized)
{
    fetcher.add(QStringLiteral("https://cdn.example.org/logo.svg"), svgBytes(),
                QStringLiteral("image/svg+xml"));
    EXPECT_EQ(render({figure(QStringLiteral("https://cdn.example.org/logo.svg"), QStringLiteral("Logo"))}),
              0);
    EXPECT_TRUE(errors.isEmpty());

    const Docx::Run &run = document.paragraphs().first()->runs().first();
    ASSERT_EQ(run.kind, Docx::Run::Kind::Picture);
    EXPECT_EQ(run.picture.extension, QStringLiteral("png"));
    EXPECT_TRUE(run.picture.data.startsWith("\x89PNG"));
    EXPECT_EQ(run.picture.pixelWidth, 102);
    EXPECT_EQ(run.picture.pixelHeight, 52);
}

TEST_F(BlockDispatcherTest, BrokenSvgFigureIsSkipped)
{
    fetcher.add(QStringLiteral("https://cdn.example.org/logo.svg"), QByteArrayLiteral("<svg width=\"10\""),
                QStringLiteral("image/svg+xml"));
    EXPECT_EQ(render({figure(QStringLiteral("https://cdn.example.org/logo.svg"), QStringLiteral("Logo")),
                      block(BlockType::Unstyled, QStringLiteral("next"))}),
              1);

    ASSERT_EQ(errors.count(RenderError::Kind::UnrecognizedImage), 1);
    EXPECT_EQ(errors.errors().first().context, QStringLiteral("fig"));
    EXPECT_EQ(document.paragraphs().last()->text(), QStringLiteral("next"));
}

TEST_F(BlockDispatcherTest, InlineSvgDataUrlIsEmbedded)
{
    entities.insert(QStringLiteral("3"),
                    Shelf::Entity{QStringLiteral("IMG"),
                                  QJsonObject{{"src", QStringLiteral("data:image/svg+xml;base64,")
                                                          + QString::fromLatin1(svgBytes().toBase64())}}});
    Shelf::Block text = block(BlockType::Unstyled, StyleResolver::imageMarker());
    text.entityRanges.append(entityRange(QStringLiteral("3"), 0, 1));

    EXPECT_EQ(render({text}), 0);
    EXPECT_TRUE(errors.isEmpty());
    EXPECT_TRUE(fetcher.requested.isEmpty());

    const auto &runs = document.paragraphs().first()->runs();
    ASSERT_EQ(runs.size(), 1);
    EXPECT_EQ(runs.first().kind, Docx::Run::Kind::Picture);
    EXPECT_EQ(runs.first().picture.extension, QStringLiteral("png"));
}

TEST_F(BlockDispatcherTest, MissingFigureIsReported)
{
    EXPECT_EQ(render({figure(QStringLiteral("https://cdn.example.org/gone.png"))}), 1);
    EXPECT_EQ(errors.count(RenderError::Kind::ExternalService), 1);
}

TEST_F(BlockDispatcherTest, DataUrlFigureHasNoCaption)
{
    const QString src = QStringLiteral("data:image/png;base64,")
        + QString::fromLatin1(pngBytes(4, 4).toBase64());
    render({figure(src, QStringLiteral("ignored"))});

    const auto paragraphs = document.paragraphs();
    ASSERT_EQ(paragraphs.size(), 1);
    EXPECT_EQ(paragraphs.first()->runs().first().picture.pixelWidth, 4);
    EXPECT_TRUE(fetcher.requested.isEmpty());
}

TEST_F(BlockDispatcherTest, InlineImageIsSquare)
{
    fetcher.add(QStringLiteral("https://cdn.example.org/icon.png"), pngBytes(64, 32));
    entities.insert(QStringLiteral("7"),
                    Shelf::Entity{QStringLiteral("IMG"),
                                  QJsonObject{{"src", "https://cdn.example.org/icon.png"}, {"size", 48}}});

    Shelf::Block text = block(BlockType::Unstyled,
                              QStringLiteral("a") + StyleResolver::imageMarker() + QStringLiteral("b"));
    text.entityRanges.append(entityRange(QStringLiteral("7"), 1, 1));
    render({text});

    const auto &runs = document.paragraphs().first()->runs();
    ASSERT_EQ(runs.size(), 3);
    EXPECT_EQ(runs.at(0).text, QStringLiteral("a"));
    EXPECT_EQ(runs.at(1).kind, Docx::Run::Kind::Picture);
    EXPECT_EQ(runs.at(1).picture.width, DocxUtils::inchesToEmu(0.5));
    EXPECT_EQ(runs.at(1).picture.height, DocxUtils::inchesToEmu(0.5));
    EXPECT_EQ(runs.at(2).text, QStringLiteral("b"));
}

TEST_F(BlockDispatcherTest, HyperlinkRun)
{
    entities.insert(QStringLiteral("0"),
                    Shelf::Entity{QStringLiteral("LINK"), QJsonObject{{"href", "https://docs.example.org"}}});
    Shelf::Block text = block(BlockType::Unstyled, QStringLiteral("see docs"));
    text.entityRanges.append(entityRange(QStringLiteral("0"), 4, 4));
    render({text});

    const auto &runs = document.paragraphs().first()->runs();
    ASSERT_EQ(runs.size(), 2);
    EXPECT_EQ(runs.at(0).kind, Docx::Run::Kind::Text);
    EXPECT_EQ(runs.at(1).kind, Docx::Run::Kind::Hyperlink);
    EXPECT_EQ(runs.at(1).href, QStringLiteral("https://docs.example.org"));
    EXPECT_EQ(runs.at(1).text, QStringLiteral("docs"));
}

TEST_F(BlockDispatcherTest, EndArticleForgetsEntities)
{
    entities.insert(QStringLiteral("0"),
                    Shelf::Entity{QStringLiteral("LINK"), QJsonObject{{"href", "https://docs.example.org"}}});
    Shelf::Block text = block(BlockType::Unstyled, QStringLiteral("see docs"));
    text.entityRanges.append(entityRange(QStringLiteral("0"), 4, 4));
    render({text});
    dispatcher.endArticle();

    const QList<Shelf::Block> after = {text};
    EXPECT_TRUE(dispatcher.dispatch(after, 0));
    const auto &runs = document.paragraphs().last()->runs();
    ASSERT_EQ(runs.size(), 1);
    EXPECT_EQ(runs.first().kind, Docx::Run::Kind::Text);
    EXPECT_EQ(runs.first().text, QStringLiteral("see docs"));
}

TEST_F(BlockDispatcherTest, BlockLink)
{
    entities.insert(QStringLiteral("0"),
                    Shelf::Entity{QStringLiteral("LINK"),
                                  QJsonObject{{"href", "https://example.org/guide"}, {"style", "block"}}});
    Shelf::Block text = block(BlockType::Unstyled, QStringLiteral("The guide"));
    text.entityRanges.append(entityRange(QStringLiteral("0"), 0, 9));
    render({text});

    const auto &runs = document.paragraphs().first()->runs();
    ASSERT_EQ(runs.size(), 2);
    EXPECT_EQ(runs.at(0).text, QStringLiteral("The guide\n"));
    EXPECT_TRUE(runs.at(0).font.italic());
    EXPECT_EQ(runs.at(0).font.color(), settings.linkColor);
    EXPECT_EQ(runs.at(1).text, QStringLiteral("https://example.org/guide"));
    EXPECT_TRUE(runs.at(1).font.italic());
}

TEST_F(BlockDispatcherTest, YouTubeVideo)
{
    fetcher.add(QStringLiteral("https://img.youtube.com/vi/abc123/sddefault.jpg"), pngBytes(64, 48),
                QStringLiteral("image/jpeg"));
    Shelf::Block video = block(BlockType::Video);
    video.data.insert(QStringLiteral("src"), QStringLiteral("https://youtu.be/abc123"));
    video.data.insert(QStringLiteral("label"), QStringLiteral("Demo"));
    EXPECT_EQ(render({video}), 0);

    const auto paragraphs = document.paragraphs();
    ASSERT_EQ(paragraphs.size(), 2);
    EXPECT_EQ(paragraphs.at(0)->runs().first().kind, Docx::Run::Kind::Picture);
    EXPECT_EQ(paragraphs.at(1)->styleName(), QStringLiteral("Caption"));
    EXPECT_EQ(paragraphs.at(1)->text(), QStringLiteral("Demo\nhttps://youtu.be/abc123"));
    EXPECT_TRUE(errors.isEmpty());
}

TEST_F(BlockDispatcherTest, VimeoVideoFetchesMetadata)
{
    fetcher.add(QStringLiteral("http://vimeo.com/api/v2/video/76979871.json"),
                QByteArrayLiteral(R"([{"thumbnail_large": "https://i.vimeocdn.com/t/1.jpg"}])"),
                QStringLiteral("application/json"));
    fetcher.add(QStringLiteral("https://i.vimeocdn.com/t/1.jpg"), pngBytes(32, 32));

    Shelf::Block video = block(BlockType::Video);
    video.data.insert(QStringLiteral("src"), QStringLiteral("https://vimeo.com/76979871"));
    render({video});

    EXPECT_TRUE(fetcher.requested.contains(QStringLiteral("http://vimeo.com/api/v2/video/76979871.json")));
    EXPECT_EQ(document.paragraphs().first()->runs().first().kind, Docx::Run::Kind::Picture);
}

TEST_F(BlockDispatcherTest, UnknownVideoHostKeepsCaption)
{
    Shelf::Block video = block(BlockType::Video);
    video.data.insert(QStringLiteral("src"), QStringLiteral("https://example.org/clip.mp4"));
    EXPECT_EQ(render({video}), 0);

    ASSERT_EQ(document.paragraphs().size(), 1);
    EXPECT_EQ(document.paragraphs().first()->styleName(), QStringLiteral("Caption"));
    EXPECT_TRUE(fetcher.requested.isEmpty());
    EXPECT_TRUE(errors.isEmpty());
}

TEST_F(BlockDispatcherTest, FallbackJoinsCurrentParagraph)
{
    Shelf::Block atomic = block(BlockType::Other, QStringLiteral(" tail"));
    atomic.typeName = QStringLiteral("atomic");
    render({block(BlockType::Unstyled, QStringLiteral("head")), atomic,
            block(BlockType::Other)});

    ASSERT_EQ(document.paragraphs().size(), 1);
    EXPECT_EQ(document.paragraphs().first()->text(), QStringLiteral("head tail"));
}

TEST_F(BlockDispatcherTest, DispatchCountsEveryBlock)
{
    render({block(BlockType::Unstyled, QStringLiteral("a")),
            block(BlockType::Cell, QStringLiteral("orphan")),
            block(BlockType::Unstyled)});
    EXPECT_EQ(dispatcher.dispatchCount(), 3);
}

TEST(BlockDispatcherAlignmentTest, Alignment)
{
    EXPECT_EQ(BlockDispatcher::alignmentFor(QStringLiteral("left")), Docx::Alignment::Left);
    EXPECT_EQ(BlockDispatcher::alignmentFor(QStringLiteral("right")), Docx::Alignment::Right);
    EXPECT_EQ(BlockDispatcher::alignmentFor(QString()), Docx::Alignment::Center);
}

TEST(BlockDispatcherFetcherTest, VideoWithoutFetcherIsReported)
{
    Docx::Document document;
    StructuralTracker tracker;
    ErrorSink errors;
    BlockDispatcher dispatcher(document, tracker, errors);
    Shelf::EntityMap entities;
    dispatcher.beginArticle(entities, 3);

    Shelf::Block video = block(BlockType::Video, QString(), QStringLiteral("v1"));
    video.data.insert(QStringLiteral("src"), QStringLiteral("https://www.youtube.com/watch?v=xyz"));
    video.data.insert(QStringLiteral("label"), QStringLiteral("Talk"));
    const QList<Shelf::Block> blocks = {video};
    dispatcher.dispatch(blocks, 0);

    EXPECT_EQ(errors.count(RenderError::Kind::ExternalService), 1);
    ASSERT_EQ(document.paragraphs().size(), 1);
    EXPECT_EQ(document.paragraphs().first()->text(), QStringLiteral("Talk\nhttps://www.youtube.com/watch?v=xyz"));
}
