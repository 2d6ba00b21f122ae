#include <gtest/gtest.h>

#include "blobfetcher.h"
#include "docxutils.h"
#include "markdowntable.h"
#include "objectstore.h"
#include "pictureloader.h"
#include "rendererror.h"
#include "rendersettings.h"
#include "shelfdocxsettings.h"
#include "snippetresolver.h"
#include "testsupport.h"

#include <QDateTime>
#include <QFile>
#include <QJsonDocument>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QUrlQuery>

using namespace TestSupport;

// --- ErrorSink ---

TEST(ErrorSinkTest, CountsByKind)
{
    ErrorSink errors;
    EXPECT_TRUE(errors.isEmpty());
    errors.report(RenderError::Kind::Block, QStringLiteral("k1"), QStringLiteral("bad"));
    errors.report(RenderError::Kind::Attribute, QStringLiteral("k2"), QStringLiteral("worse"));
    errors.report(RenderError::Kind::Block, QStringLiteral("k3"), QStringLiteral("again"));

    EXPECT_EQ(errors.count(), 3);
    EXPECT_EQ(errors.count(RenderError::Kind::Block), 2);
    EXPECT_EQ(errors.count(RenderError::Kind::Storage), 0);
    EXPECT_TRUE(errors.errors().at(1).toString().contains(QStringLiteral("k2")));

    errors.clear();
    EXPECT_TRUE(errors.isEmpty());
}

TEST(ErrorSinkTest, KindNames)
{
    EXPECT_EQ(RenderError::kindName(RenderError::Kind::UnrecognizedImage), QStringLiteral("unrecognized-image"));
    EXPECT_NE(RenderError::kindName(RenderError::Kind::Storage), RenderError::kindName(RenderError::Kind::Block));
}

// --- Settings ---

TEST(RenderSettingsTest, ConfigDefaultsMatchBuiltIns)
{
    // Keep a user shelfdocxrc out of the picture
    QStandardPaths::setTestModeEnabled(true);
    const RenderSettings defaults;
    const RenderSettings configured = RenderSettings::fromConfig(ShelfDocxSettings::self());

    EXPECT_EQ(configured.fontFamily, defaults.fontFamily);
    EXPECT_DOUBLE_EQ(configured.fontSize, defaults.fontSize);
    EXPECT_EQ(configured.headerColor, defaults.headerColor);
    EXPECT_EQ(configured.codeFontFamily, defaults.codeFontFamily);
    EXPECT_EQ(configured.dictionaryShading, defaults.dictionaryShading);
    EXPECT_DOUBLE_EQ(configured.imageMaxWidthCm, defaults.imageMaxWidthCm);
    EXPECT_DOUBLE_EQ(configured.pixelsPerInch, defaults.pixelsPerInch);
    EXPECT_EQ(configured.includeTableOfContents, defaults.includeTableOfContents);
    EXPECT_EQ(configured.fetchTimeoutMs, defaults.fetchTimeoutMs);
}

TEST(RenderSettingsTest, NullConfigGivesDefaults)
{
    const RenderSettings settings = RenderSettings::fromConfig(nullptr);
    EXPECT_EQ(settings.fontFamily, QStringLiteral("Inter"));
    EXPECT_EQ(settings.linkColor, QColor(76, 174, 227));
}

// --- Markdown tables ---

TEST(MarkdownTableTest, ParsesPipeTable)
{
    MarkdownTableParser parser;
    const auto table = parser.parse(QStringLiteral("| Name | Value |\n|:-----|------:|\n| a | **1** |\n| b |\n"));
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->columnCount, 2);
    EXPECT_EQ(table->header, (QStringList{QStringLiteral("Name"), QStringLiteral("Value")}));
    ASSERT_EQ(table->rows.size(), 2);
    EXPECT_EQ(table->rows.at(0), (QStringList{QStringLiteral("a"), QStringLiteral("1")}));
    EXPECT_EQ(table->rows.at(1), (QStringList{QStringLiteral("b"), QString()}));
}

TEST(MarkdownTableTest, TextWithoutTable)
{
    MarkdownTableParser parser;
    EXPECT_FALSE(parser.parse(QStringLiteral("no table here")).has_value());
    EXPECT_FALSE(parser.parse(QString()).has_value());
}

TEST(MarkdownTableTest, OnlyFirstTableIsRead)
{
    MarkdownTableParser parser;
    const auto table = parser.parse(QStringLiteral(
        "|a|b|\n|---|---|\n|1|2|\n\ntext\n\n|c|d|e|\n|---|---|---|\n|3|4|5|\n"));
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->columnCount, 2);
    EXPECT_EQ(table->header, (QStringList{QStringLiteral("a"), QStringLiteral("b")}));
    ASSERT_EQ(table->rows.size(), 1);
}

// --- Pictures ---

TEST(PictureLoaderTest, DataUrls)
{
    QString mime;
    const auto decoded = PictureLoader::decodeDataUrl(QStringLiteral("data:image/png;base64,aGVsbG8="), &mime);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, QByteArrayLiteral("hello"));
    EXPECT_EQ(mime, QStringLiteral("image/png"));

    EXPECT_FALSE(PictureLoader::decodeDataUrl(QStringLiteral("https://x/y.png")).has_value());
    EXPECT_FALSE(PictureLoader::decodeDataUrl(QStringLiteral("data:image/png;base64,@@@")).has_value());
}

TEST(PictureLoaderTest, SvgDetection)
{
    EXPECT_TRUE(PictureLoader::isSvg(QByteArray(), QStringLiteral("image/svg+xml")));
    EXPECT_TRUE(PictureLoader::isSvg(svgBytes(), QString()));
    EXPECT_TRUE(PictureLoader::isSvg(QByteArrayLiteral("<?xml version=\"1.0\"?>\n<svg/>"), QString()));
    EXPECT_FALSE(PictureLoader::isSvg(pngBytes(2, 2), QStringLiteral("image/png")));
}

TEST(PictureLoaderTest, BorderAddsTwoPercent)
{
    QImage image(200, 100, QImage::Format_RGB32);
    image.fill(Qt::black);
    const QImage framed = PictureLoader::addBorder(image, Qt::white);
    EXPECT_EQ(framed.width(), 204);
    EXPECT_EQ(framed.height(), 104);
    EXPECT_EQ(framed.pixelColor(0, 0), QColor(Qt::white));
    EXPECT_EQ(framed.pixelColor(102, 52), QColor(Qt::black));
}

TEST(PictureLoaderTest, RasterBytesAreKept)
{
    const QByteArray png = pngBytes(30, 20);
    const auto loaded = PictureLoader::fromBytes(png, QStringLiteral("image/png"), QStringLiteral("ctx"),
                                                 PictureLoader::Frame::None, QColor());
    ASSERT_TRUE(std::holds_alternative<Docx::Picture>(loaded));
    const Docx::Picture &picture = std::get<Docx::Picture>(loaded);
    EXPECT_EQ(picture.data, png);
    EXPECT_EQ(picture.extension, QStringLiteral("png"));
    EXPECT_EQ(picture.pixelWidth, 30);
    EXPECT_EQ(picture.width, DocxUtils::pixelsToEmu(30, PictureLoader::NaturalDpi));
}

TEST(PictureLoaderTest, UndecodableBytes)
{
    const auto svg = PictureLoader::fromBytes(QByteArrayLiteral("<svg><g"), QStringLiteral("image/svg+xml"),
                                              QStringLiteral("logo"), PictureLoader::Frame::None, QColor());
    ASSERT_TRUE(std::holds_alternative<RenderError>(svg));
    EXPECT_EQ(std::get<RenderError>(svg).kind, RenderError::Kind::UnrecognizedImage);
    EXPECT_EQ(std::get<RenderError>(svg).context, QStringLiteral("logo"));

    const auto junk = PictureLoader::fromBytes(QByteArrayLiteral("\x01\x02\x03 junk"), QString(),
                                               QStringLiteral("junk"), PictureLoader::Frame::None, QColor());
    ASSERT_TRUE(std::holds_alternative<RenderError>(junk));
    EXPECT_EQ(std::get<RenderError>(junk).kind, RenderError::Kind::UnrecognizedImage);
}

TEST(PictureLoaderTest, SvgBecomesPng)
{
    const auto loaded = PictureLoader::fromBytes(svgBytes(), QString(), QStringLiteral("logo"),
                                                 PictureLoader::Frame::None, QColor());
    ASSERT_TRUE(std::holds_alternative<Docx::Picture>(loaded));
    const Docx::Picture &picture = std::get<Docx::Picture>(loaded);
    EXPECT_EQ(picture.extension, QStringLiteral("png"));
    EXPECT_EQ(picture.pixelWidth, 100);
    EXPECT_EQ(picture.pixelHeight, 50);

    QImage decoded;
    ASSERT_TRUE(decoded.loadFromData(picture.data, "PNG"));
    EXPECT_EQ(decoded.pixelColor(50, 25), QColor(0x34, 0xab, 0x76));
}

TEST(PictureLoaderTest, LoadWithoutFetcher)
{
    PictureLoader loader;
    const auto remote = loader.load(QStringLiteral("https://x/y.png"));
    ASSERT_TRUE(std::holds_alternative<RenderError>(remote));
    EXPECT_EQ(std::get<RenderError>(remote).kind, RenderError::Kind::ExternalService);

    const auto empty = loader.load(QString());
    ASSERT_TRUE(std::holds_alternative<RenderError>(empty));
    EXPECT_EQ(std::get<RenderError>(empty).kind, RenderError::Kind::Block);
}

TEST(PictureLoaderTest, FramedFetch)
{
    FakeBlobFetcher fetcher;
    fetcher.add(QStringLiteral("https://x/y.png"), pngBytes(50, 50));
    RenderSettings settings;
    PictureLoader loader(&fetcher, settings);

    const auto loaded = loader.load(QStringLiteral("https://x/y.png"), PictureLoader::Frame::Bordered);
    ASSERT_TRUE(std::holds_alternative<Docx::Picture>(loaded));
    EXPECT_EQ(std::get<Docx::Picture>(loaded).pixelWidth, 51);
    EXPECT_EQ(fetcher.requested, QStringList{QStringLiteral("https://x/y.png")});
}

// --- Fetching ---

TEST(CurlBlobFetcherTest, ReadsFileUrls)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("blob.bin"));
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write(QByteArrayLiteral("payload"));
    file.close();

    CurlBlobFetcher fetcher(5000);
    const Result<FetchedBlob> blob = fetcher.get(QUrl::fromLocalFile(path));
    ASSERT_TRUE(std::holds_alternative<FetchedBlob>(blob)) << std::get<RenderError>(blob).toString().toStdString();
    EXPECT_EQ(std::get<FetchedBlob>(blob).data, QByteArrayLiteral("payload"));
}

TEST(CurlBlobFetcherTest, MissingFileIsAnError)
{
    QTemporaryDir dir;
    CurlBlobFetcher fetcher(5000);
    const Result<FetchedBlob> blob = fetcher.get(QUrl::fromLocalFile(dir.filePath(QStringLiteral("absent"))));
    ASSERT_TRUE(std::holds_alternative<RenderError>(blob));
    EXPECT_EQ(std::get<RenderError>(blob).kind, RenderError::Kind::ExternalService);
}

// --- Object store ---

TEST(LocalObjectStoreTest, PutAndPresign)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    LocalObjectStore store(dir.path());

    const Result<QUrl> stored = store.put(QStringLiteral("bucket"), QStringLiteral("export/1/2/a.docx"),
                                          QByteArrayLiteral("data"), QStringLiteral("application/octet-stream"),
                                          QStringLiteral("private"));
    ASSERT_TRUE(std::holds_alternative<QUrl>(stored));
    EXPECT_TRUE(QFile::exists(store.pathFor(QStringLiteral("bucket"), QStringLiteral("export/1/2/a.docx"))));

    const Result<QUrl> url = store.presignedGet(QStringLiteral("bucket"), QStringLiteral("export/1/2/a.docx"), 900);
    ASSERT_TRUE(std::holds_alternative<QUrl>(url));
    const qint64 expires = QUrlQuery(std::get<QUrl>(url)).queryItemValue(QStringLiteral("Expires")).toLongLong();
    EXPECT_GT(expires, QDateTime::currentSecsSinceEpoch());

    EXPECT_TRUE(store.remove(QStringLiteral("bucket"), QStringLiteral("export/1/2/a.docx")));
    EXPECT_FALSE(QFile::exists(store.pathFor(QStringLiteral("bucket"), QStringLiteral("export/1/2/a.docx"))));
}

TEST(LocalObjectStoreTest, RejectsUnsafeKeys)
{
    QTemporaryDir dir;
    LocalObjectStore store(dir.path());
    for (const char *key : {"", "/abs", "a/../b", "a//b", "./a"}) {
        const Result<QUrl> stored = store.put(QStringLiteral("bucket"), QString::fromLatin1(key),
                                              QByteArrayLiteral("x"), QString(), QString());
        ASSERT_TRUE(std::holds_alternative<RenderError>(stored)) << key;
        EXPECT_EQ(std::get<RenderError>(stored).kind, RenderError::Kind::Storage);
    }
}

TEST(LocalObjectStoreTest, PresignMissingObject)
{
    QTemporaryDir dir;
    LocalObjectStore store(dir.path());
    const Result<QUrl> url = store.presignedGet(QStringLiteral("bucket"), QStringLiteral("none"), 900);
    ASSERT_TRUE(std::holds_alternative<RenderError>(url));
    EXPECT_EQ(std::get<RenderError>(url).kind, RenderError::Kind::Storage);
}

// --- Snippets ---

TEST(SnippetResolverTest, FromJson)
{
    const QJsonObject library = QJsonDocument::fromJson(R"({
        "articles": {"a1": {"blocks": [
            {"key": "k1", "type": "unstyled", "text": "one"},
            {"key": "k2", "type": "unstyled", "text": "two"},
            {"key": 3, "type": "unstyled", "text": "three"}
        ], "entity_map": {"0": {"type": "LINK", "data": {"href": "https://a"}}}}},
        "snippets": {"s1": {"article": "a1", "blocks": [3, "k1"]}}
    })").object();

    InMemorySnippetResolver resolver = InMemorySnippetResolver::fromJson(library);
    const Result<ResolvedSnippet> resolved = resolver.resolveSnippet(QStringLiteral("s1"));
    ASSERT_TRUE(std::holds_alternative<ResolvedSnippet>(resolved));

    const ResolvedSnippet &snippet = std::get<ResolvedSnippet>(resolved);
    EXPECT_EQ(snippet.sourceBlocks.size(), 3);
    const QList<Shelf::Block> included = snippet.includedBlocks();
    ASSERT_EQ(included.size(), 2);
    EXPECT_EQ(included.at(0).text, QStringLiteral("one"));
    EXPECT_EQ(included.at(1).text, QStringLiteral("three"));
    EXPECT_TRUE(snippet.entityMap.contains(QStringLiteral("0")));
}

TEST(SnippetResolverTest, LookupFailures)
{
    InMemorySnippetResolver resolver;
    resolver.addSnippet(QStringLiteral("orphan"), QStringLiteral("gone"), {QStringLiteral("k")});

    const auto unknown = resolver.resolveSnippet(QStringLiteral("nope"));
    ASSERT_TRUE(std::holds_alternative<RenderError>(unknown));
    EXPECT_EQ(std::get<RenderError>(unknown).kind, RenderError::Kind::ExternalService);

    const auto orphan = resolver.resolveSnippet(QStringLiteral("orphan"));
    ASSERT_TRUE(std::holds_alternative<RenderError>(orphan));
    EXPECT_TRUE(std::get<RenderError>(orphan).message.contains(QStringLiteral("gone")));
}
