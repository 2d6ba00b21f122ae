#include <gtest/gtest.h>

#include "shelfmodel.h"

#include <QJsonArray>
#include <QJsonDocument>

using namespace Shelf;

namespace {

QJsonObject parse(const char *json)
{
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

} // namespace

TEST(ShelfModelTest, BlockTypeNames)
{
    EXPECT_EQ(blockTypeFromString(QStringLiteral("header-two")), BlockType::HeaderTwo);
    EXPECT_EQ(blockTypeFromString(QStringLiteral("ordered-list-item")), BlockType::OrderedListItem);
    EXPECT_EQ(blockTypeFromString(QStringLiteral("gist-block")), BlockType::GistBlock);
    EXPECT_EQ(blockTypeFromString(QStringLiteral("atomic")), BlockType::Other);
    EXPECT_EQ(blockTypeName(BlockType::CodeBlock), QStringLiteral("code-block"));
    EXPECT_EQ(blockTypeName(BlockType::Other), QStringLiteral("other"));
}

TEST(ShelfModelTest, KeysAcceptNumbersAndStrings)
{
    EXPECT_EQ(keyString(QJsonValue(42)), QStringLiteral("42"));
    EXPECT_EQ(keyString(QJsonValue(QStringLiteral("a1b"))), QStringLiteral("a1b"));
    EXPECT_TRUE(keyString(QJsonValue()).isEmpty());
}

TEST(ShelfModelTest, BlockFromJson)
{
    const Block block = Block::fromJson(parse(R"({
        "key": "k1", "type": "unstyled", "text": "Hello world", "depth": 2,
        "inlineStyleRanges": [{"style": "BOLD", "offset": 0, "length": 5}],
        "entityRanges": [{"key": 7, "offset": 6, "length": 5}],
        "data": {"align": "left"}
    })"));

    EXPECT_EQ(block.type, BlockType::Unstyled);
    EXPECT_EQ(block.key, QStringLiteral("k1"));
    EXPECT_EQ(block.text, QStringLiteral("Hello world"));
    EXPECT_EQ(block.depth, 2);
    EXPECT_TRUE(block.hasDepth);
    ASSERT_EQ(block.inlineStyleRanges.size(), 1);
    EXPECT_EQ(block.inlineStyleRanges.first().style.name, QStringLiteral("BOLD"));
    EXPECT_EQ(block.inlineStyleRanges.first().length, 5);
    ASSERT_EQ(block.entityRanges.size(), 1);
    EXPECT_EQ(block.entityRanges.first().key, QStringLiteral("7"));
    EXPECT_EQ(block.data.value(QLatin1String("align")).toString(), QStringLiteral("left"));
}

TEST(ShelfModelTest, MissingDepthIsRemembered)
{
    const Block block = Block::fromJson(parse(R"({"type": "unordered-list-item", "text": "x"})"));
    EXPECT_FALSE(block.hasDepth);
    EXPECT_EQ(block.depth, 0);
}

TEST(ShelfModelTest, UnknownTypeKeepsItsName)
{
    const Block block = Block::fromJson(parse(R"({"type": "atomic", "text": "x"})"));
    EXPECT_EQ(block.type, BlockType::Other);
    EXPECT_EQ(block.typeName, QStringLiteral("atomic"));
}

TEST(ShelfModelTest, StyleTokenForms)
{
    const StyleToken named = StyleToken::fromJson(QJsonValue(QStringLiteral("ITALIC")));
    EXPECT_EQ(named.kind, StyleToken::Kind::Named);
    EXPECT_EQ(named.name, QStringLiteral("ITALIC"));

    const StyleToken link = StyleToken::fromJson(parse(R"({"link": "https://example.org"})"));
    EXPECT_EQ(link.kind, StyleToken::Kind::Link);
    EXPECT_EQ(link.href, QStringLiteral("https://example.org"));

    const StyleToken image = StyleToken::fromJson(
        parse(R"({"img": {"type": "IMG", "data": {"src": "https://x/y.png", "size": "32"}}})"));
    EXPECT_EQ(image.kind, StyleToken::Kind::Image);
    EXPECT_EQ(image.image.src, QStringLiteral("https://x/y.png"));
    EXPECT_EQ(image.image.size, 32);
}

TEST(ShelfModelTest, DocumentFromJson)
{
    const Document doc = Document::fromJson(parse(R"({
        "id": 12, "request_user_id": 5, "shelf_name": "Handbook",
        "books": [{"name": "Book A", "articles": [{
            "id": 3, "name": "First", "description": "About", "doc_version": 3,
            "meta": {"icon": "https://x/icon.png"},
            "entity_map": {"0": {"type": "LINK", "data": {"href": "https://a"}}},
            "blocks": [{"type": "unstyled", "text": "one"}, {"type": "cell", "text": "two"}]
        }]}]
    })"));

    EXPECT_EQ(doc.id, QStringLiteral("12"));
    EXPECT_EQ(doc.requestUserId, QStringLiteral("5"));
    EXPECT_EQ(doc.name, QStringLiteral("Handbook"));
    ASSERT_EQ(doc.books.size(), 1);
    ASSERT_EQ(doc.books.first().articles.size(), 1);

    const Article &article = doc.books.first().articles.first();
    EXPECT_EQ(article.id, QStringLiteral("3"));
    EXPECT_EQ(article.docVersion, 3);
    EXPECT_EQ(article.icon, QStringLiteral("https://x/icon.png"));
    ASSERT_TRUE(article.entityMap.contains(QStringLiteral("0")));
    EXPECT_EQ(article.entityMap.value(QStringLiteral("0")).type, QStringLiteral("LINK"));
    ASSERT_EQ(article.blocks.size(), 2);
    EXPECT_EQ(article.blocks.at(1).type, BlockType::Cell);
}

TEST(ShelfModelTest, DocVersionDefaultsToOne)
{
    const Article article = Article::fromJson(parse(R"({"name": "old"})"));
    EXPECT_EQ(article.docVersion, 1);
    EXPECT_TRUE(article.blocks.isEmpty());
}

TEST(ShelfModelTest, TerminalBlockIsEmptyUnstyled)
{
    const Block terminal = Block::terminal();
    EXPECT_EQ(terminal.type, BlockType::Unstyled);
    EXPECT_TRUE(terminal.text.isEmpty());
    EXPECT_EQ(terminal.depth, 0);
}
