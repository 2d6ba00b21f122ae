#include "shelfmodel.h"

#include <QJsonArray>
#include <QVariant>

namespace Shelf {

namespace {

struct TypeName {
    BlockType type;
    const char *name;
};

constexpr TypeName kTypeNames[] = {
    {BlockType::Unstyled, "unstyled"},
    {BlockType::HeaderTwo, "header-two"},
    {BlockType::HeaderThree, "header-three"},
    {BlockType::HeaderStep, "header-step"},
    {BlockType::OrderedListItem, "ordered-list-item"},
    {BlockType::UnorderedListItem, "unordered-list-item"},
    {BlockType::Figure, "figure"},
    {BlockType::MdTable, "mdtable"},
    {BlockType::Dictionary, "dictionary"},
    {BlockType::Cell, "cell"},
    {BlockType::Blockquote, "blockquote"},
    {BlockType::CodeBlock, "code-block"},
    {BlockType::Video, "video"},
    {BlockType::GistBlock, "gist-block"},
    {BlockType::Snippet, "snippet"},
};

int intValue(const QJsonValue &value, int fallback = 0)
{
    if (value.isUndefined() || value.isNull())
        return fallback;
    bool ok = false;
    const int result = value.toVariant().toInt(&ok);
    return ok ? result : fallback;
}

ImageDescriptor imageFromEntityData(const QJsonObject &data)
{
    ImageDescriptor image;
    image.src = data.value(QLatin1String("src")).toString();
    image.size = intValue(data.value(QLatin1String("size")));
    return image;
}

} // namespace

BlockType blockTypeFromString(const QString &name)
{
    for (const auto &entry : kTypeNames) {
        if (name == QLatin1String(entry.name))
            return entry.type;
    }
    return BlockType::Other;
}

QString blockTypeName(BlockType type)
{
    for (const auto &entry : kTypeNames) {
        if (entry.type == type)
            return QString::fromLatin1(entry.name);
    }
    return QStringLiteral("other");
}

QString keyString(const QJsonValue &value)
{
    if (value.isString())
        return value.toString();
    if (value.isDouble())
        return QString::number(static_cast<qint64>(value.toDouble()));
    return {};
}

// --- StyleToken ---

StyleToken StyleToken::named(const QString &name)
{
    StyleToken token;
    token.kind = Kind::Named;
    token.name = name;
    return token;
}

StyleToken StyleToken::link(const QString &href)
{
    StyleToken token;
    token.kind = Kind::Link;
    token.name = QStringLiteral("LINK");
    token.href = href;
    return token;
}

StyleToken StyleToken::image(const ImageDescriptor &image)
{
    StyleToken token;
    token.kind = Kind::Image;
    token.name = QStringLiteral("IMG");
    token.image = image;
    return token;
}

StyleToken StyleToken::fromJson(const QJsonValue &value)
{
    if (value.isObject()) {
        const QJsonObject obj = value.toObject();
        if (obj.contains(QLatin1String("link")))
            return link(obj.value(QLatin1String("link")).toString());
        if (obj.contains(QLatin1String("img"))) {
            // {"img": entity} where entity is {type, data}
            const QJsonObject entity = obj.value(QLatin1String("img")).toObject();
            const QJsonObject data = entity.contains(QLatin1String("data"))
                ? entity.value(QLatin1String("data")).toObject()
                : entity;
            return image(imageFromEntityData(data));
        }
        return named(QString());
    }
    return named(value.toString());
}

// --- Block ---

Block Block::fromJson(const QJsonObject &obj)
{
    Block block;
    block.typeName = obj.value(QLatin1String("type")).toString(QStringLiteral("unstyled"));
    block.type = blockTypeFromString(block.typeName);
    block.key = keyString(obj.value(QLatin1String("key")));
    block.text = obj.value(QLatin1String("text")).toString();
    block.hasDepth = obj.contains(QLatin1String("depth"));
    block.depth = intValue(obj.value(QLatin1String("depth")));
    block.offset = intValue(obj.value(QLatin1String("offset")));
    block.length = intValue(obj.value(QLatin1String("length")));
    block.data = obj.value(QLatin1String("data")).toObject();

    const QJsonArray entities = obj.value(QLatin1String("entityRanges")).toArray();
    for (const auto &v : entities) {
        const QJsonObject e = v.toObject();
        EntityRange range;
        range.key = keyString(e.value(QLatin1String("key")));
        range.offset = intValue(e.value(QLatin1String("offset")));
        range.length = intValue(e.value(QLatin1String("length")));
        block.entityRanges.append(range);
    }

    const QJsonArray styles = obj.value(QLatin1String("inlineStyleRanges")).toArray();
    for (const auto &v : styles) {
        const QJsonObject s = v.toObject();
        StyleRange range;
        range.style = StyleToken::fromJson(s.value(QLatin1String("style")));
        range.offset = intValue(s.value(QLatin1String("offset")));
        range.length = intValue(s.value(QLatin1String("length")));
        block.inlineStyleRanges.append(range);
    }

    return block;
}

Block Block::terminal()
{
    Block block;
    block.type = BlockType::Unstyled;
    block.typeName = QStringLiteral("unstyled");
    return block;
}

// --- Containers ---

Article Article::fromJson(const QJsonObject &obj)
{
    Article article;
    article.id = keyString(obj.value(QLatin1String("id")));
    article.name = obj.value(QLatin1String("name")).toString();
    article.description = obj.value(QLatin1String("description")).toString();
    article.icon = obj.value(QLatin1String("meta")).toObject()
                       .value(QLatin1String("icon")).toString();
    article.docVersion = intValue(obj.value(QLatin1String("doc_version")), 1);

    const QJsonObject entities = obj.value(QLatin1String("entity_map")).toObject();
    for (auto it = entities.constBegin(); it != entities.constEnd(); ++it) {
        const QJsonObject e = it.value().toObject();
        Entity entity;
        entity.type = e.value(QLatin1String("type")).toString();
        entity.data = e.value(QLatin1String("data")).toObject();
        article.entityMap.insert(it.key(), entity);
    }

    const QJsonArray blocks = obj.value(QLatin1String("blocks")).toArray();
    article.blocks.reserve(blocks.size());
    for (const auto &v : blocks)
        article.blocks.append(Block::fromJson(v.toObject()));

    return article;
}

Book Book::fromJson(const QJsonObject &obj)
{
    Book book;
    book.name = obj.value(QLatin1String("name")).toString();
    const QJsonArray articles = obj.value(QLatin1String("articles")).toArray();
    for (const auto &v : articles)
        book.articles.append(Article::fromJson(v.toObject()));
    return book;
}

Document Document::fromJson(const QJsonObject &obj)
{
    Document doc;
    doc.id = keyString(obj.value(QLatin1String("id")));
    doc.requestUserId = keyString(obj.value(QLatin1String("request_user_id")));
    doc.name = obj.value(QLatin1String("shelf_name")).toString();
    const QJsonArray books = obj.value(QLatin1String("books")).toArray();
    for (const auto &v : books)
        doc.books.append(Book::fromJson(v.toObject()));
    return doc;
}

} // namespace Shelf
