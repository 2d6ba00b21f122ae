/*
 * shelfmodel.h: Shelf input model (books, articles, flat block stream)
 *
 * Mirrors the JSON produced by the editor: every article is a flat,
 * key-ordered list of blocks with inline style ranges and entity
 * references. Nesting (tables, dictionaries, lists) is only implied by
 * block adjacency and the per-block depth value.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_SHELFMODEL_H
#define SHELFDOCX_SHELFMODEL_H

#include <QHash>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>

namespace Shelf {

// --- Block types ---

enum class BlockType {
    Unstyled,
    HeaderTwo,
    HeaderThree,
    HeaderStep,
    OrderedListItem,
    UnorderedListItem,
    Figure,
    MdTable,
    Dictionary,
    Cell,
    Blockquote,
    CodeBlock,
    Video,
    GistBlock,
    Snippet,
    Other
};

BlockType blockTypeFromString(const QString &name);
QString blockTypeName(BlockType type);

// Entity and block keys arrive either as strings or as numbers
QString keyString(const QJsonValue &value);

// --- Entities ---

struct Entity {
    QString type;       // "LINK", "IMG", ...
    QJsonObject data;   // href / src / size / style
};

using EntityMap = QHash<QString, Entity>;

struct EntityRange {
    QString key;
    int offset = 0;
    int length = 0;
};

// --- Inline styles ---

struct ImageDescriptor {
    QString src;
    int size = 0;   // pixels, square
};

struct StyleToken {
    enum class Kind { Named, Link, Image };

    Kind kind = Kind::Named;
    QString name;           // BOLD, ITALIC, CODE, header-step, ...
    QString href;           // Link
    ImageDescriptor image;  // Image

    static StyleToken named(const QString &name);
    static StyleToken link(const QString &href);
    static StyleToken image(const ImageDescriptor &image);
    static StyleToken fromJson(const QJsonValue &value);
};

struct StyleRange {
    StyleToken style;
    int offset = 0;
    int length = 0;
};

// --- Blocks ---

struct Block {
    BlockType type = BlockType::Unstyled;
    QString typeName = QStringLiteral("unstyled");
    QString key;
    QString text;
    int depth = 0;
    bool hasDepth = false;
    int offset = 0;
    int length = 0;
    QList<EntityRange> entityRanges;
    QList<StyleRange> inlineStyleRanges;
    QJsonObject data;

    static Block fromJson(const QJsonObject &obj);

    // Empty trailing paragraph appended to every article so that open
    // tables and dictionaries are closed before the page break.
    static Block terminal();
};

// --- Containers ---

struct Article {
    QString id;
    QString name;
    QString description;
    QString icon;
    int docVersion = 1;
    EntityMap entityMap;
    QList<Block> blocks;

    static Article fromJson(const QJsonObject &obj);
};

struct Book {
    QString name;
    QList<Article> articles;

    static Book fromJson(const QJsonObject &obj);
};

struct Document {
    QString id;
    QString requestUserId;
    QString name;
    QList<Book> books;

    static Document fromJson(const QJsonObject &obj);
};

} // namespace Shelf

#endif // SHELFDOCX_SHELFMODEL_H
