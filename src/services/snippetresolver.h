/*
 * snippetresolver.h: Resolves snippet blocks to the blocks they include
 *
 * A snippet references a source article and a subset of its block keys.
 * The driver splices the source blocks whose key is included, in source
 * order, in place of the snippet block.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_SNIPPETRESOLVER_H
#define SHELFDOCX_SNIPPETRESOLVER_H

#include "rendererror.h"
#include "shelfmodel.h"

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>

struct ResolvedSnippet {
    QList<Shelf::Block> sourceBlocks;   // every block of the source article
    QSet<QString> includedKeys;
    Shelf::EntityMap entityMap;         // entities of the source article

    // Source blocks whose key is included, in source order
    QList<Shelf::Block> includedBlocks() const;
};

class SnippetResolver
{
public:
    virtual ~SnippetResolver() = default;

    virtual Result<ResolvedSnippet> resolveSnippet(const QString &snippetId) = 0;
};

class InMemorySnippetResolver : public SnippetResolver
{
public:
    void addArticle(const QString &articleId, const Shelf::Article &article);
    void addSnippet(const QString &snippetId, const QString &articleId,
                    const QStringList &blockKeys);

    Result<ResolvedSnippet> resolveSnippet(const QString &snippetId) override;

    // {"snippets": {id: {"article": id, "blocks": [keys]}},
    //  "articles": {id: {"blocks": [...], "entity_map": {...}}}}
    static InMemorySnippetResolver fromJson(const QJsonObject &library);

private:
    struct SnippetRecord {
        QString articleId;
        QSet<QString> keys;
    };

    QHash<QString, Shelf::Article> m_articles;
    QHash<QString, SnippetRecord> m_snippets;
};

#endif // SHELFDOCX_SNIPPETRESOLVER_H
