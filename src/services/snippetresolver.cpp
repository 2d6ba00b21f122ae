#include "snippetresolver.h"

#include <QJsonArray>

namespace {

RenderError lookupError(const QString &context, const QString &message)
{
    RenderError error;
    error.kind = RenderError::Kind::ExternalService;
    error.context = context;
    error.message = message;
    return error;
}

} // namespace

QList<Shelf::Block> ResolvedSnippet::includedBlocks() const
{
    QList<Shelf::Block> blocks;
    for (const auto &block : sourceBlocks) {
        if (includedKeys.contains(block.key))
            blocks.append(block);
    }
    return blocks;
}

void InMemorySnippetResolver::addArticle(const QString &articleId, const Shelf::Article &article)
{
    m_articles.insert(articleId, article);
}

void InMemorySnippetResolver::addSnippet(const QString &snippetId, const QString &articleId,
                                         const QStringList &blockKeys)
{
    SnippetRecord record;
    record.articleId = articleId;
    for (const auto &key : blockKeys)
        record.keys.insert(key);
    m_snippets.insert(snippetId, record);
}

Result<ResolvedSnippet> InMemorySnippetResolver::resolveSnippet(const QString &snippetId)
{
    auto snippet = m_snippets.constFind(snippetId);
    if (snippet == m_snippets.constEnd())
        return lookupError(snippetId, QStringLiteral("unknown snippet"));

    auto article = m_articles.constFind(snippet->articleId);
    if (article == m_articles.constEnd())
        return lookupError(snippetId,
                           QStringLiteral("source article %1 not found").arg(snippet->articleId));

    ResolvedSnippet resolved;
    resolved.sourceBlocks = article->blocks;
    resolved.includedKeys = snippet->keys;
    resolved.entityMap = article->entityMap;
    return resolved;
}

InMemorySnippetResolver InMemorySnippetResolver::fromJson(const QJsonObject &library)
{
    InMemorySnippetResolver resolver;

    const QJsonObject articles = library.value(QLatin1String("articles")).toObject();
    for (auto it = articles.constBegin(); it != articles.constEnd(); ++it) {
        Shelf::Article article = Shelf::Article::fromJson(it.value().toObject());
        article.id = it.key();
        resolver.addArticle(it.key(), article);
    }

    const QJsonObject snippets = library.value(QLatin1String("snippets")).toObject();
    for (auto it = snippets.constBegin(); it != snippets.constEnd(); ++it) {
        const QJsonObject obj = it.value().toObject();
        QStringList keys;
        const QJsonArray blockKeys = obj.value(QLatin1String("blocks")).toArray();
        for (const auto &key : blockKeys)
            keys.append(Shelf::keyString(key));
        resolver.addSnippet(it.key(), Shelf::keyString(obj.value(QLatin1String("article"))), keys);
    }

    return resolver;
}
