#include "objectstore.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QUrlQuery>

namespace {

RenderError storageError(const QString &context, const QString &message)
{
    RenderError error;
    error.kind = RenderError::Kind::Storage;
    error.context = context;
    error.message = message;
    return error;
}

// Keys are relative paths; reject anything that would leave the bucket
bool isSafeKey(const QString &key)
{
    if (key.isEmpty() || key.startsWith(QLatin1Char('/')))
        return false;
    const QStringList parts = key.split(QLatin1Char('/'));
    for (const auto &part : parts) {
        if (part.isEmpty() || part == QLatin1String("..") || part == QLatin1String("."))
            return false;
    }
    return true;
}

} // namespace

LocalObjectStore::LocalObjectStore(const QString &rootPath)
    : m_root(rootPath)
{
}

QString LocalObjectStore::pathFor(const QString &bucket, const QString &key) const
{
    return QDir(m_root).filePath(bucket + QLatin1Char('/') + key);
}

Result<QUrl> LocalObjectStore::put(const QString &bucket, const QString &key,
                                   const QByteArray &data, const QString &contentType,
                                   const QString &acl)
{
    Q_UNUSED(acl)
    const QString context = bucket + QLatin1Char('/') + key;
    if (bucket.isEmpty() || !isSafeKey(key))
        return storageError(context, QStringLiteral("invalid bucket or key"));

    const QString path = pathFor(bucket, key);
    if (!QDir().mkpath(QFileInfo(path).absolutePath()))
        return storageError(context, QStringLiteral("cannot create directory"));

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        return storageError(context, file.errorString());
    if (file.write(data) != data.size() || !file.commit())
        return storageError(context, file.errorString());

    qDebug() << "LocalObjectStore: stored" << data.size() << "bytes as" << context
             << "(" << contentType << ")";
    return QUrl::fromLocalFile(QFileInfo(path).absoluteFilePath());
}

Result<QUrl> LocalObjectStore::presignedGet(const QString &bucket, const QString &key,
                                            int ttlSeconds)
{
    const QString context = bucket + QLatin1Char('/') + key;
    if (bucket.isEmpty() || !isSafeKey(key))
        return storageError(context, QStringLiteral("invalid bucket or key"));

    const QString path = pathFor(bucket, key);
    if (!QFile::exists(path))
        return storageError(context, QStringLiteral("no such object"));

    QUrl url = QUrl::fromLocalFile(QFileInfo(path).absoluteFilePath());
    QUrlQuery query;
    const qint64 expires = QDateTime::currentSecsSinceEpoch() + ttlSeconds;
    query.addQueryItem(QStringLiteral("Expires"), QString::number(expires));
    url.setQuery(query);
    return url;
}

bool LocalObjectStore::remove(const QString &bucket, const QString &key)
{
    if (bucket.isEmpty() || !isSafeKey(key))
        return false;
    return QFile::remove(pathFor(bucket, key));
}
