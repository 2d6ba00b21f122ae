/*
 * objectstore.h: Bucket/key storage for rendered documents
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_OBJECTSTORE_H
#define SHELFDOCX_OBJECTSTORE_H

#include "rendererror.h"

#include <QByteArray>
#include <QString>
#include <QUrl>

class ObjectStore
{
public:
    virtual ~ObjectStore() = default;

    virtual Result<QUrl> put(const QString &bucket, const QString &key,
                             const QByteArray &data, const QString &contentType,
                             const QString &acl) = 0;
    virtual Result<QUrl> presignedGet(const QString &bucket, const QString &key,
                                      int ttlSeconds) = 0;
    virtual bool remove(const QString &bucket, const QString &key) = 0;
};

// Stores objects as files under <root>/<bucket>/<key>. ACLs are not
// modelled; presigned URLs are file URLs carrying an expiry query item.
class LocalObjectStore : public ObjectStore
{
public:
    explicit LocalObjectStore(const QString &rootPath);

    Result<QUrl> put(const QString &bucket, const QString &key,
                     const QByteArray &data, const QString &contentType,
                     const QString &acl) override;
    Result<QUrl> presignedGet(const QString &bucket, const QString &key,
                              int ttlSeconds) override;
    bool remove(const QString &bucket, const QString &key) override;

    QString pathFor(const QString &bucket, const QString &key) const;

private:
    QString m_root;
};

#endif // SHELFDOCX_OBJECTSTORE_H
