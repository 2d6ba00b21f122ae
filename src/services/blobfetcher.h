/*
 * blobfetcher.h: Fetches remote resources (images, video metadata)
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_BLOBFETCHER_H
#define SHELFDOCX_BLOBFETCHER_H

#include "rendererror.h"

#include <QByteArray>
#include <QString>
#include <QUrl>

struct FetchedBlob {
    QByteArray data;
    QString contentType;    // as reported by the server, may be empty
};

class BlobFetcher
{
public:
    virtual ~BlobFetcher() = default;

    virtual Result<FetchedBlob> get(const QUrl &url) = 0;
};

// libcurl-backed fetcher; follows redirects, HTTP status >= 400 is an error
class CurlBlobFetcher : public BlobFetcher
{
public:
    explicit CurlBlobFetcher(int timeoutMs = 30000);

    Result<FetchedBlob> get(const QUrl &url) override;

private:
    int m_timeoutMs;
};

#endif // SHELFDOCX_BLOBFETCHER_H
