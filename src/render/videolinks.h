/*
 * videolinks.h: Video provider URL recognition and thumbnail lookup
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_VIDEOLINKS_H
#define SHELFDOCX_VIDEOLINKS_H

#include "rendererror.h"

#include <QByteArray>
#include <QString>
#include <QUrl>

class BlobFetcher;

namespace VideoLinks {

enum class Provider { None, YouTube, Vimeo };

Provider providerFor(const QString &url);

// Empty when the URL carries no recognizable video id
QString youTubeId(const QString &url);
QString vimeoId(const QString &url);

QUrl youTubeThumbnail(const QString &videoId);
QUrl vimeoMetadataUrl(const QString &videoId);

// thumbnail_large of the first entry of a Vimeo v2 metadata response
QUrl vimeoThumbnailFromMetadata(const QByteArray &json);

// Thumbnail URL for a recognized provider. Vimeo needs a metadata fetch.
Result<QUrl> thumbnailFor(const QString &url, BlobFetcher &fetcher);

} // namespace VideoLinks

#endif // SHELFDOCX_VIDEOLINKS_H
