/*
 * pictureloader.h: Image source -> embeddable Docx::Picture
 *
 * Sources are data: URLs or remote URLs fetched through a BlobFetcher.
 * Decoding and re-encoding go through QImage; SVG is rendered with
 * QSvgRenderer at its default size and embedded as PNG. Framed pictures
 * are placed on a canvas grown by width/50 pixels and filled with the
 * border colour.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_PICTURELOADER_H
#define SHELFDOCX_PICTURELOADER_H

#include "docxdocument.h"
#include "rendererror.h"
#include "rendersettings.h"

#include <QByteArray>
#include <QColor>
#include <QImage>
#include <QString>

#include <optional>

class BlobFetcher;

class PictureLoader
{
public:
    enum class Frame { None, Bordered };

    // Density assumed for the natural size of a picture
    static constexpr qreal NaturalDpi = 72.0;

    explicit PictureLoader(BlobFetcher *fetcher = nullptr,
                           const RenderSettings &settings = RenderSettings());

    // Natural size at NaturalDpi, not yet scaled to the page
    Result<Docx::Picture> load(const QString &source, Frame frame = Frame::None);

    // Decoded payload of a base64 data: URL; mimeType receives the media type
    static std::optional<QByteArray> decodeDataUrl(const QString &url, QString *mimeType = nullptr);

    static bool isSvg(const QByteArray &data, const QString &contentType);

    // Null image when the document is invalid or has no size
    static QImage rasterizeSvg(const QByteArray &data);

    static QImage addBorder(const QImage &image, const QColor &color);

    // Image bytes -> picture; re-encodes when framed or when Word cannot
    // show the source format
    static Result<Docx::Picture> fromBytes(const QByteArray &data, const QString &contentType,
                                           const QString &context, Frame frame,
                                           const QColor &borderColor);

private:
    BlobFetcher *m_fetcher;
    RenderSettings m_settings;
};

#endif // SHELFDOCX_PICTURELOADER_H
