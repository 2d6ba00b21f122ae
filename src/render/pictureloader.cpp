#include "pictureloader.h"
#include "blobfetcher.h"
#include "docxutils.h"

#include <QBuffer>
#include <QDebug>
#include <QImageReader>
#include <QPainter>
#include <QSvgRenderer>
#include <QUrl>

namespace {

RenderError imageError(RenderError::Kind kind, const QString &context, const QString &message)
{
    RenderError error;
    error.kind = kind;
    error.context = context;
    error.message = message;
    return error;
}

// Formats embedded as-is
bool isWordRasterFormat(const QByteArray &format)
{
    return format == "png" || format == "jpeg" || format == "jpg"
        || format == "gif" || format == "bmp";
}

} // namespace

PictureLoader::PictureLoader(BlobFetcher *fetcher, const RenderSettings &settings)
    : m_fetcher(fetcher)
    , m_settings(settings)
{
}

std::optional<QByteArray> PictureLoader::decodeDataUrl(const QString &url, QString *mimeType)
{
    if (!url.startsWith(QLatin1String("data:")))
        return std::nullopt;

    const int comma = url.indexOf(QLatin1Char(','));
    if (comma < 0)
        return std::nullopt;

    // data:image/png;base64,....
    const QString header = url.mid(5, comma - 5);
    const QStringList params = header.split(QLatin1Char(';'));
    if (mimeType)
        *mimeType = params.value(0);
    if (!params.contains(QLatin1String("base64")))
        return QUrl::fromPercentEncoding(url.mid(comma + 1).toUtf8()).toUtf8();

    auto decoded = QByteArray::fromBase64Encoding(url.mid(comma + 1).toLatin1(),
                                                  QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded)
        return std::nullopt;
    return *decoded;
}

bool PictureLoader::isSvg(const QByteArray &data, const QString &contentType)
{
    if (contentType.startsWith(QLatin1String("image/svg"), Qt::CaseInsensitive))
        return true;
    const QByteArray head = data.left(512).trimmed();
    return head.startsWith("<svg") || (head.startsWith("<?xml") && head.contains("<svg"));
}

QImage PictureLoader::addBorder(const QImage &image, const QColor &color)
{
    const int border = image.width() / 50;
    QImage canvas(image.width() + border, image.height() + border, QImage::Format_RGB32);
    canvas.fill(color);

    QPainter painter(&canvas);
    painter.drawImage((canvas.width() - image.width()) / 2,
                      (canvas.height() - image.height()) / 2, image);
    painter.end();
    return canvas;
}

QImage PictureLoader::rasterizeSvg(const QByteArray &data)
{
    QSvgRenderer renderer(data);
    if (!renderer.isValid()) {
        qWarning() << "PictureLoader: invalid SVG document";
        return {};
    }

    const QSize size = renderer.defaultSize();
    if (size.isEmpty()) {
        qWarning() << "PictureLoader: SVG without a size";
        return {};
    }

    QImage image(size, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);
    QPainter painter(&image);
    renderer.render(&painter);
    painter.end();
    return image;
}

Result<Docx::Picture> PictureLoader::fromBytes(const QByteArray &data, const QString &contentType,
                                               const QString &context, Frame frame,
                                               const QColor &borderColor)
{
    QByteArray format;
    QImage image;
    if (isSvg(data, contentType)) {
        // Word gets a PNG rendition
        image = rasterizeSvg(data);
        if (image.isNull())
            return imageError(RenderError::Kind::UnrecognizedImage, context,
                              QStringLiteral("cannot render SVG image"));
        format = "svg";
    } else {
        QBuffer buffer;
        buffer.setData(data);
        buffer.open(QIODevice::ReadOnly);
        QImageReader reader(&buffer);
        format = reader.format().toLower();
        image = reader.read();
        if (image.isNull())
            return imageError(RenderError::Kind::UnrecognizedImage, context,
                              QStringLiteral("cannot decode image: %1").arg(reader.errorString()));
    }

    Docx::Picture picture;
    picture.data = data;
    picture.extension = QString::fromLatin1(format == "jpg" ? QByteArray("jpeg") : format);

    const bool keepFormat = isWordRasterFormat(format);
    if (frame == Frame::Bordered || !keepFormat) {
        if (frame == Frame::Bordered)
            image = addBorder(image, borderColor);

        // Qt ships no GIF writer
        QByteArray outFormat = keepFormat && format != "gif" ? format : QByteArray("png");
        QByteArray encoded;
        QBuffer out(&encoded);
        out.open(QIODevice::WriteOnly);
        if (!image.save(&out, outFormat.constData())) {
            outFormat = "png";
            encoded.clear();
            out.seek(0);
            if (!image.save(&out, "png"))
                return imageError(RenderError::Kind::UnrecognizedImage, context,
                                  QStringLiteral("cannot re-encode image"));
        }
        picture.data = encoded;
        picture.extension = QString::fromLatin1(outFormat == "jpg" ? QByteArray("jpeg") : outFormat);
    }

    picture.pixelWidth = image.width();
    picture.pixelHeight = image.height();
    picture.width = DocxUtils::pixelsToEmu(image.width(), NaturalDpi);
    picture.height = DocxUtils::pixelsToEmu(image.height(), NaturalDpi);
    return picture;
}

Result<Docx::Picture> PictureLoader::load(const QString &source, Frame frame)
{
    if (source.isEmpty())
        return imageError(RenderError::Kind::Block, source, QStringLiteral("empty image source"));

    if (source.startsWith(QLatin1String("data:"))) {
        QString mimeType;
        const auto data = decodeDataUrl(source, &mimeType);
        if (!data)
            return imageError(RenderError::Kind::UnrecognizedImage, source.left(64),
                              QStringLiteral("malformed data URL"));
        // Inline data is embedded without a frame
        return fromBytes(*data, mimeType, source.left(64), Frame::None, QColor());
    }

    if (!m_fetcher)
        return imageError(RenderError::Kind::ExternalService, source,
                          QStringLiteral("no fetcher configured"));

    auto fetched = m_fetcher->get(QUrl(source));
    if (auto *error = std::get_if<RenderError>(&fetched))
        return *error;

    const FetchedBlob &blob = std::get<FetchedBlob>(fetched);
    return fromBytes(blob.data, blob.contentType, source, frame, m_settings.imageBorderColor);
}
