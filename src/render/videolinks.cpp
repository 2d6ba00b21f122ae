#include "videolinks.h"
#include "blobfetcher.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QUrlQuery>

namespace VideoLinks {

namespace {

RenderError videoError(const QString &context, const QString &message)
{
    RenderError error;
    error.kind = RenderError::Kind::ExternalService;
    error.context = context;
    error.message = message;
    return error;
}

} // namespace

Provider providerFor(const QString &url)
{
    if (!youTubeId(url).isEmpty())
        return Provider::YouTube;
    if (!vimeoId(url).isEmpty())
        return Provider::Vimeo;
    return Provider::None;
}

QString youTubeId(const QString &url)
{
    const QUrl parsed(url);
    const QString host = parsed.host().toLower();
    const QString path = parsed.path();

    if (host == QLatin1String("youtu.be"))
        return path.mid(1).section(QLatin1Char('/'), 0, 0);

    if (host == QLatin1String("www.youtube.com") || host == QLatin1String("youtube.com")
        || host == QLatin1String("m.youtube.com")) {
        if (path == QLatin1String("/watch"))
            return QUrlQuery(parsed).queryItemValue(QStringLiteral("v"));
        if (path.startsWith(QLatin1String("/embed/")))
            return path.section(QLatin1Char('/'), 2, 2);
        if (path.startsWith(QLatin1String("/v/")))
            return path.section(QLatin1Char('/'), 2, 2);
    }
    return {};
}

QString vimeoId(const QString &url)
{
    static const QRegularExpression re(QStringLiteral(
        "https?://(?:www\\.|player\\.)?vimeo\\.com/"
        "(?:channels/(?:\\w+/)?|groups/([^/]*)/videos/|album/(\\d+)/video/|video/|)"
        "(\\d+)(?:$|/|\\?)"));
    const QRegularExpressionMatch match = re.match(url);
    if (!match.hasMatch())
        return {};
    return match.captured(3);
}

QUrl youTubeThumbnail(const QString &videoId)
{
    return QUrl(QStringLiteral("https://img.youtube.com/vi/%1/sddefault.jpg").arg(videoId));
}

QUrl vimeoMetadataUrl(const QString &videoId)
{
    return QUrl(QStringLiteral("http://vimeo.com/api/v2/video/%1.json").arg(videoId));
}

QUrl vimeoThumbnailFromMetadata(const QByteArray &json)
{
    const QJsonDocument doc = QJsonDocument::fromJson(json);
    const QJsonArray entries = doc.array();
    if (entries.isEmpty())
        return {};
    return QUrl(entries.first().toObject().value(QLatin1String("thumbnail_large")).toString());
}

Result<QUrl> thumbnailFor(const QString &url, BlobFetcher &fetcher)
{
    const QString youTube = youTubeId(url);
    if (!youTube.isEmpty())
        return youTubeThumbnail(youTube);

    const QString vimeo = vimeoId(url);
    if (vimeo.isEmpty())
        return videoError(url, QStringLiteral("unrecognized video provider"));

    auto metadata = fetcher.get(vimeoMetadataUrl(vimeo));
    if (auto *error = std::get_if<RenderError>(&metadata))
        return *error;

    const QUrl thumbnail = vimeoThumbnailFromMetadata(std::get<FetchedBlob>(metadata).data);
    if (!thumbnail.isValid() || thumbnail.isEmpty())
        return videoError(url, QStringLiteral("no thumbnail in Vimeo metadata"));
    return thumbnail;
}

} // namespace VideoLinks
