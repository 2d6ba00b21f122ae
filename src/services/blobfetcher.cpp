#include "blobfetcher.h"

#include <QDebug>

#include <curl/curl.h>

namespace {

size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userdata)
{
    const size_t total = size * nmemb;
    auto *buffer = static_cast<QByteArray *>(userdata);
    buffer->append(static_cast<const char *>(contents), static_cast<qsizetype>(total));
    return total;
}

bool initCurl()
{
    static const bool initialized = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    return initialized;
}

RenderError fetchError(const QUrl &url, const QString &message)
{
    RenderError error;
    error.kind = RenderError::Kind::ExternalService;
    error.context = url.toString();
    error.message = message;
    return error;
}

} // namespace

CurlBlobFetcher::CurlBlobFetcher(int timeoutMs)
    : m_timeoutMs(timeoutMs)
{
}

Result<FetchedBlob> CurlBlobFetcher::get(const QUrl &url)
{
    if (!url.isValid() || url.scheme().isEmpty())
        return fetchError(url, QStringLiteral("invalid URL"));

    if (!initCurl())
        return fetchError(url, QStringLiteral("failed to initialize libcurl"));

    CURL *curl = curl_easy_init();
    if (!curl)
        return fetchError(url, QStringLiteral("failed to create curl handle"));

    const QByteArray encoded = url.toEncoded();
    QByteArray body;

    curl_easy_setopt(curl, CURLOPT_URL, encoded.constData());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(m_timeoutMs));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(m_timeoutMs));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "ShelfDocx/1.0");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    const CURLcode res = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    char *contentType = nullptr;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &contentType);

    FetchedBlob blob;
    if (contentType)
        blob.contentType = QString::fromLatin1(contentType);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        qWarning() << "CurlBlobFetcher: fetch failed" << url << curl_easy_strerror(res);
        return fetchError(url, QString::fromUtf8(curl_easy_strerror(res)));
    }
    if (status >= 400) {
        qWarning() << "CurlBlobFetcher: HTTP" << status << url;
        return fetchError(url, QStringLiteral("HTTP %1").arg(status));
    }

    qDebug() << "CurlBlobFetcher: fetched" << body.size() << "bytes from" << url;
    blob.data = body;
    return blob;
}
