#include "docxarchive.h"

#include <QDebug>

#include <miniz.h>

namespace Docx {

// --- ArchiveWriter ---

struct ArchiveWriter::Private {
    mz_zip_archive zip{};
    bool open = false;
};

ArchiveWriter::ArchiveWriter()
    : d(std::make_unique<Private>())
{
    if (mz_zip_writer_init_heap(&d->zip, 0, 64 * 1024))
        d->open = true;
    else
        qWarning() << "ArchiveWriter: failed to initialise zip writer";
}

ArchiveWriter::~ArchiveWriter()
{
    if (d->open)
        mz_zip_writer_end(&d->zip);
}

bool ArchiveWriter::addFile(const QString &path, const QByteArray &data)
{
    if (!d->open)
        return false;
    const QByteArray name = path.toUtf8();
    if (!mz_zip_writer_add_mem(&d->zip, name.constData(), data.constData(),
                               static_cast<size_t>(data.size()),
                               MZ_DEFAULT_COMPRESSION)) {
        qWarning() << "ArchiveWriter: failed to add" << path
                   << mz_zip_get_error_string(mz_zip_get_last_error(&d->zip));
        return false;
    }
    return true;
}

QByteArray ArchiveWriter::finish()
{
    if (!d->open)
        return {};

    void *buffer = nullptr;
    size_t size = 0;
    if (!mz_zip_writer_finalize_heap_archive(&d->zip, &buffer, &size)) {
        qWarning() << "ArchiveWriter: failed to finalize archive"
                   << mz_zip_get_error_string(mz_zip_get_last_error(&d->zip));
        mz_zip_writer_end(&d->zip);
        d->open = false;
        return {};
    }

    QByteArray result(static_cast<const char *>(buffer), static_cast<qsizetype>(size));
    mz_free(buffer);
    mz_zip_writer_end(&d->zip);
    d->open = false;
    return result;
}

// --- ArchiveReader ---

struct ArchiveReader::Private {
    mz_zip_archive zip{};
    QByteArray data;    // must outlive the reader state
    bool open = false;
};

ArchiveReader::ArchiveReader()
    : d(std::make_unique<Private>())
{
}

ArchiveReader::~ArchiveReader()
{
    if (d->open)
        mz_zip_reader_end(&d->zip);
}

bool ArchiveReader::open(const QByteArray &data)
{
    if (d->open) {
        mz_zip_reader_end(&d->zip);
        d->open = false;
    }
    d->zip = mz_zip_archive{};
    d->data = data;
    if (!mz_zip_reader_init_mem(&d->zip, d->data.constData(),
                                static_cast<size_t>(d->data.size()), 0)) {
        qWarning() << "ArchiveReader: not a zip archive"
                   << mz_zip_get_error_string(mz_zip_get_last_error(&d->zip));
        return false;
    }
    d->open = true;
    return true;
}

bool ArchiveReader::isOpen() const
{
    return d->open;
}

QStringList ArchiveReader::entries() const
{
    QStringList names;
    if (!d->open)
        return names;
    const mz_uint count = mz_zip_reader_get_num_files(&d->zip);
    for (mz_uint i = 0; i < count; ++i) {
        char name[512];
        if (mz_zip_reader_get_filename(&d->zip, i, name, sizeof(name)) > 0)
            names.append(QString::fromUtf8(name));
    }
    return names;
}

bool ArchiveReader::contains(const QString &path) const
{
    if (!d->open)
        return false;
    return mz_zip_reader_locate_file(&d->zip, path.toUtf8().constData(), nullptr, 0) >= 0;
}

std::optional<QByteArray> ArchiveReader::read(const QString &path) const
{
    if (!d->open)
        return std::nullopt;

    const int index = mz_zip_reader_locate_file(&d->zip, path.toUtf8().constData(),
                                                nullptr, 0);
    if (index < 0)
        return std::nullopt;

    size_t size = 0;
    void *buffer = mz_zip_reader_extract_to_heap(&d->zip, static_cast<mz_uint>(index),
                                                 &size, 0);
    if (!buffer) {
        qWarning() << "ArchiveReader: failed to extract" << path;
        return std::nullopt;
    }
    QByteArray result(static_cast<const char *>(buffer), static_cast<qsizetype>(size));
    mz_free(buffer);
    return result;
}

} // namespace Docx
