/*
 * docxarchive.h: Zip container for OOXML packages (miniz)
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_DOCXARCHIVE_H
#define SHELFDOCX_DOCXARCHIVE_H

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <memory>
#include <optional>

namespace Docx {

class ArchiveWriter
{
public:
    ArchiveWriter();
    ~ArchiveWriter();

    ArchiveWriter(const ArchiveWriter &) = delete;
    ArchiveWriter &operator=(const ArchiveWriter &) = delete;

    bool addFile(const QString &path, const QByteArray &data);

    // Finalizes the central directory; empty on failure
    QByteArray finish();

private:
    struct Private;
    std::unique_ptr<Private> d;
};

class ArchiveReader
{
public:
    ArchiveReader();
    ~ArchiveReader();

    ArchiveReader(const ArchiveReader &) = delete;
    ArchiveReader &operator=(const ArchiveReader &) = delete;

    bool open(const QByteArray &data);
    bool isOpen() const;

    QStringList entries() const;
    bool contains(const QString &path) const;
    std::optional<QByteArray> read(const QString &path) const;

private:
    struct Private;
    std::unique_ptr<Private> d;
};

} // namespace Docx

#endif // SHELFDOCX_DOCXARCHIVE_H
