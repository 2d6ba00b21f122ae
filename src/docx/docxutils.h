/*
 * docxutils.h: Unit conversions and escaping shared by the DOCX writer
 * and the renderer
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_DOCXUTILS_H
#define SHELFDOCX_DOCXUTILS_H

#include <QColor>
#include <QString>
#include <QtMath>

namespace DocxUtils {

constexpr qint64 kEmuPerInch = 914400;
constexpr qint64 kEmuPerCm = 360000;
constexpr int kTwipsPerInch = 1440;

/// Convert inches to twips (dxa), the unit of table and indent widths.
inline int inchesToTwips(qreal inches)
{
    return qRound(inches * kTwipsPerInch);
}

/// Convert points to half-points (w:sz).
inline int toHalfPoints(qreal points)
{
    return qRound(points * 2.0);
}

inline qint64 inchesToEmu(qreal inches)
{
    return qRound64(inches * kEmuPerInch);
}

inline qint64 cmToEmu(qreal cm)
{
    return qRound64(cm * kEmuPerCm);
}

/// Convert a pixel extent at the given density to EMU.
inline qint64 pixelsToEmu(int pixels, qreal dpi)
{
    if (dpi <= 0)
        dpi = 72.0;
    return qRound64(pixels * kEmuPerInch / dpi);
}

/// "RRGGBB" as used by w:color and w:shd.
inline QString hexColor(const QColor &color)
{
    if (!color.isValid())
        return QStringLiteral("auto");
    return color.name(QColor::HexRgb).mid(1).toUpper();
}

/// Style ids are the style name without spaces ("Heading 1" -> "Heading1").
inline QString styleId(const QString &name)
{
    QString id;
    id.reserve(name.size());
    for (QChar ch : name) {
        if (ch.isLetterOrNumber())
            id.append(ch);
    }
    if (!id.isEmpty())
        id[0] = id.at(0).toUpper();
    return id;
}

/// Whether a code point may appear in an XML 1.0 document.
inline bool isXmlChar(char32_t ucs)
{
    if (ucs < 0x20)
        return ucs == 0x9 || ucs == 0xA || ucs == 0xD;
    if (ucs >= 0xD800 && ucs <= 0xDFFF)
        return false;
    return ucs != 0xFFFE && ucs != 0xFFFF && ucs <= 0x10FFFF;
}

/// Drop code points XML 1.0 cannot carry, lone surrogates included.
inline QString xmlSafe(const QString &text)
{
    QString safe;
    safe.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (ch.isHighSurrogate() && i + 1 < text.size() && text.at(i + 1).isLowSurrogate()) {
            safe.append(ch);
            safe.append(text.at(++i));
        } else if (isXmlChar(ch.unicode())) {
            safe.append(ch);
        }
    }
    return safe;
}

} // namespace DocxUtils

#endif // SHELFDOCX_DOCXUTILS_H
