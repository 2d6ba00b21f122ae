#include "docxfont.h"

#include <QHash>
#include <QStringList>
#include <QtGlobal>

namespace Docx {

std::optional<Font::Property> Font::propertyFromPath(const QString &path)
{
    static const QHash<QString, Property> names = {
        {QStringLiteral("bold"), Property::Bold},
        {QStringLiteral("italic"), Property::Italic},
        {QStringLiteral("underline"), Property::Underline},
        {QStringLiteral("strike"), Property::Strike},
        {QStringLiteral("subscript"), Property::Subscript},
        {QStringLiteral("math"), Property::Math},
        {QStringLiteral("no_proof"), Property::NoProof},
        {QStringLiteral("web_hidden"), Property::WebHidden},
        {QStringLiteral("rtl"), Property::Rtl},
        {QStringLiteral("size"), Property::Size},
        {QStringLiteral("shadow"), Property::Shadow},
        {QStringLiteral("highlight_color"), Property::Highlight},
        {QStringLiteral("hidden"), Property::Hidden},
        {QStringLiteral("cs_bold"), Property::CsBold},
        {QStringLiteral("name"), Property::Name},
    };

    const QStringList parts = path.split(QLatin1Char('.'));
    if (parts.size() == 2) {
        // Only the colour carries a nested attribute
        if (parts.at(0) == QLatin1String("color") && parts.at(1) == QLatin1String("rgb"))
            return Property::Color;
        return std::nullopt;
    }
    if (parts.size() != 1)
        return std::nullopt;

    auto it = names.constFind(parts.first());
    if (it == names.constEnd())
        return std::nullopt;
    return it.value();
}

bool Font::isEmpty() const
{
    return !(m_hasBold || m_hasItalic || m_hasUnderline || m_hasStrike
             || m_hasSubscript || m_hasMath || m_hasNoProof || m_hasWebHidden
             || m_hasRtl || m_hasSize || m_hasColor || m_hasShadow
             || m_hasHighlight || m_hasHidden || m_hasCsBold || m_hasName);
}

void Font::copyProperty(Property property, const Font &from)
{
    switch (property) {
    case Property::Bold:
        m_bold = from.m_bold;
        m_hasBold = from.m_hasBold;
        break;
    case Property::Italic:
        m_italic = from.m_italic;
        m_hasItalic = from.m_hasItalic;
        break;
    case Property::Underline:
        m_underline = from.m_underline;
        m_hasUnderline = from.m_hasUnderline;
        break;
    case Property::Strike:
        m_strike = from.m_strike;
        m_hasStrike = from.m_hasStrike;
        break;
    case Property::Subscript:
        m_subscript = from.m_subscript;
        m_hasSubscript = from.m_hasSubscript;
        break;
    case Property::Math:
        m_math = from.m_math;
        m_hasMath = from.m_hasMath;
        break;
    case Property::NoProof:
        m_noProof = from.m_noProof;
        m_hasNoProof = from.m_hasNoProof;
        break;
    case Property::WebHidden:
        m_webHidden = from.m_webHidden;
        m_hasWebHidden = from.m_hasWebHidden;
        break;
    case Property::Rtl:
        m_rtl = from.m_rtl;
        m_hasRtl = from.m_hasRtl;
        break;
    case Property::Size:
        m_size = from.m_size;
        m_hasSize = from.m_hasSize;
        break;
    case Property::Color:
        m_color = from.m_color;
        m_hasColor = from.m_hasColor;
        break;
    case Property::Shadow:
        m_shadow = from.m_shadow;
        m_hasShadow = from.m_hasShadow;
        break;
    case Property::Highlight:
        m_highlight = from.m_highlight;
        m_hasHighlight = from.m_hasHighlight;
        break;
    case Property::Hidden:
        m_hidden = from.m_hidden;
        m_hasHidden = from.m_hasHidden;
        break;
    case Property::CsBold:
        m_csBold = from.m_csBold;
        m_hasCsBold = from.m_hasCsBold;
        break;
    case Property::Name:
        m_name = from.m_name;
        m_hasName = from.m_hasName;
        break;
    }
}

void Font::mergeFrom(const Font &other)
{
    if (other.m_hasBold) setBold(other.m_bold);
    if (other.m_hasItalic) setItalic(other.m_italic);
    if (other.m_hasUnderline) setUnderline(other.m_underline);
    if (other.m_hasStrike) setStrike(other.m_strike);
    if (other.m_hasSubscript) setSubscript(other.m_subscript);
    if (other.m_hasMath) setMath(other.m_math);
    if (other.m_hasNoProof) setNoProof(other.m_noProof);
    if (other.m_hasWebHidden) setWebHidden(other.m_webHidden);
    if (other.m_hasRtl) setRtl(other.m_rtl);
    if (other.m_hasSize) setSize(other.m_size);
    if (other.m_hasColor) setColor(other.m_color);
    if (other.m_hasShadow) setShadow(other.m_shadow);
    if (other.m_hasHighlight) setHighlight(other.m_highlight);
    if (other.m_hasHidden) setHidden(other.m_hidden);
    if (other.m_hasCsBold) setCsBold(other.m_csBold);
    if (other.m_hasName) setName(other.m_name);
}

bool Font::operator==(const Font &other) const
{
    return m_hasBold == other.m_hasBold && m_bold == other.m_bold
        && m_hasItalic == other.m_hasItalic && m_italic == other.m_italic
        && m_hasUnderline == other.m_hasUnderline && m_underline == other.m_underline
        && m_hasStrike == other.m_hasStrike && m_strike == other.m_strike
        && m_hasSubscript == other.m_hasSubscript && m_subscript == other.m_subscript
        && m_hasMath == other.m_hasMath && m_math == other.m_math
        && m_hasNoProof == other.m_hasNoProof && m_noProof == other.m_noProof
        && m_hasWebHidden == other.m_hasWebHidden && m_webHidden == other.m_webHidden
        && m_hasRtl == other.m_hasRtl && m_rtl == other.m_rtl
        && m_hasSize == other.m_hasSize && qFuzzyCompare(m_size + 1, other.m_size + 1)
        && m_hasColor == other.m_hasColor && m_color == other.m_color
        && m_hasShadow == other.m_hasShadow && m_shadow == other.m_shadow
        && m_hasHighlight == other.m_hasHighlight && m_highlight == other.m_highlight
        && m_hasHidden == other.m_hasHidden && m_hidden == other.m_hidden
        && m_hasCsBold == other.m_hasCsBold && m_csBold == other.m_csBold
        && m_hasName == other.m_hasName && m_name == other.m_name;
}

} // namespace Docx
