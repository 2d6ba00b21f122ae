/*
 * docxfont.h: Character properties of a run or style (w:rPr)
 *
 * Every property carries a has-flag; unset properties are not written
 * and inherit from the paragraph style in Word.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_DOCXFONT_H
#define SHELFDOCX_DOCXFONT_H

#include <QColor>
#include <QString>

#include <optional>

namespace Docx {

class Font
{
public:
    enum class Property {
        Bold,
        Italic,
        Underline,
        Strike,
        Subscript,
        Math,
        NoProof,
        WebHidden,
        Rtl,
        Size,
        Color,
        Shadow,
        Highlight,
        Hidden,
        CsBold,
        Name
    };

    // Resolves attribute paths such as "italic", "no_proof" or "color.rgb"
    static std::optional<Property> propertyFromPath(const QString &path);

    // Setters
    void setBold(bool on) { m_bold = on; m_hasBold = true; }
    void setItalic(bool on) { m_italic = on; m_hasItalic = true; }
    void setUnderline(bool on) { m_underline = on; m_hasUnderline = true; }
    void setStrike(bool on) { m_strike = on; m_hasStrike = true; }
    void setSubscript(bool on) { m_subscript = on; m_hasSubscript = true; }
    void setMath(bool on) { m_math = on; m_hasMath = true; }
    void setNoProof(bool on) { m_noProof = on; m_hasNoProof = true; }
    void setWebHidden(bool on) { m_webHidden = on; m_hasWebHidden = true; }
    void setRtl(bool on) { m_rtl = on; m_hasRtl = true; }
    void setSize(qreal pts) { m_size = pts; m_hasSize = true; }
    void setColor(const QColor &c) { m_color = c; m_hasColor = true; }
    void setShadow(bool on) { m_shadow = on; m_hasShadow = true; }
    void setHighlight(const QString &name) { m_highlight = name; m_hasHighlight = true; }
    void setHidden(bool on) { m_hidden = on; m_hasHidden = true; }
    void setCsBold(bool on) { m_csBold = on; m_hasCsBold = true; }
    void setName(const QString &family) { m_name = family; m_hasName = true; }

    // Getters
    bool bold() const { return m_bold; }
    bool italic() const { return m_italic; }
    bool underline() const { return m_underline; }
    bool strike() const { return m_strike; }
    bool subscript() const { return m_subscript; }
    bool math() const { return m_math; }
    bool noProof() const { return m_noProof; }
    bool webHidden() const { return m_webHidden; }
    bool rtl() const { return m_rtl; }
    qreal size() const { return m_size; }
    QColor color() const { return m_color; }
    bool shadow() const { return m_shadow; }
    QString highlight() const { return m_highlight; }
    bool hidden() const { return m_hidden; }
    bool csBold() const { return m_csBold; }
    QString name() const { return m_name; }

    // Has* flags
    bool hasBold() const { return m_hasBold; }
    bool hasItalic() const { return m_hasItalic; }
    bool hasUnderline() const { return m_hasUnderline; }
    bool hasStrike() const { return m_hasStrike; }
    bool hasSubscript() const { return m_hasSubscript; }
    bool hasMath() const { return m_hasMath; }
    bool hasNoProof() const { return m_hasNoProof; }
    bool hasWebHidden() const { return m_hasWebHidden; }
    bool hasRtl() const { return m_hasRtl; }
    bool hasSize() const { return m_hasSize; }
    bool hasColor() const { return m_hasColor; }
    bool hasShadow() const { return m_hasShadow; }
    bool hasHighlight() const { return m_hasHighlight; }
    bool hasHidden() const { return m_hasHidden; }
    bool hasCsBold() const { return m_hasCsBold; }
    bool hasName() const { return m_hasName; }

    bool isEmpty() const;

    // Copy one property, set or unset, from another font
    void copyProperty(Property property, const Font &from);

    // Overlay every property that is set on other (last applied wins)
    void mergeFrom(const Font &other);

    bool operator==(const Font &other) const;
    bool operator!=(const Font &other) const { return !(*this == other); }

private:
    bool m_bold = false;
    bool m_italic = false;
    bool m_underline = false;
    bool m_strike = false;
    bool m_subscript = false;
    bool m_math = false;
    bool m_noProof = false;
    bool m_webHidden = false;
    bool m_rtl = false;
    qreal m_size = 0;
    QColor m_color;
    bool m_shadow = false;
    QString m_highlight;
    bool m_hidden = false;
    bool m_csBold = false;
    QString m_name;

    bool m_hasBold = false;
    bool m_hasItalic = false;
    bool m_hasUnderline = false;
    bool m_hasStrike = false;
    bool m_hasSubscript = false;
    bool m_hasMath = false;
    bool m_hasNoProof = false;
    bool m_hasWebHidden = false;
    bool m_hasRtl = false;
    bool m_hasSize = false;
    bool m_hasColor = false;
    bool m_hasShadow = false;
    bool m_hasHighlight = false;
    bool m_hasHidden = false;
    bool m_hasCsBold = false;
    bool m_hasName = false;
};

} // namespace Docx

#endif // SHELFDOCX_DOCXFONT_H
