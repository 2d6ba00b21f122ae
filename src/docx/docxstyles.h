/*
 * docxstyles.h: Style registry backing word/styles.xml and numbering.xml
 *
 * Lookup is case-insensitive ("Heading 1" finds Word's "heading 1").
 * List styles ("List Bullet 3", "List Number 2") are created on demand and
 * bound to the bullet or decimal numbering definition at level N-1.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_DOCXSTYLES_H
#define SHELFDOCX_DOCXSTYLES_H

#include "docxfont.h"

#include <QHash>
#include <QList>
#include <QString>

#include <memory>
#include <vector>

namespace Docx {

struct Style {
    enum class Type { Paragraph, Character, Table };

    QString name;
    QString id;
    Type type = Type::Paragraph;
    QString basedOn;            // style id
    Font font;
    int numId = 0;              // 0 = not a list style
    int level = 0;              // ilvl
    bool isDefault = false;
    bool custom = false;
};

class StyleRegistry
{
public:
    static constexpr int BulletNumId = 1;
    static constexpr int DecimalNumId = 2;
    static constexpr int MaxListLevel = 9;

    StyleRegistry();

    Style *style(const QString &name);
    const Style *style(const QString &name) const;
    const Style *styleById(const QString &id) const;
    bool contains(const QString &name) const { return style(name) != nullptr; }

    Style &getOrCreate(const QString &name, Style::Type type = Style::Type::Paragraph);

    // Styles in creation order
    QList<const Style *> styles() const;

private:
    Style &add(const QString &name, Style::Type type, bool custom);
    void installDefaults();

    std::vector<std::unique_ptr<Style>> m_styles;
    QHash<QString, Style *> m_byName;   // lower-cased name
};

} // namespace Docx

#endif // SHELFDOCX_DOCXSTYLES_H
