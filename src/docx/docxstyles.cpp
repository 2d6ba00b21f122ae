#include "docxstyles.h"
#include "docxutils.h"

#include <QRegularExpression>

namespace Docx {

StyleRegistry::StyleRegistry()
{
    installDefaults();
}

Style &StyleRegistry::add(const QString &name, Style::Type type, bool custom)
{
    auto style = std::make_unique<Style>();
    style->name = name;
    style->id = DocxUtils::styleId(name);
    style->type = type;
    style->custom = custom;
    Style &ref = *style;
    m_byName.insert(name.toLower(), style.get());
    m_styles.push_back(std::move(style));
    return ref;
}

void StyleRegistry::installDefaults()
{
    Style &normal = add(QStringLiteral("Normal"), Style::Type::Paragraph, false);
    normal.isDefault = true;

    static const qreal headingSizes[] = {16.0, 13.0, 12.0};
    for (int level = 1; level <= 3; ++level) {
        Style &heading = add(QStringLiteral("heading %1").arg(level),
                             Style::Type::Paragraph, false);
        heading.basedOn = normal.id;
        heading.font.setBold(true);
        heading.font.setSize(headingSizes[level - 1]);
        heading.font.setColor(QColor(0x36, 0x5F, 0x91));
    }

    Style &title = add(QStringLiteral("Title"), Style::Type::Paragraph, false);
    title.basedOn = normal.id;
    title.font.setSize(28.0);

    Style &caption = add(QStringLiteral("caption"), Style::Type::Paragraph, false);
    caption.basedOn = normal.id;
    caption.font.setSize(9.0);

    Style &pre = add(QStringLiteral("HTML Preformatted"), Style::Type::Paragraph, false);
    pre.basedOn = normal.id;
    pre.font.setName(QStringLiteral("Courier New"));
    pre.font.setSize(10.0);

    add(QStringLiteral("Table Grid"), Style::Type::Table, false);
}

Style *StyleRegistry::style(const QString &name)
{
    return m_byName.value(name.toLower(), nullptr);
}

const Style *StyleRegistry::style(const QString &name) const
{
    return m_byName.value(name.toLower(), nullptr);
}

const Style *StyleRegistry::styleById(const QString &id) const
{
    for (const auto &s : m_styles) {
        if (s->id == id)
            return s.get();
    }
    return nullptr;
}

Style &StyleRegistry::getOrCreate(const QString &name, Style::Type type)
{
    if (Style *existing = style(name))
        return *existing;

    static const QRegularExpression listPattern(
        QStringLiteral("^List (Bullet|Number)(?: (\\d+))?$"),
        QRegularExpression::CaseInsensitiveOption);
    const auto match = listPattern.match(name);
    if (match.hasMatch()) {
        Style &list = add(name, Style::Type::Paragraph, false);
        list.basedOn = QStringLiteral("Normal");
        const bool bullet = match.captured(1).compare(QLatin1String("Bullet"),
                                                      Qt::CaseInsensitive) == 0;
        list.numId = bullet ? BulletNumId : DecimalNumId;
        const int n = match.captured(2).isEmpty() ? 1 : match.captured(2).toInt();
        list.level = qBound(0, n - 1, MaxListLevel - 1);
        return list;
    }

    Style &created = add(name, type, true);
    if (type == Style::Type::Paragraph)
        created.basedOn = QStringLiteral("Normal");
    return created;
}

QList<const Style *> StyleRegistry::styles() const
{
    QList<const Style *> result;
    result.reserve(static_cast<int>(m_styles.size()));
    for (const auto &s : m_styles)
        result.append(s.get());
    return result;
}

} // namespace Docx
