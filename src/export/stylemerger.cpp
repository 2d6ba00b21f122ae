#include "stylemerger.h"
#include "rendererror.h"

#include <QDebug>
#include <QSet>

#include <optional>
#include <vector>

QStringList StyleMerger::defaultAttributes()
{
    return {
        QStringLiteral("italic"),
        QStringLiteral("math"),
        QStringLiteral("no_proof"),
        QStringLiteral("web_hidden"),
        QStringLiteral("strike"),
        QStringLiteral("subscript"),
        QStringLiteral("rtl"),
        QStringLiteral("size"),
        QStringLiteral("color.rgb"),
        QStringLiteral("shadow"),
        QStringLiteral("highlight_color"),
        QStringLiteral("hidden"),
        QStringLiteral("cs_bold"),
        QStringLiteral("name"),
    };
}

StyleMerger::StyleMerger(const QStringList &attributes)
    : m_attributes(attributes)
{
}

QHash<QString, Docx::Font> StyleMerger::sampleFonts(const Docx::Document &templateDocument)
{
    QHash<QString, Docx::Font> samples;
    const auto paragraphs = templateDocument.paragraphs();
    for (const Docx::Paragraph *paragraph : paragraphs) {
        // No early exit: the last run seen for a style name wins
        for (const auto &run : paragraph->runs())
            samples.insert(paragraph->styleName().toLower(), run.font);
    }
    return samples;
}

int StyleMerger::merge(Docx::Document &produced, const Docx::Document &templateDocument,
                       ErrorSink *errors) const
{
    const QHash<QString, Docx::Font> samples = sampleFonts(templateDocument);
    if (samples.isEmpty())
        return 0;

    // Resolve paths once; unknown ones are reported and dropped
    std::vector<Docx::Font::Property> properties;
    for (const auto &path : m_attributes) {
        const std::optional<Docx::Font::Property> property = Docx::Font::propertyFromPath(path);
        if (!property) {
            if (errors)
                errors->report(RenderError::Kind::Attribute, path,
                               QStringLiteral("unknown font attribute"));
            else
                qWarning() << "StyleMerger: unknown font attribute" << path;
            continue;
        }
        properties.push_back(*property);
    }

    QSet<QString> merged;
    const auto paragraphs = produced.paragraphs();
    for (const Docx::Paragraph *paragraph : paragraphs) {
        const QString key = paragraph->styleName().toLower();
        auto sample = samples.constFind(key);
        if (sample == samples.constEnd() || merged.contains(key))
            continue;

        Docx::Style *style = produced.styles().style(paragraph->styleName());
        if (!style) {
            if (errors)
                errors->report(RenderError::Kind::Attribute, paragraph->styleName(),
                               QStringLiteral("paragraph style is not registered"));
            continue;
        }

        for (const auto property : properties)
            style->font.copyProperty(property, *sample);
        merged.insert(key);
    }

    qDebug() << "StyleMerger: merged" << merged.size() << "styles from the template";
    return merged.size();
}
