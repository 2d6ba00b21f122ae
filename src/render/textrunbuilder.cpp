#include "textrunbuilder.h"
#include "rendererror.h"
#include "styleresolver.h"

#include <QVariant>

#include <algorithm>

bool RunDescriptor::canMergeWith(const RunDescriptor &other) const
{
    if (image || other.image)
        return false;
    return font == other.font && shading == other.shading && href == other.href;
}

TextRunBuilder::TextRunBuilder(const Docx::Font &baseFont)
    : m_baseFont(baseFont)
{
}

QList<Shelf::StyleRange> TextRunBuilder::foldEntities(const QList<Shelf::EntityRange> &entityRanges,
                                                      const Shelf::EntityMap &entityMap)
{
    QList<Shelf::StyleRange> folded;
    for (const auto &range : entityRanges) {
        auto it = entityMap.constFind(range.key);
        if (it == entityMap.constEnd())
            continue;

        Shelf::StyleRange style;
        style.offset = range.offset;
        style.length = range.length;
        if (it->type == QLatin1String("LINK")) {
            style.style = Shelf::StyleToken::link(it->data.value(QLatin1String("href")).toString());
        } else if (it->type == QLatin1String("IMG")) {
            Shelf::ImageDescriptor image;
            image.src = it->data.value(QLatin1String("src")).toString();
            image.size = it->data.value(QLatin1String("size")).toVariant().toInt();
            style.style = Shelf::StyleToken::image(image);
        } else {
            continue;
        }
        folded.append(style);
    }
    return folded;
}

void TextRunBuilder::sortRanges(QList<Shelf::StyleRange> &ranges)
{
    std::stable_sort(ranges.begin(), ranges.end(),
                     [](const Shelf::StyleRange &a, const Shelf::StyleRange &b) {
                         return a.offset < b.offset;
                     });
}

QStringList TextRunBuilder::codePoints(const QString &text)
{
    QStringList result;
    result.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        if (text.at(i).isHighSurrogate() && i + 1 < text.size()
            && text.at(i + 1).isLowSurrogate()) {
            result.append(text.mid(i, 2));
            ++i;
        } else {
            result.append(QString(text.at(i)));
        }
    }
    return result;
}

QList<RunDescriptor> TextRunBuilder::build(const QString &text,
                                           const QList<Shelf::StyleRange> &inlineStyleRanges,
                                           const QList<Shelf::EntityRange> &entityRanges,
                                           const Shelf::EntityMap &entityMap,
                                           const QList<Shelf::StyleRange> &trailingRanges,
                                           ErrorSink *errors,
                                           const QString &context) const
{
    QList<Shelf::StyleRange> ranges = inlineStyleRanges;
    ranges.append(foldEntities(entityRanges, entityMap));
    ranges.append(trailingRanges);
    sortRanges(ranges);

    const QStringList glyphs = codePoints(text);
    QList<RunDescriptor> runs;
    runs.reserve(glyphs.size());
    for (const auto &glyph : glyphs) {
        RunDescriptor run;
        run.text = glyph;
        run.font = m_baseFont;
        runs.append(run);
    }

    const QString marker = StyleResolver::imageMarker();

    for (const auto &range : std::as_const(ranges)) {
        const FormattingInstruction instruction = StyleResolver::resolve(range.style);
        if (instruction.action == FormattingInstruction::Action::None)
            continue;

        const int first = qMax(0, range.offset);
        const int last = static_cast<int>(qMin(qint64(runs.size()),
                                               qint64(range.offset) + qint64(range.length)));
        if (first >= last)
            continue;

        if (instruction.action == FormattingInstruction::Action::Invalid) {
            // Affected characters fall back to the plain default run
            for (int i = first; i < last; ++i) {
                RunDescriptor plain;
                plain.text = glyphs.at(i);
                plain.font = m_baseFont;
                runs[i] = plain;
            }
            if (errors)
                errors->report(RenderError::Kind::Attribute, context,
                               QStringLiteral("%1 at %2: %3")
                                   .arg(range.style.name).arg(range.offset).arg(instruction.problem));
            continue;
        }

        for (int i = first; i < last; ++i) {
            RunDescriptor &run = runs[i];
            switch (instruction.action) {
            case FormattingInstruction::Action::Format:
                run.font.mergeFrom(instruction.font);
                if (instruction.shading.isValid())
                    run.shading = instruction.shading;
                break;
            case FormattingInstruction::Action::Hyperlink:
                run.href = instruction.href;
                break;
            case FormattingInstruction::Action::Image:
                if (run.text == marker)
                    run.text.clear();
                run.image = instruction.image;
                break;
            case FormattingInstruction::Action::None:
            case FormattingInstruction::Action::Invalid:
                break;
            }
        }
    }

    return runs;
}
