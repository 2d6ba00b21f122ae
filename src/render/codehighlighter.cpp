#include "codehighlighter.h"

CodeHighlighter::CodeHighlighter()
{
    static KSyntaxHighlighting::Repository repo;
    m_repo = &repo;
    setTheme(repo.defaultTheme(KSyntaxHighlighting::Repository::LightTheme));
}

KSyntaxHighlighting::Definition CodeHighlighter::definitionFor(const QString &language) const
{
    if (language.trimmed().isEmpty())
        return {};
    auto def = m_repo->definitionForName(language.trimmed());
    if (!def.isValid())
        def = m_repo->definitionForFileName(QStringLiteral("file.") + language.trimmed().toLower());
    return def;
}

QList<CodeHighlighter::Span> CodeHighlighter::highlight(const QString &code, const QString &language)
{
    m_spans.clear();
    m_lineOffset = 0;

    const auto def = definitionFor(language);
    if (!def.isValid())
        return {};

    setDefinition(def);

    KSyntaxHighlighting::State state;
    const auto lines = code.split(QLatin1Char('\n'));
    for (const auto &line : lines) {
        state = highlightLine(line, state);
        m_lineOffset += line.size() + 1; // newline
    }

    return m_spans;
}

void CodeHighlighter::applyFormat(int offset, int length,
                                  const KSyntaxHighlighting::Format &format)
{
    if (length == 0 || format.isDefaultTextStyle(theme()))
        return;

    Span span;
    span.start = m_lineOffset + offset;
    span.length = length;
    if (format.hasTextColor(theme()))
        span.font.setColor(format.textColor(theme()));
    if (format.hasBackgroundColor(theme()))
        span.background = format.backgroundColor(theme());
    if (format.isBold(theme()))
        span.font.setBold(true);
    if (format.isItalic(theme()))
        span.font.setItalic(true);
    m_spans.append(span);
}
