#include "docxdocument.h"

#include <QStringList>

namespace Docx {

// --- Picture ---

void Picture::scaleToWidth(qint64 maxWidth)
{
    if (maxWidth <= 0 || width <= maxWidth || width <= 0)
        return;
    height = static_cast<qint64>(static_cast<double>(height) * maxWidth / width);
    width = maxWidth;
}

// --- Paragraph ---

Paragraph::Paragraph(const QString &styleName)
    : m_styleName(styleName)
{
}

Run &Paragraph::addRun(const QString &text)
{
    Run run;
    run.kind = Run::Kind::Text;
    run.text = text;
    m_runs.append(run);
    return m_runs.last();
}

Run &Paragraph::addHyperlinkRun(const QString &href, const QString &text)
{
    Run run;
    run.kind = Run::Kind::Hyperlink;
    run.href = href;
    run.text = text;
    m_runs.append(run);
    return m_runs.last();
}

Run &Paragraph::addPicture(const Picture &picture)
{
    Run run;
    run.kind = Run::Kind::Picture;
    run.picture = picture;
    m_runs.append(run);
    return m_runs.last();
}

Run &Paragraph::addField(const QString &instruction, const QString &placeholder)
{
    Run run;
    run.kind = Run::Kind::Field;
    run.instruction = instruction;
    run.text = placeholder;
    m_runs.append(run);
    return m_runs.last();
}

void Paragraph::addPageBreak()
{
    Run run;
    run.kind = Run::Kind::PageBreak;
    m_runs.append(run);
}

QString Paragraph::text() const
{
    QString result;
    for (const auto &run : m_runs) {
        if (run.kind == Run::Kind::Text || run.kind == Run::Kind::Hyperlink)
            result += run.text;
    }
    return result;
}

// --- Cell ---

void Cell::setText(const QString &text)
{
    Paragraph &p = paragraph();
    p.runs().clear();
    p.addRun(text);
}

QString Cell::text() const
{
    QStringList lines;
    for (const auto &p : paragraphs)
        lines.append(p.text());
    return lines.join(QLatin1Char('\n'));
}

// --- Table ---

Table::Table(int rows, int columns)
    : m_columns(qMax(1, columns))
{
    m_columnWidths.fill(0, m_columns);
    for (int r = 0; r < rows; ++r)
        addRow();
}

void Table::addRow()
{
    QList<Cell> cells;
    cells.reserve(m_columns);
    for (int c = 0; c < m_columns; ++c)
        cells.append(Cell());
    m_rows.append(cells);
}

Cell &Table::cell(int row, int column)
{
    return m_rows[row][column];
}

const Cell &Table::cell(int row, int column) const
{
    return m_rows.at(row).at(column);
}

int Table::columnWidth(int column) const
{
    if (column < 0 || column >= m_columnWidths.size())
        return 0;
    return m_columnWidths.at(column);
}

void Table::setColumnWidth(int column, int twips)
{
    if (column < 0 || column >= m_columns)
        return;
    m_columnWidths[column] = twips;
    for (auto &row : m_rows)
        row[column].width = twips;
}

// --- Document ---

Document::Document() = default;

Paragraph &Document::addParagraph(const QString &styleName)
{
    auto paragraph = std::make_unique<Paragraph>(styleName);
    Paragraph &ref = *paragraph;
    m_styles.getOrCreate(styleName);
    m_body.emplace_back(std::move(paragraph));
    return ref;
}

Table &Document::addTable(int rows, int columns)
{
    auto table = std::make_unique<Table>(rows, columns);
    Table &ref = *table;
    m_body.emplace_back(std::move(table));
    return ref;
}

QList<Paragraph *> Document::paragraphs()
{
    QList<Paragraph *> result;
    for (auto &element : m_body) {
        if (auto *p = std::get_if<std::unique_ptr<Paragraph>>(&element))
            result.append(p->get());
    }
    return result;
}

QList<const Paragraph *> Document::paragraphs() const
{
    QList<const Paragraph *> result;
    for (const auto &element : m_body) {
        if (auto *p = std::get_if<std::unique_ptr<Paragraph>>(&element))
            result.append(p->get());
    }
    return result;
}

QList<Table *> Document::tables()
{
    QList<Table *> result;
    for (auto &element : m_body) {
        if (auto *t = std::get_if<std::unique_ptr<Table>>(&element))
            result.append(t->get());
    }
    return result;
}

QList<const Table *> Document::tables() const
{
    QList<const Table *> result;
    for (const auto &element : m_body) {
        if (auto *t = std::get_if<std::unique_ptr<Table>>(&element))
            result.append(t->get());
    }
    return result;
}

} // namespace Docx
