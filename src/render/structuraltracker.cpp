#include "structuraltracker.h"
#include "docxdocument.h"
#include "docxutils.h"

StructuralTracker::StructuralTracker(const RenderSettings &settings)
    : m_settings(settings)
{
}

void StructuralTracker::reset(int docVersion)
{
    m_docVersion = docVersion;
    m_table.reset();
    m_dictionary.reset();
    m_lastOrderedStyle.clear();
    m_headerStep = 0;
    m_currentDepth = 1;
}

int StructuralTracker::columnsForDepth(int depth)
{
    switch (depth) {
    case 0:
        return 2;
    case 1:
        return 4;
    case 2:
        return 2;
    case 3:
        return 3;
    default:
        return 1;
    }
}

int StructuralTracker::orderedListLevel(int depth)
{
    return qMin(depth + 2, 4);
}

int StructuralTracker::unorderedListLevel(int depth)
{
    return depth + 2;
}

int StructuralTracker::normalizeCellDepths(QList<Shelf::Block> &blocks)
{
    int rewrites = 0;
    int i = 0;
    while (i < blocks.size()) {
        const Shelf::Block &block = blocks.at(i);
        // Past the end the peek counts as a neutral [1, 1, 1]
        if (block.type == Shelf::BlockType::Cell && block.depth == 1
            && i + 2 < blocks.size() && blocks.at(i + 2).depth == 2) {
            for (int k = 0; k < 3; ++k) {
                blocks[i + k].depth = 3;
                blocks[i + k].hasDepth = true;
            }
            ++rewrites;
            ++i;
        }
        ++i;
    }
    return rewrites;
}

Docx::Table &StructuralTracker::openTable(Docx::Document &document, int columns)
{
    Docx::Table &table = document.addTable(1, columns);
    table.setStyleName(QStringLiteral("Table Grid"));
    table.setAutofit(false);
    m_table = TableCursor{&table, 0};
    return table;
}

Docx::Cell *StructuralTracker::nextTableCell(Docx::Document &document,
                                             const QList<Shelf::Block> &blocks, int index)
{
    const Shelf::Block &block = blocks.at(index);

    if (m_docVersion == 3) {
        // Explicit column count on the first cell of each table
        const QJsonObject tableData = block.data.value(QLatin1String("table")).toObject();
        if (!tableData.isEmpty())
            openTable(document, qMax(1, tableData.value(QLatin1String("cols")).toInt(1)));
    } else {
        const bool continues = index > 0
            && blocks.at(index - 1).type == Shelf::BlockType::Cell
            && blocks.at(index - 1).depth == block.depth;
        if (!continues)
            m_table.reset();
        if (!m_table)
            openTable(document, columnsForDepth(block.depth));
    }

    if (!m_table)
        return nullptr;

    Docx::Table *table = m_table->table;
    if (m_table->cell >= table->columnCount()) {
        m_table->cell = 0;
        table->addRow();
    }
    return &table->cell(table->rowCount() - 1, m_table->cell++);
}

Docx::Cell *StructuralTracker::nextDictionaryCell(Docx::Document &document,
                                                  const QList<Shelf::Block> &blocks, int index)
{
    const bool continues = index > 0
        && blocks.at(index - 1).type == Shelf::BlockType::Dictionary;
    if (!continues)
        m_dictionary.reset();

    if (!m_dictionary) {
        Docx::Table &table = document.addTable(1, 3);
        table.setStyleName(QStringLiteral("Table Grid"));
        table.setAutofit(false);
        table.setColumnWidth(1, DocxUtils::inchesToTwips(0.17));
        m_dictionary = DictionaryCursor{&table, 0};
    }

    Docx::Table *table = m_dictionary->table;
    if (m_dictionary->cell >= table->columnCount()) {
        m_dictionary->cell = 0;
        table->addRow();
    }

    const int row = table->rowCount() - 1;
    if (row % 2 == 0) {
        for (int c = 0; c < table->columnCount(); ++c)
            table->cell(row, c).shading = m_settings.dictionaryShading;
    }

    if (m_dictionary->cell == 1) {
        table->cell(row, 1).width = DocxUtils::inchesToTwips(0.3);
        m_dictionary->cell = 2;
    }

    return &table->cell(row, m_dictionary->cell++);
}

bool StructuralTracker::enterOrderedList(const QString &styleName)
{
    const bool separate = !m_lastOrderedStyle.isEmpty() && m_lastOrderedStyle != styleName;
    m_lastOrderedStyle = styleName;
    return separate;
}
