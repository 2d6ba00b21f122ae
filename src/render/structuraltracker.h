/*
 * structuraltracker.h: Rebuilds tables, dictionaries and list runs from
 * the flat block stream
 *
 * Block nesting is only implied by adjacency and depth. The tracker keeps
 * one independent state per structural category (open table, open
 * dictionary, last ordered-list style, header-step counter, accumulated
 * depth) and decides for every block whether it continues the open
 * structure or starts a new one. State lives for one article.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_STRUCTURALTRACKER_H
#define SHELFDOCX_STRUCTURALTRACKER_H

#include "rendersettings.h"
#include "shelfmodel.h"

#include <QList>
#include <QString>

#include <optional>

namespace Docx {
class Document;
class Table;
struct Cell;
}

class StructuralTracker
{
public:
    explicit StructuralTracker(const RenderSettings &settings = RenderSettings());

    // Start of an article: every category back to its initial state
    void reset(int docVersion);

    // Versions up to 2 encode table columns in the cell depth
    static bool isLegacyVersion(int docVersion) { return docVersion <= 2; }

    // depth 0 -> 2, 1 -> 4, 2 -> 2, 3 -> 3, anything else -> 1
    static int columnsForDepth(int depth);

    // "List Number N": depth + 2, values above 4 clamp to 4
    static int orderedListLevel(int depth);
    // "List Bullet N": depth + 2
    static int unorderedListLevel(int depth);

    // Legacy pre-pass: a depth-1 cell whose second successor has depth 2
    // starts a 3-column table; the three blocks are rewritten to depth 3.
    // Heuristic for an ambiguous encoding. Returns the number of rewrites.
    static int normalizeCellDepths(QList<Shelf::Block> &blocks);

    // --- Tables ---

    // Cell that receives blocks[index], opening a table when the block
    // does not continue the open one. nullptr when a version 3 cell has
    // no table to continue.
    Docx::Cell *nextTableCell(Docx::Document &document,
                              const QList<Shelf::Block> &blocks, int index);

    // Cell of the 3-column dictionary grid that receives blocks[index];
    // column 1 is a fixed-width spacer and never receives text.
    Docx::Cell *nextDictionaryCell(Docx::Document &document,
                                   const QList<Shelf::Block> &blocks, int index);

    // Flat content ends the open table
    void closeTable() { m_table.reset(); }

    Docx::Table *currentTable() const { return m_table ? m_table->table : nullptr; }

    // --- Lists ---

    // Records an ordered-list paragraph; true when the previous paragraph
    // was an ordered-list paragraph with a different style
    bool enterOrderedList(const QString &styleName);
    void endOrderedList() { m_lastOrderedStyle.clear(); }

    // --- Header steps ---

    int nextHeaderStep() { return ++m_headerStep; }

    // --- Depth ---

    void enterDepth(int depth) { m_currentDepth += depth; }
    void leaveDepth(int depth) { m_currentDepth -= depth; }
    int currentDepth() const { return m_currentDepth; }

private:
    struct TableCursor {
        Docx::Table *table = nullptr;
        int cell = 0;
    };

    struct DictionaryCursor {
        Docx::Table *table = nullptr;
        int cell = 0;
    };

    Docx::Table &openTable(Docx::Document &document, int columns);

    RenderSettings m_settings;
    int m_docVersion = 1;
    std::optional<TableCursor> m_table;
    std::optional<DictionaryCursor> m_dictionary;
    QString m_lastOrderedStyle;
    int m_headerStep = 0;
    int m_currentDepth = 1;
};

#endif // SHELFDOCX_STRUCTURALTRACKER_H
