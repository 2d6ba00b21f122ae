/*
 * markdowntable.h: Pipe-table parsing for mdtable blocks (MD4C)
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_MARKDOWNTABLE_H
#define SHELFDOCX_MARKDOWNTABLE_H

#include <QList>
#include <QString>
#include <QStringList>

#include <md4c.h>

#include <optional>

struct MarkdownTable {
    QStringList header;
    QList<QStringList> rows;    // data rows, divider excluded
    int columnCount = 0;
};

class MarkdownTableParser
{
public:
    // First table in the text, cell text without inline markup.
    // nullopt when the text holds no table.
    std::optional<MarkdownTable> parse(const QString &text);

private:
    static int sEnterBlock(MD_BLOCKTYPE type, void *detail, void *userdata);
    static int sLeaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata);
    static int sEnterSpan(MD_SPANTYPE type, void *detail, void *userdata);
    static int sLeaveSpan(MD_SPANTYPE type, void *detail, void *userdata);
    static int sText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size,
                     void *userdata);

    int enterBlock(MD_BLOCKTYPE type, void *detail);
    int leaveBlock(MD_BLOCKTYPE type, void *detail);
    int onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size);

    std::optional<MarkdownTable> m_table;
    int m_tableCount = 0;
    bool m_inTable = false;
    bool m_inHead = false;
    bool m_inCell = false;
    QStringList m_row;
    QString m_cellText;
};

#endif // SHELFDOCX_MARKDOWNTABLE_H
