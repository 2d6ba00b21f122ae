#include "markdowntable.h"

#include <QByteArray>

std::optional<MarkdownTable> MarkdownTableParser::parse(const QString &text)
{
    m_table.reset();
    m_tableCount = 0;
    m_inTable = false;
    m_inHead = false;
    m_inCell = false;
    m_row.clear();
    m_cellText.clear();

    const QByteArray utf8 = text.toUtf8();

    MD_PARSER parser = {};
    parser.abi_version = 0;
    parser.flags = MD_FLAG_TABLES | MD_FLAG_NOHTML;
    parser.enter_block = &MarkdownTableParser::sEnterBlock;
    parser.leave_block = &MarkdownTableParser::sLeaveBlock;
    parser.enter_span = &MarkdownTableParser::sEnterSpan;
    parser.leave_span = &MarkdownTableParser::sLeaveSpan;
    parser.text = &MarkdownTableParser::sText;

    if (md_parse(utf8.constData(), static_cast<MD_SIZE>(utf8.size()), &parser, this) != 0)
        return std::nullopt;

    return m_table;
}

// --- Static callbacks ---

int MarkdownTableParser::sEnterBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
{ return static_cast<MarkdownTableParser *>(userdata)->enterBlock(type, detail); }
int MarkdownTableParser::sLeaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
{ return static_cast<MarkdownTableParser *>(userdata)->leaveBlock(type, detail); }
int MarkdownTableParser::sEnterSpan(MD_SPANTYPE, void *, void *)
{ return 0; }
int MarkdownTableParser::sLeaveSpan(MD_SPANTYPE, void *, void *)
{ return 0; }
int MarkdownTableParser::sText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size, void *userdata)
{ return static_cast<MarkdownTableParser *>(userdata)->onText(type, text, size); }

// --- Block handling ---

int MarkdownTableParser::enterBlock(MD_BLOCKTYPE type, void *detail)
{
    switch (type) {
    case MD_BLOCK_TABLE: {
        // Only the first table counts
        if (m_tableCount++ > 0)
            break;
        auto *d = static_cast<MD_BLOCK_TABLE_DETAIL *>(detail);
        m_inTable = true;
        m_table = MarkdownTable();
        m_table->columnCount = static_cast<int>(d->col_count);
        break;
    }
    case MD_BLOCK_THEAD:
        m_inHead = true;
        break;
    case MD_BLOCK_TR:
        m_row.clear();
        break;
    case MD_BLOCK_TH:
    case MD_BLOCK_TD:
        m_inCell = true;
        m_cellText.clear();
        break;
    default:
        break;
    }
    return 0;
}

int MarkdownTableParser::leaveBlock(MD_BLOCKTYPE type, void * /*detail*/)
{
    if (!m_inTable)
        return 0;

    switch (type) {
    case MD_BLOCK_TABLE:
        m_inTable = false;
        break;
    case MD_BLOCK_THEAD:
        m_inHead = false;
        break;
    case MD_BLOCK_TR:
        while (m_row.size() < m_table->columnCount)
            m_row.append(QString());
        if (m_inHead)
            m_table->header = m_row;
        else
            m_table->rows.append(m_row);
        m_row.clear();
        break;
    case MD_BLOCK_TH:
    case MD_BLOCK_TD:
        m_inCell = false;
        m_row.append(m_cellText.trimmed());
        break;
    default:
        break;
    }
    return 0;
}

int MarkdownTableParser::onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size)
{
    if (!m_inTable || !m_inCell)
        return 0;

    switch (type) {
    case MD_TEXT_NULLCHAR:
        m_cellText += QChar(0xFFFD);
        break;
    case MD_TEXT_BR:
    case MD_TEXT_SOFTBR:
        m_cellText += QLatin1Char(' ');
        break;
    default:
        m_cellText += QString::fromUtf8(text, static_cast<int>(size));
        break;
    }
    return 0;
}
