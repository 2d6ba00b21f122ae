/*
 * docxdocument.h: In-memory WordprocessingML document
 *
 * The body is an ordered list of paragraphs and tables. Handles returned
 * by addParagraph()/addTable() stay valid for the document's lifetime,
 * so renderers may keep pointers to an open table while appending more
 * content after it.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_DOCXDOCUMENT_H
#define SHELFDOCX_DOCXDOCUMENT_H

#include "docxfont.h"
#include "docxstyles.h"

#include <QByteArray>
#include <QColor>
#include <QList>
#include <QMap>
#include <QString>

#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace Docx {

enum class Alignment { Left, Center, Right, Justify };

enum class BorderEdge { Top, Start, Bottom, End, InsideH, InsideV };

struct Border {
    QString value = QStringLiteral("single");
    int size = 4;               // eighths of a point
    QColor color;               // invalid = auto
    int space = 0;
};

struct Picture {
    QByteArray data;
    QString extension = QStringLiteral("png");
    int pixelWidth = 0;
    int pixelHeight = 0;
    qint64 width = 0;           // EMU
    qint64 height = 0;          // EMU

    // Shrink to maxWidth (EMU) if wider, keeping the aspect ratio
    void scaleToWidth(qint64 maxWidth);
};

struct Run {
    enum class Kind { Text, Hyperlink, Picture, PageBreak, Field };

    Kind kind = Kind::Text;
    QString text;               // '\n' is a line break, '\t' a tab
    Font font;
    QColor shading;             // invalid = none
    QString href;               // Hyperlink
    Picture picture;            // Picture
    QString instruction;        // Field
};

class Paragraph
{
public:
    explicit Paragraph(const QString &styleName = QStringLiteral("Normal"));

    QString styleName() const { return m_styleName; }
    void setStyleName(const QString &name) { m_styleName = name; }

    std::optional<Alignment> alignment() const { return m_alignment; }
    void setAlignment(Alignment alignment) { m_alignment = alignment; }

    // Properties of the paragraph mark (w:pPr/w:rPr)
    Font &markFont() { return m_markFont; }
    const Font &markFont() const { return m_markFont; }

    Run &addRun(const QString &text = QString());
    Run &addHyperlinkRun(const QString &href, const QString &text);
    Run &addPicture(const Picture &picture);
    Run &addField(const QString &instruction, const QString &placeholder);
    void addPageBreak();

    QList<Run> &runs() { return m_runs; }
    const QList<Run> &runs() const { return m_runs; }

    // Concatenated run text
    QString text() const;

private:
    QString m_styleName;
    std::optional<Alignment> m_alignment;
    Font m_markFont;
    QList<Run> m_runs;
};

struct Cell {
    QList<Paragraph> paragraphs = {Paragraph()};
    QColor shading;             // invalid = none
    QMap<BorderEdge, Border> borders;
    int width = 0;              // twips, 0 = auto

    Paragraph &paragraph() { return paragraphs.first(); }
    const Paragraph &paragraph() const { return paragraphs.first(); }

    // Replaces the content with a single run
    void setText(const QString &text);
    QString text() const;
};

class Table
{
public:
    Table(int rows, int columns);

    int rowCount() const { return m_rows.size(); }
    int columnCount() const { return m_columns; }

    void addRow();
    Cell &cell(int row, int column);
    const Cell &cell(int row, int column) const;
    QList<Cell> &row(int row) { return m_rows[row]; }
    const QList<Cell> &row(int row) const { return m_rows.at(row); }

    QString styleName() const { return m_styleName; }
    void setStyleName(const QString &name) { m_styleName = name; }

    bool autofit() const { return m_autofit; }
    void setAutofit(bool on) { m_autofit = on; }

    // Width of a grid column in twips; 0 = share the remaining width
    int columnWidth(int column) const;
    void setColumnWidth(int column, int twips);

    int indent() const { return m_indent; }
    void setIndent(int twips) { m_indent = twips; }

private:
    int m_columns = 0;
    QList<QList<Cell>> m_rows;
    QList<int> m_columnWidths;
    QString m_styleName;
    bool m_autofit = true;
    int m_indent = 0;
};

class Document
{
public:
    using BodyElement = std::variant<std::unique_ptr<Paragraph>, std::unique_ptr<Table>>;

    Document();
    Document(Document &&) = default;
    Document &operator=(Document &&) = default;
    Document(const Document &) = delete;
    Document &operator=(const Document &) = delete;

    Paragraph &addParagraph(const QString &styleName = QStringLiteral("Normal"));
    Table &addTable(int rows, int columns);

    const std::vector<BodyElement> &body() const { return m_body; }

    // Top-level paragraphs in body order (table content excluded)
    QList<Paragraph *> paragraphs();
    QList<const Paragraph *> paragraphs() const;
    QList<Table *> tables();
    QList<const Table *> tables() const;

    StyleRegistry &styles() { return m_styles; }
    const StyleRegistry &styles() const { return m_styles; }

    QString title() const { return m_title; }
    void setTitle(const QString &title) { m_title = title; }
    QString author() const { return m_author; }
    void setAuthor(const QString &author) { m_author = author; }

private:
    std::vector<BodyElement> m_body;
    StyleRegistry m_styles;
    QString m_title;
    QString m_author;
};

} // namespace Docx

#endif // SHELFDOCX_DOCXDOCUMENT_H
