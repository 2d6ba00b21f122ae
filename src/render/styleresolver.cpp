#include "styleresolver.h"

FormattingInstruction StyleResolver::resolve(const Shelf::StyleToken &token)
{
    FormattingInstruction instruction;

    switch (token.kind) {
    case Shelf::StyleToken::Kind::Link:
        if (token.href.isEmpty()) {
            instruction.action = FormattingInstruction::Action::Invalid;
            instruction.problem = QStringLiteral("link without href");
        } else {
            instruction.action = FormattingInstruction::Action::Hyperlink;
            instruction.href = token.href;
        }
        return instruction;

    case Shelf::StyleToken::Kind::Image:
        if (token.image.src.isEmpty()) {
            instruction.action = FormattingInstruction::Action::Invalid;
            instruction.problem = QStringLiteral("image without src");
        } else {
            instruction.action = FormattingInstruction::Action::Image;
            instruction.image = token.image;
        }
        return instruction;

    case Shelf::StyleToken::Kind::Named:
        break;
    }

    const QString &name = token.name;
    Docx::Font &font = instruction.font;

    if (name == QLatin1String("BOLD")) {
        font.setBold(true);
    } else if (name == QLatin1String("ITALIC")) {
        font.setItalic(true);
    } else if (name == QLatin1String("UNDERLINE")) {
        font.setUnderline(true);
    } else if (name == QLatin1String("CODE")) {
        font.setColor(QColor(68, 114, 196));
        font.setSize(12.0);
        font.setName(QStringLiteral("Times New Roman"));
    } else if (name == QLatin1String("KBD")) {
        instruction.shading = QColor(0xE7, 0xE6, 0xE6);
        font.setSize(11.0);
        font.setName(QStringLiteral("Courier New"));
    } else if (name == QLatin1String("DFN")) {
        instruction.shading = QColor(0xB3, 0xC6, 0xE7);
    } else if (name == QLatin1String("header-step")) {
        font.setBold(true);
        font.setSize(10.5);
    } else {
        return instruction;
    }

    instruction.action = FormattingInstruction::Action::Format;
    return instruction;
}

QString StyleResolver::imageMarker()
{
    return QString::fromUtf8("\xF0\x9F\x96\xBC");   // U+1F5BC FRAME WITH PICTURE
}
