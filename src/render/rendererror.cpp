#include "rendererror.h"

#include <QDebug>

QString RenderError::kindName(Kind kind)
{
    switch (kind) {
    case Kind::Block:
        return QStringLiteral("block");
    case Kind::Attribute:
        return QStringLiteral("attribute");
    case Kind::UnrecognizedImage:
        return QStringLiteral("unrecognized-image");
    case Kind::ExternalService:
        return QStringLiteral("external-service");
    case Kind::Storage:
        return QStringLiteral("storage");
    }
    return QStringLiteral("unknown");
}

QString RenderError::toString() const
{
    if (context.isEmpty())
        return QStringLiteral("[%1] %2").arg(kindName(kind), message);
    return QStringLiteral("[%1] %2: %3").arg(kindName(kind), context, message);
}

void ErrorSink::report(const RenderError &error)
{
    qWarning().noquote() << "ErrorSink:" << error.toString();
    m_errors.append(error);
}

void ErrorSink::report(RenderError::Kind kind, const QString &context, const QString &message)
{
    RenderError error;
    error.kind = kind;
    error.context = context;
    error.message = message;
    report(error);
}

int ErrorSink::count(RenderError::Kind kind) const
{
    int n = 0;
    for (const auto &e : m_errors) {
        if (e.kind == kind)
            ++n;
    }
    return n;
}
