/*
 * rendererror.h: Error values and the error-collection sink
 *
 * Rendering never throws. Operations that yield a value return
 * Result<T>; handlers report what they absorbed to an ErrorSink, which
 * logs each report and keeps it for inspection after the render.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_RENDERERROR_H
#define SHELFDOCX_RENDERERROR_H

#include <QList>
#include <QString>

#include <variant>

struct RenderError {
    enum class Kind {
        Block,              // one block failed, rendering continued
        Attribute,          // one style attribute could not be applied
        UnrecognizedImage,  // fetched bytes are not a raster image we can embed
        ExternalService,    // fetch or lookup failed
        Storage             // upload failed (fatal for save)
    };

    Kind kind = Kind::Block;
    QString context;        // block key, attribute name or URL
    QString message;

    static QString kindName(Kind kind);
    QString toString() const;
};

template<typename T>
using Result = std::variant<T, RenderError>;

class ErrorSink
{
public:
    void report(const RenderError &error);
    void report(RenderError::Kind kind, const QString &context, const QString &message);

    const QList<RenderError> &errors() const { return m_errors; }
    int count() const { return m_errors.size(); }
    int count(RenderError::Kind kind) const;
    bool isEmpty() const { return m_errors.isEmpty(); }
    void clear() { m_errors.clear(); }

private:
    QList<RenderError> m_errors;
};

#endif // SHELFDOCX_RENDERERROR_H
