/*
 * rendersettings.h: Options struct for the DOCX renderer
 *
 * Defaults match shelfdocxsettings.kcfg. Library code only sees this
 * struct; fromConfig() bridges the KConfigXT singleton.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SHELFDOCX_RENDERSETTINGS_H
#define SHELFDOCX_RENDERSETTINGS_H

#include <QColor>
#include <QString>

class ShelfDocxSettings;

struct RenderSettings {
    // Text
    QString fontFamily = QStringLiteral("Inter");
    qreal fontSize = 12.0;
    QColor textColor = QColor(64, 64, 64);
    QColor headerColor = QColor(52, 171, 118);
    QColor linkColor = QColor(76, 174, 227);
    QString codeFontFamily = QStringLiteral("Courier New");
    qreal codeFontSize = 10.0;

    // Tables
    QColor dictionaryShading = QColor(0xE7, 0xE7, 0xF9);
    QColor codeBorderColor = QColor(0x36, 0x5F, 0xDD);

    // Images
    qreal imageMaxWidthCm = 14.8;
    QColor imageBorderColor = QColor(233, 240, 255);
    qreal pixelsPerInch = 96.0;

    // Document
    bool includeTableOfContents = false;
    int fetchTimeoutMs = 30000;

    static RenderSettings fromConfig(const ShelfDocxSettings *config);
};

#endif // SHELFDOCX_RENDERSETTINGS_H
