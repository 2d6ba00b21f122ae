#include "rendersettings.h"
#include "shelfdocxsettings.h"

RenderSettings RenderSettings::fromConfig(const ShelfDocxSettings *config)
{
    RenderSettings settings;
    if (!config)
        return settings;

    settings.fontFamily = config->fontFamily();
    settings.fontSize = config->fontSize();
    settings.textColor = config->textColor();
    settings.headerColor = config->headerColor();
    settings.linkColor = config->linkColor();
    settings.codeFontFamily = config->codeFontFamily();
    settings.codeFontSize = config->codeFontSize();

    settings.dictionaryShading = config->dictionaryShading();
    settings.codeBorderColor = config->codeBorderColor();

    settings.imageMaxWidthCm = config->imageMaxWidth();
    settings.imageBorderColor = config->imageBorderColor();
    settings.pixelsPerInch = config->pixelsPerInch();

    settings.includeTableOfContents = config->includeTableOfContents();
    settings.fetchTimeoutMs = config->fetchTimeout();
    return settings;
}
