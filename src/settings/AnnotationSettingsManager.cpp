#include "settings/AnnotationSettingsManager.h"
#include "settings/Settings.h"
#include <QSettings>

AnnotationSettingsManager& AnnotationSettingsManager::instance()
{
    static AnnotationSettingsManager instance;
    return instance;
}

QColor AnnotationSettingsManager::loadColor() const
{
    auto settings = NodeMark::getSettings();
    const QColor color = settings.value(kSettingsKeyColor, defaultColor()).value<QColor>();
    return color.isValid() ? color : defaultColor();
}

void AnnotationSettingsManager::saveColor(const QColor& color)
{
    auto settings = NodeMark::getSettings();
    settings.setValue(kSettingsKeyColor, color);
}

qreal AnnotationSettingsManager::loadWidth() const
{
    auto settings = NodeMark::getSettings();
    bool ok = false;
    const qreal width = settings.value(kSettingsKeyWidth, kDefaultWidth).toDouble(&ok);
    if (!ok || width <= 0.0 || width > kMaxWidth) {
        return kDefaultWidth;
    }
    return width;
}

void AnnotationSettingsManager::saveWidth(qreal width)
{
    auto settings = NodeMark::getSettings();
    settings.setValue(kSettingsKeyWidth, width);
}

qreal AnnotationSettingsManager::loadOpacity() const
{
    auto settings = NodeMark::getSettings();
    bool ok = false;
    const qreal opacity = settings.value(kSettingsKeyOpacity, kDefaultOpacity).toDouble(&ok);
    if (!ok || opacity < 0.0 || opacity > 1.0) {
        return kDefaultOpacity;
    }
    return opacity;
}

void AnnotationSettingsManager::saveOpacity(qreal opacity)
{
    auto settings = NodeMark::getSettings();
    settings.setValue(kSettingsKeyOpacity, opacity);
}

bool AnnotationSettingsManager::loadHasArrow() const
{
    auto settings = NodeMark::getSettings();
    return settings.value(kSettingsKeyHasArrow, kDefaultHasArrow).toBool();
}

void AnnotationSettingsManager::saveHasArrow(bool enabled)
{
    auto settings = NodeMark::getSettings();
    settings.setValue(kSettingsKeyHasArrow, enabled);
}

qreal AnnotationSettingsManager::loadFontSize() const
{
    auto settings = NodeMark::getSettings();
    bool ok = false;
    const qreal size = settings.value(kSettingsKeyFontSize, kDefaultFontSize).toDouble(&ok);
    if (!ok || size < kMinFontSize || size > kMaxFontSize) {
        return kDefaultFontSize;
    }
    return size;
}

void AnnotationSettingsManager::saveFontSize(qreal size)
{
    auto settings = NodeMark::getSettings();
    settings.setValue(kSettingsKeyFontSize, size);
}

NodeStyle AnnotationSettingsManager::loadDefaultStyle() const
{
    NodeStyle style;
    style.color = loadColor();
    style.width = loadWidth();
    style.opacity = loadOpacity();
    style.hasArrow = loadHasArrow();
    style.fontSize = loadFontSize();
    return style;
}

void AnnotationSettingsManager::saveDefaultStyle(const NodeStyle& style)
{
    saveColor(style.color);
    saveWidth(style.width);
    saveOpacity(style.opacity);
    saveHasArrow(style.hasArrow);
    saveFontSize(style.fontSize);
}
