#include "settings/ViewSettingsManager.h"
#include "settings/Settings.h"
#include <QSettings>

ViewSettingsManager& ViewSettingsManager::instance()
{
    static ViewSettingsManager instance;
    return instance;
}

qreal ViewSettingsManager::loadBaseMagnification() const
{
    auto settings = NodeMark::getSettings();
    bool ok = false;
    const qreal value = settings.value(kSettingsKeyBaseMagnification,
                                       kDefaultBaseMagnification).toDouble(&ok);
    if (!ok || value < kMinBaseMagnification || value > kMaxBaseMagnification) {
        return kDefaultBaseMagnification;
    }
    return value;
}

void ViewSettingsManager::saveBaseMagnification(qreal magnification)
{
    auto settings = NodeMark::getSettings();
    settings.setValue(kSettingsKeyBaseMagnification, magnification);
}

qreal ViewSettingsManager::loadKeyboardZoomStep() const
{
    return loadStep(kSettingsKeyKeyboardZoomStep, kDefaultKeyboardZoomStep);
}

void ViewSettingsManager::saveKeyboardZoomStep(qreal step)
{
    auto settings = NodeMark::getSettings();
    settings.setValue(kSettingsKeyKeyboardZoomStep, step);
}

qreal ViewSettingsManager::loadWheelZoomStep() const
{
    return loadStep(kSettingsKeyWheelZoomStep, kDefaultWheelZoomStep);
}

void ViewSettingsManager::saveWheelZoomStep(qreal step)
{
    auto settings = NodeMark::getSettings();
    settings.setValue(kSettingsKeyWheelZoomStep, step);
}

qreal ViewSettingsManager::loadStep(const char* key, qreal defaultValue)
{
    auto settings = NodeMark::getSettings();
    bool ok = false;
    const qreal value = settings.value(key, defaultValue).toDouble(&ok);
    // A step of 1.0 or less would never zoom in
    if (!ok || value <= 1.0 || value > kMaxZoomStep) {
        return defaultValue;
    }
    return value;
}
