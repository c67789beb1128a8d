#ifndef VIEWSETTINGSMANAGER_H
#define VIEWSETTINGSMANAGER_H

#include <QtGlobal>

/**
 * @brief Singleton class for managing page magnification and zoom steps.
 */
class ViewSettingsManager
{
public:
    static ViewSettingsManager& instance();

    // Rasterizer base magnification (pixels per document unit at zoom 1.0)
    qreal loadBaseMagnification() const;
    void saveBaseMagnification(qreal magnification);

    // Ctrl+= / Ctrl+- factor
    qreal loadKeyboardZoomStep() const;
    void saveKeyboardZoomStep(qreal step);

    // Ctrl+wheel factor per notch
    qreal loadWheelZoomStep() const;
    void saveWheelZoomStep(qreal step);

    // Default values
    static constexpr qreal kDefaultBaseMagnification = 1.5;
    static constexpr qreal kDefaultKeyboardZoomStep = 1.2;
    static constexpr qreal kDefaultWheelZoomStep = 1.1;
    static constexpr qreal kMinBaseMagnification = 0.25;
    static constexpr qreal kMaxBaseMagnification = 8.0;
    static constexpr qreal kMaxZoomStep = 4.0;

private:
    ViewSettingsManager() = default;
    ViewSettingsManager(const ViewSettingsManager&) = delete;
    ViewSettingsManager& operator=(const ViewSettingsManager&) = delete;

    static qreal loadStep(const char* key, qreal defaultValue);

    static constexpr const char* kSettingsKeyBaseMagnification = "view/baseMagnification";
    static constexpr const char* kSettingsKeyKeyboardZoomStep = "view/keyboardZoomStep";
    static constexpr const char* kSettingsKeyWheelZoomStep = "view/wheelZoomStep";
};

#endif // VIEWSETTINGSMANAGER_H
