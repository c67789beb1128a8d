#ifndef ANNOTATIONSETTINGSMANAGER_H
#define ANNOTATIONSETTINGSMANAGER_H

#include <QColor>
#include "annotations/NodeAnnotation.h"

/**
 * @brief Singleton class for managing the style given to new nodes.
 *
 * Values that fail validation on load fall back to the defaults below.
 */
class AnnotationSettingsManager
{
public:
    static AnnotationSettingsManager& instance();

    // Color settings
    QColor loadColor() const;
    void saveColor(const QColor& color);

    // Width settings (document units)
    qreal loadWidth() const;
    void saveWidth(qreal width);

    // Opacity settings
    qreal loadOpacity() const;
    void saveOpacity(qreal opacity);

    // Arrowhead settings
    bool loadHasArrow() const;
    void saveHasArrow(bool enabled);

    // Label font size settings
    qreal loadFontSize() const;
    void saveFontSize(qreal size);

    NodeStyle loadDefaultStyle() const;
    void saveDefaultStyle(const NodeStyle& style);

    // Default values
    static QColor defaultColor() { return Qt::red; }
    static constexpr qreal kDefaultWidth = 2.0;
    static constexpr qreal kDefaultOpacity = 0.7;
    static constexpr bool kDefaultHasArrow = true;
    static constexpr qreal kDefaultFontSize = 12.0;
    static constexpr qreal kMaxWidth = 50.0;
    static constexpr qreal kMinFontSize = 4.0;
    static constexpr qreal kMaxFontSize = 96.0;

private:
    AnnotationSettingsManager() = default;
    AnnotationSettingsManager(const AnnotationSettingsManager&) = delete;
    AnnotationSettingsManager& operator=(const AnnotationSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyColor = "node/color";
    static constexpr const char* kSettingsKeyWidth = "node/width";
    static constexpr const char* kSettingsKeyOpacity = "node/opacity";
    static constexpr const char* kSettingsKeyHasArrow = "node/hasArrow";
    static constexpr const char* kSettingsKeyFontSize = "node/fontSize";
};

#endif // ANNOTATIONSETTINGSMANAGER_H
