#ifndef NODEPROPERTIESDIALOG_H
#define NODEPROPERTIESDIALOG_H

#include <QColor>
#include <QDialog>
#include <QString>

#include "annotations/NodeAnnotation.h"

class QCheckBox;
class QDoubleSpinBox;
class QLabel;
class QLineEdit;
class QPushButton;
class QSlider;
class QSpinBox;

/**
 * @brief Modal editor for a node's name and style.
 *
 * The dialog works on a copy of the values; nothing reaches the node until
 * the caller applies an accepted result with applyTo().
 */
class NodePropertiesDialog : public QDialog
{
    Q_OBJECT

public:
    explicit NodePropertiesDialog(const NodeAnnotation& node, QWidget* parent = nullptr);
    ~NodePropertiesDialog() override;

    QString name() const;
    void setName(const QString& name);

    QColor color() const { return m_color; }
    void setColor(const QColor& color);

    // Style assembled from the editors
    NodeStyle style() const;

    void setWidth(qreal width);
    void setOpacity(qreal opacity);
    void setFontSize(qreal size);
    void setHasArrow(bool hasArrow);

    // "Use as default for new lines"
    bool saveAsDefault() const;
    void setSaveAsDefault(bool enabled);

    // Blank names keep the node's current name
    void applyTo(NodeAnnotation& node) const;

private slots:
    void onChooseColor();
    void onOpacityChanged(int value);

private:
    void setupUi();
    void updateColorButton();

    QString m_originalName;
    QColor m_color;

    QLineEdit* m_nameEdit = nullptr;
    QPushButton* m_colorButton = nullptr;
    QDoubleSpinBox* m_widthSpin = nullptr;
    QSlider* m_opacitySlider = nullptr;
    QLabel* m_opacityLabel = nullptr;
    QSpinBox* m_fontSizeSpin = nullptr;
    QCheckBox* m_arrowCheck = nullptr;
    QCheckBox* m_defaultCheck = nullptr;
};

#endif // NODEPROPERTIESDIALOG_H
