#include "ui/NodePropertiesDialog.h"
#include "settings/AnnotationSettingsManager.h"

#include <QCheckBox>
#include <QColorDialog>
#include <QDialogButtonBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QSlider>
#include <QSpinBox>
#include <QVBoxLayout>
#include <QtMath>

namespace {
constexpr int kOpacitySteps = 100;
constexpr double kMinWidth = 0.5;
constexpr double kWidthStep = 0.5;
}  // namespace

NodePropertiesDialog::NodePropertiesDialog(const NodeAnnotation& node, QWidget* parent)
    : QDialog(parent)
    , m_originalName(node.name())
    , m_color(node.color())
{
    setWindowTitle(tr("Edit Node Properties"));
    setModal(true);

    setupUi();

    setName(node.name());
    setWidth(node.width());
    setOpacity(node.opacity());
    setFontSize(node.fontSize());
    setHasArrow(node.hasArrow());
    updateColorButton();

    setMinimumWidth(360);
}

NodePropertiesDialog::~NodePropertiesDialog() = default;

void NodePropertiesDialog::setupUi()
{
    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(12, 12, 12, 12);
    mainLayout->setSpacing(10);

    auto* form = new QFormLayout();
    form->setSpacing(8);

    m_nameEdit = new QLineEdit(this);
    m_nameEdit->setObjectName("nameEdit");
    form->addRow(tr("Name:"), m_nameEdit);

    m_colorButton = new QPushButton(tr("Choose..."), this);
    m_colorButton->setObjectName("colorButton");
    connect(m_colorButton, &QPushButton::clicked, this, &NodePropertiesDialog::onChooseColor);
    form->addRow(tr("Color:"), m_colorButton);

    m_widthSpin = new QDoubleSpinBox(this);
    m_widthSpin->setObjectName("widthSpin");
    m_widthSpin->setRange(kMinWidth, AnnotationSettingsManager::kMaxWidth);
    m_widthSpin->setSingleStep(kWidthStep);
    m_widthSpin->setDecimals(1);
    form->addRow(tr("Thickness:"), m_widthSpin);

    auto* opacityRow = new QHBoxLayout();
    m_opacitySlider = new QSlider(Qt::Horizontal, this);
    m_opacitySlider->setObjectName("opacitySlider");
    m_opacitySlider->setRange(0, kOpacitySteps);
    m_opacityLabel = new QLabel(this);
    m_opacityLabel->setMinimumWidth(36);
    connect(m_opacitySlider, &QSlider::valueChanged, this, &NodePropertiesDialog::onOpacityChanged);
    opacityRow->addWidget(m_opacitySlider, 1);
    opacityRow->addWidget(m_opacityLabel);
    form->addRow(tr("Opacity:"), opacityRow);

    m_fontSizeSpin = new QSpinBox(this);
    m_fontSizeSpin->setObjectName("fontSizeSpin");
    m_fontSizeSpin->setRange(qCeil(AnnotationSettingsManager::kMinFontSize),
                             qFloor(AnnotationSettingsManager::kMaxFontSize));
    form->addRow(tr("Font Size:"), m_fontSizeSpin);

    m_arrowCheck = new QCheckBox(tr("Show Arrow"), this);
    m_arrowCheck->setObjectName("arrowCheck");
    form->addRow(QString(), m_arrowCheck);

    mainLayout->addLayout(form);

    m_defaultCheck = new QCheckBox(tr("Use as default for new lines"), this);
    m_defaultCheck->setObjectName("defaultCheck");
    mainLayout->addWidget(m_defaultCheck);

    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    mainLayout->addWidget(buttons);
}

// ============================================================================
// Values
// ============================================================================

QString NodePropertiesDialog::name() const
{
    return m_nameEdit->text().trimmed();
}

void NodePropertiesDialog::setName(const QString& name)
{
    m_nameEdit->setText(name);
}

void NodePropertiesDialog::setColor(const QColor& color)
{
    if (!color.isValid()) {
        return;
    }
    m_color = color;
    updateColorButton();
}

NodeStyle NodePropertiesDialog::style() const
{
    NodeStyle style;
    style.color = m_color;
    style.width = m_widthSpin->value();
    style.opacity = static_cast<qreal>(m_opacitySlider->value()) / kOpacitySteps;
    style.fontSize = m_fontSizeSpin->value();
    style.hasArrow = m_arrowCheck->isChecked();
    return style;
}

void NodePropertiesDialog::setWidth(qreal width)
{
    m_widthSpin->setValue(width);
}

void NodePropertiesDialog::setOpacity(qreal opacity)
{
    m_opacitySlider->setValue(qRound(opacity * kOpacitySteps));
    onOpacityChanged(m_opacitySlider->value());
}

void NodePropertiesDialog::setFontSize(qreal size)
{
    m_fontSizeSpin->setValue(qRound(size));
}

void NodePropertiesDialog::setHasArrow(bool hasArrow)
{
    m_arrowCheck->setChecked(hasArrow);
}

bool NodePropertiesDialog::saveAsDefault() const
{
    return m_defaultCheck->isChecked();
}

void NodePropertiesDialog::setSaveAsDefault(bool enabled)
{
    m_defaultCheck->setChecked(enabled);
}

void NodePropertiesDialog::applyTo(NodeAnnotation& node) const
{
    const QString newName = name();
    node.setName(newName.isEmpty() ? m_originalName : newName);
    node.setStyle(style());
}

// ============================================================================
// Slots
// ============================================================================

void NodePropertiesDialog::onChooseColor()
{
    const QColor chosen = QColorDialog::getColor(m_color, this, tr("Line Color"));
    setColor(chosen);
}

void NodePropertiesDialog::onOpacityChanged(int value)
{
    m_opacityLabel->setText(QString::number(static_cast<qreal>(value) / kOpacitySteps, 'f', 2));
}

void NodePropertiesDialog::updateColorButton()
{
    m_colorButton->setStyleSheet(QStringLiteral("QPushButton { background-color: %1; color: %2; }")
                                     .arg(m_color.name(),
                                          m_color.lightness() > 128 ? QStringLiteral("#000000")
                                                                    : QStringLiteral("#ffffff")));
}
