#include "SubtitleStyleWidget.h"
#include "PreviewCanvas.h"

#include <QColorDialog>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLinearGradient>
#include <QPainter>
#include <QVBoxLayout>

namespace {

// Neutral backdrop so light and dark colours both read in the sample
QImage sampleBackground() {
    QImage image(640, 160, QImage::Format_RGB32);
    QPainter p(&image);
    QLinearGradient gradient(0, 0, image.width(), 0);
    gradient.setColorAt(0.0, QColor(30, 40, 60));
    gradient.setColorAt(0.5, QColor(120, 130, 140));
    gradient.setColorAt(1.0, QColor(220, 210, 190));
    p.fillRect(image.rect(), gradient);
    return image;
}

} // namespace

SubtitleStyleWidget::SubtitleStyleWidget(QWidget* parent) : QWidget(parent) {
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(4, 4, 4, 4);
    layout->setAlignment(Qt::AlignTop);

    auto* fontGroup = new QGroupBox("Font", this);
    auto* form = new QFormLayout(fontGroup);

    m_fontCombo = new QFontComboBox(fontGroup);
    form->addRow("Family:", m_fontCombo);

    m_sizeSpin = new QSpinBox(fontGroup);
    m_sizeSpin->setRange(8, 200);
    m_sizeSpin->setSuffix(" px");
    form->addRow("Size:", m_sizeSpin);

    m_colourButton = new QPushButton(fontGroup);
    form->addRow("Colour:", m_colourButton);

    m_boldCheck = new QCheckBox("Bold", fontGroup);
    form->addRow(QString(), m_boldCheck);

    layout->addWidget(fontGroup);

    auto* outlineGroup = new QGroupBox("Outline && Placement", this);
    auto* outlineForm = new QFormLayout(outlineGroup);

    m_outlineSpin = new QSpinBox(outlineGroup);
    m_outlineSpin->setRange(0, 10);
    m_outlineSpin->setSuffix(" px");
    m_outlineSpin->setSpecialValueText("None");
    outlineForm->addRow("Outline width:", m_outlineSpin);

    m_outlineColourButton = new QPushButton(outlineGroup);
    outlineForm->addRow("Outline colour:", m_outlineColourButton);

    m_shadowCheck = new QCheckBox("Drop shadow", outlineGroup);
    outlineForm->addRow(QString(), m_shadowCheck);

    m_marginSpin = new QSpinBox(outlineGroup);
    m_marginSpin->setRange(0, 500);
    m_marginSpin->setSuffix(" px");
    outlineForm->addRow("Bottom margin:", m_marginSpin);

    layout->addWidget(outlineGroup);

    m_sample = new PreviewCanvas(this);
    m_sample->setMinimumSize(320, 80);
    m_sample->setMaximumHeight(160);
    m_sample->setFrame(sampleBackground());
    m_sample->setFixedScale(0.5);
    m_sample->setText("Sample subtitle\nSecond line");
    layout->addWidget(m_sample);

    auto* resetRow = new QHBoxLayout();
    auto* resetBtn = new QPushButton("Reset to Defaults", this);
    resetRow->addStretch();
    resetRow->addWidget(resetBtn);
    layout->addLayout(resetRow);

    connect(m_fontCombo, &QFontComboBox::currentFontChanged, this, &SubtitleStyleWidget::commit);
    connect(m_sizeSpin, QOverload<int>::of(&QSpinBox::valueChanged), this, &SubtitleStyleWidget::commit);
    connect(m_outlineSpin, QOverload<int>::of(&QSpinBox::valueChanged), this, &SubtitleStyleWidget::commit);
    connect(m_marginSpin, QOverload<int>::of(&QSpinBox::valueChanged), this, &SubtitleStyleWidget::commit);
    connect(m_boldCheck, &QCheckBox::toggled, this, &SubtitleStyleWidget::commit);
    connect(m_shadowCheck, &QCheckBox::toggled, this, &SubtitleStyleWidget::commit);
    connect(m_colourButton, &QPushButton::clicked, this, &SubtitleStyleWidget::onPickColour);
    connect(m_outlineColourButton, &QPushButton::clicked, this, &SubtitleStyleWidget::onPickOutlineColour);
    connect(resetBtn, &QPushButton::clicked, this, &SubtitleStyleWidget::onResetDefaults);

    setStyle(SubtitleStyle{});
}

SubtitleStyleWidget::~SubtitleStyleWidget() = default;

void SubtitleStyleWidget::setStyle(const SubtitleStyle& style) {
    m_updating = true;
    m_style = style;
    m_fontCombo->setCurrentFont(QFont(style.family));
    m_sizeSpin->setValue(style.size);
    m_outlineSpin->setValue(style.outlineWidth);
    m_marginSpin->setValue(style.marginV);
    m_boldCheck->setChecked(style.bold);
    m_shadowCheck->setChecked(style.shadow);
    updateColourButton(m_colourButton, style.color);
    updateColourButton(m_outlineColourButton, style.outlineColor);
    m_sample->setSubtitleStyle(style);
    m_updating = false;
}

void SubtitleStyleWidget::updateColourButton(QPushButton* button, const QString& hex) {
    button->setText(hex.toLower());
    button->setStyleSheet(QString("QPushButton { background-color: %1; color: %2; }")
        .arg(hex, QColor(hex).lightness() > 128 ? "black" : "white"));
}

bool SubtitleStyleWidget::pickColour(QString& hex, const QString& title) {
    QColor colour = QColorDialog::getColor(QColor(hex), this, title);
    if (!colour.isValid()) return false;
    hex = colour.name(QColor::HexRgb);
    return true;
}

void SubtitleStyleWidget::onPickColour() {
    QString hex = m_style.color;
    if (!pickColour(hex, "Text Colour")) return;
    m_style.color = hex;
    updateColourButton(m_colourButton, hex);
    commit();
}

void SubtitleStyleWidget::onPickOutlineColour() {
    QString hex = m_style.outlineColor;
    if (!pickColour(hex, "Outline Colour")) return;
    m_style.outlineColor = hex;
    updateColourButton(m_outlineColourButton, hex);
    commit();
}

void SubtitleStyleWidget::onResetDefaults() {
    setStyle(SubtitleStyle{});
    emit styleChanged(m_style);
}

void SubtitleStyleWidget::commit() {
    if (m_updating) return;

    m_style.family = m_fontCombo->currentFont().family();
    m_style.size = m_sizeSpin->value();
    m_style.outlineWidth = m_outlineSpin->value();
    m_style.marginV = m_marginSpin->value();
    m_style.bold = m_boldCheck->isChecked();
    m_style.shadow = m_shadowCheck->isChecked();

    m_sample->setSubtitleStyle(m_style);
    emit styleChanged(m_style);
}
