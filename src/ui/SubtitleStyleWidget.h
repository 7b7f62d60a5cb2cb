#pragma once

#include <QWidget>
#include <QFontComboBox>
#include <QSpinBox>
#include <QCheckBox>
#include <QPushButton>
#include "SubtitleStyle.h"

class PreviewCanvas;

class SubtitleStyleWidget : public QWidget {
    Q_OBJECT
public:
    explicit SubtitleStyleWidget(QWidget* parent = nullptr);
    ~SubtitleStyleWidget();

    void setStyle(const SubtitleStyle& style);
    const SubtitleStyle& style() const { return m_style; }

signals:
    void styleChanged(const SubtitleStyle& style);

private slots:
    void onPickColour();
    void onPickOutlineColour();
    void onResetDefaults();

private:
    void commit();
    void updateColourButton(QPushButton* button, const QString& hex);
    bool pickColour(QString& hex, const QString& title);

    QFontComboBox* m_fontCombo;
    QSpinBox* m_sizeSpin;
    QSpinBox* m_outlineSpin;
    QSpinBox* m_marginSpin;
    QPushButton* m_colourButton;
    QPushButton* m_outlineColourButton;
    QCheckBox* m_boldCheck;
    QCheckBox* m_shadowCheck;
    PreviewCanvas* m_sample;

    SubtitleStyle m_style;
    bool m_updating = false;
};
