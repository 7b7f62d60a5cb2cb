#pragma once

#include <QWidget>
#include <QLineEdit>
#include <QSpinBox>
#include <QDoubleSpinBox>
#include <QComboBox>
#include "SettingsManager.h"

// Encoder and output options. Every edit is reported right away so the
// caller can persist it.
class OutputSettingsWidget : public QWidget {
    Q_OBJECT
public:
    explicit OutputSettingsWidget(QWidget* parent = nullptr);
    ~OutputSettingsWidget();

    void setSettings(const AppSettings& settings);

signals:
    void settingsEdited(const AppSettings& settings);

private slots:
    void onBrowseOutputDir();
    void onBrowseFfmpeg();

private:
    void commit();

    QLineEdit* m_outputDirEdit;
    QLineEdit* m_ffmpegEdit;
    QSpinBox* m_crfSpin;
    QComboBox* m_presetCombo;
    QDoubleSpinBox* m_offsetSpin;
    QDoubleSpinBox* m_fpsSpin;

    AppSettings m_settings;
    bool m_updating = false;
};
