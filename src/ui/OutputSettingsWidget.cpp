#include "OutputSettingsWidget.h"
#include "JobBuilder.h"

#include <QFileDialog>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QVBoxLayout>

OutputSettingsWidget::OutputSettingsWidget(QWidget* parent) : QWidget(parent) {
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(4, 4, 4, 4);
    layout->setAlignment(Qt::AlignTop);

    // Output group
    auto* outputGroup = new QGroupBox("Output", this);
    auto* outputForm = new QFormLayout(outputGroup);

    auto* dirRow = new QHBoxLayout();
    m_outputDirEdit = new QLineEdit(outputGroup);
    m_outputDirEdit->setPlaceholderText("\"output\" folder next to each video");
    auto* browseDirBtn = new QPushButton("Browse...", outputGroup);
    dirRow->addWidget(m_outputDirEdit, 1);
    dirRow->addWidget(browseDirBtn);
    outputForm->addRow("Folder:", dirRow);

    m_offsetSpin = new QDoubleSpinBox(outputGroup);
    m_offsetSpin->setRange(-3600.0, 3600.0);
    m_offsetSpin->setDecimals(2);
    m_offsetSpin->setSingleStep(0.1);
    m_offsetSpin->setSuffix(" s");
    m_offsetSpin->setToolTip("Shifts every subtitle line; negative values show them earlier");
    outputForm->addRow("Start offset:", m_offsetSpin);

    layout->addWidget(outputGroup);

    // Encoder group
    auto* encoderGroup = new QGroupBox("Encoder", this);
    auto* encoderForm = new QFormLayout(encoderGroup);

    m_crfSpin = new QSpinBox(encoderGroup);
    m_crfSpin->setRange(0, 51);
    m_crfSpin->setToolTip("Lower is better quality and larger files");
    encoderForm->addRow("CRF:", m_crfSpin);

    m_presetCombo = new QComboBox(encoderGroup);
    m_presetCombo->addItems(JobBuilder::presets());
    encoderForm->addRow("Preset:", m_presetCombo);

    auto* ffmpegRow = new QHBoxLayout();
    m_ffmpegEdit = new QLineEdit(encoderGroup);
    m_ffmpegEdit->setPlaceholderText(AppConstants::DefaultFfmpegProgram);
    auto* browseFfmpegBtn = new QPushButton("Browse...", encoderGroup);
    ffmpegRow->addWidget(m_ffmpegEdit, 1);
    ffmpegRow->addWidget(browseFfmpegBtn);
    encoderForm->addRow("ffmpeg:", ffmpegRow);

    layout->addWidget(encoderGroup);

    // CSV group
    auto* csvGroup = new QGroupBox("CSV subtitles", this);
    auto* csvForm = new QFormLayout(csvGroup);
    m_fpsSpin = new QDoubleSpinBox(csvGroup);
    m_fpsSpin->setRange(1.0, 240.0);
    m_fpsSpin->setDecimals(3);
    m_fpsSpin->setToolTip("Frame rate used for new CSV mappings with frame-based times");
    csvForm->addRow("Default FPS:", m_fpsSpin);
    layout->addWidget(csvGroup);

    connect(browseDirBtn, &QPushButton::clicked, this, &OutputSettingsWidget::onBrowseOutputDir);
    connect(browseFfmpegBtn, &QPushButton::clicked, this, &OutputSettingsWidget::onBrowseFfmpeg);
    connect(m_outputDirEdit, &QLineEdit::editingFinished, this, &OutputSettingsWidget::commit);
    connect(m_ffmpegEdit, &QLineEdit::editingFinished, this, &OutputSettingsWidget::commit);
    connect(m_crfSpin, QOverload<int>::of(&QSpinBox::valueChanged), this, &OutputSettingsWidget::commit);
    connect(m_presetCombo, &QComboBox::currentTextChanged, this, &OutputSettingsWidget::commit);
    connect(m_offsetSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged),
            this, &OutputSettingsWidget::commit);
    connect(m_fpsSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged),
            this, &OutputSettingsWidget::commit);
}

OutputSettingsWidget::~OutputSettingsWidget() = default;

void OutputSettingsWidget::setSettings(const AppSettings& settings) {
    m_updating = true;
    m_settings = settings;
    m_outputDirEdit->setText(settings.outputDir);
    m_ffmpegEdit->setText(settings.ffmpegPath == AppConstants::DefaultFfmpegProgram
                              ? QString() : settings.ffmpegPath);
    m_crfSpin->setValue(settings.crf);
    int presetIndex = m_presetCombo->findText(settings.preset);
    m_presetCombo->setCurrentIndex(presetIndex >= 0 ? presetIndex
                                                    : m_presetCombo->findText(AppConstants::DefaultPreset));
    m_offsetSpin->setValue(settings.startOffset);
    m_fpsSpin->setValue(settings.fps);
    m_updating = false;
}

void OutputSettingsWidget::commit() {
    if (m_updating) return;

    AppSettings s = m_settings;
    s.outputDir = m_outputDirEdit->text().trimmed();
    QString ffmpeg = m_ffmpegEdit->text().trimmed();
    s.ffmpegPath = ffmpeg.isEmpty() ? QString(AppConstants::DefaultFfmpegProgram) : ffmpeg;
    s.crf = m_crfSpin->value();
    s.preset = m_presetCombo->currentText();
    s.startOffset = m_offsetSpin->value();
    s.fps = m_fpsSpin->value();

    if (s.outputDir == m_settings.outputDir && s.ffmpegPath == m_settings.ffmpegPath
        && s.crf == m_settings.crf && s.preset == m_settings.preset
        && s.startOffset == m_settings.startOffset && s.fps == m_settings.fps)
        return;

    m_settings = s;
    emit settingsEdited(m_settings);
}

void OutputSettingsWidget::onBrowseOutputDir() {
    QString dir = QFileDialog::getExistingDirectory(this, "Output Folder", m_outputDirEdit->text());
    if (dir.isEmpty()) return;
    m_outputDirEdit->setText(dir);
    commit();
}

void OutputSettingsWidget::onBrowseFfmpeg() {
    QString path = QFileDialog::getOpenFileName(this, "Locate ffmpeg", m_ffmpegEdit->text());
    if (path.isEmpty()) return;
    m_ffmpegEdit->setText(path);
    commit();
}
