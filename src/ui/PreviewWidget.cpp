#include "PreviewWidget.h"
#include "PreviewCanvas.h"
#include "TimeUtil.h"

#include <QVBoxLayout>

PreviewWidget::PreviewWidget(QWidget* parent) : QWidget(parent) {
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);

    m_canvas = new PreviewCanvas(this);
    layout->addWidget(m_canvas, 1);

    m_captionLabel = new QLabel(this);
    m_captionLabel->setAlignment(Qt::AlignCenter);
    layout->addWidget(m_captionLabel);

    m_cycleTimer.setInterval(CycleIntervalMs);
    connect(&m_cycleTimer, &QTimer::timeout, this, &PreviewWidget::showNextLine);
}

PreviewWidget::~PreviewWidget() = default;

void PreviewWidget::showPreview(const QImage& frame, const SubtitleLines& lines) {
    m_lines = lines;
    m_index = -1;
    m_canvas->setFrame(frame);

    if (m_lines.empty()) {
        m_cycleTimer.stop();
        m_canvas->setText({});
        m_captionLabel->setText("No subtitle lines");
        return;
    }

    showNextLine();
    if (m_lines.size() > 1)
        m_cycleTimer.start();
    else
        m_cycleTimer.stop();
}

void PreviewWidget::setSubtitleStyle(const SubtitleStyle& style) {
    m_canvas->setSubtitleStyle(style);
}

void PreviewWidget::clearPreview(const QString& message) {
    m_cycleTimer.stop();
    m_lines.clear();
    m_index = -1;
    m_canvas->setMessage(message);
    m_captionLabel->clear();
}

void PreviewWidget::showNextLine() {
    if (m_lines.empty()) return;
    m_index = (m_index + 1) % static_cast<int>(m_lines.size());
    m_canvas->setText(m_lines[m_index].plainText());
    updateCaption();
}

void PreviewWidget::updateCaption() {
    const SubtitleLine& line = m_lines[m_index];
    m_captionLabel->setText(QString("Line %1 of %2   %3 - %4")
        .arg(m_index + 1)
        .arg(m_lines.size())
        .arg(TimeUtil::secondsToHMSms(line.start), TimeUtil::secondsToHMSms(line.end)));
}
