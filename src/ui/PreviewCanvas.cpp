#include "PreviewCanvas.h"
#include "SubtitleRenderer.h"

#include <QPainter>
#include <algorithm>

PreviewCanvas::PreviewCanvas(QWidget* parent) : QWidget(parent) {
    setMinimumSize(320, 180);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
}

void PreviewCanvas::setFrame(const QImage& frame) {
    m_frame = frame;
    m_message.clear();
    update();
}

void PreviewCanvas::setText(const QString& text) {
    m_text = text;
    update();
}

void PreviewCanvas::setMessage(const QString& message) {
    m_message = message;
    m_frame = QImage();
    m_text.clear();
    update();
}

void PreviewCanvas::setSubtitleStyle(const SubtitleStyle& style) {
    m_style = style;
    update();
}

void PreviewCanvas::setFixedScale(double scale) {
    m_fixedScale = scale;
    update();
}

QRectF PreviewCanvas::frameDisplayRect() const {
    if (m_frame.isNull()) return {};

    double scale = std::min(static_cast<double>(width()) / m_frame.width(),
                            static_cast<double>(height()) / m_frame.height());
    double w = m_frame.width() * scale;
    double h = m_frame.height() * scale;
    return QRectF((width() - w) / 2.0, (height() - h) / 2.0, w, h);
}

void PreviewCanvas::paintEvent(QPaintEvent*) {
    QPainter painter(this);
    painter.setRenderHint(QPainter::SmoothPixmapTransform);
    painter.fillRect(rect(), QColor(0x3a, 0x3a, 0x3a));

    if (m_frame.isNull()) {
        painter.setPen(QColor(180, 180, 180));
        painter.drawText(rect(), Qt::AlignCenter | Qt::TextWordWrap,
                         m_message.isEmpty() ? "Double-click a video to preview" : m_message);
        return;
    }

    QRectF fr = frameDisplayRect();
    painter.drawImage(fr, m_frame);

    // libass scales the script to the video height, so do the same here
    QRect target = fr.toAlignedRect();
    double scale = m_fixedScale > 0.0 ? m_fixedScale : SubtitleRenderer::scaleFor(target.height());
    SubtitleRenderer::paint(painter, target, m_text, m_style, scale);
}
