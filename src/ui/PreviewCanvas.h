#pragma once

#include <QWidget>
#include <QImage>
#include <QString>
#include "SubtitleStyle.h"

// Paints a frame fitted to the widget and one subtitle over it.
class PreviewCanvas : public QWidget {
    Q_OBJECT
public:
    explicit PreviewCanvas(QWidget* parent = nullptr);

    void setFrame(const QImage& frame);
    void setText(const QString& text);
    void setMessage(const QString& message);
    void setSubtitleStyle(const SubtitleStyle& style);

    // 0 scales text with the displayed frame height like libass does
    void setFixedScale(double scale);

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    QRectF frameDisplayRect() const;

    QImage m_frame;
    QString m_text;
    QString m_message;
    SubtitleStyle m_style;
    double m_fixedScale = 0.0;
};
