#pragma once

#include <QWidget>
#include <QImage>
#include <QLabel>
#include <QTimer>
#include "SubtitleData.h"
#include "SubtitleStyle.h"

class PreviewCanvas;

// Shows a still frame with the subtitle lines drawn over it one after the
// other, so style changes can be judged before burning.
class PreviewWidget : public QWidget {
    Q_OBJECT
public:
    static constexpr int CycleIntervalMs = 1500;

    explicit PreviewWidget(QWidget* parent = nullptr);
    ~PreviewWidget();

    void showPreview(const QImage& frame, const SubtitleLines& lines);
    void setSubtitleStyle(const SubtitleStyle& style);
    void clearPreview(const QString& message = {});

private slots:
    void showNextLine();

private:
    void updateCaption();

    PreviewCanvas* m_canvas;
    QLabel* m_captionLabel;
    QTimer m_cycleTimer;
    SubtitleLines m_lines;
    int m_index = -1;
};
