#include "DropArea.h"
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QMimeData>
#include <QUrl>

DropArea::DropArea(QWidget* parent) : QLabel(parent) {
    setText("Drop video and subtitle files here");
    setAlignment(Qt::AlignCenter);
    setMinimumHeight(80);
    setWordWrap(true);
    setAcceptDrops(true);
    setHighlighted(false);
}

void DropArea::setHighlighted(bool on) {
    setStyleSheet(on
        ? "QLabel { border: 2px dashed #3daee9; border-radius: 6px; background: #1f3a4a; }"
        : "QLabel { border: 2px dashed #777; border-radius: 6px; }");
}

void DropArea::dragEnterEvent(QDragEnterEvent* event) {
    if (event->mimeData()->hasUrls()) {
        setHighlighted(true);
        event->acceptProposedAction();
    }
}

void DropArea::dragLeaveEvent(QDragLeaveEvent* event) {
    setHighlighted(false);
    QLabel::dragLeaveEvent(event);
}

void DropArea::dropEvent(QDropEvent* event) {
    setHighlighted(false);

    QStringList paths;
    for (const QUrl& url : event->mimeData()->urls()) {
        if (url.isLocalFile())
            paths << url.toLocalFile();
    }
    if (paths.isEmpty()) return;

    event->acceptProposedAction();
    emit filesDropped(paths);
}
