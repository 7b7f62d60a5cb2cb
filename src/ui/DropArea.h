#pragma once

#include <QLabel>
#include <QStringList>

// Accepts local files dragged in from the desktop or a file manager.
class DropArea : public QLabel {
    Q_OBJECT
public:
    explicit DropArea(QWidget* parent = nullptr);

signals:
    void filesDropped(const QStringList& paths);

protected:
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dragLeaveEvent(QDragLeaveEvent* event) override;
    void dropEvent(QDropEvent* event) override;

private:
    void setHighlighted(bool on);
};
