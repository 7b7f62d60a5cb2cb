#pragma once

#include <QWidget>
#include <QListWidget>
#include <QPushButton>
#include <QStringList>

enum class QueueItemKind {
    Video,
    Subtitle
};

// Files waiting to be processed: videos with a thumbnail, subtitle files
// with their format. Items carry their path and a status line.
class JobQueueWidget : public QWidget {
    Q_OBJECT
public:
    explicit JobQueueWidget(QWidget* parent = nullptr);
    ~JobQueueWidget();

    // Returns the number of files actually queued. Duplicates and files
    // that are neither video nor subtitle are skipped.
    int addFiles(const QStringList& paths);
    void clear();

    QStringList videos() const;
    QStringList subtitles() const;

    void setStatus(const QString& path, const QString& status);
    void setVideoInfo(const QString& path, const QString& info);

    // Locks adding and clearing while a batch runs
    void setBusy(bool busy);

    static bool isVideoFile(const QString& path);
    static QString fileDialogFilter();

signals:
    void videoActivated(const QString& path);
    void csvActivated(const QString& path);
    void addFilesRequested();

private slots:
    void onClearClicked();
    void onItemDoubleClicked(QListWidgetItem* item);

private:
    static constexpr int ThumbWidth = 96;
    static constexpr int ThumbHeight = 54;
    static constexpr int UserRolePath = Qt::UserRole;
    static constexpr int UserRoleKind = Qt::UserRole + 1;
    static constexpr int UserRoleInfo = Qt::UserRole + 2;

    QPixmap generateVideoThumbnail(const QString& path);
    QPixmap generateSubtitleThumbnail(const QString& path);
    QListWidgetItem* findItem(const QString& path) const;
    QStringList pathsOfKind(QueueItemKind kind) const;
    void updateItemText(QListWidgetItem* item, const QString& status);

    QListWidget* m_listWidget;
    QPushButton* m_addButton;
    QPushButton* m_clearButton;
};
