#include "JobQueueWidget.h"
#include "FrameGrabber.h"
#include "Logger.h"
#include "SubtitleParserFactory.h"

#include <QFileInfo>
#include <QHBoxLayout>
#include <QPainter>
#include <QVBoxLayout>

namespace {

const QStringList VideoSuffixes = {
    "mp4", "mkv", "avi", "mov", "wmv", "webm", "m4v", "flv", "ts", "mpg", "mpeg"
};

} // namespace

JobQueueWidget::JobQueueWidget(QWidget* parent) : QWidget(parent) {
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);

    m_listWidget = new QListWidget(this);
    m_listWidget->setIconSize(QSize(ThumbWidth, ThumbHeight));
    m_listWidget->setSelectionMode(QAbstractItemView::SingleSelection);
    m_listWidget->setToolTip("Double-click a video to preview it, a CSV file to map its columns");
    layout->addWidget(m_listWidget, 1);

    auto* buttonRow = new QHBoxLayout();
    m_addButton = new QPushButton("Add Files...", this);
    m_clearButton = new QPushButton("Clear", this);
    buttonRow->addWidget(m_addButton);
    buttonRow->addStretch();
    buttonRow->addWidget(m_clearButton);
    layout->addLayout(buttonRow);

    connect(m_addButton, &QPushButton::clicked, this, &JobQueueWidget::addFilesRequested);
    connect(m_clearButton, &QPushButton::clicked, this, &JobQueueWidget::onClearClicked);
    connect(m_listWidget, &QListWidget::itemDoubleClicked, this, &JobQueueWidget::onItemDoubleClicked);
}

JobQueueWidget::~JobQueueWidget() = default;

bool JobQueueWidget::isVideoFile(const QString& path) {
    return VideoSuffixes.contains(QFileInfo(path).suffix().toLower());
}

QPixmap JobQueueWidget::generateVideoThumbnail(const QString& path) {
    FrameGrabber grabber;
    if (grabber.open(path)) {
        double at = grabber.duration() > 2.0 ? 1.0 : 0.0;
        QImage frame = grabber.grabFrameAt(at);
        if (!frame.isNull()) {
            return QPixmap::fromImage(frame).scaled(
                ThumbWidth, ThumbHeight, Qt::KeepAspectRatio, Qt::SmoothTransformation);
        }
    } else {
        qCDebug(lcUi) << "No thumbnail for" << path << grabber.errorString();
    }

    QPixmap pm(ThumbWidth, ThumbHeight);
    pm.fill(QColor(40, 60, 80));
    QPainter p(&pm);
    p.setPen(QColor(100, 180, 255));
    p.drawText(pm.rect(), Qt::AlignCenter, "Video");
    return pm;
}

QPixmap JobQueueWidget::generateSubtitleThumbnail(const QString& path) {
    QPixmap pm(ThumbWidth, ThumbHeight);
    pm.fill(QColor(60, 50, 30));
    QPainter p(&pm);
    p.setPen(QColor(255, 180, 60));
    QFont f = p.font();
    f.setPointSize(12);
    f.setBold(true);
    p.setFont(f);
    p.drawText(pm.rect(), Qt::AlignCenter, QFileInfo(path).suffix().toUpper());
    return pm;
}

int JobQueueWidget::addFiles(const QStringList& paths) {
    int added = 0;
    for (const QString& raw : paths) {
        QFileInfo info(raw);
        const QString path = info.absoluteFilePath();
        if (findItem(path)) continue;

        QueueItemKind kind;
        if (SubtitleParserFactory::isSubtitleFile(path))
            kind = QueueItemKind::Subtitle;
        else if (isVideoFile(path))
            kind = QueueItemKind::Video;
        else {
            qCInfo(lcUi) << "Ignoring unsupported file" << path;
            continue;
        }

        QPixmap thumb = kind == QueueItemKind::Video
            ? generateVideoThumbnail(path) : generateSubtitleThumbnail(path);

        auto* item = new QListWidgetItem(QIcon(thumb), info.fileName());
        item->setData(UserRolePath, path);
        item->setData(UserRoleKind, static_cast<int>(kind));
        item->setToolTip(path);
        m_listWidget->addItem(item);
        ++added;
    }

    return added;
}

void JobQueueWidget::clear() {
    m_listWidget->clear();
}

QStringList JobQueueWidget::pathsOfKind(QueueItemKind kind) const {
    QStringList paths;
    for (int i = 0; i < m_listWidget->count(); ++i) {
        QListWidgetItem* item = m_listWidget->item(i);
        if (static_cast<QueueItemKind>(item->data(UserRoleKind).toInt()) == kind)
            paths << item->data(UserRolePath).toString();
    }
    return paths;
}

QStringList JobQueueWidget::videos() const {
    return pathsOfKind(QueueItemKind::Video);
}

QStringList JobQueueWidget::subtitles() const {
    return pathsOfKind(QueueItemKind::Subtitle);
}

QListWidgetItem* JobQueueWidget::findItem(const QString& path) const {
    for (int i = 0; i < m_listWidget->count(); ++i) {
        QListWidgetItem* item = m_listWidget->item(i);
        if (item->data(UserRolePath).toString() == path)
            return item;
    }
    return nullptr;
}

void JobQueueWidget::updateItemText(QListWidgetItem* item, const QString& status) {
    QString text = QFileInfo(item->data(UserRolePath).toString()).fileName();
    const QString info = item->data(UserRoleInfo).toString();
    if (!info.isEmpty()) text += "\n" + info;
    if (!status.isEmpty()) text += "\n" + status;
    item->setText(text);
}

void JobQueueWidget::setStatus(const QString& path, const QString& status) {
    if (QListWidgetItem* item = findItem(path))
        updateItemText(item, status);
}

void JobQueueWidget::setVideoInfo(const QString& path, const QString& info) {
    if (QListWidgetItem* item = findItem(path)) {
        item->setData(UserRoleInfo, info);
        updateItemText(item, {});
    }
}

void JobQueueWidget::setBusy(bool busy) {
    m_addButton->setEnabled(!busy);
    m_clearButton->setEnabled(!busy);
}

QString JobQueueWidget::fileDialogFilter() {
    QStringList patterns;
    for (const QString& s : VideoSuffixes) patterns << "*." + s;
    QStringList subPatterns;
    for (const QString& s : SubtitleParserFactory::supportedSuffixes()) subPatterns << "*." + s;

    return QString("All Supported (%1 %2);;Video Files (%1);;Subtitle Files (%2);;All Files (*)")
        .arg(patterns.join(' '), subPatterns.join(' '));
}

void JobQueueWidget::onClearClicked() {
    clear();
}

void JobQueueWidget::onItemDoubleClicked(QListWidgetItem* item) {
    const QString path = item->data(UserRolePath).toString();
    auto kind = static_cast<QueueItemKind>(item->data(UserRoleKind).toInt());

    if (kind == QueueItemKind::Video)
        emit videoActivated(path);
    else if (SubtitleParserFactory::formatForPath(path) == SubtitleFormat::Csv)
        emit csvActivated(path);
}
