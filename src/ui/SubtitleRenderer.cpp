#include "SubtitleRenderer.h"
#include "AppConstants.h"

#include <QFontMetricsF>
#include <QPainterPath>
#include <algorithm>

double SubtitleRenderer::scaleFor(int targetHeight) {
    return targetHeight > 0 ? static_cast<double>(targetHeight) / AppConstants::AssPlayResY : 1.0;
}

void SubtitleRenderer::paint(QPainter& painter, const QRect& target, const QString& text,
                             const SubtitleStyle& style, double scale) {
    if (text.isEmpty() || target.isEmpty()) return;

    QFont font(style.family);
    font.setPixelSize(std::max(1, qRound(style.size * scale)));
    font.setBold(style.bold);
    QFontMetricsF fm(font);

    const QStringList rows = text.split('\n');
    const double outline = style.outlineWidth * scale;
    const double shadowOffset = std::max(1.0, 3.0 * scale);
    const double lineHeight = fm.lineSpacing();

    // Baseline of the last row sits marginV above the bottom edge
    double y = target.bottom() - style.marginV * scale - fm.descent()
             - lineHeight * (rows.size() - 1);

    QPainterPath path;
    for (const QString& row : rows) {
        double x = target.left() + (target.width() - fm.horizontalAdvance(row)) / 2.0;
        path.addText(QPointF(x, y), font, row);
        y += lineHeight;
    }

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing);

    if (style.shadow) {
        painter.setPen(Qt::NoPen);
        painter.setBrush(QColor(0, 0, 0, 150));
        painter.drawPath(path.translated(shadowOffset, shadowOffset));
    }

    if (outline > 0.0) {
        QPen pen(QColor(style.outlineColor), outline * 2.0);
        pen.setJoinStyle(Qt::RoundJoin);
        painter.strokePath(path, pen);
    }

    painter.fillPath(path, QColor(style.color));
    painter.restore();
}
