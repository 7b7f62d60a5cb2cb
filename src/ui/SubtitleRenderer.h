#pragma once

#include <QPainter>
#include <QRect>
#include <QString>
#include "SubtitleStyle.h"

// Approximates libass output for previews: bottom-centred text with outline
// and drop shadow. Sizes in the style are relative to the ASS canvas height.
namespace SubtitleRenderer {

// Pixel scale for a target of the given height
double scaleFor(int targetHeight);

void paint(QPainter& painter, const QRect& target, const QString& text,
           const SubtitleStyle& style, double scale);

} // namespace SubtitleRenderer
