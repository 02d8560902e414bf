#pragma once

#include <QColor>
#include <QFont>
#include <QPainter>
#include <QPointF>
#include <QRectF>
#include "Clip.h"

// Paints one text layer centered on a surface-space anchor in one of the
// four overlay styles.
class TextOverlayRenderer {
public:
    // Box padding around the text metrics, surface pixels
    static constexpr double BoxPadX = 12.0;
    static constexpr double BoxPadY = 8.0;
    static constexpr double BoxRadius = 12.0;
    // Outline stroke width as a fraction of the font size
    static constexpr double OutlineRatio = 0.15;

    // fontScale maps design pixels to surface pixels (the surface's sy)
    static void paint(QPainter& painter, const TextPayload& text, const QPointF& anchor,
                      double fontScale);

    static QFont fontFor(const TextPayload& text, double fontScale);
    // Background box for the box styles, centered on anchor
    static QRectF boxRect(const TextPayload& text, const QPointF& anchor, double fontScale);
    static QColor backgroundFor(const TextPayload& text);
};
