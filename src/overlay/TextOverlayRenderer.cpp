#include "TextOverlayRenderer.h"
#include <QFontMetricsF>
#include <QPainterPath>
#include <algorithm>

QFont TextOverlayRenderer::fontFor(const TextPayload& text, double fontScale) {
    QFont font(text.font.isEmpty() ? QStringLiteral("Arial") : text.font);
    font.setPixelSize(std::max(1, qRound(text.size * fontScale)));
    font.setBold(text.bold);
    font.setItalic(text.italic);
    return font;
}

QColor TextOverlayRenderer::backgroundFor(const TextPayload& text) {
    switch (text.style) {
    case TextStyle::SolidBox:
        return text.background.isValid() ? text.background : QColor(0, 0, 0);
    case TextStyle::RoundedBox:
        return text.background.isValid() ? text.background : QColor(0, 0, 0, 178);
    case TextStyle::TranslucentBox:
        return QColor(0, 0, 0, 128);
    case TextStyle::Outline:
        break;
    }
    return QColor();
}

QRectF TextOverlayRenderer::boxRect(const TextPayload& text, const QPointF& anchor,
                                    double fontScale) {
    QFont font = fontFor(text, fontScale);
    QFontMetricsF fm(font);
    double w = fm.horizontalAdvance(text.content);
    double h = font.pixelSize();
    return QRectF(anchor.x() - w / 2.0 - BoxPadX, anchor.y() - h / 2.0 - BoxPadY,
                  w + 2 * BoxPadX, h + 2 * BoxPadY);
}

void TextOverlayRenderer::paint(QPainter& painter, const TextPayload& text, const QPointF& anchor,
                                double fontScale) {
    if (text.content.isEmpty()) return;

    QFont font = fontFor(text, fontScale);
    QFontMetricsF fm(font);
    double width = fm.horizontalAdvance(text.content);
    // Baseline that puts the glyph box's middle on the anchor
    QPointF baseline(anchor.x() - width / 2.0,
                     anchor.y() + (fm.ascent() - fm.descent()) / 2.0);

    QPainterPath glyphs;
    glyphs.addText(baseline, font, text.content);

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);

    switch (text.style) {
    case TextStyle::Outline: {
        QPen stroke(QColor(0, 0, 0));
        stroke.setWidthF(font.pixelSize() * OutlineRatio);
        stroke.setJoinStyle(Qt::RoundJoin);
        painter.strokePath(glyphs, stroke);
        break;
    }
    case TextStyle::SolidBox:
    case TextStyle::TranslucentBox:
        painter.fillRect(boxRect(text, anchor, fontScale), backgroundFor(text));
        break;
    case TextStyle::RoundedBox: {
        QPainterPath box;
        box.addRoundedRect(boxRect(text, anchor, fontScale), BoxRadius, BoxRadius);
        painter.fillPath(box, backgroundFor(text));
        break;
    }
    }

    painter.fillPath(glyphs, text.color.isValid() ? text.color : QColor(Qt::white));
    painter.restore();
}
