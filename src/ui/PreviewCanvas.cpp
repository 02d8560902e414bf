#include "PreviewCanvas.h"
#include <QPainter>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QtMath>

PreviewCanvas::PreviewCanvas(QWidget* parent) : QWidget(parent) {
    setMinimumSize(180, 320);
}

void PreviewCanvas::setFrame(const QImage& frame) {
    m_frame = frame;
    update();
}

void PreviewCanvas::resetView() {
    m_viewZoom = 1.0;
    m_viewOffset = QPointF(0.0, 0.0);
    update();
}

QRectF PreviewCanvas::frameDisplayRect() const {
    if (m_frame.isNull()) return QRectF();

    QSizeF frameSize(m_frame.size());
    QSizeF widgetSize = size();

    double baseScale = qMin(widgetSize.width() / frameSize.width(),
                            widgetSize.height() / frameSize.height());
    double effectiveScale = baseScale * m_viewZoom;

    double w = frameSize.width() * effectiveScale;
    double h = frameSize.height() * effectiveScale;
    double x = (widgetSize.width() - w) / 2.0 + m_viewOffset.x();
    double y = (widgetSize.height() - h) / 2.0 + m_viewOffset.y();
    return QRectF(x, y, w, h);
}

void PreviewCanvas::paintEvent(QPaintEvent*) {
    QPainter painter(this);
    painter.setRenderHint(QPainter::SmoothPixmapTransform);

    painter.fillRect(rect(), QColor(0x3a, 0x3a, 0x3a));

    QRectF fr = frameDisplayRect();
    if (fr.isNull()) {
        painter.setPen(QColor(150, 150, 150));
        painter.drawText(rect(), Qt::AlignCenter, "No Media");
        return;
    }
    painter.drawImage(fr, m_frame);
}

void PreviewCanvas::mousePressEvent(QMouseEvent* event) {
    if (event->button() == Qt::MiddleButton) {
        m_viewPanning = true;
        m_viewPanStart = event->position();
        m_viewOffsetStart = m_viewOffset;
        setCursor(Qt::ClosedHandCursor);
        return;
    }
    if (event->button() == Qt::LeftButton) {
        emit clicked();
    }
}

void PreviewCanvas::mouseMoveEvent(QMouseEvent* event) {
    if (!m_viewPanning) return;
    m_viewOffset = m_viewOffsetStart + (event->position() - m_viewPanStart);
    update();
}

void PreviewCanvas::mouseReleaseEvent(QMouseEvent* event) {
    if (event->button() == Qt::MiddleButton && m_viewPanning) {
        m_viewPanning = false;
        setCursor(Qt::ArrowCursor);
    }
}

void PreviewCanvas::wheelEvent(QWheelEvent* event) {
    // Zoom around the cursor
    QPointF cursor = event->position();
    QRectF before = frameDisplayRect();
    if (before.isNull()) return;

    double factor = event->angleDelta().y() > 0 ? 1.15 : 1.0 / 1.15;
    double newZoom = qBound(0.1, m_viewZoom * factor, 20.0);
    double ratio = newZoom / m_viewZoom;
    m_viewZoom = newZoom;

    QPointF center(width() / 2.0, height() / 2.0);
    QPointF rel = cursor - center - m_viewOffset;
    m_viewOffset += rel - rel * ratio;
    update();
}

void PreviewCanvas::mouseDoubleClickEvent(QMouseEvent* event) {
    if (event->button() == Qt::MiddleButton) {
        resetView();
        return;
    }
    QWidget::mouseDoubleClickEvent(event);
}
