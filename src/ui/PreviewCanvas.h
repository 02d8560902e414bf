#pragma once

#include <QWidget>
#include <QImage>
#include <QPointF>

// Shows the composed render surface fitted into the widget, with view zoom
// (wheel) and pan (middle drag). A left click emits clicked().
class PreviewCanvas : public QWidget {
    Q_OBJECT
public:
    explicit PreviewCanvas(QWidget* parent = nullptr);

    void setFrame(const QImage& frame);
    void resetView();

signals:
    void clicked();

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;

private:
    // Display rect of the frame with view zoom and pan applied
    QRectF frameDisplayRect() const;

    QImage m_frame;

    double m_viewZoom = 1.0;
    QPointF m_viewOffset{0.0, 0.0};  // widget pixels
    bool m_viewPanning = false;
    QPointF m_viewPanStart;
    QPointF m_viewOffsetStart;
};
