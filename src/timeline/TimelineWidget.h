#pragma once

#include <QWidget>
#include <QStringList>
#include "Clip.h"
#include "InteractionController.h"

class TimelineModel;

// Ruler plus one lane per track. Pointer gestures on clips are forwarded to
// the InteractionController; clicks on the ruler or on empty lane space seek.
class TimelineWidget : public QWidget {
    Q_OBJECT
public:
    TimelineWidget(TimelineModel& model, InteractionController& interaction,
                   QWidget* parent = nullptr);
    ~TimelineWidget();

    void zoomToFitAll();

signals:
    void seekRequested(double seconds);
    void filesDropped(const QStringList& paths);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void contextMenuEvent(QContextMenuEvent* event) override;
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dragMoveEvent(QDragMoveEvent* event) override;
    void dropEvent(QDropEvent* event) override;
    QSize minimumSizeHint() const override { return QSize(200, 150); }

private:
    struct Hit {
        ClipRef ref;
        DragHandle handle = DragHandle::Body;
    };

    void paintRuler(QPainter& painter, const QRect& rect);
    void paintTracks(QPainter& painter, const QRect& rect);
    void paintPlayhead(QPainter& painter, const QRect& rect);

    double xToTime(int x) const;
    int timeToX(double time) const;
    QRect clipRect(const Clip& clip, int lane) const;

    // Clip under pos and which part of it; ref is invalid on a miss
    Hit hitTest(const QPoint& pos) const;
    void updateCursor(const QPoint& pos);

    TimelineModel& m_model;
    InteractionController& m_interaction;

    double m_zoom = 50.0;           // pixels per second
    double m_scrollOffset = 0.0;    // seconds at the left edge of the lanes

    bool m_scrubbing = false;
    bool m_panning = false;
    int m_panStartX = 0;
    double m_panStartScroll = 0.0;

    static constexpr int RulerHeight = 28;
    static constexpr int TrackHeight = 40;
    static constexpr int TrackHeaderWidth = 80;
    static constexpr int HandleWidthPx = 6;
};
