#include "TimelineWidget.h"
#include "TimelineModel.h"
#include "Track.h"
#include "TimeUtil.h"
#include <QPainter>
#include <QMouseEvent>
#include <QKeyEvent>
#include <QWheelEvent>
#include <QContextMenuEvent>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QMimeData>
#include <QMenu>
#include <QInputDialog>
#include <QFileInfo>
#include <QUrl>
#include <algorithm>
#include <cmath>

namespace {

// Lane order top to bottom
const ClipType LaneKinds[] = {ClipType::Text, ClipType::Video, ClipType::Audio};
constexpr int LaneCount = 3;

QString clipLabel(const Clip& clip) {
    if (const TextPayload* t = clip.text()) return t->content;
    if (const AudioPayload* a = clip.audio()) return a->displayName;
    return QFileInfo(clip.sourcePath()).fileName();
}

} // namespace

TimelineWidget::TimelineWidget(TimelineModel& model, InteractionController& interaction,
                               QWidget* parent)
    : QWidget(parent)
    , m_model(model)
    , m_interaction(interaction)
{
    setMinimumHeight(RulerHeight + LaneCount * TrackHeight);
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setAcceptDrops(true);

    connect(&m_model, &TimelineModel::playheadChanged, this, [this](double pos) {
        // Keep the playhead in view while playing
        if (!m_scrubbing && !m_interaction.isDragging() && !m_panning) {
            int px = timeToX(pos);
            if (px < TrackHeaderWidth || px > width()) {
                double viewWidth = (width() - TrackHeaderWidth) / m_zoom;
                m_scrollOffset = std::max(0.0, pos - viewWidth * 0.2);
            }
        }
        update();
    });
    connect(&m_model, &TimelineModel::clipAdded, this, [this]() { update(); });
    connect(&m_model, &TimelineModel::clipRemoved, this, [this]() { update(); });
    connect(&m_model, &TimelineModel::clipTimingChanged, this, [this]() { update(); });
    connect(&m_model, &TimelineModel::durationChanged, this, [this]() { update(); });
    connect(&m_interaction, &InteractionController::selectionChanged, this, [this]() { update(); });
}

TimelineWidget::~TimelineWidget() = default;

void TimelineWidget::zoomToFitAll() {
    double total = m_model.duration();
    if (total <= 0.0) return;

    int viewWidth = std::max(50, width() - TrackHeaderWidth);
    m_zoom = (viewWidth * 0.9) / total;
    m_scrollOffset = 0.0;
    update();
}

// --- Geometry ---

double TimelineWidget::xToTime(int x) const {
    return (x - TrackHeaderWidth) / m_zoom + m_scrollOffset;
}

int TimelineWidget::timeToX(double time) const {
    return TrackHeaderWidth + static_cast<int>((time - m_scrollOffset) * m_zoom);
}

QRect TimelineWidget::clipRect(const Clip& clip, int lane) const {
    int cx = timeToX(clip.start);
    int cw = std::max(static_cast<int>(clip.duration() * m_zoom), 4);
    return QRect(cx, RulerHeight + lane * TrackHeight + 2, cw, TrackHeight - 4);
}

TimelineWidget::Hit TimelineWidget::hitTest(const QPoint& pos) const {
    Hit hit;
    int y = pos.y() - RulerHeight;
    if (y < 0 || pos.x() < TrackHeaderWidth) return hit;

    int lane = y / TrackHeight;
    if (lane >= LaneCount) return hit;

    const Track* track = m_model.track(LaneKinds[lane]);
    const auto& clips = track->clips();
    // Last drawn is on top
    for (auto it = clips.rbegin(); it != clips.rend(); ++it) {
        QRect r = clipRect(*it, lane);
        if (pos.x() < r.left() || pos.x() > r.right()) continue;

        hit.ref = it->ref();
        if (r.width() > 3 * HandleWidthPx) {
            if (pos.x() <= r.left() + HandleWidthPx) hit.handle = DragHandle::Left;
            else if (pos.x() >= r.right() - HandleWidthPx) hit.handle = DragHandle::Right;
        }
        return hit;
    }
    return hit;
}

void TimelineWidget::updateCursor(const QPoint& pos) {
    Hit hit = hitTest(pos);
    if (!hit.ref.isValid()) {
        setCursor(Qt::ArrowCursor);
    } else if (hit.handle == DragHandle::Body) {
        setCursor(Qt::OpenHandCursor);
    } else {
        setCursor(Qt::SizeHorCursor);
    }
}

// --- Paint ---

void TimelineWidget::paintEvent(QPaintEvent*) {
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);

    painter.fillRect(rect(), QColor(35, 35, 38));

    QRect rulerRect(TrackHeaderWidth, 0, width() - TrackHeaderWidth, RulerHeight);
    QRect tracksRect(0, RulerHeight, width(), height() - RulerHeight);

    paintRuler(painter, rulerRect);
    paintTracks(painter, tracksRect);
    paintPlayhead(painter, QRect(TrackHeaderWidth, 0, width() - TrackHeaderWidth, height()));
}

void TimelineWidget::paintRuler(QPainter& painter, const QRect& rect) {
    painter.fillRect(rect, QColor(50, 50, 54));

    // Labels need about 60px between them
    static constexpr double MinLabelSpacingPx = 60.0;
    static const double candidates[] = {0.1, 0.2, 0.5, 1, 2, 5, 10, 15, 30, 60, 120, 300, 600};

    double tickInterval = 600.0;
    for (double c : candidates) {
        if (c * m_zoom >= MinLabelSpacingPx) {
            tickInterval = c;
            break;
        }
    }

    painter.setPen(QColor(130, 130, 130));
    painter.setFont(QFont("Arial", 8));

    double startTime = m_scrollOffset;
    double endTime = m_scrollOffset + rect.width() / m_zoom;

    for (double t = std::floor(startTime / tickInterval) * tickInterval;
         t <= endTime; t += tickInterval) {
        int x = timeToX(t);
        if (x < rect.left() || x > rect.right()) continue;

        painter.drawLine(x, rect.bottom() - 8, x, rect.bottom());
        painter.drawText(x + 3, rect.bottom() - 10, TimeUtil::secondsToMMSS(t));
    }

    // Project end marker
    int endX = timeToX(m_model.duration());
    if (endX >= rect.left() && endX <= rect.right()) {
        painter.setPen(QColor(200, 200, 90));
        painter.drawLine(endX, rect.top(), endX, rect.bottom());
    }

    painter.setPen(QColor(60, 60, 64));
    painter.drawLine(rect.bottomLeft(), rect.bottomRight());
}

void TimelineWidget::paintTracks(QPainter& painter, const QRect& rect) {
    const ClipRef selected = m_interaction.selection();
    const ClipRef dragged = m_interaction.isDragging() ? m_interaction.draggedClip() : ClipRef();

    for (int lane = 0; lane < LaneCount; ++lane) {
        const Track* track = m_model.track(LaneKinds[lane]);
        int y = rect.top() + lane * TrackHeight;

        QRect headerRect(0, y, TrackHeaderWidth, TrackHeight);
        QRect laneRect(TrackHeaderWidth, y, rect.width() - TrackHeaderWidth, TrackHeight);

        painter.fillRect(headerRect, QColor(45, 45, 48));
        painter.setPen(QColor(180, 180, 180));
        painter.drawText(headerRect.adjusted(6, 0, 0, 0), Qt::AlignVCenter, track->name());

        painter.fillRect(laneRect, QColor(40, 40, 43));

        painter.save();
        painter.setClipRect(laneRect);
        for (const Clip& clip : track->clips()) {
            QRect r = clipRect(clip, lane);

            QColor color;
            switch (clip.type()) {
            case ClipType::Video: color = QColor(60, 100, 160); break;
            case ClipType::Audio: color = clip.isLinkedAudio() ? QColor(50, 115, 70)
                                                               : QColor(60, 140, 80); break;
            case ClipType::Text: color = QColor(160, 100, 60); break;
            }

            painter.fillRect(r, color);

            bool isSelected = clip.ref() == selected ||
                (dragged.isValid() && clip.id == dragged.id &&
                 (clip.ref() == dragged || clip.isLinkedAudio()));
            if (isSelected) {
                painter.setPen(QPen(QColor(255, 200, 50), 2));
            } else {
                painter.setPen(color.lighter(130));
            }
            painter.drawRect(r);

            // Resize grips
            if (r.width() > 3 * HandleWidthPx && !clip.isLinkedAudio()) {
                QColor grip = color.lighter(150);
                painter.fillRect(QRect(r.left(), r.top(), HandleWidthPx / 2, r.height()), grip);
                painter.fillRect(QRect(r.right() - HandleWidthPx / 2 + 1, r.top(),
                                       HandleWidthPx / 2, r.height()), grip);
            }

            if (r.width() > 40) {
                painter.setPen(QColor(220, 220, 220));
                painter.setFont(QFont("Arial", 7));
                painter.drawText(r.adjusted(HandleWidthPx, 0, -HandleWidthPx, 0),
                                 Qt::AlignVCenter | Qt::TextSingleLine, clipLabel(clip));
            }
        }
        painter.restore();

        painter.setPen(QColor(55, 55, 58));
        painter.drawLine(0, y + TrackHeight, rect.width(), y + TrackHeight);
    }
}

void TimelineWidget::paintPlayhead(QPainter& painter, const QRect& rect) {
    int x = timeToX(m_model.playheadPosition());
    if (x < rect.left() || x > rect.right()) return;

    painter.setPen(QPen(QColor(220, 50, 50), 2));
    painter.drawLine(x, rect.top(), x, rect.bottom());

    QPolygon triangle;
    triangle << QPoint(x - 6, rect.top()) << QPoint(x + 6, rect.top())
             << QPoint(x, rect.top() + 8);
    painter.setBrush(QColor(220, 50, 50));
    painter.setPen(Qt::NoPen);
    painter.drawPolygon(triangle);
}

// --- Mouse events ---

void TimelineWidget::mousePressEvent(QMouseEvent* event) {
    int mx = static_cast<int>(event->position().x());
    int my = static_cast<int>(event->position().y());

    if (event->button() == Qt::MiddleButton) {
        m_panning = true;
        m_panStartX = mx;
        m_panStartScroll = m_scrollOffset;
        setCursor(Qt::ClosedHandCursor);
        return;
    }

    if (event->button() != Qt::LeftButton) return;
    if (mx <= TrackHeaderWidth) return;

    // Ruler scrubs
    if (my < RulerHeight) {
        m_scrubbing = true;
        emit seekRequested(std::max(0.0, xToTime(mx)));
        return;
    }

    Hit hit = hitTest(QPoint(mx, my));
    if (hit.ref.isValid()) {
        m_interaction.press(hit.ref, hit.handle);
        if (hit.handle == DragHandle::Body) setCursor(Qt::ClosedHandCursor);
    } else {
        m_interaction.clearSelection();
        m_scrubbing = true;
        emit seekRequested(std::max(0.0, xToTime(mx)));
    }
    update();
}

void TimelineWidget::mouseMoveEvent(QMouseEvent* event) {
    int mx = static_cast<int>(event->position().x());

    if (m_panning) {
        double dx = mx - m_panStartX;
        m_scrollOffset = std::max(0.0, m_panStartScroll - dx / m_zoom);
        update();
        return;
    }

    if (m_scrubbing) {
        emit seekRequested(std::max(0.0, xToTime(mx)));
        return;
    }

    if (m_interaction.isDragging()) {
        m_interaction.dragTo(xToTime(mx));
        return;
    }

    updateCursor(event->position().toPoint());
}

void TimelineWidget::mouseReleaseEvent(QMouseEvent* event) {
    if (event->button() == Qt::MiddleButton && m_panning) {
        m_panning = false;
        setCursor(Qt::ArrowCursor);
        return;
    }
    if (event->button() == Qt::LeftButton) {
        m_scrubbing = false;
        if (m_interaction.isDragging()) m_interaction.endDrag();
        updateCursor(event->position().toPoint());
        update();
    }
}

void TimelineWidget::mouseDoubleClickEvent(QMouseEvent* event) {
    if (event->button() == Qt::MiddleButton) {
        zoomToFitAll();
        return;
    }
    QWidget::mouseDoubleClickEvent(event);
}

// --- Key events ---

void TimelineWidget::keyPressEvent(QKeyEvent* event) {
    if (event->key() == Qt::Key_Delete || event->key() == Qt::Key_Backspace) {
        if (m_interaction.selection().isValid()) {
            m_interaction.deleteClip(m_interaction.selection());
        }
    } else if (event->key() == Qt::Key_Escape) {
        m_interaction.clearSelection();
    } else {
        QWidget::keyPressEvent(event);
    }
}

// --- Context menu ---

void TimelineWidget::contextMenuEvent(QContextMenuEvent* event) {
    Hit hit = hitTest(event->pos());
    if (!hit.ref.isValid()) return;

    ClipRef ref = hit.ref;
    QString reason;
    bool removable = m_model.canRemoveClip(ref, &reason);

    QMenu menu(this);
    QAction* deleteAction = menu.addAction("Delete");
    deleteAction->setEnabled(removable);
    if (!removable) deleteAction->setToolTip(reason);
    connect(deleteAction, &QAction::triggered, this, [this, ref]() {
        m_interaction.deleteClip(ref);
    });

    const Clip* clip = m_model.findClip(ref);
    if (clip && clip->type() != ClipType::Text) {
        menu.addSeparator();
        // Linked audio shows and edits its video's values
        const Clip* owner = clip->isLinkedAudio()
            ? m_model.findClip(ClipRef{ClipType::Video, ref.id}) : clip;
        if (owner && owner->type() == ClipType::Video) {
            QMenu* speedMenu = menu.addMenu("Speed");
            for (double speed : {0.5, 1.0, 1.5, 2.0}) {
                QAction* a = speedMenu->addAction(QString("%1x").arg(speed));
                a->setCheckable(true);
                a->setChecked(owner->speed() == speed);
                connect(a, &QAction::triggered, this, [this, ref, speed]() {
                    m_interaction.setClipSpeed(ref, speed);
                });
            }
        }
        const int percent = qRound((owner ? owner->volume() : clip->volume()) * 100.0);
        QAction* volumeAction = menu.addAction(QString("Volume (%1%)...").arg(percent));
        connect(volumeAction, &QAction::triggered, this, [this, ref, percent]() {
            bool ok = false;
            int value = QInputDialog::getInt(this, "Clip Volume", "Volume (%):",
                                             percent, 0, 100, 5, &ok);
            if (ok) m_interaction.setClipVolume(ref, value / 100.0);
        });
    }

    menu.exec(event->globalPos());
}

// --- Wheel ---

void TimelineWidget::wheelEvent(QWheelEvent* event) {
    if (event->modifiers() & Qt::ControlModifier) {
        // Zoom around the cursor
        int mx = static_cast<int>(event->position().x());
        double timeAtCursor = xToTime(mx);

        double factor = event->angleDelta().y() > 0 ? 1.2 : 1.0 / 1.2;
        m_zoom = std::clamp(m_zoom * factor, 2.0, 2000.0);
        m_scrollOffset = std::max(0.0, timeAtCursor - (mx - TrackHeaderWidth) / m_zoom);
    } else {
        double delta = event->angleDelta().y() > 0 ? -20.0 : 20.0;
        m_scrollOffset = std::max(0.0, m_scrollOffset + delta / m_zoom);
    }
    update();
}

// --- Drag and drop ---

void TimelineWidget::dragEnterEvent(QDragEnterEvent* event) {
    if (event->mimeData()->hasUrls()) {
        event->acceptProposedAction();
    }
}

void TimelineWidget::dragMoveEvent(QDragMoveEvent* event) {
    if (event->mimeData()->hasUrls()) {
        event->acceptProposedAction();
    }
}

void TimelineWidget::dropEvent(QDropEvent* event) {
    const QMimeData* mime = event->mimeData();
    if (!mime->hasUrls()) return;

    QStringList paths;
    for (const QUrl& url : mime->urls()) {
        if (url.isLocalFile()) paths << url.toLocalFile();
    }
    if (!paths.isEmpty()) emit filesDropped(paths);

    event->acceptProposedAction();
}
