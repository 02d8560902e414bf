#include "InteractionController.h"
#include "TimelineModel.h"
#include "TimelineCommands.h"
#include "Logging.h"
#include <QUndoStack>
#include <algorithm>
#include <cmath>

InteractionController::InteractionController(TimelineModel& model, QUndoStack& undoStack,
                                             QObject* parent)
    : QObject(parent)
    , m_model(model)
    , m_undoStack(undoStack)
{
    connect(&m_model, &TimelineModel::clipTimingChanged,
            this, &InteractionController::onClipTimingChanged);
    connect(&m_model, &TimelineModel::clipRemoved,
            this, &InteractionController::onClipRemoved);
}

bool InteractionController::beginDrag(const ClipRef& ref, DragHandle handle) {
    if (m_drag.active) endDrag();

    // Linked audio has no timing of its own; the gesture drives its video
    ClipRef target;
    const Clip* clip = editTarget(ref, target);
    if (!clip) return false;

    m_drag.active = true;
    m_drag.ref = target;
    m_drag.handle = handle;
    m_drag.origStart = clip->start;
    m_drag.origEnd = clip->end;
    m_drag.frozenDuration = m_model.duration();
    m_drag.gestureId = m_nextGestureId++;
    return true;
}

bool InteractionController::press(const ClipRef& ref, DragHandle handle) {
    if (handle == DragHandle::Body) click(ref);
    return beginDrag(ref, handle);
}

void InteractionController::dragTo(double pointerTime) {
    if (!m_drag.active || !std::isfinite(pointerTime)) return;

    const Clip* clip = m_model.findClip(m_drag.ref);
    if (!clip) {
        m_drag.active = false;
        return;
    }

    const double minLen = m_model.minClipDuration();
    const double total = m_drag.frozenDuration;
    double start = clip->start;
    double end = clip->end;

    switch (m_drag.handle) {
    case DragHandle::Body: {
        double len = m_drag.origEnd - m_drag.origStart;
        double maxStart = std::max(0.0, total - len);
        start = std::clamp(pointerTime - len / 2.0, 0.0, maxStart);
        end = start + len;
        break;
    }
    case DragHandle::Left:
        start = std::clamp(pointerTime, 0.0, std::max(0.0, end - minLen));
        break;
    case DragHandle::Right:
        end = std::clamp(pointerTime, start + minLen, std::max(start + minLen, total));
        break;
    }

    if (start == clip->start && end == clip->end) return;

    if (m_drag.handle == DragHandle::Body) {
        m_undoStack.push(new MoveClipCommand(m_model, m_drag.ref, clip->start, clip->end,
                                             start, end, m_drag.gestureId));
    } else {
        m_undoStack.push(new ResizeClipCommand(m_model, m_drag.ref, clip->start, clip->end,
                                               start, end, m_drag.gestureId));
    }
}

void InteractionController::endDrag() {
    m_drag = DragState();
}

void InteractionController::click(const ClipRef& ref) {
    const Clip* clip = m_model.findClip(ref);
    if (clip && clip->type() == ClipType::Text) select(ref);
}

void InteractionController::clearSelection() {
    if (!m_selection.isValid()) return;
    m_selection = ClipRef();
    emit selectionChanged(m_selection);
}

bool InteractionController::setClipTiming(const ClipRef& ref, double start, double end) {
    if (!std::isfinite(start) || !std::isfinite(end)) return false;

    ClipRef target;
    const Clip* clip = editTarget(ref, target);
    if (!clip) return false;

    const double minLen = m_model.minClipDuration();
    const double total = std::max(m_model.duration(), minLen);
    start = std::clamp(start, 0.0, std::max(0.0, end - minLen));
    end = std::clamp(end, start + minLen, std::max(start + minLen, total));

    if (start == clip->start && end == clip->end) {
        // Nothing moved but the panel may hold an unclamped value
        if (target == m_selection) emit selectedTimingChanged(clip->start, clip->end);
        return true;
    }

    m_undoStack.push(new ResizeClipCommand(m_model, target, clip->start, clip->end, start, end));
    return true;
}

bool InteractionController::setClipVolume(const ClipRef& ref, double volume) {
    if (!std::isfinite(volume)) return false;
    ClipRef target;
    const Clip* clip = editTarget(ref, target);
    if (!clip || clip->type() == ClipType::Text) return false;

    volume = std::clamp(volume, 0.0, 1.0);
    if (volume == clip->volume()) return true;
    m_undoStack.push(new SetClipVolumeCommand(m_model, target, clip->volume(), volume));
    return true;
}

bool InteractionController::setClipSpeed(const ClipRef& ref, double speed) {
    if (!std::isfinite(speed) || speed <= 0.0) return false;
    ClipRef target;
    const Clip* clip = editTarget(ref, target);
    // Standalone audio always plays at 1x
    if (!clip || clip->type() != ClipType::Video) return false;

    if (speed == clip->speed()) return true;
    m_undoStack.push(new SetVideoSpeedCommand(m_model, target.id, clip->speed(), speed));
    return true;
}

bool InteractionController::deleteClip(const ClipRef& ref) {
    QString reason;
    if (!m_model.canRemoveClip(ref, &reason)) {
        qCWarning(lcTimeline) << "Delete rejected:" << reason;
        return false;
    }
    m_undoStack.push(new DeleteClipCommand(m_model, ref));
    return true;
}

void InteractionController::onClipTimingChanged(const ClipRef& ref, double start, double end) {
    if (ref == m_selection) emit selectedTimingChanged(start, end);
}

void InteractionController::onClipRemoved(const ClipRef& ref) {
    if (ref == m_selection) clearSelection();
    if (m_drag.active && ref == m_drag.ref) m_drag = DragState();
}

const Clip* InteractionController::editTarget(const ClipRef& ref, ClipRef& target) const {
    const Clip* clip = m_model.findClip(ref);
    target = ref;
    if (clip && clip->isLinkedAudio()) {
        target = ClipRef{ClipType::Video, ref.id};
        clip = m_model.findClip(target);
    }
    return clip;
}

void InteractionController::select(const ClipRef& ref) {
    if (ref != m_selection) {
        m_selection = ref;
        emit selectionChanged(ref);
    }
    if (const Clip* clip = m_model.findClip(ref)) {
        emit selectedTimingChanged(clip->start, clip->end);
    }
}
