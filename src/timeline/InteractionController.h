#pragma once

#include <QObject>
#include "Clip.h"

class QUndoStack;
class TimelineModel;

enum class DragHandle {
    Body,
    Left,
    Right
};

// Turns pointer gestures, timing-panel edits and clip property edits into
// clamped mutations, pushed as commands on the undo stack. Owns the text
// selection.
class InteractionController : public QObject {
    Q_OBJECT
public:
    InteractionController(TimelineModel& model, QUndoStack& undoStack, QObject* parent = nullptr);

    // Gesture lifecycle. The project duration and the clip's original bounds
    // are frozen at beginDrag for the rest of the gesture.
    bool beginDrag(const ClipRef& ref, DragHandle handle);
    // Pointer press on a clip. A body press also selects like click(); a
    // trim handle only starts the gesture.
    bool press(const ClipRef& ref, DragHandle handle);
    void dragTo(double pointerTime);
    void endDrag();
    bool isDragging() const { return m_drag.active; }
    ClipRef draggedClip() const { return m_drag.ref; }

    // A non-handle click; selects text clips
    void click(const ClipRef& ref);
    void clearSelection();
    ClipRef selection() const { return m_selection; }

    // Timing panel edit. start lands in [0, end - min], end in [start + min, duration].
    bool setClipTiming(const ClipRef& ref, double start, double end);

    // Volume in [0, 1] and speed > 0 of video and audio clips. Linked audio
    // is edited through its video. False for text clips and invalid values.
    bool setClipVolume(const ClipRef& ref, double volume);
    bool setClipSpeed(const ClipRef& ref, double speed);

    // Rejected (with a warning) for the primary video and for clip-linked audio
    bool deleteClip(const ClipRef& ref);

signals:
    void selectionChanged(const ClipRef& ref);
    void selectedTimingChanged(double start, double end);

private slots:
    void onClipTimingChanged(const ClipRef& ref, double start, double end);
    void onClipRemoved(const ClipRef& ref);

private:
    void select(const ClipRef& ref);
    // Linked audio resolves to its video; null for unknown clips
    const Clip* editTarget(const ClipRef& ref, ClipRef& target) const;

    struct DragState {
        bool active = false;
        ClipRef ref;
        DragHandle handle = DragHandle::Body;
        double origStart = 0.0;
        double origEnd = 0.0;
        double frozenDuration = 0.0;
        int gestureId = 0;
    };

    TimelineModel& m_model;
    QUndoStack& m_undoStack;
    DragState m_drag;
    ClipRef m_selection;
    int m_nextGestureId = 1;
};
