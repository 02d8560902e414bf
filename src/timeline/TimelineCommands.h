#pragma once

#include <QUndoCommand>
#include <vector>
#include "TimelineModel.h"

// Ids used by QUndoStack to decide which commands may merge
enum class TimelineCommandId : int {
    MoveClip = 1,
    ResizeClip = 2
};

// Shared shape of move and resize: a clip goes from one pair of bounds to
// another through TimelineModel::setClipBounds. Successive updates from the
// same pointer gesture collapse into a single undo step.
class ClipBoundsCommand : public QUndoCommand {
public:
    ClipBoundsCommand(TimelineModel& model, const ClipRef& ref,
                      double oldStart, double oldEnd,
                      double newStart, double newEnd,
                      int gestureId, QUndoCommand* parent = nullptr);

    void redo() override;
    void undo() override;
    bool mergeWith(const QUndoCommand* other) override;

    ClipRef clipRef() const { return m_ref; }
    int gestureId() const { return m_gestureId; }
    double newStart() const { return m_newStart; }
    double newEnd() const { return m_newEnd; }

protected:
    TimelineModel& m_model;
    ClipRef m_ref;
    double m_oldStart;
    double m_oldEnd;
    double m_newStart;
    double m_newEnd;
    int m_gestureId;
};

class MoveClipCommand : public ClipBoundsCommand {
public:
    MoveClipCommand(TimelineModel& model, const ClipRef& ref,
                    double oldStart, double oldEnd, double newStart, double newEnd,
                    int gestureId = -1, QUndoCommand* parent = nullptr);
    int id() const override { return static_cast<int>(TimelineCommandId::MoveClip); }
};

class ResizeClipCommand : public ClipBoundsCommand {
public:
    ResizeClipCommand(TimelineModel& model, const ClipRef& ref,
                      double oldStart, double oldEnd, double newStart, double newEnd,
                      int gestureId = -1, QUndoCommand* parent = nullptr);
    int id() const override { return static_cast<int>(TimelineCommandId::ResizeClip); }
};

// Removes a clip (and for video, its linked audio). Undo puts every removed
// clip back at its old index.
class DeleteClipCommand : public QUndoCommand {
public:
    DeleteClipCommand(TimelineModel& model, const ClipRef& ref, QUndoCommand* parent = nullptr);

    void redo() override;
    void undo() override;

    int removedCount() const { return static_cast<int>(m_removed.size()); }

private:
    TimelineModel& m_model;
    ClipRef m_ref;
    std::vector<RemovedClip> m_removed;
};

// Volume of a video or audio clip. A video's linked audio follows it.
class SetClipVolumeCommand : public QUndoCommand {
public:
    SetClipVolumeCommand(TimelineModel& model, const ClipRef& ref,
                         double oldVolume, double newVolume, QUndoCommand* parent = nullptr);

    void redo() override;
    void undo() override;

private:
    TimelineModel& m_model;
    ClipRef m_ref;
    double m_oldVolume;
    double m_newVolume;
};

// Playback rate of a video clip and its linked audio
class SetVideoSpeedCommand : public QUndoCommand {
public:
    SetVideoSpeedCommand(TimelineModel& model, int videoId,
                         double oldSpeed, double newSpeed, QUndoCommand* parent = nullptr);

    void redo() override;
    void undo() override;

private:
    TimelineModel& m_model;
    int m_videoId;
    double m_oldSpeed;
    double m_newSpeed;
};
