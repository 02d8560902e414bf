#include "TimelineCommands.h"
#include "Logging.h"

namespace {

QString kindName(ClipType type) {
    switch (type) {
    case ClipType::Video: return "Video";
    case ClipType::Audio: return "Audio";
    case ClipType::Text: return "Text";
    }
    return QString();
}

} // namespace

ClipBoundsCommand::ClipBoundsCommand(TimelineModel& model, const ClipRef& ref,
                                     double oldStart, double oldEnd,
                                     double newStart, double newEnd,
                                     int gestureId, QUndoCommand* parent)
    : QUndoCommand(parent)
    , m_model(model)
    , m_ref(ref)
    , m_oldStart(oldStart)
    , m_oldEnd(oldEnd)
    , m_newStart(newStart)
    , m_newEnd(newEnd)
    , m_gestureId(gestureId)
{}

void ClipBoundsCommand::redo() {
    if (!m_model.setClipBounds(m_ref, m_newStart, m_newEnd)) {
        qCWarning(lcTimeline) << "Clip" << m_ref.id << "no longer exists, bounds not applied";
    }
}

void ClipBoundsCommand::undo() {
    if (!m_model.setClipBounds(m_ref, m_oldStart, m_oldEnd)) {
        qCWarning(lcTimeline) << "Clip" << m_ref.id << "no longer exists, bounds not restored";
    }
}

bool ClipBoundsCommand::mergeWith(const QUndoCommand* other) {
    if (other->id() != id()) return false;
    auto* cmd = static_cast<const ClipBoundsCommand*>(other);
    // -1 marks a one-off edit that never merges
    if (m_gestureId < 0 || cmd->m_gestureId != m_gestureId || cmd->m_ref != m_ref) {
        return false;
    }
    m_newStart = cmd->m_newStart;
    m_newEnd = cmd->m_newEnd;
    return true;
}

MoveClipCommand::MoveClipCommand(TimelineModel& model, const ClipRef& ref,
                                 double oldStart, double oldEnd, double newStart, double newEnd,
                                 int gestureId, QUndoCommand* parent)
    : ClipBoundsCommand(model, ref, oldStart, oldEnd, newStart, newEnd, gestureId, parent)
{
    setText(QString("Move %1 Clip").arg(kindName(ref.type)));
}

ResizeClipCommand::ResizeClipCommand(TimelineModel& model, const ClipRef& ref,
                                     double oldStart, double oldEnd, double newStart, double newEnd,
                                     int gestureId, QUndoCommand* parent)
    : ClipBoundsCommand(model, ref, oldStart, oldEnd, newStart, newEnd, gestureId, parent)
{
    setText(QString("Trim %1 Clip").arg(kindName(ref.type)));
}

DeleteClipCommand::DeleteClipCommand(TimelineModel& model, const ClipRef& ref, QUndoCommand* parent)
    : QUndoCommand(parent)
    , m_model(model)
    , m_ref(ref)
{
    setText(QString("Delete %1 Clip").arg(kindName(ref.type)));
}

void DeleteClipCommand::redo() {
    m_removed = m_model.removeClip(m_ref);
    if (m_removed.empty()) {
        // Rejected removals leave nothing to undo
        setObsolete(true);
    }
}

void DeleteClipCommand::undo() {
    m_model.restoreClips(m_removed);
    m_removed.clear();
}

SetClipVolumeCommand::SetClipVolumeCommand(TimelineModel& model, const ClipRef& ref,
                                           double oldVolume, double newVolume,
                                           QUndoCommand* parent)
    : QUndoCommand(parent)
    , m_model(model)
    , m_ref(ref)
    , m_oldVolume(oldVolume)
    , m_newVolume(newVolume)
{
    setText(QString("Change %1 Clip Volume").arg(kindName(ref.type)));
}

void SetClipVolumeCommand::redo() {
    if (!m_model.setClipVolume(m_ref, m_newVolume)) {
        qCWarning(lcTimeline) << "Clip" << m_ref.id << "no longer exists, volume not applied";
    }
}

void SetClipVolumeCommand::undo() {
    if (!m_model.setClipVolume(m_ref, m_oldVolume)) {
        qCWarning(lcTimeline) << "Clip" << m_ref.id << "no longer exists, volume not restored";
    }
}

SetVideoSpeedCommand::SetVideoSpeedCommand(TimelineModel& model, int videoId,
                                           double oldSpeed, double newSpeed,
                                           QUndoCommand* parent)
    : QUndoCommand(parent)
    , m_model(model)
    , m_videoId(videoId)
    , m_oldSpeed(oldSpeed)
    , m_newSpeed(newSpeed)
{
    setText(QString("Set Video Speed %1x").arg(newSpeed));
}

void SetVideoSpeedCommand::redo() {
    if (!m_model.setVideoSpeed(m_videoId, m_newSpeed)) {
        qCWarning(lcTimeline) << "Video clip" << m_videoId << "no longer exists, speed not applied";
    }
}

void SetVideoSpeedCommand::undo() {
    if (!m_model.setVideoSpeed(m_videoId, m_oldSpeed)) {
        qCWarning(lcTimeline) << "Video clip" << m_videoId << "no longer exists, speed not restored";
    }
}
