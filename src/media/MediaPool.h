#pragma once

#include <QObject>
#include <map>
#include <memory>
#include <vector>
#include "Clip.h"
#include "MediaHandle.h"

class TimelineModel;
class MediaHandleFactory;

// Owns the media handle of every video and audio clip in the model, keyed by
// clip. Handles are created when clips appear, rebuilt when a clip's source
// changes and destroyed with the clip.
class MediaPool : public QObject {
    Q_OBJECT
public:
    MediaPool(TimelineModel& model, MediaHandleFactory& factory, QObject* parent = nullptr);
    ~MediaPool() override;

    MediaHandle* handle(const ClipRef& ref) const;
    int handleCount() const { return static_cast<int>(m_handles.size()); }
    std::vector<MediaHandle*> handles() const;

    void pauseAll();

signals:
    void handleCreated(const ClipRef& ref, MediaHandle* handle);

private slots:
    void onClipAdded(const ClipRef& ref);
    void onClipRemoved(const ClipRef& ref);
    void onClipSourceChanged(const ClipRef& ref);

private:
    void createHandle(const ClipRef& ref);
    void destroyHandle(const ClipRef& ref);

    TimelineModel& m_model;
    MediaHandleFactory& m_factory;
    std::map<ClipRef, std::unique_ptr<MediaHandle>> m_handles;
};
