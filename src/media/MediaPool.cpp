#include "MediaPool.h"
#include "MediaHandleFactory.h"
#include "TimelineModel.h"
#include "Logging.h"

MediaPool::MediaPool(TimelineModel& model, MediaHandleFactory& factory, QObject* parent)
    : QObject(parent)
    , m_model(model)
    , m_factory(factory)
{
    connect(&m_model, &TimelineModel::clipAdded, this, &MediaPool::onClipAdded);
    connect(&m_model, &TimelineModel::clipRemoved, this, &MediaPool::onClipRemoved);
    connect(&m_model, &TimelineModel::clipSourceChanged, this, &MediaPool::onClipSourceChanged);

    // Pick up clips that existed before the pool
    for (ClipType kind : {ClipType::Video, ClipType::Audio}) {
        for (const auto& c : m_model.track(kind)->clips()) {
            createHandle(c.ref());
        }
    }
}

MediaPool::~MediaPool() = default;

MediaHandle* MediaPool::handle(const ClipRef& ref) const {
    auto it = m_handles.find(ref);
    return it != m_handles.end() ? it->second.get() : nullptr;
}

std::vector<MediaHandle*> MediaPool::handles() const {
    std::vector<MediaHandle*> result;
    result.reserve(m_handles.size());
    for (const auto& [ref, h] : m_handles) result.push_back(h.get());
    return result;
}

void MediaPool::pauseAll() {
    for (const auto& [ref, h] : m_handles) {
        if (h->status() != MediaStatus::Failed) h->pause();
    }
}

void MediaPool::onClipAdded(const ClipRef& ref) {
    createHandle(ref);
}

void MediaPool::onClipRemoved(const ClipRef& ref) {
    destroyHandle(ref);
}

void MediaPool::onClipSourceChanged(const ClipRef& ref) {
    destroyHandle(ref);
    createHandle(ref);
}

void MediaPool::createHandle(const ClipRef& ref) {
    if (ref.type == ClipType::Text || m_handles.count(ref)) return;

    const Clip* clip = m_model.findClip(ref);
    if (!clip) return;

    std::unique_ptr<MediaHandle> h = m_factory.create(*clip);
    if (!h) {
        qCWarning(lcMedia) << "No media handle for clip" << ref.id << clip->sourcePath();
        return;
    }

    MediaHandle* raw = h.get();
    m_handles.emplace(ref, std::move(h));
    qCDebug(lcMedia) << "Handle created for clip" << ref.id << raw->source();
    emit handleCreated(ref, raw);
}

void MediaPool::destroyHandle(const ClipRef& ref) {
    auto it = m_handles.find(ref);
    if (it == m_handles.end()) return;
    qCDebug(lcMedia) << "Handle destroyed for clip" << ref.id << it->second->source();
    m_handles.erase(it);
}
