#include "ActiveElementResolver.h"
#include "TimelineModel.h"

namespace ActiveElementResolver {

namespace {

std::vector<Clip> activeOn(const Track* track, double t) {
    std::vector<Clip> result;
    if (!track) return result;
    for (const auto& c : track->clips()) {
        if (c.isActiveAt(t)) result.push_back(c);
    }
    return result;
}

} // namespace

ActiveSet resolve(const TimelineModel& model, double t) {
    ActiveSet set;
    set.time = t;
    set.video = activeVideo(model, t);
    set.audio = activeAudio(model, t);
    set.text = activeText(model, t);
    return set;
}

std::optional<Clip> activeVideo(const TimelineModel& model, double t) {
    const Track* track = model.track(ClipType::Video);
    if (track) {
        // Overlapping video clips resolve to document order
        for (const auto& c : track->clips()) {
            if (c.isActiveAt(t)) return c;
        }
    }
    return std::nullopt;
}

std::vector<Clip> activeAudio(const TimelineModel& model, double t) {
    return activeOn(model.track(ClipType::Audio), t);
}

std::vector<Clip> activeText(const TimelineModel& model, double t) {
    return activeOn(model.track(ClipType::Text), t);
}

} // namespace ActiveElementResolver
