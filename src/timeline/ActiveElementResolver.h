#pragma once

#include <optional>
#include <vector>
#include "Clip.h"

class TimelineModel;

// Snapshot of what is on screen / on air at one instant. Holds copies so
// that sync and compositing read a consistent state for the whole tick.
struct ActiveSet {
    double time = 0.0;
    std::optional<Clip> video;   // at most one
    std::vector<Clip> audio;     // every concurrent audio clip
    std::vector<Clip> text;      // every concurrent text clip
};

namespace ActiveElementResolver {

// A clip is active when t is in [start, end). Video resolves to the first
// match in track order; audio and text return the complete matching set.
ActiveSet resolve(const TimelineModel& model, double t);

std::optional<Clip> activeVideo(const TimelineModel& model, double t);
std::vector<Clip> activeAudio(const TimelineModel& model, double t);
std::vector<Clip> activeText(const TimelineModel& model, double t);

} // namespace ActiveElementResolver
