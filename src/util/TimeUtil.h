#pragma once

#include <QString>
#include <algorithm>
#include <cmath>

namespace TimeUtil {

// 0:07.250 style, hours only when needed
inline QString secondsToHMS(double totalSeconds) {
    totalSeconds = std::max(0.0, totalSeconds);
    int whole = static_cast<int>(totalSeconds);
    int hours = whole / 3600;
    int minutes = (whole % 3600) / 60;
    int seconds = whole % 60;
    int millis = static_cast<int>((totalSeconds - whole) * 1000);

    if (hours > 0) {
        return QString("%1:%2:%3.%4")
            .arg(hours)
            .arg(minutes, 2, 10, QChar('0'))
            .arg(seconds, 2, 10, QChar('0'))
            .arg(millis, 3, 10, QChar('0'));
    }
    return QString("%1:%2.%3")
        .arg(minutes)
        .arg(seconds, 2, 10, QChar('0'))
        .arg(millis, 3, 10, QChar('0'));
}

inline QString secondsToMMSS(double totalSeconds) {
    int whole = static_cast<int>(std::max(0.0, totalSeconds));
    return QString("%1:%2")
        .arg(whole / 60)
        .arg(whole % 60, 2, 10, QChar('0'));
}

// "0:07 / 0:30" transport readout
inline QString formatClock(double position, double duration) {
    return QString("%1 / %2").arg(secondsToMMSS(position), secondsToMMSS(duration));
}

// Snap to the nearest frame boundary of the given rate
inline double snapToFrame(double seconds, double fps) {
    if (fps <= 0.0) return seconds;
    return std::round(seconds * fps) / fps;
}

} // namespace TimeUtil
