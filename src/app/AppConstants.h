#pragma once

#include <QString>

namespace AppConstants {
    inline constexpr const char* AppName = "ReelForge";
    inline constexpr const char* AppVersion = "0.1.0";
    inline constexpr const char* OrgName = "ReelForge";

    inline constexpr int DefaultWindowWidth = 1280;
    inline constexpr int DefaultWindowHeight = 900;

    // Design space text anchors are authored in (portrait short-form video)
    inline constexpr int DesignWidth = 1080;
    inline constexpr int DesignHeight = 1920;

    // Smallest span any clip may have on the timeline (seconds)
    inline constexpr double MinClipDuration = 0.1;

    // Drift tolerances before a media handle is reseeked (seconds)
    inline constexpr double VideoDriftTolerance = 0.1;
    inline constexpr double AudioDriftTolerance = 0.2;

    inline constexpr double DefaultFps = 30.0;
    inline constexpr double DefaultTextDuration = 3.0;
    // End time given to text descriptors when nothing else is on the timeline
    inline constexpr double FallbackTextEnd = 10.0;

    // Span given to media whose length is not known yet
    inline constexpr double PlaceholderClipDuration = 5.0;

    inline constexpr double StandaloneAudioVolume = 0.8;

    // Mix bus format
    inline constexpr int MixSampleRate = 48000;
    inline constexpr int MixChannels = 2;
}
