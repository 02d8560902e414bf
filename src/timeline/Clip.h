#pragma once

#include <QString>
#include <QPointF>
#include <QColor>
#include <QMetaType>
#include <variant>

// Order matches the alternatives of ClipPayload
enum class ClipType {
    Video,
    Audio,
    Text
};

struct VideoPayload {
    QString sourcePath;
    double speed = 1.0;
    double volume = 1.0;
    bool primary = false;     // primary clip can be replaced but never deleted
};

struct AudioPayload {
    QString sourcePath;
    QString displayName;
    double volume = 0.8;
    double speed = 1.0;       // mirrors the parent speed for clip-linked audio
    bool linkedToVideo = false;
};

enum class TextStyle {
    Outline,
    SolidBox,
    RoundedBox,
    TranslucentBox
};

struct TextPayload {
    QString content;
    QPointF anchor{540.0, 960.0};   // design space
    double size = 48.0;             // design space pixels
    QColor color = QColor(Qt::white);
    QString font = QStringLiteral("Arial");
    bool bold = false;
    bool italic = false;
    QColor background;              // invalid = style default
    TextStyle style = TextStyle::Outline;
    bool visible = false;           // recomputed every tick
};

using ClipPayload = std::variant<VideoPayload, AudioPayload, TextPayload>;

// Identifies a clip across tracks. A clip-linked audio clip shares its
// parent's id, so the kind is part of the identity.
struct ClipRef {
    ClipType type = ClipType::Video;
    int id = -1;

    bool isValid() const { return id >= 0; }
    bool operator==(const ClipRef& o) const { return type == o.type && id == o.id; }
    bool operator!=(const ClipRef& o) const { return !(*this == o); }
    bool operator<(const ClipRef& o) const {
        return type != o.type ? type < o.type : id < o.id;
    }
};
Q_DECLARE_METATYPE(ClipRef)

struct Clip {
    int id = -1;
    double start = 0.0;   // seconds on the project clock
    double end = 0.0;
    ClipPayload payload;

    ClipType type() const { return static_cast<ClipType>(payload.index()); }
    ClipRef ref() const { return ClipRef{type(), id}; }
    double duration() const { return end - start; }

    // Half-open so a boundary instant belongs to exactly one clip
    bool isActiveAt(double t) const { return t >= start && t < end; }

    VideoPayload* video() { return std::get_if<VideoPayload>(&payload); }
    const VideoPayload* video() const { return std::get_if<VideoPayload>(&payload); }
    AudioPayload* audio() { return std::get_if<AudioPayload>(&payload); }
    const AudioPayload* audio() const { return std::get_if<AudioPayload>(&payload); }
    TextPayload* text() { return std::get_if<TextPayload>(&payload); }
    const TextPayload* text() const { return std::get_if<TextPayload>(&payload); }

    bool isLinkedAudio() const {
        const AudioPayload* a = audio();
        return a && a->linkedToVideo;
    }
    bool isPrimaryVideo() const {
        const VideoPayload* v = video();
        return v && v->primary;
    }

    QString sourcePath() const {
        if (const VideoPayload* v = video()) return v->sourcePath;
        if (const AudioPayload* a = audio()) return a->sourcePath;
        return QString();
    }
    double speed() const {
        if (const VideoPayload* v = video()) return v->speed;
        if (const AudioPayload* a = audio()) return a->speed;
        return 1.0;
    }
    double volume() const {
        if (const VideoPayload* v = video()) return v->volume;
        if (const AudioPayload* a = audio()) return a->volume;
        return 0.0;
    }
};
