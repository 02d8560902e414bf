#pragma once

#include <QObject>
#include <QString>
#include <vector>
#include "Clip.h"

class Track : public QObject {
    Q_OBJECT
public:
    explicit Track(ClipType kind, const QString& name, QObject* parent = nullptr);
    ~Track();

    ClipType kind() const { return m_kind; }
    QString name() const { return m_name; }
    void setName(const QString& name) { m_name = name; }

    // Clips of another kind are refused
    bool addClip(const Clip& clip);
    bool insertClip(int index, const Clip& clip);
    Clip takeClip(int index);

    int clipCount() const { return static_cast<int>(m_clips.size()); }
    Clip& clip(int index) { return m_clips[index]; }
    const Clip& clip(int index) const { return m_clips[index]; }
    const std::vector<Clip>& clips() const { return m_clips; }
    std::vector<Clip>& clips() { return m_clips; }

    int indexOf(int clipId) const;
    Clip* findClip(int clipId);
    const Clip* findClip(int clipId) const;

    double duration() const;   // max end over this lane

private:
    ClipType m_kind;
    QString m_name;
    std::vector<Clip> m_clips;
};
