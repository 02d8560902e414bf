#pragma once

#include <QObject>
#include <QImage>
#include <QPointF>
#include <QSize>
#include <vector>
#include "Clip.h"

class MediaHandle;

// Owns the render surface. Each compose() draws the active video's current
// frame (black without one) and then every given text layer, mapped from
// the design space into surface pixels.
class Compositor : public QObject {
    Q_OBJECT
public:
    explicit Compositor(const QSize& designSize, QObject* parent = nullptr);

    const QImage& compose(MediaHandle* video, const std::vector<Clip>& textClips);

    const QImage& surface() const { return m_surface; }
    QSize surfaceSize() const { return m_surface.size(); }
    QSize designSize() const { return m_designSize; }

    double scaleX() const;
    double scaleY() const;
    QPointF mapToSurface(const QPointF& design) const;
    QPointF mapToDesign(const QPointF& surface) const;

    // Ids of the text clips actually drawn by the last compose()
    const std::vector<int>& lastRenderedText() const { return m_lastRendered; }

private:
    void resizeSurface(const QSize& size);

    QSize m_designSize;
    QImage m_surface;
    std::vector<int> m_lastRendered;
};
