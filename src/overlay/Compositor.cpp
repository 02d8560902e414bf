#include "Compositor.h"
#include "TextOverlayRenderer.h"
#include "MediaHandle.h"
#include "Logging.h"
#include <QPainter>

Compositor::Compositor(const QSize& designSize, QObject* parent)
    : QObject(parent)
    , m_designSize(designSize.isValid() ? designSize : QSize(1080, 1920))
    , m_surface(m_designSize, QImage::Format_RGB32)
{
    m_surface.fill(Qt::black);
}

double Compositor::scaleX() const {
    return static_cast<double>(m_surface.width()) / m_designSize.width();
}

double Compositor::scaleY() const {
    return static_cast<double>(m_surface.height()) / m_designSize.height();
}

QPointF Compositor::mapToSurface(const QPointF& design) const {
    return QPointF(design.x() * scaleX(), design.y() * scaleY());
}

QPointF Compositor::mapToDesign(const QPointF& surface) const {
    return QPointF(surface.x() / scaleX(), surface.y() / scaleY());
}

void Compositor::resizeSurface(const QSize& size) {
    if (size == m_surface.size()) return;
    qCDebug(lcRender) << "Render surface" << m_surface.size() << "->" << size;
    m_surface = QImage(size, QImage::Format_RGB32);
}

const QImage& Compositor::compose(MediaHandle* video, const std::vector<Clip>& textClips) {
    QImage frame;
    if (video && video->isReady() && video->hasVideo()) {
        QSize native = video->frameSize();
        frame = video->currentFrame();
        if (!native.isValid() && !frame.isNull()) native = frame.size();
        if (native.isValid()) resizeSurface(native);
    }

    if (frame.isNull()) m_surface.fill(Qt::black);

    QPainter painter(&m_surface);
    if (!frame.isNull()) {
        painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
        painter.drawImage(QRect(QPoint(0, 0), m_surface.size()), frame);
    }

    m_lastRendered.clear();
    const double fontScale = scaleY();
    for (const auto& clip : textClips) {
        const TextPayload* text = clip.text();
        if (!text || text->content.isEmpty()) continue;
        TextOverlayRenderer::paint(painter, *text, mapToSurface(text->anchor), fontScale);
        m_lastRendered.push_back(clip.id);
    }
    painter.end();

    return m_surface;
}
