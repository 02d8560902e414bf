#include <cassert>
#include <cstdio>
#include <cmath>
#include <QGuiApplication>
#include "FakeMedia.h"
#include "overlay/Compositor.h"
#include "overlay/TextOverlayRenderer.h"
#include "timeline/TimelineModel.h"

static Clip textClip(int id, const QString& content, TextStyle style) {
    Clip c;
    c.id = id;
    c.start = 0.0;
    c.end = 5.0;
    TextPayload t;
    t.content = content;
    t.style = style;
    t.background = QColor(Qt::blue);
    c.payload = t;
    return c;
}

void test_no_video_is_black_at_design_size() {
    Compositor comp(QSize(1080, 1920));
    const QImage& out = comp.compose(nullptr, {});
    assert(out.size() == QSize(1080, 1920));
    assert(out.pixel(540, 960) == qRgb(0, 0, 0));
    assert(comp.lastRenderedText().empty());
    printf("PASS: test_no_video_is_black_at_design_size\n");
}

void test_surface_follows_video_size() {
    TimelineModel model;
    FakeMediaFactory factory;
    MediaPool pool(model, factory);
    int v = model.attachPrimaryVideo("/media/a.mp4", 10.0);

    Compositor comp(QSize(1080, 1920));
    const QImage& out = comp.compose(pool.handle({ClipType::Video, v}), {});
    assert(out.size() == QSize(540, 960));
    assert(comp.surfaceSize() == QSize(540, 960));
    assert(comp.designSize() == QSize(1080, 1920));
    assert(QColor(out.pixel(270, 480)) == QColor(Qt::red));

    assert(std::abs(comp.scaleX() - 0.5) < 1e-9);
    QPointF p = comp.mapToSurface(QPointF(1080, 1920));
    assert(std::abs(p.x() - 540.0) < 1e-9 && std::abs(p.y() - 960.0) < 1e-9);
    QPointF back = comp.mapToDesign(p);
    assert(std::abs(back.x() - 1080.0) < 1e-9);

    // Same size again keeps the surface
    const uchar* bits = comp.surface().constBits();
    comp.compose(pool.handle({ClipType::Video, v}), {});
    assert(comp.surface().constBits() == bits);
    printf("PASS: test_surface_follows_video_size\n");
}

void test_design_center_maps_to_surface_center() {
    TimelineModel model;
    FakeMediaFactory factory;
    MediaPool pool(model, factory);
    int v = model.attachPrimaryVideo("/media/a.mp4", 10.0);
    FakeMediaHandle* h = fakeHandle(pool, {ClipType::Video, v});

    std::vector<Clip> texts;
    texts.push_back(textClip(3, "Center", TextStyle::SolidBox));
    const QPointF designCenter(540.0, 960.0);
    assert(texts[0].text()->anchor == designCenter);

    Compositor comp(QSize(1080, 1920));
    const QSize sizes[] = {QSize(1080, 1920), QSize(540, 960), QSize(720, 1280),
                           QSize(1440, 2560), QSize(1080, 1080), QSize(600, 1000)};
    for (const QSize& size : sizes) {
        h->setFrame(size, Qt::red);
        const QImage& out = comp.compose(h, texts);
        assert(out.size() == size);

        QPointF c = comp.mapToSurface(designCenter);
        assert(std::abs(c.x() - size.width() / 2.0) < 1e-9);
        assert(std::abs(c.y() - size.height() / 2.0) < 1e-9);

        QRectF box = TextOverlayRenderer::boxRect(*texts[0].text(), c, comp.scaleY());
        assert(std::abs(box.center().x() - c.x()) < 1e-6);
        assert(std::abs(box.center().y() - c.y()) < 1e-6);

        // The layer covers the middle of the frame; the corners show video
        assert(comp.lastRenderedText().size() == 1);
        assert(QColor(out.pixel(size.width() / 2, size.height() / 2)) != QColor(Qt::red));
        assert(QColor(out.pixel(2, 2)) == QColor(Qt::red));
    }
    printf("PASS: test_design_center_maps_to_surface_center\n");
}

void test_not_ready_video_draws_black() {
    TimelineModel model;
    FakeMediaFactory factory;
    FakeMediaInfo loading;
    loading.ready = false;
    factory.setMedia("/media/a.mp4", loading);
    MediaPool pool(model, factory);
    int v = model.attachPrimaryVideo("/media/a.mp4", 10.0);

    Compositor comp(QSize(1080, 1920));
    const QImage& out = comp.compose(pool.handle({ClipType::Video, v}), {});
    assert(out.size() == QSize(1080, 1920));
    assert(out.pixel(10, 10) == qRgb(0, 0, 0));
    printf("PASS: test_not_ready_video_draws_black\n");
}

void test_text_layers_are_drawn_scaled() {
    TimelineModel model;
    FakeMediaFactory factory;
    MediaPool pool(model, factory);
    int v = model.attachPrimaryVideo("/media/a.mp4", 10.0);

    std::vector<Clip> texts;
    texts.push_back(textClip(7, "Hello", TextStyle::SolidBox));
    texts.push_back(textClip(8, "", TextStyle::SolidBox));

    Compositor comp(QSize(1080, 1920));
    const QImage& out = comp.compose(pool.handle({ClipType::Video, v}), texts);

    // Only the non-empty layer counts as rendered
    assert(comp.lastRenderedText().size() == 1);
    assert(comp.lastRenderedText()[0] == 7);

    // Anchor (540, 960) in design space lands at (270, 480); size 48 scales to
    // 24 px, so the top padding of the box sits just above y = 468
    QRectF box = TextOverlayRenderer::boxRect(*texts[0].text(), QPointF(270, 480), 0.5);
    assert(std::abs(box.center().x() - 270.0) < 1e-6);
    assert(std::abs(box.center().y() - 480.0) < 1e-6);
    assert(QColor(out.pixel(270, 462)) == QColor(Qt::blue));
    // Away from the box the video shows through
    assert(QColor(out.pixel(20, 20)) == QColor(Qt::red));
    printf("PASS: test_text_layers_are_drawn_scaled\n");
}

void test_style_backgrounds() {
    TextPayload t;
    t.style = TextStyle::Outline;
    assert(!TextOverlayRenderer::backgroundFor(t).isValid());
    t.style = TextStyle::SolidBox;
    assert(TextOverlayRenderer::backgroundFor(t) == QColor(0, 0, 0));
    t.style = TextStyle::TranslucentBox;
    assert(TextOverlayRenderer::backgroundFor(t).alpha() == 128);
    t.style = TextStyle::RoundedBox;
    t.background = QColor(Qt::green);
    assert(TextOverlayRenderer::backgroundFor(t) == QColor(Qt::green));
    printf("PASS: test_style_backgrounds\n");
}

int main(int argc, char* argv[]) {
    qputenv("QT_QPA_PLATFORM", "offscreen");
    QGuiApplication app(argc, argv);
    test_no_video_is_black_at_design_size();
    test_surface_follows_video_size();
    test_design_center_maps_to_surface_center();
    test_not_ready_video_draws_black();
    test_text_layers_are_drawn_scaled();
    test_style_backgrounds();
    printf("All compositor tests passed.\n");
    return 0;
}
