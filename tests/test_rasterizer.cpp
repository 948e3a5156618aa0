#include "core/geometry/BoundsCalculator.hpp"
#include "core/geometry/FitTransform.hpp"
#include "core/render/Rasterizer.hpp"
#include <QColor>
#include <QImage>
#include <cassert>
#include <memory>

static bool isInk(const QImage &img, int x, int y) { return qGray(img.pixel(x, y)) < 64; }
static bool isBackground(const QImage &img, int x, int y) {
    return img.pixel(x, y) == QColor(Qt::white).rgb();
}

static int inkCount(const QImage &img) {
    int n = 0;
    for (int y = 0; y < img.height(); ++y)
        for (int x = 0; x < img.width(); ++x)
            n += qGray(img.pixel(x, y)) < 128 ? 1 : 0;
    return n;
}

int main() {
    kc::Rasterizer rasterizer(300, std::make_shared<kc::PolylineRenderPolicy>(12.0));
    kc::BoundsCalculator bounds(6.f, 300.f);
    kc::FitTransform fit(300.0, 80.0, 220.0);

    kc::Session line;
    line.strokes.push_back({{10.f, 10.f}, {50.f, 10.f}, {90.f, 10.f}});
    const QImage img = rasterizer.render(line, fit.compute(*bounds.compute(line)).transform);
    assert(img.width() == 300 && img.height() == 300);
    // the stroke is centred on the canvas: y 10 -> 150, x 10..90 -> 110..190
    assert(isInk(img, 150, 150));
    assert(isInk(img, 115, 150));
    assert(isInk(img, 185, 150));
    assert(isBackground(img, 150, 100));
    assert(isBackground(img, 10, 10));
    assert(isBackground(img, 150, 170));

    // single-point strokes leave no ink
    kc::Session tap;
    tap.strokes.push_back({{40.f, 40.f}});
    const QImage blank = rasterizer.render(tap, fit.compute(*bounds.compute(tap)).transform);
    assert(inkCount(blank) == 0);

    // the active stroke is drawn too
    kc::Session active;
    active.active = {{150.f, 100.f}, {150.f, 200.f}};
    const QImage mid = rasterizer.render(active, fit.compute(*bounds.compute(active)).transform);
    assert(isInk(mid, 150, 150));
    assert(inkCount(mid) > 0);

    // custom policy colours
    kc::Rasterizer inverted(64, std::make_shared<kc::PolylineRenderPolicy>(4.0, Qt::white, Qt::black));
    kc::FitTransform smallFit(64.0, 10.0, 50.0);
    kc::BoundsCalculator smallBounds(2.f, 64.f);
    const QImage inv = inverted.render(line, smallFit.compute(*smallBounds.compute(line)).transform);
    assert(inv.width() == 64);
    assert(inv.pixel(0, 0) == QColor(Qt::black).rgb());
    assert(qGray(inv.pixel(32, 32)) > 192);
    return 0;
}
