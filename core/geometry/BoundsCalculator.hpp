#pragma once
#include <algorithm>
#include <optional>
#include "core/input/StrokeStore.hpp"

namespace kc {

struct BoundingBox {
    float minX;
    float minY;
    float maxX;
    float maxY;

    float width() const { return maxX - minX; }
    float height() const { return maxY - minY; }
    float centerX() const { return (minX + maxX) * 0.5f; }
    float centerY() const { return (minY + maxY) * 0.5f; }
};

class BoundsCalculator {
public:
    // padding is added on every side; a positive canvasExtent clamps the
    // padded box to [0, canvasExtent] on both axes.
    explicit BoundsCalculator(float padding = 0.f, float canvasExtent = 0.f)
        : m_padding(padding), m_canvasExtent(canvasExtent) {}

    std::optional<BoundingBox> compute(const Session &session) const {
        bool found = false;
        BoundingBox box{0.f, 0.f, 0.f, 0.f};
        auto include = [&](const Point &p) {
            if (!found) {
                box = {p.x, p.y, p.x, p.y};
                found = true;
                return;
            }
            box.minX = std::min(box.minX, p.x);
            box.minY = std::min(box.minY, p.y);
            box.maxX = std::max(box.maxX, p.x);
            box.maxY = std::max(box.maxY, p.y);
        };
        for (const auto &stroke : session.strokes)
            for (const auto &p : stroke)
                include(p);
        for (const auto &p : session.active)
            include(p);
        if (!found)
            return std::nullopt;

        box.minX -= m_padding;
        box.minY -= m_padding;
        box.maxX += m_padding;
        box.maxY += m_padding;
        if (m_canvasExtent > 0.f) {
            // Each edge is clamped on its own so min <= max still holds.
            box.minX = std::clamp(box.minX, 0.f, m_canvasExtent);
            box.minY = std::clamp(box.minY, 0.f, m_canvasExtent);
            box.maxX = std::clamp(box.maxX, 0.f, m_canvasExtent);
            box.maxY = std::clamp(box.maxY, 0.f, m_canvasExtent);
        }
        return box;
    }

    float padding() const { return m_padding; }
    float canvasExtent() const { return m_canvasExtent; }

private:
    float m_padding;
    float m_canvasExtent;
};

} // namespace kc
