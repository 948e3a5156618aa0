#pragma once
#include <algorithm>
#include <QPointF>
#include <QTransform>
#include "BoundsCalculator.hpp"

namespace kc {

struct Fit {
    QTransform transform;
    double rawSize{0.0};
    double targetSize{0.0};
    double scale{1.0};
};

// Centers a bounding box on a square canvas. Only glyphs whose larger side
// falls outside [minSize, maxSize] are rescaled.
class FitTransform {
public:
    FitTransform(double canvasSize, double minSize, double maxSize)
        : m_canvasSize(canvasSize), m_minSize(minSize), m_maxSize(maxSize) {}

    Fit compute(const BoundingBox &box) const {
        Fit fit;
        fit.rawSize = std::max(box.width(), box.height());
        fit.targetSize = fit.rawSize;
        if (fit.rawSize < m_minSize)
            fit.targetSize = m_minSize;
        else if (fit.rawSize > m_maxSize)
            fit.targetSize = m_maxSize;
        fit.scale = fit.rawSize > 0.0 ? fit.targetSize / fit.rawSize : 1.0;

        const QPointF target(m_canvasSize / 2.0, m_canvasSize / 2.0);
        // Applied to points in reverse: recentre on the origin, scale, move to
        // the canvas centre.
        fit.transform.translate(target.x(), target.y());
        fit.transform.scale(fit.scale, fit.scale);
        fit.transform.translate(-box.centerX(), -box.centerY());
        return fit;
    }

    double canvasSize() const { return m_canvasSize; }

private:
    double m_canvasSize;
    double m_minSize;
    double m_maxSize;
};

} // namespace kc
