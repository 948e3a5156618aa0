#pragma once
#include <memory>
#include <utility>
#include <QImage>
#include <QPainter>
#include <QTransform>
#include "RenderPolicy.hpp"

namespace kc {

class Rasterizer {
public:
    explicit Rasterizer(int canvasSize,
                        std::shared_ptr<const RenderPolicy> policy =
                            std::make_shared<PolylineRenderPolicy>())
        : m_canvasSize(canvasSize), m_policy(std::move(policy)) {}

    // Renders finalized strokes and then the active one through the fit
    // transform onto a fresh canvas.
    QImage render(const Session &session, const QTransform &transform) const {
        QImage image(m_canvasSize, m_canvasSize, QImage::Format_RGB32);
        image.fill(m_policy->background());
        QPainter painter(&image);
        painter.setRenderHint(QPainter::Antialiasing, true);
        painter.setTransform(transform);
        for (const auto &stroke : session.strokes)
            m_policy->paintStroke(painter, stroke);
        if (!session.active.empty())
            m_policy->paintStroke(painter, session.active);
        painter.end();
        return image;
    }

    int canvasSize() const { return m_canvasSize; }

private:
    int m_canvasSize;
    std::shared_ptr<const RenderPolicy> m_policy;
};

} // namespace kc
