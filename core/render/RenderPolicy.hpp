#pragma once
#include <QColor>
#include <QPainter>
#include <QPainterPath>
#include <QPen>
#include "core/input/StrokeStore.hpp"

namespace kc {

class RenderPolicy {
public:
    virtual ~RenderPolicy() = default;
    virtual QColor background() const = 0;
    // Painter already carries the fit transform.
    virtual void paintStroke(QPainter &painter, const Stroke &stroke) const = 0;
};

// Round-capped polyline in a single colour. Strokes with fewer than two
// points draw nothing, so a lone tap is not ink.
class PolylineRenderPolicy : public RenderPolicy {
public:
    explicit PolylineRenderPolicy(qreal strokeWidth = 12.0,
                                  QColor foreground = Qt::black,
                                  QColor background = Qt::white)
        : m_width(strokeWidth), m_foreground(foreground), m_background(background) {}

    QColor background() const override { return m_background; }

    void paintStroke(QPainter &painter, const Stroke &stroke) const override {
        if (stroke.size() < 2)
            return;
        QPainterPath path;
        path.moveTo(stroke[0].x, stroke[0].y);
        for (size_t i = 1; i < stroke.size(); ++i)
            path.lineTo(stroke[i].x, stroke[i].y);
        QPen pen(m_foreground, m_width);
        pen.setCapStyle(Qt::RoundCap);
        pen.setJoinStyle(Qt::RoundJoin);
        painter.setPen(pen);
        painter.setBrush(Qt::NoBrush);
        painter.drawPath(path);
    }

    qreal strokeWidth() const { return m_width; }

private:
    qreal m_width;
    QColor m_foreground;
    QColor m_background;
};

} // namespace kc
