#pragma once
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>
#include <QImage>
#include "Errors.hpp"

namespace kc {

// Dense NHWC tensor with a single channel.
struct InputTensor {
    std::array<int64_t, 4> shape{1, 0, 0, 1};
    std::vector<float> data;

    int64_t height() const { return shape[1]; }
    int64_t width() const { return shape[2]; }
    float at(int64_t y, int64_t x) const {
        return data[static_cast<size_t>(y * shape[2] + x)];
    }
};

// Rec. 601 luma.
struct LumaWeights {
    float r{0.299f};
    float g{0.587f};
    float b{0.114f};
};

class TensorEncoder {
public:
    explicit TensorEncoder(int modelInputSize = 64, LumaWeights weights = LumaWeights())
        : m_size(modelInputSize), m_weights(weights) {
        const float sum = m_weights.r + m_weights.g + m_weights.b;
        if (m_size <= 0 || std::fabs(sum - 1.f) > 1e-4f)
            throw InvalidInputError("TensorEncoder needs a positive size and luma weights summing to 1");
    }

    // Raster -> [1, M, M, 1] tensor with ink near 1 and background near 0.
    InputTensor encode(const QImage &raster) const {
        if (raster.isNull() || raster.width() <= 0 || raster.height() <= 0)
            throw InvalidInputError("Cannot encode an empty raster");

        QImage resized = raster.scaled(m_size, m_size, Qt::IgnoreAspectRatio,
                                       Qt::SmoothTransformation);
        if (resized.format() != QImage::Format_RGB32 &&
            resized.format() != QImage::Format_ARGB32) {
            resized = resized.convertToFormat(QImage::Format_ARGB32);
        }

        InputTensor tensor;
        tensor.shape = {1, m_size, m_size, 1};
        tensor.data.resize(static_cast<size_t>(m_size) * m_size);
        for (int y = 0; y < m_size; ++y) {
            const QRgb *line = reinterpret_cast<const QRgb *>(resized.constScanLine(y));
            for (int x = 0; x < m_size; ++x) {
                const float r = clampChannel(qRed(line[x]));
                const float g = clampChannel(qGreen(line[x]));
                const float b = clampChannel(qBlue(line[x]));
                const float luminance =
                    (m_weights.r * r + m_weights.g * g + m_weights.b * b) / 255.f;
                tensor.data[static_cast<size_t>(y) * m_size + x] =
                    std::clamp(1.f - luminance, 0.f, 1.f);
            }
        }
        return tensor;
    }

    int inputSize() const { return m_size; }

private:
    static float clampChannel(int v) {
        return std::clamp(static_cast<float>(v), 0.f, 255.f);
    }

    int m_size;
    LumaWeights m_weights;
};

} // namespace kc
