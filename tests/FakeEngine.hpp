#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>
#include "core/recognition/InferenceEngine.hpp"

namespace kc {

// Returns a fixed score vector; optionally sleeps or throws.
class FakeEngine : public InferenceEngine {
public:
    explicit FakeEngine(std::vector<float> scores) : m_scores(std::move(scores)) {}

    std::vector<float> run(const InputTensor &input) override {
        ++m_calls;
        m_lastShape = input.shape;
        if (m_delayMs > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(m_delayMs));
        if (m_fail)
            throw std::runtime_error("device lost");
        return m_scores;
    }

    std::array<int64_t, 4> m_lastShape{};
    std::atomic<int> m_calls{0};
    int m_delayMs{0};
    bool m_fail{false};

private:
    std::vector<float> m_scores;
};

} // namespace kc
