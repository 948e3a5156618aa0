#pragma once
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <QImage>
#include "Errors.hpp"
#include "InferenceEngine.hpp"
#include "LabelFilter.hpp"
#include "ResultRanker.hpp"
#include "TensorEncoder.hpp"
#include "core/geometry/BoundsCalculator.hpp"
#include "core/geometry/FitTransform.hpp"
#include "core/render/Rasterizer.hpp"
#include "utils/Config.hpp"
#include "utils/Logger.hpp"

namespace kc {

// Strategy objects a recognizer is assembled from. Null members fall back to
// the defaults derived from the config.
struct RecognizerPolicies {
    std::shared_ptr<const LabelFilterPolicy> labelFilter;
    std::shared_ptr<const ScorePolicy> score;
    std::shared_ptr<const RenderPolicy> render;
};

// Session -> raster -> tensor -> engine -> ranked glyphs. After initialize()
// every method is const and safe to call from several threads, provided the
// engine is.
class CharacterRecognizer {
public:
    CharacterRecognizer(const RecognizerConfig &config,
                        std::shared_ptr<InferenceEngine> engine,
                        RecognizerPolicies policies = RecognizerPolicies())
        : m_config(checked(config)), m_engine(std::move(engine)),
          m_bounds(config.padding, static_cast<float>(config.canvasSize)),
          m_fit(config.canvasSize, config.minTargetSize, config.maxTargetSize),
          m_rasterizer(config.canvasSize, renderPolicyOrDefault(policies.render, config)),
          m_encoder(config.modelInputSize),
          m_ranker(static_cast<size_t>(config.topK), scorePolicyOrDefault(policies.score)),
          m_filterPolicy(labelPolicyOrDefault(policies.labelFilter, config)) {
        if (!m_engine)
            throw InitializationError("No inference engine supplied");
    }

    void initialize() { initialize(m_config.labelsPath); }

    void initialize(const std::string &labelsPath) {
        m_index.reset();
        initialize(LabelTable::fromFile(labelsPath));
    }

    void initialize(const LabelTable &labels) {
        m_index.reset();
        m_labelCount = 0;
        m_index = FilteredIndex::build(labels, *m_filterPolicy);
        m_labelCount = labels.size();
    }

    bool isInitialized() const { return m_index.has_value(); }

    const FilteredIndex *filteredIndex() const { return m_index ? &*m_index : nullptr; }
    size_t labelCount() const { return m_labelCount; }
    const RecognizerConfig &config() const { return m_config; }

    // Nothing to recognize yields no image rather than an error.
    std::optional<QImage> capture(const Session &session) const {
        const std::optional<BoundingBox> box = m_bounds.compute(session);
        if (!box)
            return std::nullopt;
        const Fit fit = m_fit.compute(*box);
        KC_LOG(LogLevel::Debug, "Fit raw=" + std::to_string(fit.rawSize) +
                                    " target=" + std::to_string(fit.targetSize) +
                                    " scale=" + std::to_string(fit.scale));
        return m_rasterizer.render(session, fit.transform);
    }

    std::optional<InputTensor> encode(const Session &session) const {
        const std::optional<QImage> raster = capture(session);
        if (!raster)
            return std::nullopt;
        return m_encoder.encode(*raster);
    }

    std::vector<RecognitionResult> recognize(const Session &session) const {
        if (!m_index)
            throw NotInitializedError();
        const std::optional<InputTensor> tensor = encode(session);
        if (!tensor)
            throw InvalidInputError("Nothing to recognize: session is empty");

        std::vector<float> scores;
        try {
            scores = m_engine->run(*tensor);
        } catch (const RecognitionError &) {
            throw;
        } catch (const std::exception &err) {
            throw InferenceError(err.what());
        }
        return m_ranker.rank(scores, &*m_index);
    }

private:
    static const RecognizerConfig &checked(const RecognizerConfig &config) {
        validateConfig(config);
        return config;
    }

    static std::shared_ptr<const RenderPolicy>
    renderPolicyOrDefault(std::shared_ptr<const RenderPolicy> policy, const RecognizerConfig &config) {
        if (policy)
            return policy;
        return std::make_shared<PolylineRenderPolicy>(config.strokeWidth);
    }

    static std::shared_ptr<const ScorePolicy>
    scorePolicyOrDefault(std::shared_ptr<const ScorePolicy> policy) {
        if (policy)
            return policy;
        return std::make_shared<MinMaxScorePolicy>();
    }

    static std::shared_ptr<const LabelFilterPolicy>
    labelPolicyOrDefault(std::shared_ptr<const LabelFilterPolicy> policy,
                         const RecognizerConfig &config) {
        if (policy)
            return policy;
        return std::make_shared<UnicodeRangePolicy>(config.alphabetFirst, config.alphabetLast);
    }

    RecognizerConfig m_config;
    std::shared_ptr<InferenceEngine> m_engine;
    BoundsCalculator m_bounds;
    FitTransform m_fit;
    Rasterizer m_rasterizer;
    TensorEncoder m_encoder;
    ResultRanker m_ranker;
    std::shared_ptr<const LabelFilterPolicy> m_filterPolicy;
    std::optional<FilteredIndex> m_index;
    size_t m_labelCount{0};
};

} // namespace kc
