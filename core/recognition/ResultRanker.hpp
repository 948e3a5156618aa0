#pragma once
#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "Errors.hpp"
#include "LabelFilter.hpp"

namespace kc {

struct RecognitionResult {
    std::string glyph;
    float confidence;
};

class ScorePolicy {
public:
    virtual ~ScorePolicy() = default;
    // Raw scores of the filtered candidates -> confidences in [0,1], same order.
    virtual std::vector<float> normalize(const std::vector<float> &raw) const = 0;
};

// Min-max over the filtered candidates only; the rest of the vocabulary
// would otherwise dominate the range. Identical scores give 0 everywhere.
class MinMaxScorePolicy : public ScorePolicy {
public:
    std::vector<float> normalize(const std::vector<float> &raw) const override {
        std::vector<float> out(raw.size(), 0.f);
        if (raw.empty())
            return out;
        const auto bounds = std::minmax_element(raw.begin(), raw.end());
        // double keeps the range finite for any pair of finite floats
        const double lo = *bounds.first;
        const double range = static_cast<double>(*bounds.second) - lo;
        if (!(range > 0.0))
            return out;
        for (size_t i = 0; i < raw.size(); ++i)
            out[i] = static_cast<float>(std::clamp((raw[i] - lo) / range, 0.0, 1.0));
        return out;
    }
};

class ResultRanker {
public:
    explicit ResultRanker(size_t topK = 5,
                          std::shared_ptr<const ScorePolicy> policy =
                              std::make_shared<MinMaxScorePolicy>())
        : m_topK(topK), m_policy(std::move(policy)) {}

    std::vector<RecognitionResult> rank(const std::vector<float> &scores,
                                        const FilteredIndex *index) const {
        if (!index)
            throw NotInitializedError("Label filter not built");
        if (scores.size() != index->classCount())
            throw InvalidInputError("Score vector has " + std::to_string(scores.size()) +
                                    " entries, expected " +
                                    std::to_string(index->classCount()));

        std::vector<float> raw;
        raw.reserve(index->size());
        for (const auto &entry : index->entries()) {
            const float v = scores[entry.classIndex];
            if (!std::isfinite(v))
                throw InvalidInputError("Non-finite score for class " +
                                        std::to_string(entry.classIndex));
            raw.push_back(v);
        }
        const std::vector<float> confidence = m_policy->normalize(raw);
        if (confidence.size() != raw.size())
            throw InvalidInputError("Score policy changed the candidate count");

        std::vector<RecognitionResult> results;
        results.reserve(raw.size());
        for (size_t i = 0; i < raw.size(); ++i)
            results.push_back({index->entries()[i].glyph, confidence[i]});
        std::stable_sort(results.begin(), results.end(),
                         [](const RecognitionResult &a, const RecognitionResult &b) {
                             return a.confidence > b.confidence;
                         });
        if (results.size() > m_topK)
            results.resize(m_topK);
        return results;
    }

    size_t topK() const { return m_topK; }

private:
    size_t m_topK;
    std::shared_ptr<const ScorePolicy> m_policy;
};

} // namespace kc
