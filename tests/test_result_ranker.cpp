#include "core/recognition/ResultRanker.hpp"
#include <cassert>
#include <cfloat>
#include <cmath>
#include <limits>

namespace {
const std::string A = "\xE3\x81\x82";  // あ
const std::string I = "\xE3\x81\x84";  // い
const std::string U = "\xE3\x81\x86";  // う
const std::string E = "\xE3\x81\x88";  // え
const std::string O = "\xE3\x81\x8A";  // お
const std::string KA = "\xE3\x81\x8B"; // か

void assertWellFormed(const std::vector<kc::RecognitionResult> &results, size_t k) {
    assert(results.size() <= k);
    for (size_t i = 0; i < results.size(); ++i) {
        assert(results[i].confidence >= 0.f && results[i].confidence <= 1.f);
        if (i > 0)
            assert(results[i - 1].confidence >= results[i].confidence);
    }
}
} // namespace

int main() {
    // classes 0 and 4 are outside the alphabet
    kc::LabelTable table({"X", A, I, U, "Y", E, O, KA});
    kc::FilteredIndex index = kc::FilteredIndex::build(table, kc::UnicodeRangePolicy());
    assert(index.size() == 6);

    kc::ResultRanker ranker(5);

    // best score on a filtered class
    auto results = ranker.rank({0.1f, 0.2f, 0.9f, 0.4f, 0.05f, 0.3f, 0.5f, 0.2f}, &index);
    assertWellFormed(results, 5);
    assert(results.size() == 5);
    assert(results[0].glyph == I && results[0].confidence == 1.f);
    assert(results[1].glyph == O);
    assert(std::fabs(results[1].confidence - (0.5f - 0.2f) / (0.9f - 0.2f)) < 1e-5f);

    // best score overall is out of the alphabet and never shows up
    results = ranker.rank({0.95f, 0.1f, 0.2f, 0.6f, 0.99f, 0.3f, 0.1f, 0.1f}, &index);
    assertWellFormed(results, 5);
    for (const auto &r : results)
        assert(r.glyph != "X" && r.glyph != "Y");
    assert(results[0].glyph == U && results[0].confidence == 1.f);
    // min is taken over the filtered candidates only
    assert(results.back().confidence == 0.f);

    // identical filtered scores are all 0, in class order
    results = ranker.rank({5.f, 0.3f, 0.3f, 0.3f, -1.f, 0.3f, 0.3f, 0.3f}, &index);
    assert(results.size() == 5);
    for (const auto &r : results)
        assert(r.confidence == 0.f);
    assert(results[0].glyph == A && results[1].glyph == I && results[4].glyph == O);

    // ties keep class order
    results = ranker.rank({0.f, 0.7f, 0.1f, 0.7f, 0.f, 0.2f, 0.f, 0.7f}, &index);
    assert(results[0].glyph == A && results[1].glyph == U && results[2].glyph == KA);

    // K above the candidate count returns every candidate
    kc::ResultRanker wide(10);
    results = wide.rank({0.f, 1.f, 2.f, 3.f, 4.f, 5.f, 6.f, 7.f}, &index);
    assert(results.size() == 6);
    assert(results[0].glyph == KA && results[5].glyph == A);
    assertWellFormed(results, 10);

    bool threw = false;
    try {
        ranker.rank({0.f, 1.f, 2.f}, &index);
    } catch (const kc::InvalidInputError &) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ranker.rank({0.f, 1.f, 2.f, 3.f, 4.f, 5.f, 6.f, 7.f}, nullptr);
    } catch (const kc::NotInitializedError &) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        const float nan = std::numeric_limits<float>::quiet_NaN();
        ranker.rank({0.f, nan, 2.f, 3.f, 4.f, 5.f, 6.f, 7.f}, &index);
    } catch (const kc::InvalidInputError &) {
        threw = true;
    }
    assert(threw);

    // out-of-alphabet classes may hold anything
    const float inf = std::numeric_limits<float>::infinity();
    results = ranker.rank({inf, 0.f, 1.f, 2.f, -inf, 3.f, 4.f, 5.f}, &index);
    assert(results[0].glyph == KA && results[0].confidence == 1.f);

    // a range wider than FLT_MAX still normalizes
    const std::vector<float> extreme =
        kc::MinMaxScorePolicy().normalize({-FLT_MAX, 0.f, FLT_MAX});
    assert(extreme[0] == 0.f);
    assert(std::fabs(extreme[1] - 0.5f) < 1e-6f);
    assert(extreme[2] == 1.f);

    results = ranker.rank({0.f, -FLT_MAX, FLT_MAX, 0.f, 0.f, 0.f, -FLT_MAX, 0.f}, &index);
    assertWellFormed(results, 5);
    assert(results[0].glyph == I && results[0].confidence == 1.f);
    assert(std::fabs(results[1].confidence - 0.5f) < 1e-6f);
    return 0;
}
