#pragma once
#include <vector>
#include "TensorEncoder.hpp"

namespace kc {

// Black box that turns a [1, M, M, 1] tensor into one score per class,
// aligned with the label file. run() may be called from several threads.
class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;
    virtual std::vector<float> run(const InputTensor &input) = 0;
};

} // namespace kc
