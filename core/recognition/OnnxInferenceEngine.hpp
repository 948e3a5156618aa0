#pragma once
#include <array>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <onnxruntime_cxx_api.h>
#include "Errors.hpp"
#include "InferenceEngine.hpp"
#include "utils/Logger.hpp"

namespace kc {

class OnnxInferenceEngine : public InferenceEngine {
public:
    OnnxInferenceEngine() = default;

    // Throws InitializationError when the file is missing or ONNX Runtime
    // rejects it. A failed load leaves the engine unloaded.
    void loadModel(const std::string &path) {
        m_session.reset();
        m_modelPath = path;

        std::ifstream file(path, std::ios::binary);
        if (!file.good())
            throw InitializationError("Model file " + path + " not found");

        Ort::SessionOptions opts;
        opts.SetIntraOpNumThreads(1);
        try {
            m_session = std::make_unique<Ort::Session>(m_env, path.c_str(), opts);
            Ort::AllocatorWithDefaultOptions allocator;
            m_inputName = m_session->GetInputNameAllocated(0, allocator).get();
            m_outputName = m_session->GetOutputNameAllocated(0, allocator).get();
        } catch (const Ort::Exception &err) {
            m_session.reset();
            throw InitializationError("ONNX Runtime could not load " + path + ": " + err.what());
        }
        KC_LOG(LogLevel::Info, "Loaded model " + path);
    }

    bool loaded() const { return m_session != nullptr; }
    const std::string &modelPath() const { return m_modelPath; }

    std::vector<float> run(const InputTensor &input) override {
        if (!m_session)
            throw NotInitializedError("No model loaded");
        try {
            Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
            // CreateTensor wants a mutable pointer but does not write through it.
            Ort::Value tensor = Ort::Value::CreateTensor<float>(
                mem, const_cast<float *>(input.data.data()), input.data.size(),
                input.shape.data(), input.shape.size());
            const char *inputName = m_inputName.c_str();
            const char *outputName = m_outputName.c_str();
            auto outputs = m_session->Run(Ort::RunOptions{nullptr}, &inputName, &tensor, 1,
                                          &outputName, 1);
            const auto &out = outputs.front();
            const size_t count = out.GetTensorTypeAndShapeInfo().GetElementCount();
            const float *scores = out.GetTensorData<float>();
            return std::vector<float>(scores, scores + count);
        } catch (const Ort::Exception &err) {
            throw InferenceError(err.what());
        }
    }

private:
    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "kanacast"};
    std::unique_ptr<Ort::Session> m_session;
    std::string m_modelPath;
    std::string m_inputName;
    std::string m_outputName;
};

} // namespace kc
