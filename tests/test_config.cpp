#include "utils/Config.hpp"
#include <QJsonObject>
#include <QtGlobal>
#include <cassert>
#include <cstdio>
#include <fstream>

template <typename F> static bool rejects(F &&f) {
    try {
        f();
    } catch (const kc::InitializationError &) {
        return true;
    }
    return false;
}

int main() {
    qunsetenv("KC_MODEL_PATH");
    qunsetenv("KC_LABELS_PATH");
    qunsetenv("KC_CANVAS_SIZE");
    qunsetenv("KC_TOP_K");

    // missing file keeps defaults
    kc::RecognizerConfig cfg = kc::loadConfig(QStringLiteral("missing-config.json"));
    assert(cfg.canvasSize == 300 && cfg.modelInputSize == 64);
    assert(cfg.strokeWidth == 12.f && cfg.padding == 6.f);
    assert(cfg.minTargetSize == 80.f && cfg.maxTargetSize == 220.f);
    assert(cfg.topK == 5);
    assert(cfg.alphabetFirst == 0x3040 && cfg.alphabetLast == 0x309F);
    kc::validateConfig(cfg);

    const char *path = "config_test.json";
    {
        std::ofstream out(path);
        out << "{ \"canvas_size\": 256, \"model_input_size\": 48, \"stroke_width\": 10,"
               " \"top_k\": 3, \"alphabet_first\": \"0x30A0\", \"alphabet_last\": 12543,"
               " \"model\": \"m.onnx\", \"labels\": \"l.txt\" }";
    }
    cfg = kc::loadConfig(QString::fromLatin1(path));
    assert(cfg.canvasSize == 256 && cfg.modelInputSize == 48);
    assert(cfg.strokeWidth == 10.f && cfg.padding == 5.f);
    assert(cfg.topK == 3);
    assert(cfg.alphabetFirst == 0x30A0 && cfg.alphabetLast == 0x30FF);
    assert(cfg.modelPath == "m.onnx" && cfg.labelsPath == "l.txt");
    assert(cfg.minTargetSize == 80.f);

    // environment wins over the file
    qputenv("KC_MODEL_PATH", "env.onnx");
    qputenv("KC_TOP_K", "7");
    cfg = kc::loadConfig(QString::fromLatin1(path));
    assert(cfg.modelPath == "env.onnx" && cfg.topK == 7);
    assert(cfg.labelsPath == "l.txt");
    qunsetenv("KC_MODEL_PATH");
    qunsetenv("KC_TOP_K");

    // malformed JSON falls back to defaults
    {
        std::ofstream out(path);
        out << "{ \"canvas_size\": ";
    }
    cfg = kc::loadConfig(QString::fromLatin1(path));
    assert(cfg.canvasSize == 300);
    std::remove(path);

    kc::RecognizerConfig bad;
    bad.topK = 0;
    assert(rejects([&] { kc::validateConfig(bad); }));
    bad = kc::RecognizerConfig();
    bad.minTargetSize = 500.f;
    assert(rejects([&] { kc::validateConfig(bad); }));
    bad = kc::RecognizerConfig();
    bad.alphabetFirst = 0x309F;
    bad.alphabetLast = 0x3040;
    assert(rejects([&] { kc::validateConfig(bad); }));
    bad = kc::RecognizerConfig();
    bad.canvasSize = 0;
    assert(rejects([&] { kc::validateConfig(bad); }));

    // padding follows the stroke width unless the key is present
    kc::RecognizerConfig layered;
    layered.padding = 3.f;
    kc::applyJson(QJsonObject(), layered);
    assert(layered.padding == 6.f);
    QJsonObject explicitPadding;
    explicitPadding.insert(QStringLiteral("padding"), 2.5);
    kc::applyJson(explicitPadding, layered);
    assert(layered.padding == 2.5f);

    assert(kc::parseLogLevel("DEBUG") == kc::LogLevel::Debug);
    assert(kc::parseLogLevel("ERROR") == kc::LogLevel::Error);
    assert(kc::parseLogLevel("verbose") == kc::LogLevel::Info);
    return 0;
}
