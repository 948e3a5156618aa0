#pragma once
#include <string>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>
#include <QtGlobal>
#include "core/recognition/Errors.hpp"
#include "utils/Logger.hpp"

namespace kc {

struct RecognizerConfig {
    int canvasSize{300};
    int modelInputSize{64};
    float strokeWidth{12.f};
    float padding{6.f};
    float minTargetSize{80.f};
    float maxTargetSize{220.f};
    int topK{5};
    char32_t alphabetFirst{0x3040};
    char32_t alphabetLast{0x309F};
    std::string modelPath{"models/kana.onnx"};
    std::string labelsPath{"models/kana_labels.txt"};
};

namespace detail {

// Accepts 12354, "12354" or "0x3042".
inline bool readCodepoint(const QJsonValue &value, char32_t &out) {
    if (value.isDouble()) {
        const double d = value.toDouble();
        if (d < 0 || d > 0x10FFFF)
            return false;
        out = static_cast<char32_t>(d);
        return true;
    }
    if (value.isString()) {
        bool ok = false;
        const uint v = value.toString().trimmed().toUInt(&ok, 0);
        if (!ok || v > 0x10FFFF)
            return false;
        out = static_cast<char32_t>(v);
        return true;
    }
    return false;
}

} // namespace detail

// Missing keys keep their current value, except padding: without a
// "padding" key it is reset to half of the resulting stroke width.
inline void applyJson(const QJsonObject &obj, RecognizerConfig &cfg) {
    cfg.canvasSize = obj.value(QStringLiteral("canvas_size")).toInt(cfg.canvasSize);
    cfg.modelInputSize = obj.value(QStringLiteral("model_input_size")).toInt(cfg.modelInputSize);
    cfg.strokeWidth = static_cast<float>(
        obj.value(QStringLiteral("stroke_width")).toDouble(cfg.strokeWidth));
    // Padding follows the stroke width unless set explicitly.
    cfg.padding = static_cast<float>(
        obj.value(QStringLiteral("padding")).toDouble(cfg.strokeWidth / 2.0));
    cfg.minTargetSize = static_cast<float>(
        obj.value(QStringLiteral("min_target_size")).toDouble(cfg.minTargetSize));
    cfg.maxTargetSize = static_cast<float>(
        obj.value(QStringLiteral("max_target_size")).toDouble(cfg.maxTargetSize));
    cfg.topK = obj.value(QStringLiteral("top_k")).toInt(cfg.topK);

    const QJsonValue first = obj.value(QStringLiteral("alphabet_first"));
    if (!first.isUndefined() && !detail::readCodepoint(first, cfg.alphabetFirst))
        KC_LOG(LogLevel::Warn, "Ignoring malformed alphabet_first");
    const QJsonValue last = obj.value(QStringLiteral("alphabet_last"));
    if (!last.isUndefined() && !detail::readCodepoint(last, cfg.alphabetLast))
        KC_LOG(LogLevel::Warn, "Ignoring malformed alphabet_last");

    const QString model = obj.value(QStringLiteral("model")).toString();
    if (!model.isEmpty())
        cfg.modelPath = model.toStdString();
    const QString labels = obj.value(QStringLiteral("labels")).toString();
    if (!labels.isEmpty())
        cfg.labelsPath = labels.toStdString();
}

inline void applyEnvironment(RecognizerConfig &cfg) {
    const QString model = qEnvironmentVariable("KC_MODEL_PATH");
    if (!model.isEmpty())
        cfg.modelPath = model.toStdString();
    const QString labels = qEnvironmentVariable("KC_LABELS_PATH");
    if (!labels.isEmpty())
        cfg.labelsPath = labels.toStdString();
    const int canvas = qEnvironmentVariableIntValue("KC_CANVAS_SIZE");
    if (canvas > 0)
        cfg.canvasSize = canvas;
    const int topK = qEnvironmentVariableIntValue("KC_TOP_K");
    if (topK > 0)
        cfg.topK = topK;
}

// Defaults, then the JSON file if it exists and parses, then environment.
inline RecognizerConfig loadConfig(const QString &path = QStringLiteral("config/kanacast.json")) {
    RecognizerConfig cfg;
    QFile file(path);
    if (file.open(QIODevice::ReadOnly)) {
        QJsonParseError err;
        const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
        file.close();
        if (err.error != QJsonParseError::NoError || !doc.isObject()) {
            KC_LOG(LogLevel::Warn, "Config " + path.toStdString() +
                                       " is malformed (" + err.errorString().toStdString() +
                                       "), using defaults");
        } else {
            applyJson(doc.object(), cfg);
        }
    } else {
        KC_LOG(LogLevel::Debug, "No config at " + path.toStdString() + ", using defaults");
    }
    applyEnvironment(cfg);
    return cfg;
}

inline void validateConfig(const RecognizerConfig &cfg) {
    if (cfg.canvasSize <= 0 || cfg.modelInputSize <= 0)
        throw InitializationError("Canvas and model input sizes must be positive");
    if (cfg.strokeWidth <= 0.f || cfg.padding < 0.f)
        throw InitializationError("Stroke width must be positive and padding non-negative");
    if (cfg.minTargetSize <= 0.f || cfg.minTargetSize > cfg.maxTargetSize)
        throw InitializationError("Target size range is empty");
    if (cfg.topK <= 0)
        throw InitializationError("top_k must be at least 1");
    if (cfg.alphabetFirst > cfg.alphabetLast)
        throw InitializationError("Alphabet range is reversed");
}

} // namespace kc
