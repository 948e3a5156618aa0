#include "core/input/StrokeStore.hpp"
#include "core/recognition/CharacterRecognizer.hpp"
#include "core/recognition/OnnxInferenceEngine.hpp"
#include "utils/Config.hpp"
#include "utils/Logger.hpp"
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QImage>
#include <QString>
#include <iomanip>
#include <iostream>
#include <memory>

namespace {

void applyNumericOption(const QCommandLineParser &parser, const QCommandLineOption &opt,
                        int &target) {
    if (!parser.isSet(opt))
        return;
    bool ok = false;
    const int v = parser.value(opt).toInt(&ok);
    if (ok)
        target = v;
    else
        KC_LOG(kc::LogLevel::Warn, "Ignoring non-numeric --" + opt.names().last().toStdString());
}

void applyNumericOption(const QCommandLineParser &parser, const QCommandLineOption &opt,
                        float &target) {
    if (!parser.isSet(opt))
        return;
    bool ok = false;
    const float v = parser.value(opt).toFloat(&ok);
    if (ok)
        target = v;
    else
        KC_LOG(kc::LogLevel::Warn, "Ignoring non-numeric --" + opt.names().last().toStdString());
}

void applyCodepointOption(const QCommandLineParser &parser, const QCommandLineOption &opt,
                          char32_t &target) {
    if (!parser.isSet(opt))
        return;
    bool ok = false;
    const uint v = parser.value(opt).toUInt(&ok, 0);
    if (ok && v <= 0x10FFFF)
        target = static_cast<char32_t>(v);
    else
        KC_LOG(kc::LogLevel::Warn, "Ignoring malformed --" + opt.names().last().toStdString());
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    QCommandLineParser parser;
    parser.setApplicationDescription("KanaCast: recognize a handwritten character from a stroke CSV");
    parser.addHelpOption();

    QCommandLineOption configOpt({"c", "config"}, "JSON config file", "path",
                                 "config/kanacast.json");
    QCommandLineOption strokesOpt({"s", "strokes"}, "Stroke CSV (stroke,x,y per line)", "path");
    QCommandLineOption modelOpt({"m", "model"}, "ONNX model", "path");
    QCommandLineOption labelsOpt({"l", "labels"}, "Label file, one label per line", "path");
    QCommandLineOption canvasOpt("canvas-size", "Raster canvas size", "px");
    QCommandLineOption inputOpt("input-size", "Model input size", "px");
    QCommandLineOption widthOpt({"w", "stroke-width"}, "Raster stroke width", "px");
    QCommandLineOption paddingOpt("padding", "Bounding box padding", "px");
    QCommandLineOption minOpt("min-size", "Glyphs smaller than this are scaled up", "px");
    QCommandLineOption maxOpt("max-size", "Glyphs larger than this are scaled down", "px");
    QCommandLineOption topKOpt({"k", "top-k"}, "Number of results", "count");
    QCommandLineOption firstOpt("alphabet-first", "First code point of the target alphabet",
                                "codepoint");
    QCommandLineOption lastOpt("alphabet-last", "Last code point of the target alphabet",
                               "codepoint");
    QCommandLineOption dumpOpt({"d", "dump-raster"}, "Write the rendered raster as PNG", "path");
    QCommandLineOption verboseOpt({"v", "verbose"}, "Debug logging");

    parser.addOption(configOpt);
    parser.addOption(strokesOpt);
    parser.addOption(modelOpt);
    parser.addOption(labelsOpt);
    parser.addOption(canvasOpt);
    parser.addOption(inputOpt);
    parser.addOption(widthOpt);
    parser.addOption(paddingOpt);
    parser.addOption(minOpt);
    parser.addOption(maxOpt);
    parser.addOption(topKOpt);
    parser.addOption(firstOpt);
    parser.addOption(lastOpt);
    parser.addOption(dumpOpt);
    parser.addOption(verboseOpt);

    parser.process(app);

    if (parser.isSet(verboseOpt))
        kc::setLogLevel(kc::LogLevel::Debug);

    if (!parser.isSet(strokesOpt)) {
        std::cerr << "Missing --strokes" << std::endl;
        parser.showHelp(1);
    }

    kc::RecognizerConfig cfg = kc::loadConfig(parser.value(configOpt));
    if (parser.isSet(modelOpt))
        cfg.modelPath = parser.value(modelOpt).toStdString();
    if (parser.isSet(labelsOpt))
        cfg.labelsPath = parser.value(labelsOpt).toStdString();
    applyNumericOption(parser, canvasOpt, cfg.canvasSize);
    applyNumericOption(parser, inputOpt, cfg.modelInputSize);
    applyNumericOption(parser, widthOpt, cfg.strokeWidth);
    if (parser.isSet(widthOpt) && !parser.isSet(paddingOpt))
        cfg.padding = cfg.strokeWidth / 2.f;
    applyNumericOption(parser, paddingOpt, cfg.padding);
    applyNumericOption(parser, minOpt, cfg.minTargetSize);
    applyNumericOption(parser, maxOpt, cfg.maxTargetSize);
    applyNumericOption(parser, topKOpt, cfg.topK);
    applyCodepointOption(parser, firstOpt, cfg.alphabetFirst);
    applyCodepointOption(parser, lastOpt, cfg.alphabetLast);

    kc::StrokeStore store;
    if (!store.importCSV(parser.value(strokesOpt).toStdString())) {
        KC_LOG(kc::LogLevel::Error, "Could not read strokes from " +
                                        parser.value(strokesOpt).toStdString());
        return 1;
    }

    try {
        auto engine = std::make_shared<kc::OnnxInferenceEngine>();
        engine->loadModel(cfg.modelPath);
        kc::CharacterRecognizer recognizer(cfg, engine);
        recognizer.initialize();

        const kc::Session session = store.snapshot();
        if (parser.isSet(dumpOpt)) {
            const auto raster = recognizer.capture(session);
            if (raster && !raster->save(parser.value(dumpOpt), "PNG"))
                KC_LOG(kc::LogLevel::Warn, "Failed to write " + parser.value(dumpOpt).toStdString());
        }
        if (session.empty()) {
            std::cout << "Nothing to recognize" << std::endl;
            return 0;
        }

        const auto results = recognizer.recognize(session);
        for (size_t i = 0; i < results.size(); ++i) {
            std::cout << (i + 1) << ". " << results[i].glyph << "  " << std::fixed
                      << std::setprecision(1) << results[i].confidence * 100.f << "%"
                      << std::endl;
        }
    } catch (const kc::RecognitionError &err) {
        KC_LOG(kc::LogLevel::Error, err.what());
        return 1;
    }
    return 0;
}
