#include <QApplication>
#include "CanvasWindow.hpp"
#include "core/recognition/OnnxInferenceEngine.hpp"
#include "utils/Config.hpp"
#include "utils/Logger.hpp"
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QString>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    QApplication app(argc, argv);
    QCommandLineParser parser;
    parser.setApplicationDescription("KanaCast desktop handwriting pad");
    parser.addHelpOption();

    QCommandLineOption configOpt({"c", "config"},
        "JSON config file", "path", "config/kanacast.json");
    QCommandLineOption modelOpt({"m", "model"},
        "ONNX model", "path");
    QCommandLineOption labelsOpt({"l", "labels"},
        "Label file", "path");
    QCommandLineOption strokeWidthOpt({"w", "stroke-width"},
        "On-screen stroke width", "width", "4");
    QCommandLineOption autoOpt({"a", "auto"},
        "Recognize after every stroke");

    parser.addOption(configOpt);
    parser.addOption(modelOpt);
    parser.addOption(labelsOpt);
    parser.addOption(strokeWidthOpt);
    parser.addOption(autoOpt);

    parser.process(app);

    kc::RecognizerConfig cfg = kc::loadConfig(parser.value(configOpt));
    if (parser.isSet(modelOpt))
        cfg.modelPath = parser.value(modelOpt).toStdString();
    if (parser.isSet(labelsOpt))
        cfg.labelsPath = parser.value(labelsOpt).toStdString();

    CanvasWindowOptions opts;
    opts.padSize = cfg.canvasSize;
    opts.strokeWidth = parser.value(strokeWidthOpt).toInt();
    if (opts.strokeWidth <= 0)
        opts.strokeWidth = 4;
    opts.recognizeOnRelease = parser.isSet(autoOpt);

    KC_LOG(kc::LogLevel::Info, "KanaCast Desktop starting");

    std::shared_ptr<const kc::CharacterRecognizer> recognizer;
    QString initError;
    try {
        auto engine = std::make_shared<kc::OnnxInferenceEngine>();
        engine->loadModel(cfg.modelPath);
        auto built = std::make_shared<kc::CharacterRecognizer>(cfg, engine);
        built->initialize();
        recognizer = built;
    } catch (const kc::RecognitionError &err) {
        KC_LOG(kc::LogLevel::Error, std::string("Recognizer unavailable: ") + err.what());
        initError = QString::fromStdString(err.what());
    }

    CanvasWindow win(recognizer, opts, initError);
    win.show();
    return app.exec();
}
