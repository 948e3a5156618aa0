#ifndef CANVASWINDOW_HPP
#define CANVASWINDOW_HPP
#include "core/input/StrokeStore.hpp"
#include "core/recognition/CharacterRecognizer.hpp"
#include "core/recognition/RecognitionDispatcher.hpp"
#include "utils/Logger.hpp"
#include <QColor>
#include <QHBoxLayout>
#include <QLabel>
#include <QMetaObject>
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <QPen>
#include <QPushButton>
#include <QString>
#include <QVBoxLayout>
#include <QWidget>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

struct CanvasWindowOptions {
  int padSize{300};
  int strokeWidth{4};
  QColor strokeColor{Qt::black};
  QColor padColor{Qt::white};
  bool recognizeOnRelease{false};
};

// Square drawing surface feeding a StrokeStore owned by its parent window.
// It only paints; the owner calls update() when the store changes.
class StrokePad : public QWidget {
public:
  StrokePad(kc::StrokeStore &store, const CanvasWindowOptions &opts,
            QWidget *parent = nullptr)
      : QWidget(parent), m_store(store), m_options(opts) {
    setFixedSize(opts.padSize, opts.padSize);
    setCursor(Qt::CrossCursor);
  }

  const kc::StrokeStore &store() const { return m_store; }

  void setOnStrokeEnd(std::function<void()> callback) { m_onStrokeEnd = std::move(callback); }

protected:
  void mousePressEvent(QMouseEvent *event) override {
    if (event->button() != Qt::LeftButton)
      return;
    m_store.beginStroke(toPoint(event->pos()));
  }

  void mouseMoveEvent(QMouseEvent *event) override {
    if (!(event->buttons() & Qt::LeftButton))
      return;
    m_store.extendStroke(toPoint(event->pos()));
    if (static_cast<int>(kc::globalLogLevel()) <= static_cast<int>(kc::LogLevel::Debug)) {
      KC_LOG(kc::LogLevel::Debug, "Point " + std::to_string(event->pos().x()) + "," +
                                      std::to_string(event->pos().y()));
    }
  }

  void mouseReleaseEvent(QMouseEvent *event) override {
    if (event->button() != Qt::LeftButton)
      return;
    m_store.endStroke();
    if (m_onStrokeEnd)
      m_onStrokeEnd();
  }

  void paintEvent(QPaintEvent *) override {
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing);
    p.fillRect(rect(), m_options.padColor);
    p.setPen(QPen(QColor(170, 170, 170), 2));
    p.drawRect(rect().adjusted(1, 1, -1, -1));

    QPen pen(m_options.strokeColor, m_options.strokeWidth);
    pen.setCapStyle(Qt::RoundCap);
    pen.setJoinStyle(Qt::RoundJoin);
    auto drawStroke = [&](const kc::Stroke &s) {
      if (s.empty())
        return;
      if (s.size() == 1) {
        // on-screen feedback only; a tap is not rasterized for recognition
        p.setPen(Qt::NoPen);
        p.setBrush(m_options.strokeColor);
        p.drawEllipse(QPointF(s[0].x, s[0].y), m_options.strokeWidth / 2.0,
                      m_options.strokeWidth / 2.0);
        return;
      }
      QPainterPath path;
      path.moveTo(s[0].x, s[0].y);
      for (size_t i = 1; i < s.size(); ++i)
        path.lineTo(s[i].x, s[i].y);
      p.setPen(pen);
      p.setBrush(Qt::NoBrush);
      p.drawPath(path);
    };
    for (const auto &s : m_store.strokes())
      drawStroke(s);
    drawStroke(m_store.activeStroke());
  }

private:
  static kc::Point toPoint(const QPoint &pos) {
    return {static_cast<float>(pos.x()), static_cast<float>(pos.y())};
  }

  kc::StrokeStore &m_store;
  CanvasWindowOptions m_options;
  std::function<void()> m_onStrokeEnd;
};

class CanvasWindow : public QWidget {
  Q_OBJECT
public:
  // recognizer may be null when initialization failed; initError is shown
  // instead of results then.
  CanvasWindow(std::shared_ptr<const kc::CharacterRecognizer> recognizer,
               const CanvasWindowOptions &opts = CanvasWindowOptions(),
               const QString &initError = QString(), QWidget *parent = nullptr)
      : QWidget(parent), m_options(opts), m_recognizer(std::move(recognizer)) {
    setWindowTitle(tr("KanaCast"));
    m_pad = new StrokePad(m_store, m_options, this);

    m_clearBtn = new QPushButton(tr("Clear"), this);
    m_recognizeBtn = new QPushButton(tr("Recognize"), this);
    m_resultLabel = new QLabel(this);
    m_resultLabel->setAlignment(Qt::AlignCenter);
    m_resultLabel->setMinimumHeight(120);
    m_resultLabel->setStyleSheet("font-size:16px;");

    auto *buttons = new QHBoxLayout();
    buttons->addWidget(m_clearBtn);
    buttons->addWidget(m_recognizeBtn);
    auto *layout = new QVBoxLayout(this);
    layout->addWidget(m_pad, 0, Qt::AlignHCenter);
    layout->addLayout(buttons);
    layout->addWidget(m_resultLabel);

    connect(m_clearBtn, &QPushButton::clicked, this, [this] {
      m_store.clear();
      m_resultLabel->clear();
    });
    connect(m_recognizeBtn, &QPushButton::clicked, this, &CanvasWindow::onRecognize);
    if (m_options.recognizeOnRelease)
      m_pad->setOnStrokeEnd([this] { onRecognize(); });

    m_store.addObserver([this](const kc::StrokeStore &store) {
      m_pad->update();
      m_recognizeBtn->setEnabled(m_dispatcher && !store.isEmpty());
    });

    if (m_recognizer) {
      m_dispatcher = std::make_unique<kc::RecognitionDispatcher>(m_recognizer);
    } else {
      m_resultLabel->setStyleSheet("color:#cc0000;font-size:14px;");
      m_resultLabel->setText(tr("Initialization failed: %1").arg(initError));
    }
    m_recognizeBtn->setEnabled(false);
  }

signals:
  void recognized(const QString &bestGlyph);

private slots:
  void onRecognize() {
    if (!m_dispatcher)
      return;
    const kc::Session session = m_store.snapshot();
    if (session.empty()) {
      m_resultLabel->setText(tr("Nothing to recognize"));
      return;
    }
    m_dispatcher->submit(session, [this](const kc::RecognitionReply &reply) {
      QMetaObject::invokeMethod(this, [this, reply] { showReply(reply); },
                                Qt::QueuedConnection);
    });
  }

private:
  void showReply(const kc::RecognitionReply &reply) {
    if (reply.sequence < m_lastShown)
      return;
    m_lastShown = reply.sequence;
    switch (reply.status) {
    case kc::ReplyStatus::NothingToRecognize:
      m_resultLabel->setText(tr("Nothing to recognize"));
      return;
    case kc::ReplyStatus::Failed:
      m_resultLabel->setText(tr("Recognition failed: %1")
                                 .arg(QString::fromStdString(reply.error)));
      return;
    case kc::ReplyStatus::Ok:
      break;
    }
    if (reply.results.empty()) {
      m_resultLabel->setText(tr("Could not recognize"));
      return;
    }
    QString text;
    for (size_t i = 0; i < reply.results.size(); ++i) {
      const auto &r = reply.results[i];
      text += QStringLiteral("%1. %2  %3%\n")
                  .arg(i + 1)
                  .arg(QString::fromStdString(r.glyph))
                  .arg(static_cast<double>(r.confidence) * 100.0, 0, 'f', 1);
    }
    m_resultLabel->setText(text.trimmed());
    emit recognized(QString::fromStdString(reply.results.front().glyph));
  }

  CanvasWindowOptions m_options;
  kc::StrokeStore m_store;
  std::shared_ptr<const kc::CharacterRecognizer> m_recognizer;
  // Destroyed before the store; pending replies drain first.
  std::unique_ptr<kc::RecognitionDispatcher> m_dispatcher;
  StrokePad *m_pad{nullptr};
  QPushButton *m_clearBtn{nullptr};
  QPushButton *m_recognizeBtn{nullptr};
  QLabel *m_resultLabel{nullptr};
  uint64_t m_lastShown{0};
};

#endif // CANVASWINDOW_HPP
