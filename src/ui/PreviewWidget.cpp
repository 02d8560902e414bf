#include "PreviewWidget.h"
#include "PreviewCanvas.h"
#include "TimeUtil.h"
#include <QVBoxLayout>
#include <QHBoxLayout>

namespace {
constexpr int SliderSteps = 10000;
}

PreviewWidget::PreviewWidget(QWidget* parent) : QWidget(parent) {
    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(0, 0, 0, 0);

    m_canvas = new PreviewCanvas(this);
    mainLayout->addWidget(m_canvas, 1);

    m_controlsBar = new QWidget(this);
    auto* controlsLayout = new QHBoxLayout(m_controlsBar);
    controlsLayout->setContentsMargins(8, 4, 8, 4);

    m_stepBackButton = new QPushButton("\u25C0", m_controlsBar);
    m_stepBackButton->setFixedWidth(30);
    controlsLayout->addWidget(m_stepBackButton);

    m_playButton = new QPushButton("\u25B6", m_controlsBar);
    m_playButton->setFixedWidth(60);
    controlsLayout->addWidget(m_playButton);

    m_stepForwardButton = new QPushButton("\u25B6", m_controlsBar);
    m_stepForwardButton->setFixedWidth(30);
    controlsLayout->addWidget(m_stepForwardButton);

    m_seekSlider = new QSlider(Qt::Horizontal, m_controlsBar);
    m_seekSlider->setRange(0, SliderSteps);
    controlsLayout->addWidget(m_seekSlider, 1);

    m_timeLabel = new QLabel(TimeUtil::formatClock(0.0, 0.0), m_controlsBar);
    m_timeLabel->setMinimumWidth(90);
    controlsLayout->addWidget(m_timeLabel);

    mainLayout->addWidget(m_controlsBar);

    connect(m_playButton, &QPushButton::clicked, this, &PreviewWidget::playPauseClicked);
    connect(m_stepBackButton, &QPushButton::clicked, this, &PreviewWidget::stepBackward);
    connect(m_stepForwardButton, &QPushButton::clicked, this, &PreviewWidget::stepForward);
    connect(m_canvas, &PreviewCanvas::clicked, this, &PreviewWidget::playPauseClicked);
    connect(m_seekSlider, &QSlider::sliderMoved, this, [this](int value) {
        emit seekRequested(m_duration * value / static_cast<double>(SliderSteps));
    });
}

PreviewWidget::~PreviewWidget() = default;

void PreviewWidget::displayFrame(const QImage& frame) {
    m_canvas->setFrame(frame);
}

void PreviewWidget::setDuration(double seconds) {
    m_duration = seconds;
    m_seekSlider->setEnabled(seconds > 0.0);
    setCurrentTime(m_currentTime);
}

void PreviewWidget::setCurrentTime(double seconds) {
    m_currentTime = seconds;
    m_timeLabel->setText(TimeUtil::formatClock(seconds, m_duration));

    if (!m_seekSlider->isSliderDown() && m_duration > 0) {
        m_seekSlider->setValue(static_cast<int>(seconds / m_duration * SliderSteps));
    }
}

void PreviewWidget::setPlayingState(bool playing) {
    m_playButton->setText(playing ? "\u23F8" : "\u25B6");
}
