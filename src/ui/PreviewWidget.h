#pragma once

#include <QWidget>
#include <QImage>
#include <QSlider>
#include <QPushButton>
#include <QLabel>

class PreviewCanvas;

// Render surface plus the transport bar: step, play/pause, scrubber and the
// "m:ss / m:ss" clock.
class PreviewWidget : public QWidget {
    Q_OBJECT
public:
    explicit PreviewWidget(QWidget* parent = nullptr);
    ~PreviewWidget();

    void displayFrame(const QImage& frame);
    void setDuration(double seconds);
    void setCurrentTime(double seconds);
    void setPlayingState(bool playing);

signals:
    void playPauseClicked();
    void seekRequested(double seconds);
    void stepForward();
    void stepBackward();

private:
    PreviewCanvas* m_canvas;
    QWidget* m_controlsBar;
    QSlider* m_seekSlider;
    QPushButton* m_playButton;
    QPushButton* m_stepBackButton;
    QPushButton* m_stepForwardButton;
    QLabel* m_timeLabel;

    double m_duration = 0.0;
    double m_currentTime = 0.0;
};
