#pragma once

#include <QWidget>
#include <QLabel>
#include <QGroupBox>
#include <QDoubleSpinBox>
#include "Clip.h"

class TimelineModel;
class InteractionController;

// Start/end editor for the selected text layer. Edits go through the
// InteractionController, which clamps them; the boxes then show the values
// actually applied.
class TextTimingPanel : public QWidget {
    Q_OBJECT
public:
    TextTimingPanel(TimelineModel& model, InteractionController& interaction,
                    QWidget* parent = nullptr);
    ~TextTimingPanel();

private slots:
    void onSelectionChanged(const ClipRef& ref);
    void onTimingChanged(double start, double end);
    void applyTiming();

private:
    void showTiming(double start, double end);

    TimelineModel& m_model;
    InteractionController& m_interaction;

    QGroupBox* m_group = nullptr;
    QLabel* m_contentLabel = nullptr;
    QLabel* m_emptyLabel = nullptr;
    QDoubleSpinBox* m_startSpin = nullptr;
    QDoubleSpinBox* m_endSpin = nullptr;
    QLabel* m_durationLabel = nullptr;

    ClipRef m_ref;
    bool m_updating = false;
};
