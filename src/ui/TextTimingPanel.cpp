#include "TextTimingPanel.h"
#include "TimelineModel.h"
#include "InteractionController.h"
#include "TimeUtil.h"
#include <QVBoxLayout>
#include <QFormLayout>

namespace {

QDoubleSpinBox* makeTimeSpin(QWidget* parent) {
    auto* spin = new QDoubleSpinBox(parent);
    spin->setRange(0.0, 1e6);
    spin->setDecimals(2);
    spin->setSingleStep(0.1);
    spin->setSuffix(" s");
    spin->setKeyboardTracking(false);
    return spin;
}

} // namespace

TextTimingPanel::TextTimingPanel(TimelineModel& model, InteractionController& interaction,
                                 QWidget* parent)
    : QWidget(parent)
    , m_model(model)
    , m_interaction(interaction)
{
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(4, 4, 4, 4);
    layout->setAlignment(Qt::AlignTop);

    m_emptyLabel = new QLabel("Select a text layer on the timeline", this);
    m_emptyLabel->setWordWrap(true);
    layout->addWidget(m_emptyLabel);

    m_group = new QGroupBox("Text Timing", this);
    auto* form = new QFormLayout(m_group);

    m_contentLabel = new QLabel(m_group);
    m_contentLabel->setWordWrap(true);
    form->addRow("Text:", m_contentLabel);

    m_startSpin = makeTimeSpin(m_group);
    form->addRow("Start:", m_startSpin);

    m_endSpin = makeTimeSpin(m_group);
    form->addRow("End:", m_endSpin);

    m_durationLabel = new QLabel(m_group);
    form->addRow("Duration:", m_durationLabel);

    layout->addWidget(m_group);
    m_group->setVisible(false);

    connect(m_startSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged),
            this, &TextTimingPanel::applyTiming);
    connect(m_endSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged),
            this, &TextTimingPanel::applyTiming);

    connect(&m_interaction, &InteractionController::selectionChanged,
            this, &TextTimingPanel::onSelectionChanged);
    connect(&m_interaction, &InteractionController::selectedTimingChanged,
            this, &TextTimingPanel::onTimingChanged);
}

TextTimingPanel::~TextTimingPanel() = default;

void TextTimingPanel::onSelectionChanged(const ClipRef& ref) {
    const Clip* clip = ref.isValid() ? m_model.findClip(ref) : nullptr;
    m_ref = clip ? ref : ClipRef();

    m_group->setVisible(clip != nullptr);
    m_emptyLabel->setVisible(clip == nullptr);
    if (!clip) return;

    m_contentLabel->setText(clip->text() ? clip->text()->content : QString());
    showTiming(clip->start, clip->end);
}

void TextTimingPanel::onTimingChanged(double start, double end) {
    if (!m_ref.isValid()) return;
    showTiming(start, end);
}

void TextTimingPanel::applyTiming() {
    if (m_updating || !m_ref.isValid()) return;
    m_interaction.setClipTiming(m_ref, m_startSpin->value(), m_endSpin->value());
}

void TextTimingPanel::showTiming(double start, double end) {
    m_updating = true;
    m_startSpin->setValue(start);
    m_endSpin->setValue(end);
    m_durationLabel->setText(TimeUtil::secondsToHMS(end - start));
    m_updating = false;
}
