#include "MainWindow.h"
#include "AppConstants.h"
#include "EditorEngine.h"
#include "PreviewWidget.h"
#include "TextTimingPanel.h"
#include "TimelineWidget.h"
#include "TimelineModel.h"
#include "InteractionController.h"
#include "Scheduler.h"

#include <QMenuBar>
#include <QMenu>
#include <QAction>
#include <QStatusBar>
#include <QFileDialog>
#include <QMessageBox>
#include <QFileInfo>
#include <QCloseEvent>
#include <QUndoStack>

namespace {

bool isAudioFile(const QString& path) {
    static const QStringList audioExts = {"mp3", "wav", "aac", "m4a", "ogg", "flac", "opus"};
    return audioExts.contains(QFileInfo(path).suffix().toLower());
}

} // namespace

MainWindow::MainWindow(EditorEngine& engine, QWidget* parent)
    : QMainWindow(parent)
    , m_engine(engine)
{
    setWindowTitle(QString("%1 v%2").arg(AppConstants::AppName, AppConstants::AppVersion));
    resize(AppConstants::DefaultWindowWidth, AppConstants::DefaultWindowHeight);

    setupUi();
    setupMenuBar();
    setupDockWidgets();
    connectSignals();

    m_previewWidget->displayFrame(m_engine.renderSurface());
    statusBar()->showMessage("Ready");
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi() {
    m_previewWidget = new PreviewWidget(this);
    setCentralWidget(m_previewWidget);

    m_timingPanel = new TextTimingPanel(m_engine.model(), m_engine.interaction(), this);
    m_timelineWidget = new TimelineWidget(m_engine.model(), m_engine.interaction(), this);
}

void MainWindow::setupMenuBar() {
    auto* fileMenu = menuBar()->addMenu("&File");

    auto* openVideoAction = fileMenu->addAction("Open &Video...");
    connect(openVideoAction, &QAction::triggered, this, &MainWindow::onOpenVideo);

    auto* addMediaAction = fileMenu->addAction("&Add Media...");
    connect(addMediaAction, &QAction::triggered, this, &MainWindow::onAddMedia);

    auto* loadTextsAction = fileMenu->addAction("Load &Text Layers...");
    connect(loadTextsAction, &QAction::triggered, this, &MainWindow::onLoadTexts);

    fileMenu->addSeparator();

    auto* exportAction = fileMenu->addAction("&Export...");
    exportAction->setShortcut(QKeySequence("Ctrl+E"));
    connect(exportAction, &QAction::triggered, this, &MainWindow::onExportRequested);

    fileMenu->addSeparator();

    auto* exitAction = fileMenu->addAction("E&xit");
    connect(exitAction, &QAction::triggered, this, &QWidget::close);

    auto* editMenu = menuBar()->addMenu("&Edit");
    QAction* undoAction = m_engine.undoStack().createUndoAction(this, "&Undo");
    undoAction->setShortcut(QKeySequence::Undo);
    editMenu->addAction(undoAction);
    QAction* redoAction = m_engine.undoStack().createRedoAction(this, "&Redo");
    redoAction->setShortcut(QKeySequence::Redo);
    editMenu->addAction(redoAction);

    auto* playMenu = menuBar()->addMenu("&Playback");
    auto* playAction = playMenu->addAction("Play / Pause");
    playAction->setShortcut(QKeySequence(Qt::Key_Space));
    connect(playAction, &QAction::triggered, this, [this]() { m_engine.togglePlayPause(); });

    m_viewMenu = menuBar()->addMenu("&View");

    auto* helpMenu = menuBar()->addMenu("&Help");
    auto* aboutAction = helpMenu->addAction("&About");
    connect(aboutAction, &QAction::triggered, this, [this]() {
        QMessageBox::about(this, "About ReelForge",
            QString("<h3>ReelForge v%1</h3>"
                    "<p>Short-form video timeline editor.</p>")
            .arg(AppConstants::AppVersion));
    });
}

void MainWindow::setupDockWidgets() {
    m_timingDock = new QDockWidget("Text Timing", this);
    m_timingDock->setWidget(m_timingPanel);
    m_timingDock->setObjectName("TextTimingDock");
    addDockWidget(Qt::RightDockWidgetArea, m_timingDock);

    m_timelineDock = new QDockWidget("Timeline", this);
    m_timelineDock->setWidget(m_timelineWidget);
    m_timelineDock->setObjectName("TimelineDock");
    addDockWidget(Qt::BottomDockWidgetArea, m_timelineDock);

    m_viewMenu->addAction(m_timingDock->toggleViewAction());
    m_viewMenu->addAction(m_timelineDock->toggleViewAction());
}

void MainWindow::connectSignals() {
    Scheduler& scheduler = m_engine.scheduler();

    connect(&m_engine, &EditorEngine::frameComposed, this, [this](const QImage& frame, double t) {
        m_previewWidget->displayFrame(frame);
        m_previewWidget->setCurrentTime(t);
    });

    connect(&scheduler, &Scheduler::stateChanged, this, [this](PlaybackState state) {
        m_previewWidget->setPlayingState(state == PlaybackState::Playing);
    });

    connect(&m_engine.model(), &TimelineModel::durationChanged, this, [this](double d) {
        m_previewWidget->setDuration(d);
    });

    connect(m_previewWidget, &PreviewWidget::playPauseClicked, this, [this]() {
        m_engine.togglePlayPause();
    });
    connect(m_previewWidget, &PreviewWidget::stepForward, &scheduler, &Scheduler::stepForward);
    connect(m_previewWidget, &PreviewWidget::stepBackward, &scheduler, &Scheduler::stepBackward);
    connect(m_previewWidget, &PreviewWidget::seekRequested, this, [this](double t) {
        m_engine.seek(t);
    });

    connect(m_timelineWidget, &TimelineWidget::seekRequested, this, [this](double t) {
        m_engine.seek(t);
    });
    connect(m_timelineWidget, &TimelineWidget::filesDropped, this, &MainWindow::onFilesDropped);

    connect(&m_engine, &EditorEngine::exportProgress, this, [this](double fraction) {
        statusBar()->showMessage(QString("Exporting... %1%").arg(qRound(fraction * 100.0)));
    });
    connect(&m_engine, &EditorEngine::exportFinished, this, &MainWindow::onExportFinished);
}

void MainWindow::onOpenVideo() {
    QString path = QFileDialog::getOpenFileName(this, "Open Video File", {},
        "Video Files (*.mp4 *.avi *.mkv *.mov *.webm);;All Files (*)");
    if (path.isEmpty()) return;

    if (m_engine.attachVideo(path) < 0) {
        QMessageBox::warning(this, "Open Video", m_engine.errorString());
        return;
    }
    m_timelineWidget->zoomToFitAll();
    statusBar()->showMessage(QString("Loaded %1").arg(QFileInfo(path).fileName()));
}

void MainWindow::onAddMedia() {
    QStringList paths = QFileDialog::getOpenFileNames(this, "Add Media", {},
        "Media Files (*.mp4 *.avi *.mkv *.mov *.webm *.mp3 *.wav *.aac *.m4a *.ogg *.flac);;"
        "All Files (*)");
    for (const QString& path : paths) addMediaFile(path);
    m_timelineWidget->zoomToFitAll();
}

void MainWindow::onLoadTexts() {
    QString path = QFileDialog::getOpenFileName(this, "Load Text Layers", {},
        "Text Layers (*.json);;All Files (*)");
    if (path.isEmpty()) return;

    if (!m_engine.loadTextFile(path)) {
        QMessageBox::warning(this, "Load Text Layers", m_engine.errorString());
    }
}

void MainWindow::onFilesDropped(const QStringList& paths) {
    for (const QString& path : paths) {
        if (path.endsWith(".json", Qt::CaseInsensitive)) {
            if (!m_engine.loadTextFile(path)) {
                statusBar()->showMessage(m_engine.errorString());
            }
        } else {
            addMediaFile(path);
        }
    }
    m_timelineWidget->zoomToFitAll();
}

void MainWindow::addMediaFile(const QString& path) {
    int id = -1;
    if (isAudioFile(path)) {
        id = m_engine.addAudio(path, 0.0);
    } else if (m_engine.model().primaryVideoId() < 0) {
        id = m_engine.attachVideo(path);
    } else {
        id = m_engine.addVideo(path);
    }

    if (id < 0) {
        statusBar()->showMessage(QString("Cannot add %1: %2")
            .arg(QFileInfo(path).fileName(), m_engine.errorString()));
    }
}

void MainWindow::onExportRequested() {
    if (m_engine.isExporting()) return;
    if (m_engine.model().duration() <= 0.0) {
        QMessageBox::information(this, "Export", "Nothing to export yet.");
        return;
    }

    QString path = QFileDialog::getSaveFileName(this, "Export Video", "export.mp4",
        "MP4 Video (*.mp4)");
    if (path.isEmpty()) return;

    ExportSettings settings = m_engine.settings().exportDefaults;
    settings.outputPath = path;
    if (!m_engine.exportProject(settings)) {
        QMessageBox::warning(this, "Export", m_engine.errorString());
        return;
    }
    statusBar()->showMessage("Exporting... playback runs to the end, pausing or editing cancels");
}

void MainWindow::onExportFinished(const ExportResult& result) {
    switch (result.status) {
    case ExportStatus::Completed:
        statusBar()->showMessage(QString("Exported %1 (%2 video, %3 audio, %4 text)")
            .arg(QFileInfo(result.outputPath).fileName())
            .arg(result.videoClipsSpliced)
            .arg(result.audioTracksMixed)
            .arg(result.textOverlaysRendered));
        break;
    case ExportStatus::Cancelled:
        // The error text carries the reason
        statusBar()->showMessage(result.error.isEmpty() ? QString("Export cancelled") : result.error);
        break;
    case ExportStatus::Failed:
        statusBar()->showMessage("Export failed");
        QMessageBox::warning(this, "Export", result.error);
        break;
    }
}

void MainWindow::closeEvent(QCloseEvent* event) {
    if (m_engine.isExporting()) {
        auto answer = QMessageBox::question(this, "Export running",
            "An export is in progress. Cancel it and quit?");
        if (answer != QMessageBox::Yes) {
            event->ignore();
            return;
        }
        m_engine.cancelExport();
    }
    m_engine.stopPreview();
    event->accept();
}
