#pragma once

#include <QMainWindow>
#include <QDockWidget>
#include <QStringList>

class EditorEngine;
class PreviewWidget;
class TextTimingPanel;
class TimelineWidget;
struct ExportResult;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(EditorEngine& engine, QWidget* parent = nullptr);
    ~MainWindow();

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onOpenVideo();
    void onAddMedia();
    void onLoadTexts();
    void onExportRequested();
    void onExportFinished(const ExportResult& result);
    void onFilesDropped(const QStringList& paths);

private:
    void setupUi();
    void setupMenuBar();
    void setupDockWidgets();
    void connectSignals();
    void addMediaFile(const QString& path);

    EditorEngine& m_engine;

    QDockWidget* m_timingDock = nullptr;
    QDockWidget* m_timelineDock = nullptr;
    QMenu* m_viewMenu = nullptr;

    PreviewWidget* m_previewWidget = nullptr;
    TextTimingPanel* m_timingPanel = nullptr;
    TimelineWidget* m_timelineWidget = nullptr;
};
