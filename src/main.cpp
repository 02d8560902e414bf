#include <QApplication>
#include <QGuiApplication>
#include <QCommandLineParser>
#include <QTimer>
#include <QByteArray>
#include <memory>
#include <cstdio>
#include "MainWindow.h"
#include "AppConstants.h"
#include "EditorConfig.h"
#include "EditorEngine.h"
#include "Logging.h"

namespace {

// Headless export needs fonts and QPainter but no widgets
std::unique_ptr<QGuiApplication> createApplication(int& argc, char* argv[], bool headless) {
    if (headless) return std::make_unique<QGuiApplication>(argc, argv);
    return std::make_unique<QApplication>(argc, argv);
}

bool wantsHeadless(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (qstrcmp(argv[i], "--export") == 0 || qstrncmp(argv[i], "--export=", 9) == 0) {
            return true;
        }
    }
    return false;
}

bool setupProject(EditorEngine& engine, const QStringList& inputs, const QString& textsPath) {
    for (int i = 0; i < inputs.size(); ++i) {
        int id = i == 0 ? engine.attachVideo(inputs[i]) : engine.addVideo(inputs[i]);
        if (id < 0) {
            std::fprintf(stderr, "Cannot open %s: %s\n", qPrintable(inputs[i]),
                         qPrintable(engine.errorString()));
            return false;
        }
    }
    if (!textsPath.isEmpty() && !engine.loadTextFile(textsPath)) {
        std::fprintf(stderr, "%s\n", qPrintable(engine.errorString()));
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    const bool headless = wantsHeadless(argc, argv);
    auto app = createApplication(argc, argv, headless);
    app->setApplicationName(AppConstants::AppName);
    app->setApplicationVersion(AppConstants::AppVersion);
    app->setOrganizationName(AppConstants::OrgName);

    QCommandLineParser parser;
    parser.setApplicationDescription("Short-form video timeline editor");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("video", "Primary video, followed by videos to append.",
                                 "[video...]");
    QCommandLineOption textsOption("texts", "Load text layers from a JSON file.", "json");
    QCommandLineOption configOption("config", "Load editor settings from a JSON file.", "json");
    QCommandLineOption exportOption("export", "Export to an MP4 file and exit.", "out.mp4");
    parser.addOption(textsOption);
    parser.addOption(configOption);
    parser.addOption(exportOption);
    parser.process(*app);

    EditorSettings settings;
    if (parser.isSet(configOption)) {
        EditorConfig config;
        if (!config.load(parser.value(configOption), settings)) {
            std::fprintf(stderr, "%s\n", qPrintable(config.errorString()));
            return 1;
        }
    }
    if (headless) settings.previewAudio = false;

    EditorEngine engine(settings);
    if (!setupProject(engine, parser.positionalArguments(), parser.value(textsOption))) {
        return 1;
    }

    if (headless) {
        if (engine.model().duration() <= 0.0) {
            std::fprintf(stderr, "Nothing to export\n");
            return 1;
        }

        QObject::connect(&engine, &EditorEngine::exportFinished, app.get(),
                         [&app](const ExportResult& result) {
            if (result.status == ExportStatus::Completed) {
                std::printf("Exported %s: %.2fs, %d video clips, %d audio clips, %d text layers\n",
                            qPrintable(result.outputPath), result.duration,
                            result.videoClipsSpliced, result.audioTracksMixed,
                            result.textOverlaysRendered);
                app->exit(0);
            } else {
                std::fprintf(stderr, "Export failed: %s\n", qPrintable(result.error));
                app->exit(1);
            }
        });

        ExportSettings exportSettings = settings.exportDefaults;
        exportSettings.outputPath = parser.value(exportOption);

        // Wait until every handle has finished loading before the clock starts
        auto* waitTimer = new QTimer(app.get());
        QObject::connect(waitTimer, &QTimer::timeout, app.get(), [&, waitTimer]() {
            if (!engine.isMediaSettled()) return;
            waitTimer->stop();
            engine.startPreview();
            if (!engine.exportProject(exportSettings)) {
                std::fprintf(stderr, "%s\n", qPrintable(engine.errorString()));
                app->exit(1);
            }
        });
        waitTimer->start(50);
        return app->exec();
    }

    MainWindow window(engine);
    window.show();
    engine.startPreview();

    return app->exec();
}
