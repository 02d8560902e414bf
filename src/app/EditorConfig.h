#pragma once

#include <QObject>
#include <QSize>
#include <QString>
#include <QJsonObject>
#include "AppConstants.h"
#include "ExportSink.h"

struct EditorSettings {
    QSize designSize{AppConstants::DesignWidth, AppConstants::DesignHeight};
    double minClipDuration = AppConstants::MinClipDuration;
    double videoDriftTolerance = AppConstants::VideoDriftTolerance;
    double audioDriftTolerance = AppConstants::AudioDriftTolerance;
    double previewFps = AppConstants::DefaultFps;
    int mixSampleRate = AppConstants::MixSampleRate;
    int mixChannels = AppConstants::MixChannels;
    double defaultTextDuration = AppConstants::DefaultTextDuration;
    bool previewAudio = true;
    ExportSettings exportDefaults;
};

// Editor settings as JSON. Missing keys keep their defaults; values out of
// range are replaced by the default.
class EditorConfig : public QObject {
    Q_OBJECT
public:
    explicit EditorConfig(QObject* parent = nullptr);
    ~EditorConfig();

    bool save(const QString& filePath, const EditorSettings& settings);
    bool load(const QString& filePath, EditorSettings& settings);
    bool parse(const QByteArray& json, EditorSettings& settings);

    static QJsonObject settingsToJson(const EditorSettings& settings);
    static EditorSettings settingsFromJson(const QJsonObject& obj);

    QString errorString() const { return m_error; }

private:
    QString m_error;
};
