#include "EditorConfig.h"
#include "Logging.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <algorithm>

namespace {

double positiveOr(const QJsonValue& v, double fallback) {
    double d = v.toDouble(fallback);
    return d > 0.0 ? d : fallback;
}

int positiveIntOr(const QJsonValue& v, int fallback) {
    int i = v.toInt(fallback);
    return i > 0 ? i : fallback;
}

} // namespace

EditorConfig::EditorConfig(QObject* parent) : QObject(parent) {}
EditorConfig::~EditorConfig() = default;

bool EditorConfig::save(const QString& filePath, const EditorSettings& settings) {
    QJsonObject root = settingsToJson(settings);
    root["version"] = 1;

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QString("Cannot write to: %1").arg(filePath);
        return false;
    }

    file.write(QJsonDocument(root).toJson());
    return true;
}

bool EditorConfig::load(const QString& filePath, EditorSettings& settings) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(filePath);
        return false;
    }
    if (!parse(file.readAll(), settings)) {
        m_error = QString("%1: %2").arg(filePath, m_error);
        return false;
    }
    qCDebug(lcEngine) << "Loaded settings from" << filePath;
    return true;
}

bool EditorConfig::parse(const QByteArray& json, EditorSettings& settings) {
    QJsonParseError err;
    auto doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError) {
        m_error = QString("Invalid JSON: %1").arg(err.errorString());
        return false;
    }
    if (!doc.isObject()) {
        m_error = "Invalid config format";
        return false;
    }
    settings = settingsFromJson(doc.object());
    return true;
}

QJsonObject EditorConfig::settingsToJson(const EditorSettings& s) {
    QJsonObject design;
    design["width"] = s.designSize.width();
    design["height"] = s.designSize.height();

    QJsonObject mix;
    mix["sampleRate"] = s.mixSampleRate;
    mix["channels"] = s.mixChannels;

    QJsonObject exp;
    exp["width"] = s.exportDefaults.width;
    exp["height"] = s.exportDefaults.height;
    exp["fps"] = s.exportDefaults.fps;
    exp["videoBitrate"] = s.exportDefaults.videoBitrate;
    exp["videoCodec"] = s.exportDefaults.videoCodec;
    exp["audioBitrate"] = s.exportDefaults.audioBitrate;

    QJsonObject obj;
    obj["designSize"] = design;
    obj["minClipDuration"] = s.minClipDuration;
    obj["videoDriftTolerance"] = s.videoDriftTolerance;
    obj["audioDriftTolerance"] = s.audioDriftTolerance;
    obj["previewFps"] = s.previewFps;
    obj["defaultTextDuration"] = s.defaultTextDuration;
    obj["previewAudio"] = s.previewAudio;
    obj["mix"] = mix;
    obj["export"] = exp;
    return obj;
}

EditorSettings EditorConfig::settingsFromJson(const QJsonObject& obj) {
    EditorSettings s;

    auto design = obj["designSize"].toObject();
    s.designSize = QSize(positiveIntOr(design["width"], s.designSize.width()),
                         positiveIntOr(design["height"], s.designSize.height()));

    s.minClipDuration = positiveOr(obj["minClipDuration"], s.minClipDuration);
    s.videoDriftTolerance = positiveOr(obj["videoDriftTolerance"], s.videoDriftTolerance);
    s.audioDriftTolerance = positiveOr(obj["audioDriftTolerance"], s.audioDriftTolerance);
    s.previewFps = positiveOr(obj["previewFps"], s.previewFps);
    s.defaultTextDuration = positiveOr(obj["defaultTextDuration"], s.defaultTextDuration);
    s.previewAudio = obj["previewAudio"].toBool(s.previewAudio);

    auto mix = obj["mix"].toObject();
    s.mixSampleRate = positiveIntOr(mix["sampleRate"], s.mixSampleRate);
    s.mixChannels = positiveIntOr(mix["channels"], s.mixChannels);

    auto exp = obj["export"].toObject();
    ExportSettings& e = s.exportDefaults;
    e.width = std::max(0, exp["width"].toInt(e.width));
    e.height = std::max(0, exp["height"].toInt(e.height));
    e.fps = positiveOr(exp["fps"], e.fps);
    e.videoBitrate = positiveIntOr(exp["videoBitrate"], e.videoBitrate);
    e.videoCodec = exp["videoCodec"].toString(e.videoCodec);
    e.audioBitrate = positiveIntOr(exp["audioBitrate"], e.audioBitrate);
    return s;
}
