#pragma once

#include <QObject>
#include <QString>
#include <QJsonObject>
#include <vector>
#include "Clip.h"

// A text layer as handed over by the text-authoring tool, before it has
// been placed on the timeline
struct TextDescriptor {
    TextPayload text;
    double start = 0.0;
    double end = -1.0;   // negative: not given
};

// Reads and writes text descriptors as JSON. The file is either a bare array
// of descriptors or {"version": 1, "texts": [...]}.
class TextLayerConfig : public QObject {
    Q_OBJECT
public:
    explicit TextLayerConfig(QObject* parent = nullptr);
    ~TextLayerConfig();

    bool save(const QString& filePath, const std::vector<TextDescriptor>& texts);
    bool load(const QString& filePath, std::vector<TextDescriptor>& texts);
    bool parse(const QByteArray& json, std::vector<TextDescriptor>& texts);

    static QJsonObject textToJson(const TextDescriptor& desc);
    static TextDescriptor textFromJson(const QJsonObject& obj);

    static QString styleName(TextStyle style);
    static TextStyle styleFromName(const QString& name);

    QString errorString() const { return m_error; }

private:
    QString m_error;
};
