#include "TextLayerConfig.h"
#include "Logging.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonArray>
#include <algorithm>

TextLayerConfig::TextLayerConfig(QObject* parent) : QObject(parent) {}
TextLayerConfig::~TextLayerConfig() = default;

bool TextLayerConfig::save(const QString& filePath, const std::vector<TextDescriptor>& texts) {
    QJsonArray arr;
    for (const auto& t : texts) {
        arr.append(textToJson(t));
    }

    QJsonObject root;
    root["version"] = 1;
    root["texts"] = arr;

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QString("Cannot write to: %1").arg(filePath);
        return false;
    }

    file.write(QJsonDocument(root).toJson());
    return true;
}

bool TextLayerConfig::load(const QString& filePath, std::vector<TextDescriptor>& texts) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(filePath);
        return false;
    }
    return parse(file.readAll(), texts);
}

bool TextLayerConfig::parse(const QByteArray& json, std::vector<TextDescriptor>& texts) {
    QJsonParseError parseError;
    auto doc = QJsonDocument::fromJson(json, &parseError);
    if (doc.isNull()) {
        m_error = QString("Invalid text layer JSON: %1").arg(parseError.errorString());
        return false;
    }

    QJsonArray arr;
    if (doc.isArray()) {
        arr = doc.array();
    } else if (doc.object().contains("texts")) {
        arr = doc.object()["texts"].toArray();
    } else {
        m_error = "Text layer file has no \"texts\" array";
        return false;
    }

    texts.clear();
    for (const auto& val : arr) {
        if (!val.isObject()) {
            qCWarning(lcTimeline) << "Skipping text descriptor that is not an object";
            continue;
        }
        texts.push_back(textFromJson(val.toObject()));
    }
    return true;
}

QString TextLayerConfig::styleName(TextStyle style) {
    switch (style) {
    case TextStyle::Outline: return "outline";
    case TextStyle::SolidBox: return "solid";
    case TextStyle::RoundedBox: return "rounded";
    case TextStyle::TranslucentBox: return "semi";
    }
    return "outline";
}

TextStyle TextLayerConfig::styleFromName(const QString& name) {
    const QString n = name.trimmed().toLower();
    if (n == "solid") return TextStyle::SolidBox;
    if (n == "rounded") return TextStyle::RoundedBox;
    if (n == "semi") return TextStyle::TranslucentBox;
    return TextStyle::Outline;
}

QJsonObject TextLayerConfig::textToJson(const TextDescriptor& desc) {
    const TextPayload& t = desc.text;
    QJsonObject obj;
    obj["content"] = t.content;
    obj["x"] = t.anchor.x();
    obj["y"] = t.anchor.y();
    obj["size"] = t.size;
    obj["color"] = t.color.name(QColor::HexArgb);
    obj["font"] = t.font;
    obj["bold"] = t.bold;
    obj["italic"] = t.italic;
    if (t.background.isValid()) obj["bgColor"] = t.background.name(QColor::HexArgb);
    obj["style"] = styleName(t.style);
    obj["startTime"] = desc.start;
    if (desc.end >= 0.0) obj["endTime"] = desc.end;
    return obj;
}

TextDescriptor TextLayerConfig::textFromJson(const QJsonObject& obj) {
    TextDescriptor desc;
    TextPayload& t = desc.text;
    t.content = obj["content"].toString();
    t.anchor = QPointF(obj["x"].toDouble(540.0), obj["y"].toDouble(960.0));
    t.size = obj["size"].toDouble(48.0);
    if (t.size <= 0.0) t.size = 48.0;

    QColor color(obj["color"].toString("white"));
    t.color = color.isValid() ? color : QColor(Qt::white);
    t.font = obj["font"].toString("Arial");
    t.bold = obj["bold"].toBool(false);
    t.italic = obj["italic"].toBool(false);
    if (obj.contains("bgColor")) t.background = QColor(obj["bgColor"].toString());
    t.style = styleFromName(obj["style"].toString("outline"));

    desc.start = obj["startTime"].isDouble() ? std::max(0.0, obj["startTime"].toDouble()) : 0.0;
    desc.end = obj["endTime"].isDouble() ? obj["endTime"].toDouble() : -1.0;
    return desc;
}
