#include "annotations/AnalysisSerializer.h"
#include "annotations/AnnotationStore.h"
#include "annotations/NodeAnnotation.h"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <vector>

namespace {

const QString kKeyPdfPath = QStringLiteral("pdf_path");
const QString kKeyNodes = QStringLiteral("nodes");
const QString kKeyName = QStringLiteral("name");
const QString kKeyColor = QStringLiteral("color");
const QString kKeyThickness = QStringLiteral("thickness");
const QString kKeyTransparency = QStringLiteral("transparency");
const QString kKeyHasArrow = QStringLiteral("has_arrow");
const QString kKeyFontSize = QStringLiteral("font_size");
const QString kKeyPoints = QStringLiteral("points");
const QString kKeyDeviations = QStringLiteral("deviations");
const QString kKeyPageNumber = QStringLiteral("page_number");

QJsonArray toJsonArray(const QStringList& values)
{
    QJsonArray array;
    for (const QString& value : values) {
        array.append(value);
    }
    return array;
}

QStringList toStringList(const QJsonValue& value)
{
    QStringList result;
    const QJsonArray array = value.toArray();
    for (const QJsonValue& entry : array) {
        result.append(entry.toString());
    }
    return result;
}

} // namespace

// ============================================================================
// Node / Note Mapping
// ============================================================================

QJsonObject AnalysisSerializer::noteToJson(const DeviationNote& note)
{
    QJsonObject json;
    json["deviation"] = note.deviation;
    json["causes"] = toJsonArray(note.causes);
    json["consequence"] = note.consequence;
    json["safeguards"] = toJsonArray(note.safeguards);
    json["recommendations"] = toJsonArray(note.recommendations);
    json["comments"] = note.comments;
    json["minimized"] = note.minimized;
    return json;
}

DeviationNote AnalysisSerializer::noteFromJson(const QJsonObject& json)
{
    DeviationNote note;
    note.deviation = json["deviation"].toString();
    note.causes = toStringList(json["causes"]);
    note.consequence = json["consequence"].toString();
    note.safeguards = toStringList(json["safeguards"]);
    note.recommendations = toStringList(json["recommendations"]);
    note.comments = json["comments"].toString();
    note.minimized = json["minimized"].toBool(false);
    return note;
}

QJsonObject AnalysisSerializer::nodeToJson(const NodeAnnotation& node)
{
    QJsonObject json;
    json[kKeyName] = node.name();
    json[kKeyColor] = node.color().name(QColor::HexRgb).toUpper();
    json[kKeyThickness] = node.width();
    json[kKeyTransparency] = node.opacity();
    json[kKeyHasArrow] = node.hasArrow();
    json[kKeyFontSize] = node.fontSize();

    QJsonArray points;
    for (const QPointF& p : node.points()) {
        points.append(QJsonArray{p.x(), p.y()});
    }
    json[kKeyPoints] = points;

    QJsonArray deviations;
    for (const DeviationNote& note : node.notes()) {
        deviations.append(noteToJson(note));
    }
    json[kKeyDeviations] = deviations;
    json[kKeyPageNumber] = node.page();
    return json;
}

std::unique_ptr<NodeAnnotation> AnalysisSerializer::nodeFromJson(const QJsonObject& json)
{
    const NodeStyle defaults;
    NodeStyle style;

    const QString colorName = json[kKeyColor].toString();
    if (!colorName.isEmpty()) {
        const QColor color(colorName);
        if (color.isValid()) {
            style.color = color;
        } else {
            qWarning() << "AnalysisSerializer: Invalid color" << colorName << "- using default";
        }
    }
    style.width = json[kKeyThickness].toDouble(defaults.width);
    style.opacity = json[kKeyTransparency].toDouble(defaults.opacity);
    style.hasArrow = json[kKeyHasArrow].toBool(defaults.hasArrow);
    style.fontSize = json[kKeyFontSize].toDouble(defaults.fontSize);

    QVector<QPointF> points;
    const QJsonArray pointArray = json[kKeyPoints].toArray();
    points.reserve(pointArray.size());
    for (const QJsonValue& value : pointArray) {
        const QJsonArray pair = value.toArray();
        if (pair.size() < 2 || !pair.at(0).isDouble() || !pair.at(1).isDouble()) {
            qWarning() << "AnalysisSerializer: Skipping malformed point" << value;
            continue;
        }
        points.append(QPointF(pair.at(0).toDouble(), pair.at(1).toDouble()));
    }

    auto node = std::make_unique<NodeAnnotation>(json[kKeyName].toString(), points,
                                                 json[kKeyPageNumber].toInt(0), style);

    QVector<DeviationNote> notes;
    const QJsonArray deviationArray = json[kKeyDeviations].toArray();
    notes.reserve(deviationArray.size());
    for (const QJsonValue& value : deviationArray) {
        notes.append(noteFromJson(value.toObject()));
    }
    node->setNotes(notes);
    return node;
}

// ============================================================================
// Documents
// ============================================================================

QByteArray AnalysisSerializer::toJsonData(const AnnotationStore& store, const QString& pdfPath)
{
    QJsonArray nodes;
    for (const NodeAnnotation* node : store.all()) {
        nodes.append(nodeToJson(*node));
    }

    QJsonObject root;
    root[kKeyPdfPath] = pdfPath;
    root[kKeyNodes] = nodes;
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

bool AnalysisSerializer::fromJsonData(const QByteArray& data, AnnotationStore& store,
                                      QString* pdfPath, Error* error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(error, QStringLiteral("parse"),
                 QStringLiteral("Invalid JSON at offset %1: %2")
                     .arg(parseError.offset)
                     .arg(parseError.errorString()));
        return false;
    }
    if (!doc.isObject()) {
        setError(error, QStringLiteral("format"), QStringLiteral("Root element is not an object"));
        return false;
    }

    const QJsonObject root = doc.object();
    const QJsonValue nodesValue = root[kKeyNodes];
    if (!nodesValue.isUndefined() && !nodesValue.isArray()) {
        setError(error, QStringLiteral("format"), QStringLiteral("\"nodes\" is not an array"));
        return false;
    }

    std::vector<std::unique_ptr<NodeAnnotation>> parsed;
    const QJsonArray nodeArray = nodesValue.toArray();
    parsed.reserve(nodeArray.size());
    for (const QJsonValue& value : nodeArray) {
        if (!value.isObject()) {
            setError(error, QStringLiteral("format"), QStringLiteral("Node entry is not an object"));
            return false;
        }
        parsed.push_back(nodeFromJson(value.toObject()));
    }

    store.clear();
    for (auto& node : parsed) {
        store.add(std::move(node));
    }
    if (pdfPath) {
        *pdfPath = root[kKeyPdfPath].toString();
    }

    qDebug() << "AnalysisSerializer: Loaded" << store.count() << "nodes," << store.noteCount() << "deviations";
    return true;
}

// ============================================================================
// Files
// ============================================================================

bool AnalysisSerializer::save(const AnnotationStore& store, const QString& pdfPath,
                              const QString& filePath, Error* error)
{
    QSaveFile saveFile(filePath);
    saveFile.setDirectWriteFallback(true);
    if (!saveFile.open(QIODevice::WriteOnly)) {
        const QString saveError = saveFile.errorString().trimmed();
        setError(error, QStringLiteral("open"),
                 saveError.isEmpty() ? QStringLiteral("Failed to open output file") : saveError);
        return false;
    }

    const QByteArray data = toJsonData(store, pdfPath);
    if (saveFile.write(data) != data.size()) {
        const QString writeError = saveFile.errorString().trimmed();
        saveFile.cancelWriting();
        setError(error, QStringLiteral("write"),
                 writeError.isEmpty() ? QStringLiteral("Failed to write analysis") : writeError);
        return false;
    }

    if (!saveFile.commit()) {
        const QString commitError = saveFile.errorString().trimmed();
        setError(error, QStringLiteral("commit"),
                 commitError.isEmpty() ? QStringLiteral("Failed to commit output file") : commitError);
        return false;
    }

    qDebug() << "AnalysisSerializer: Saved" << store.count() << "nodes to" << filePath;
    return true;
}

bool AnalysisSerializer::load(const QString& filePath, AnnotationStore& store,
                              QString* pdfPath, Error* error)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        const QString openError = file.errorString().trimmed();
        setError(error, QStringLiteral("open"),
                 openError.isEmpty() ? QStringLiteral("Failed to open analysis file") : openError);
        return false;
    }

    const QByteArray data = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        setError(error, QStringLiteral("read"), file.errorString());
        return false;
    }

    return fromJsonData(data, store, pdfPath, error);
}

void AnalysisSerializer::setError(Error* error, const QString& stage, const QString& message)
{
    if (!error) {
        qWarning() << "AnalysisSerializer:" << stage << "failed:" << message;
        return;
    }
    error->stage = stage;
    error->message = message;
}
