#ifndef ANALYSISSERIALIZER_H
#define ANALYSISSERIALIZER_H

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <memory>

#include "annotations/DeviationNote.h"

class AnnotationStore;
class NodeAnnotation;

/**
 * @brief Reads and writes an analysis (document path plus every node) as JSON.
 *
 * Layout:
 *   { "pdf_path": "...",
 *     "nodes": [ { "name", "color", "thickness", "transparency", "has_arrow",
 *                  "font_size", "points": [[x, y], ...], "deviations": [...],
 *                  "page_number" } ] }
 *
 * Missing node keys take the NodeStyle defaults. Loading is all-or-nothing:
 * the store is only replaced once the whole document has parsed.
 */
class AnalysisSerializer
{
public:
    struct Error {
        QString message;
        QString stage; // open / read / parse / format / write / commit
    };

    static QByteArray toJsonData(const AnnotationStore& store, const QString& pdfPath);
    static bool fromJsonData(const QByteArray& data, AnnotationStore& store,
                             QString* pdfPath = nullptr, Error* error = nullptr);

    static bool save(const AnnotationStore& store, const QString& pdfPath,
                     const QString& filePath, Error* error = nullptr);
    static bool load(const QString& filePath, AnnotationStore& store,
                     QString* pdfPath = nullptr, Error* error = nullptr);

    static QJsonObject nodeToJson(const NodeAnnotation& node);
    static std::unique_ptr<NodeAnnotation> nodeFromJson(const QJsonObject& json);
    static QJsonObject noteToJson(const DeviationNote& note);
    static DeviationNote noteFromJson(const QJsonObject& json);

private:
    static void setError(Error* error, const QString& stage, const QString& message);
};

#endif // ANALYSISSERIALIZER_H
