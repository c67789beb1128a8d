#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFileInfo>

#include "MainWindow.h"
#include "annotations/AnalysisSerializer.h"
#include "annotations/AnnotationStore.h"
#include "export/CompositeExporter.h"
#include "pdf/PopplerPageRasterizer.h"
#include "settings/Settings.h"
#include "settings/ViewSettingsManager.h"

namespace {

// Headless export: writes the composite and exits
int runExport(const QString &pdfPath, const QString &analysisPath,
              const QString &outputPath, int page)
{
    PopplerPageRasterizer rasterizer(pdfPath);
    if (!rasterizer.isValid()) {
        qWarning().noquote() << "Cannot open document:" << pdfPath;
        return 2;
    }

    AnnotationStore store;
    if (!analysisPath.isEmpty()) {
        AnalysisSerializer::Error error;
        if (!AnalysisSerializer::load(analysisPath, store, nullptr, &error)) {
            qWarning().noquote() << "Cannot load analysis:" << error.message;
            return 2;
        }
    }

    CompositeExporter exporter(rasterizer, store);
    exporter.setMagnification(ViewSettingsManager::instance().loadBaseMagnification());

    CompositeExporter::Error error;
    const bool ok = QFileInfo(outputPath).suffix().compare(QStringLiteral("pdf"), Qt::CaseInsensitive) == 0
        ? exporter.exportPdf(outputPath, &error)
        : exporter.exportPageImage(page, outputPath, QByteArray(), &error);
    if (!ok) {
        qWarning().noquote() << "Export failed (" + error.stage + "):" << error.message;
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName(NodeMark::kApplicationName);
    app.setOrganizationName(NodeMark::kOrganizationName);
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Annotate document pages with labeled node lines");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("pdf", "PDF document to open", "[pdf]");
    parser.addOption({{"a", "analysis"}, "Analysis JSON file to load", "path"});
    parser.addOption({{"e", "export"}, "Export the annotated document and exit (.pdf or image)", "path"});
    parser.addOption({{"p", "page"}, "1-based page for image export", "number", "1"});
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    const QString pdfPath = positional.value(0);
    const QString analysisPath = parser.value("analysis");

    if (parser.isSet("export")) {
        if (pdfPath.isEmpty()) {
            qWarning().noquote() << "--export requires a PDF document";
            return 2;
        }
        bool ok = false;
        const int page = parser.value("page").toInt(&ok);
        if (!ok || page < 1) {
            qWarning().noquote() << "Invalid page number:" << parser.value("page");
            return 2;
        }
        return runExport(pdfPath, analysisPath, parser.value("export"), page - 1);
    }

    MainWindow window;
    if (!pdfPath.isEmpty()) {
        window.openDocument(pdfPath);
    }
    if (!analysisPath.isEmpty()) {
        window.openAnalysis(analysisPath);
    }
    window.show();

    return app.exec();
}
