#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QString>

class AnnotationStore;
class PageCanvas;
class QLabel;

/**
 * @brief Top-level window: document/analysis files, export and the node
 * context menu around a PageCanvas.
 */
class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

    bool openDocument(const QString &pdfPath);
    bool openAnalysis(const QString &analysisPath);
    bool saveAnalysis(const QString &analysisPath);

    PageCanvas *canvas() const { return m_canvas; }
    AnnotationStore *store() const { return m_store; }

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onOpenDocument();
    void onOpenAnalysis();
    void onSave();
    void onSaveAs();
    void onExportPage();
    void onExportPdf();
    void onContextMenu(int id, const QPoint &globalPos);
    void onAnnotationSelected(int id);
    void onChangeMagnification();
    void updateStatus();

private:
    void setupMenus();
    void editNodeProperties(int id);
    void locateMissingDocument(const QString &missingPath);
    void markDirty();
    bool confirmDiscard();

    AnnotationStore *m_store;
    PageCanvas *m_canvas;
    QLabel *m_statusLabel;
    QString m_pdfPath;
    QString m_analysisPath;
    bool m_dirty = false;
};

#endif // MAINWINDOW_H
