#include "MainWindow.h"
#include "PageCanvas.h"
#include "annotations/AnalysisSerializer.h"
#include "annotations/AnnotationStore.h"
#include "export/CompositeExporter.h"
#include "pdf/PopplerPageRasterizer.h"
#include "settings/AnnotationSettingsManager.h"
#include "settings/ViewSettingsManager.h"
#include "ui/NodePropertiesDialog.h"

#include <QAction>
#include <QCloseEvent>
#include <QDebug>
#include <QFileDialog>
#include <QFileInfo>
#include <QInputDialog>
#include <QLabel>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QStatusBar>

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , m_store(new AnnotationStore(this))
    , m_canvas(nullptr)
    , m_statusLabel(new QLabel(this))
{
    m_canvas = new PageCanvas(m_store, this);
    setCentralWidget(m_canvas);
    statusBar()->addWidget(m_statusLabel, 1);

    const auto &viewSettings = ViewSettingsManager::instance();
    m_canvas->setBaseMagnification(viewSettings.loadBaseMagnification());
    m_canvas->setKeyboardZoomStep(viewSettings.loadKeyboardZoomStep());
    m_canvas->setWheelZoomStep(viewSettings.loadWheelZoomStep());
    m_canvas->session()->setDefaultStyle(AnnotationSettingsManager::instance().loadDefaultStyle());

    connect(m_canvas, &PageCanvas::annotationContextMenuRequested, this, &MainWindow::onContextMenu);
    connect(m_canvas, &PageCanvas::currentPageChanged, this, &MainWindow::updateStatus);
    connect(m_canvas, &PageCanvas::zoomChanged, this, &MainWindow::updateStatus);
    connect(m_canvas->session(), &EditSession::stateChanged, this, &MainWindow::updateStatus);
    connect(m_canvas->session(), &EditSession::annotationSelected, this, &MainWindow::onAnnotationSelected);
    connect(m_canvas->session(), &EditSession::annotationDeselected, this, [this]() {
        statusBar()->showMessage(tr("Node deselected"), 3000);
    });
    connect(m_canvas->session(), &EditSession::lineCreationEnded, this, [this]() {
        statusBar()->showMessage(tr("Line creation finished"), 3000);
    });
    connect(m_store, &AnnotationStore::annotationAdded, this, &MainWindow::markDirty);
    connect(m_store, &AnnotationStore::annotationRemoved, this, &MainWindow::markDirty);
    connect(m_store, &AnnotationStore::annotationChanged, this, &MainWindow::markDirty);

    setupMenus();
    setWindowTitle(tr("NodeMark"));
    resize(1200, 900);
    updateStatus();
}

MainWindow::~MainWindow() = default;

void MainWindow::setupMenus()
{
    auto addItem = [this](QMenu *menu, const QString &text, const QKeySequence &shortcut) {
        QAction *action = menu->addAction(text);
        action->setShortcut(shortcut);
        return action;
    };

    QMenu *fileMenu = menuBar()->addMenu(tr("&File"));
    connect(addItem(fileMenu, tr("Open PDF..."), QKeySequence::Open),
            &QAction::triggered, this, &MainWindow::onOpenDocument);
    connect(addItem(fileMenu, tr("Open Analysis..."), QKeySequence()),
            &QAction::triggered, this, &MainWindow::onOpenAnalysis);
    fileMenu->addSeparator();
    connect(addItem(fileMenu, tr("Save Analysis"), QKeySequence::Save),
            &QAction::triggered, this, &MainWindow::onSave);
    connect(addItem(fileMenu, tr("Save Analysis As..."), QKeySequence(QStringLiteral("Ctrl+Shift+S"))),
            &QAction::triggered, this, &MainWindow::onSaveAs);
    fileMenu->addSeparator();
    connect(addItem(fileMenu, tr("Export Page Image..."), QKeySequence()),
            &QAction::triggered, this, &MainWindow::onExportPage);
    connect(addItem(fileMenu, tr("Export PDF..."), QKeySequence()),
            &QAction::triggered, this, &MainWindow::onExportPdf);
    fileMenu->addSeparator();
    connect(addItem(fileMenu, tr("Quit"), QKeySequence::Quit),
            &QAction::triggered, this, &QWidget::close);

    // Canvas handles its own keys; the menu only shows them
    QMenu *editMenu = menuBar()->addMenu(tr("&Edit"));
    connect(editMenu->addAction(tr("Create Line\tCtrl+L")),
            &QAction::triggered, m_canvas, &PageCanvas::startLineCreation);
    connect(editMenu->addAction(tr("Edit Properties...")), &QAction::triggered, this, [this]() {
        const int id = m_canvas->session()->selectedId();
        if (id == NodeAnnotation::kInvalidId) {
            QMessageBox::information(this, tr("Edit Properties"), tr("Select a line first."));
            return;
        }
        editNodeProperties(id);
    });
    connect(editMenu->addAction(tr("Delete Selected\tDel")), &QAction::triggered, this, [this]() {
        m_canvas->session()->deleteSelected();
    });

    QMenu *viewMenu = menuBar()->addMenu(tr("&View"));
    connect(viewMenu->addAction(tr("Zoom In\tCtrl+=")), &QAction::triggered, m_canvas, &PageCanvas::zoomIn);
    connect(viewMenu->addAction(tr("Zoom Out\tCtrl+-")), &QAction::triggered, m_canvas, &PageCanvas::zoomOut);
    connect(viewMenu->addAction(tr("Fit to Window\tCtrl+0")), &QAction::triggered, m_canvas, &PageCanvas::resetZoom);
    connect(viewMenu->addAction(tr("Render Magnification...")), &QAction::triggered,
            this, &MainWindow::onChangeMagnification);
    viewMenu->addSeparator();
    connect(viewMenu->addAction(tr("Next Page\tPgDown")), &QAction::triggered, m_canvas, &PageCanvas::nextPage);
    connect(viewMenu->addAction(tr("Previous Page\tPgUp")), &QAction::triggered, m_canvas, &PageCanvas::previousPage);
}

// ============================================================================
// Files
// ============================================================================

bool MainWindow::openDocument(const QString &pdfPath)
{
    auto rasterizer = std::make_unique<PopplerPageRasterizer>(pdfPath);
    if (!rasterizer->isValid()) {
        const QString reason = rasterizer->isLocked() ? tr("The document is password protected.")
                                                      : tr("The document could not be opened.");
        QMessageBox::warning(this, tr("Open PDF"), QStringLiteral("%1\n%2").arg(pdfPath, reason));
        return false;
    }

    m_canvas->setRasterizer(std::move(rasterizer));
    m_pdfPath = pdfPath;
    setWindowTitle(tr("NodeMark - %1").arg(QFileInfo(pdfPath).fileName()));
    updateStatus();
    return true;
}

bool MainWindow::openAnalysis(const QString &analysisPath)
{
    QString pdfPath;
    AnalysisSerializer::Error error;
    if (!AnalysisSerializer::load(analysisPath, *m_store, &pdfPath, &error)) {
        qWarning() << "MainWindow: Failed to load analysis:" << error.stage << error.message;
        QMessageBox::warning(this, tr("Open Analysis"),
                             tr("Failed to load %1\n%2").arg(analysisPath, error.message));
        return false;
    }

    m_analysisPath = analysisPath;
    m_dirty = false;
    if (!pdfPath.isEmpty() && pdfPath != m_pdfPath) {
        if (QFileInfo::exists(pdfPath)) {
            openDocument(pdfPath);
        } else {
            locateMissingDocument(pdfPath);
        }
    }
    updateStatus();
    statusBar()->showMessage(tr("Loaded analysis from %1").arg(QFileInfo(analysisPath).fileName()), 3000);
    return true;
}

void MainWindow::locateMissingDocument(const QString &missingPath)
{
    qWarning() << "MainWindow: Analysis refers to missing PDF" << missingPath;
    const auto answer = QMessageBox::question(
        this, tr("PDF Not Found"),
        tr("PDF file not found at:\n%1\n\nWould you like to locate it?").arg(missingPath));
    if (answer != QMessageBox::Yes) {
        return;
    }

    const QString located = QFileDialog::getOpenFileName(this, tr("Locate PDF File"),
                                                         QFileInfo(missingPath).absolutePath(),
                                                         tr("PDF files (*.pdf);;All files (*)"));
    // The analysis now points at the relocated document
    if (!located.isEmpty() && openDocument(located)) {
        m_dirty = true;
    }
}

bool MainWindow::saveAnalysis(const QString &analysisPath)
{
    AnalysisSerializer::Error error;
    if (!AnalysisSerializer::save(*m_store, m_pdfPath, analysisPath, &error)) {
        qWarning() << "MainWindow: Failed to save analysis:" << error.stage << error.message;
        QMessageBox::warning(this, tr("Save Analysis"),
                             tr("Failed to save %1\n%2").arg(analysisPath, error.message));
        return false;
    }

    m_analysisPath = analysisPath;
    m_dirty = false;
    statusBar()->showMessage(tr("Saved %1 nodes, %2 deviations to %3")
                                 .arg(m_store->count())
                                 .arg(m_store->noteCount())
                                 .arg(QFileInfo(analysisPath).fileName()),
                             3000);
    return true;
}

void MainWindow::onOpenDocument()
{
    const QString path = QFileDialog::getOpenFileName(this, tr("Open PDF"), QString(),
                                                      tr("PDF files (*.pdf)"));
    if (!path.isEmpty()) {
        openDocument(path);
    }
}

void MainWindow::onOpenAnalysis()
{
    if (!confirmDiscard()) {
        return;
    }
    const QString path = QFileDialog::getOpenFileName(this, tr("Open Analysis"), QString(),
                                                      tr("JSON files (*.json);;All files (*)"));
    if (!path.isEmpty()) {
        openAnalysis(path);
    }
}

void MainWindow::onSave()
{
    if (m_analysisPath.isEmpty()) {
        onSaveAs();
        return;
    }
    saveAnalysis(m_analysisPath);
}

void MainWindow::onSaveAs()
{
    QString path = QFileDialog::getSaveFileName(this, tr("Save Analysis"), m_analysisPath,
                                                tr("JSON files (*.json)"));
    if (path.isEmpty()) {
        return;
    }
    if (QFileInfo(path).suffix().isEmpty()) {
        path += QStringLiteral(".json");
    }
    saveAnalysis(path);
}

void MainWindow::onExportPage()
{
    if (!m_canvas->rasterizer()) {
        return;
    }
    const QString path = QFileDialog::getSaveFileName(this, tr("Export Page Image"), QString(),
                                                      tr("PNG images (*.png);;JPEG images (*.jpg)"));
    if (path.isEmpty()) {
        return;
    }

    CompositeExporter exporter(*m_canvas->rasterizer(), *m_store);
    exporter.setMagnification(m_canvas->view().renderScale());
    CompositeExporter::Error error;
    if (!exporter.exportPageImage(m_canvas->currentPage(), path, QByteArray(), &error)) {
        QMessageBox::warning(this, tr("Export"), tr("Export failed (%1): %2").arg(error.stage, error.message));
        return;
    }
    statusBar()->showMessage(tr("Exported page %1 to %2").arg(m_canvas->currentPage() + 1).arg(path), 3000);
}

void MainWindow::onExportPdf()
{
    if (!m_canvas->rasterizer()) {
        return;
    }
    const QString path = QFileDialog::getSaveFileName(this, tr("Export PDF"), QString(),
                                                      tr("PDF files (*.pdf)"));
    if (path.isEmpty()) {
        return;
    }

    CompositeExporter exporter(*m_canvas->rasterizer(), *m_store);
    exporter.setMagnification(m_canvas->view().renderScale());
    CompositeExporter::Error error;
    if (!exporter.exportPdf(path, &error)) {
        QMessageBox::warning(this, tr("Export"), tr("Export failed (%1): %2").arg(error.stage, error.message));
        return;
    }
    statusBar()->showMessage(tr("Exported %1 pages to %2").arg(m_canvas->pageCount()).arg(path), 3000);
}

// ============================================================================
// Node Context Menu
// ============================================================================

void MainWindow::onContextMenu(int id, const QPoint &globalPos)
{
    NodeAnnotation *node = m_store->find(id);
    if (!node) {
        return;
    }

    QMenu menu(this);
    QAction *propertiesAction = menu.addAction(tr("Edit Properties..."));
    QAction *arrowAction = menu.addAction(tr("Show Arrowhead"));
    arrowAction->setCheckable(true);
    arrowAction->setChecked(node->hasArrow());
    QAction *addNoteAction = menu.addAction(tr("Add Deviation"));
    QAction *clearNotesAction = menu.addAction(tr("Clear Deviations (%1)").arg(node->noteCount()));
    clearNotesAction->setEnabled(node->noteCount() > 0);
    menu.addSeparator();
    QAction *deleteAction = menu.addAction(tr("Delete Line"));

    QAction *chosen = menu.exec(globalPos);
    // The node may have been removed while the menu was open
    node = m_store->find(id);
    if (!chosen || !node) {
        return;
    }

    if (chosen == propertiesAction) {
        editNodeProperties(id);
    } else if (chosen == arrowAction) {
        node->setHasArrow(arrowAction->isChecked());
        m_store->notifyChanged(id);
    } else if (chosen == addNoteAction) {
        DeviationNote note;
        note.deviation = tr("Deviation %1").arg(node->noteCount() + 1);
        node->addNote(note);
        m_store->notifyChanged(id);
    } else if (chosen == clearNotesAction) {
        node->setNotes({});
        m_store->notifyChanged(id);
    } else if (chosen == deleteAction) {
        m_store->remove(id);
    }
}

void MainWindow::editNodeProperties(int id)
{
    NodeAnnotation *node = m_store->find(id);
    if (!node) {
        return;
    }

    NodePropertiesDialog dialog(*node, this);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }
    node = m_store->find(id);
    if (!node) {
        return;
    }

    dialog.applyTo(*node);
    m_store->notifyChanged(id);

    if (dialog.saveAsDefault()) {
        const NodeStyle style = dialog.style();
        AnnotationSettingsManager::instance().saveDefaultStyle(style);
        m_canvas->session()->setDefaultStyle(style);
    }
    statusBar()->showMessage(tr("Updated %1").arg(node->name()), 3000);
}

void MainWindow::onAnnotationSelected(int id)
{
    const NodeAnnotation *node = m_store->find(id);
    if (node) {
        statusBar()->showMessage(tr("Node selected: %1").arg(node->name()), 3000);
    }
}

void MainWindow::onChangeMagnification()
{
    bool ok = false;
    const qreal current = m_canvas->view().renderScale();
    const qreal magnification = QInputDialog::getDouble(
        this, tr("Render Magnification"), tr("Pixels per PDF point at 100% zoom:"), current,
        ViewSettingsManager::kMinBaseMagnification, ViewSettingsManager::kMaxBaseMagnification,
        2, &ok);
    if (!ok) {
        return;
    }

    ViewSettingsManager::instance().saveBaseMagnification(magnification);
    m_canvas->setBaseMagnification(magnification);
    updateStatus();
}

// ============================================================================
// Status / Close
// ============================================================================

void MainWindow::updateStatus()
{
    if (!m_canvas->hasDocument()) {
        m_statusLabel->setText(tr("Open a PDF to begin"));
        return;
    }

    QString text = tr("Page %1 of %2 | Zoom %3%")
                       .arg(m_canvas->currentPage() + 1)
                       .arg(m_canvas->pageCount())
                       .arg(qRound(m_canvas->view().zoomLevel() * m_canvas->view().fitScale() * 100));
    if (m_canvas->session()->isCreating()) {
        text += tr(" | Click to add points, right-click or Esc to finish");
    } else if (m_canvas->session()->isPointEditing()) {
        text += tr(" | Drag points, right-click to add or remove, Esc to finish");
    }
    m_statusLabel->setText(text);
}

void MainWindow::markDirty()
{
    m_dirty = true;
}

bool MainWindow::confirmDiscard()
{
    if (!m_dirty) {
        return true;
    }
    const auto answer = QMessageBox::question(this, tr("Unsaved Changes"),
                                              tr("Discard unsaved changes to the analysis?"));
    return answer == QMessageBox::Yes;
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (!confirmDiscard()) {
        event->ignore();
        return;
    }
    event->accept();
}
