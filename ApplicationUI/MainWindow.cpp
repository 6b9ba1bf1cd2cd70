#include "MainWindow.hpp"

#include <QCloseEvent>
#include <QDockWidget>
#include <QHBoxLayout>
#include <QStatusBar>
#include <QTimer>

#include "CanvasWidget.hpp"
#include "MatcapEditor.hpp"
#include "PngEncoder.hpp"
#include "Scene.hpp"
#include "SoftwareWorld.hpp"
#include "SubWindows/LightsPanel.hpp"

MainWindow::MainWindow(const EditorConfig& cfg, const std::filesystem::path& configPath, QWidget* parent) :
    QMainWindow(parent)
{
    resize(900, 640);
    setWindowTitle("MatcapLab");

    // ------------------------------------------------------------
    // Editor stack
    // ------------------------------------------------------------
    m_encoder = std::make_unique<PngEncoder>();
    m_world   = std::make_unique<SoftwareWorld>(std::make_unique<Scene>(), cfg.sizes.exportSize, cfg.sizes.exportSize);
    m_editor  = std::make_unique<MatcapEditor>(*m_world, *m_encoder, cfg, this);
    m_editor->setConfigPath(configPath);

    // ------------------------------------------------------------
    // Central widget: canvas
    // ------------------------------------------------------------
    auto* central = new QWidget(this);
    auto* lay     = new QHBoxLayout(central);
    lay->setContentsMargins(12, 12, 12, 12);

    m_canvas = new CanvasWidget(m_editor.get(), m_world.get(), central);
    lay->addWidget(m_canvas, 0, Qt::AlignCenter);
    setCentralWidget(central);

    m_canvasExportSize = m_editor->config().sizes.exportSize;
    m_canvasRatio      = m_editor->config().displayRatio;

    // ------------------------------------------------------------
    // Side panel
    // ------------------------------------------------------------
    auto* dock = new QDockWidget(tr("Matcap"), this);
    dock->setFeatures(QDockWidget::DockWidgetMovable);
    m_panel = new LightsPanel(dock);
    dock->setWidget(m_panel);
    addDockWidget(Qt::RightDockWidgetArea, dock);

    statusBar()->showMessage(tr("Click the sphere to place a light. Right drag orbits, wheel zooms."));

    // ------------------------------------------------------------
    // UI tick: deliver snapshots, sync panel, redraw canvas
    // ------------------------------------------------------------
    m_uiTimer = new QTimer(this);
    m_uiTimer->setInterval(16);
    connect(m_uiTimer, &QTimer::timeout, this, &MainWindow::onUiTick);
    m_uiTimer->start();

    m_editor->requestSnapshot();
}

MainWindow::~MainWindow() noexcept
{
    if (m_uiTimer)
        m_uiTimer->stop();

    // Editor first (it references world and encoder); the encoder joins its worker last.
    m_editor.reset();
    m_world.reset();
    m_encoder.reset();
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    if (m_uiTimer)
        m_uiTimer->stop();

    QMainWindow::closeEvent(event);
}

void MainWindow::onUiTick()
{
    if (!m_editor)
        return;

    m_editor->poll();

    syncCanvasSize();

    if (m_panel)
        m_panel->idleEvent(m_editor.get());

    if (m_canvas)
        m_canvas->idleEvent();
}

void MainWindow::syncCanvasSize()
{
    const EditorConfig& cfg = m_editor->config();
    if (cfg.sizes.exportSize == m_canvasExportSize && cfg.displayRatio == m_canvasRatio)
        return;

    m_canvasExportSize = cfg.sizes.exportSize;
    m_canvasRatio      = cfg.displayRatio;

    m_world->setLogicalSize(cfg.sizes.exportSize, cfg.sizes.exportSize);
    m_editor->refreshScreenPositions();
    m_canvas->updateCanvasSize();
    m_editor->requestSnapshot();
}

// ------------------------------------------------------------
// EditorObserver
// ------------------------------------------------------------

void MainWindow::contentReady()
{
    statusBar()->showMessage(tr("Ready"), 2000);
}

void MainWindow::lightAdded(const LightRecord& /*record*/)
{
    if (m_panel)
        m_panel->markLightsDirty();
}

void MainWindow::lightUpdated(const LightRecord& /*record*/)
{
    if (m_panel)
        m_panel->markLightsDirty();
    if (m_canvas)
        m_canvas->update();
}

void MainWindow::lightRemoved(LightId /*id*/)
{
    if (m_panel)
        m_panel->markLightsDirty();
    if (m_canvas)
        m_canvas->update();
}

void MainWindow::previewUpdated(std::shared_ptr<const EncodedImage> image)
{
    if (m_panel && image)
        m_panel->setPreview(*image);
}

void MainWindow::imageExported(const std::filesystem::path& path, bool ok)
{
    const QString file = QString::fromStdString(path.string());
    if (ok)
        statusBar()->showMessage(tr("Exported %1").arg(file), 4000);
    else
        statusBar()->showMessage(tr("Export to %1 failed").arg(file), 6000);
}
