#ifndef MAINWINDOW_HPP
#define MAINWINDOW_HPP

#include <QMainWindow>
#include <filesystem>
#include <memory>

#include "EditorObserver.hpp"

class CanvasWidget;
class LightsPanel;
class MatcapEditor;
class PngEncoder;
class QTimer;
class SoftwareWorld;
struct EditorConfig;

/**
 * @brief Top-level window: canvas in the center, settings panel docked right.
 *
 * Owns the editor stack (encoder, world, editor) and drives it from a UI
 * timer. Editor notifications arrive through the EditorObserver interface.
 */
class MainWindow : public QMainWindow, public EditorObserver
{
    Q_OBJECT

public:
    /**
     * @param cfg        Initial configuration.
     * @param configPath File the config is persisted to on pointer release (may be empty).
     */
    MainWindow(const EditorConfig& cfg, const std::filesystem::path& configPath, QWidget* parent = nullptr);
    ~MainWindow() noexcept override;

    // EditorObserver
    void contentReady() override;
    void lightAdded(const LightRecord& record) override;
    void lightUpdated(const LightRecord& record) override;
    void lightRemoved(LightId id) override;
    void previewUpdated(std::shared_ptr<const EncodedImage> image) override;
    void imageExported(const std::filesystem::path& path, bool ok) override;

protected:
    void closeEvent(QCloseEvent* event) override;

private:
    std::unique_ptr<PngEncoder>    m_encoder;
    std::unique_ptr<SoftwareWorld> m_world;
    std::unique_ptr<MatcapEditor>  m_editor;

    CanvasWidget* m_canvas = nullptr;
    LightsPanel*  m_panel  = nullptr;

    QTimer* m_uiTimer = nullptr;
    void    onUiTick();

    int32_t m_canvasExportSize = 0;
    float   m_canvasRatio      = 0.0f;

    void syncCanvasSize();
};

#endif // MAINWINDOW_HPP
