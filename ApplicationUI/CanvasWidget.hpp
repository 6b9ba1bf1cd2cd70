#ifndef CANVASWIDGET_HPP
#define CANVASWIDGET_HPP

#include <QImage>
#include <QPointF>
#include <QWidget>
#include <memory>

#include "ChangeCounter.hpp"
#include "CoreTypes.hpp"
#include "Light.hpp"

class MatcapEditor;
class SoftwareWorld;

/**
 * @brief Editing canvas.
 *
 * Shows the scene through the interactive camera and forwards pointer
 * input to MatcapEditor. Light handles are drawn on top once the editor
 * reports them visible; pressing a handle starts dragging its light.
 *
 * Right button drag orbits the camera, the wheel zooms.
 */
class CanvasWidget final : public QWidget
{
    Q_OBJECT

public:
    CanvasWidget(MatcapEditor* editor, SoftwareWorld* world, QWidget* parent = nullptr);
    ~CanvasWidget() override = default;

    /// Re-renders when the scene or camera changed. Called from the UI tick.
    void idleEvent();

    /// Fixes the widget to exportSize / displayRatio logical pixels.
    void updateCanvasSize();

    QSize sizeHint() const override;

protected:
    void paintEvent(QPaintEvent* event) override;
    void enterEvent(QEnterEvent* event) override;
    void leaveEvent(QEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;

private:
    MatcapEditor*  m_editor = nullptr;
    SoftwareWorld* m_world  = nullptr;

    std::unique_ptr<ChangeMonitor> m_sceneMonitor;
    std::unique_ptr<ChangeMonitor> m_cameraMonitor;

    QImage  m_frame;
    QPointF m_lastPos;
    bool    m_orbiting = false;

    CoreEvent createCoreEvent(const QMouseEvent* e) const noexcept;

    /// Light whose handle lies under `pos` (logical pixels), or kInvalidLightId.
    LightId handleAt(const QPointF& pos) const;

    void renderFrame();
};

#endif // CANVASWIDGET_HPP
