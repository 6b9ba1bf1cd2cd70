//============================================================
// CanvasWidget.cpp
//============================================================
#include "CanvasWidget.hpp"

#include <QMouseEvent>
#include <QPainter>
#include <QWheelEvent>
#include <cmath>

#include "Image.hpp"
#include "MatcapEditor.hpp"
#include "Scene.hpp"
#include "SoftwareWorld.hpp"

namespace
{
    constexpr qreal kHandleRadius = 7.0;

    QImage toQImage(const Image& img)
    {
        if (!img.valid() || img.channels() != 4)
            return {};

        // QImage does not own the buffer; copy before the target is reused.
        return QImage(img.data(), img.width(), img.height(), img.stride(), QImage::Format_RGBA8888).copy();
    }

} // namespace

CanvasWidget::CanvasWidget(MatcapEditor* editor, SoftwareWorld* world, QWidget* parent) :
    QWidget(parent),
    m_editor{editor},
    m_world{world}
{
    Q_ASSERT(m_editor);
    Q_ASSERT(m_world);

    setMouseTracking(true);
    setAttribute(Qt::WA_OpaquePaintEvent, true);
    setCursor(Qt::CrossCursor);

    m_sceneMonitor  = std::make_unique<ChangeMonitor>(m_world->scene().changeCounter());
    m_cameraMonitor = std::make_unique<ChangeMonitor>(m_world->camera().changeCounter());

    updateCanvasSize();
}

QSize CanvasWidget::sizeHint() const
{
    const EditorConfig& cfg  = m_editor->config();
    const int           side = static_cast<int>(std::lround(cfg.sizes.exportSize / cfg.displayRatio));
    return QSize(side, side);
}

void CanvasWidget::updateCanvasSize()
{
    setFixedSize(sizeHint());
}

void CanvasWidget::idleEvent()
{
    // Both monitors must be polled so neither keeps a stale stamp.
    const bool sceneChanged  = m_sceneMonitor->changed();
    const bool cameraChanged = m_cameraMonitor->changed();

    if (sceneChanged || cameraChanged)
    {
        renderFrame();
        update();
    }
}

void CanvasWidget::renderFrame()
{
    // Snapshots may have left the world at the export ratio.
    const float ratio = m_world->pixelRatio();
    m_world->setPixelRatio(1.0f);
    m_world->render(m_world->camera());
    m_world->setPixelRatio(ratio);

    m_frame = toQImage(m_world->renderTarget());
    m_frame.setDevicePixelRatio(m_editor->config().displayRatio);
}

void CanvasWidget::paintEvent(QPaintEvent* /*event*/)
{
    QPainter p(this);
    p.fillRect(rect(), QColor(24, 24, 28));

    if (!m_frame.isNull())
        p.drawImage(QPointF(0, 0), m_frame);

    const EditorConfig& cfg = m_editor->config();
    if (!cfg.isUILightVisible)
        return;

    p.setRenderHint(QPainter::Antialiasing, true);

    const LightId dragged = m_editor->controller().draggedLight();
    for (const LightRecord* rec : m_editor->records())
    {
        const QPointF c(rec->screenPosition.x / cfg.displayRatio, rec->screenPosition.y / cfg.displayRatio);

        p.setPen(QPen(QColor(20, 20, 20), 1.5));
        p.setBrush(rec->lightId == dragged ? QColor(255, 210, 60) : QColor(240, 240, 240));
        p.drawEllipse(c, kHandleRadius, kHandleRadius);
    }
}

CoreEvent CanvasWidget::createCoreEvent(const QMouseEvent* e) const noexcept
{
    CoreEvent ev = {};

    ev.button    = static_cast<int>(e->button());
    ev.x         = static_cast<float>(e->position().x());
    ev.y         = static_cast<float>(e->position().y());
    ev.deltaX    = static_cast<float>(e->position().x() - m_lastPos.x());
    ev.deltaY    = static_cast<float>(e->position().y() - m_lastPos.y());
    ev.shift_key = (e->modifiers() & Qt::ShiftModifier) != 0;
    ev.ctrl_key  = (e->modifiers() & Qt::ControlModifier) != 0;
    ev.alt_key   = (e->modifiers() & Qt::AltModifier) != 0;

    return ev;
}

LightId CanvasWidget::handleAt(const QPointF& pos) const
{
    const EditorConfig& cfg = m_editor->config();
    if (!cfg.isUILightVisible)
        return kInvalidLightId;

    // Last drawn wins, matching paint order.
    LightId hit = kInvalidLightId;
    for (const LightRecord* rec : m_editor->records())
    {
        const QPointF c(rec->screenPosition.x / cfg.displayRatio, rec->screenPosition.y / cfg.displayRatio);
        const QPointF d = pos - c;
        if (d.x() * d.x() + d.y() * d.y() <= kHandleRadius * kHandleRadius)
            hit = rec->lightId;
    }
    return hit;
}

void CanvasWidget::enterEvent(QEnterEvent* event)
{
    QWidget::enterEvent(event);
    m_editor->pointerEnter();
}

void CanvasWidget::leaveEvent(QEvent* event)
{
    QWidget::leaveEvent(event);
    m_editor->pointerLeave();
}

void CanvasWidget::mousePressEvent(QMouseEvent* e)
{
    const CoreEvent ev = createCoreEvent(e);
    m_lastPos          = e->position();

    if (e->button() == Qt::RightButton)
    {
        m_orbiting = true;
        return;
    }

    if (e->button() != Qt::LeftButton)
        return;

    // Grabbing a handle drags the existing light instead of placing a new one.
    const LightId handle = handleAt(e->position());
    if (handle != kInvalidLightId)
    {
        m_editor->startLightDrag(handle);
        m_editor->pointerMove(ev.x, ev.y);
        update();
        return;
    }

    m_editor->pointerMove(ev.x, ev.y);
    m_editor->pointerDown();
}

void CanvasWidget::mouseMoveEvent(QMouseEvent* e)
{
    const CoreEvent ev = createCoreEvent(e);
    m_lastPos          = e->position();

    if (m_orbiting)
    {
        m_editor->orbit(ev.deltaX, ev.deltaY);
        update();
        return;
    }

    m_editor->pointerMove(ev.x, ev.y);
    if (m_editor->controller().isDragging())
        update();
}

void CanvasWidget::mouseReleaseEvent(QMouseEvent* e)
{
    if (e->button() == Qt::RightButton)
    {
        m_orbiting = false;
        return;
    }

    if (e->button() == Qt::LeftButton)
    {
        m_editor->pointerUp();
        update();
    }
}

void CanvasWidget::wheelEvent(QWheelEvent* e)
{
    m_editor->zoom(-e->angleDelta().y() / 12.0f);
    update();
}
