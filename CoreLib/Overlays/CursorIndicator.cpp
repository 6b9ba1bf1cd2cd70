#include "CursorIndicator.hpp"

#include "CoreUtilities.hpp"
#include "OverlayHandler.hpp"

CursorIndicator::CursorIndicator() : m_changeCounter{std::make_shared<ChangeCounter>()}
{
}

void CursorIndicator::setVisible(bool visible) noexcept
{
    if (m_visible == visible)
        return;

    m_visible = visible;
    m_changeCounter->change();
}

void CursorIndicator::setColor(const glm::vec4& color) noexcept
{
    if (m_color == color)
        return;

    m_color = color;
    m_changeCounter->change();
}

void CursorIndicator::place(const glm::vec3& position, const glm::vec3& direction, float length) noexcept
{
    m_position  = position;
    m_direction = un::safe_normalize(direction, m_direction);
    m_length    = length;
    m_changeCounter->change();
}

glm::vec4 CursorIndicator::colorFor(TargetSurface surface) noexcept
{
    switch (surface)
    {
        case TargetSurface::NormalSphere:
            return un::rgb(0xe5ff00);
        case TargetSurface::Plane:
            return un::rgb(0x00ffee);
        case TargetSurface::RenderSphere:
            break;
    }
    return un::rgb(0xff0000);
}

void CursorIndicator::buildOverlay(OverlayHandler& overlays) const
{
    if (!m_visible)
        return;

    overlays.begin_overlay(kOverlayId);
    overlays.add_arrow(m_position, m_direction, m_length, m_color);
    overlays.end_overlay();
}
