#include "Viewport.hpp"

#include <algorithm>
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>

Viewport::Viewport() : m_changeCounter(std::make_shared<ChangeCounter>())
{
    apply();
}

void Viewport::resize(int32_t width, int32_t height) noexcept
{
    // A 0-sized viewport is treated as invalid for pixel projection.
    width  = std::max<int32_t>(0, width);
    height = std::max<int32_t>(0, height);

    if (m_width == width && m_height == height)
        return;

    m_width  = width;
    m_height = height;
    apply();
    m_changeCounter->change();
}

void Viewport::perspective(float fovDeg, float nearPlane, float farPlane) noexcept
{
    m_viewMode = ViewMode::PERSPECTIVE;
    m_fovDeg   = std::clamp(fovDeg, 1.0f, 179.0f);
    m_near     = std::max(1e-4f, nearPlane);
    m_far      = std::max(m_near + 1e-3f, farPlane);
    apply();
    m_changeCounter->change();
}

void Viewport::orthographic(float halfHeight, float nearPlane, float farPlane) noexcept
{
    m_viewMode   = ViewMode::ORTHOGRAPHIC;
    m_halfHeight = std::max(1e-6f, halfHeight);
    m_near       = nearPlane;
    m_far        = std::max(m_near + 1e-3f, farPlane);
    apply();
    m_changeCounter->change();
}

void Viewport::setOrbit(const glm::vec3& target, float dist, const glm::vec2& rot) noexcept
{
    m_target = target;
    m_dist   = dist;
    m_rot    = rot;
    apply();
    m_changeCounter->change();
}

void Viewport::rotate(float deltaX, float deltaY) noexcept
{
    m_rot.x -= deltaX;
    m_rot.y = std::clamp(m_rot.y - deltaY, -89.0f, 89.0f);
    apply();
    m_changeCounter->change();
}

void Viewport::zoom(float deltaX, float /*deltaY*/) noexcept
{
    // The scale factor is UI-tuned.
    m_dist = std::max(m_near * 2.0f, m_dist + deltaX / 100.0f);
    apply();
    m_changeCounter->change();
}

glm::vec3 Viewport::projectNdc(const glm::vec3& world) const noexcept
{
    const glm::vec4 clip = m_matViewProj * glm::vec4(world, 1.0f);

    // clip.w == 0 indicates an invalid perspective divide.
    if (clip.w == 0.0f)
        return glm::vec3(0.0f);

    return glm::vec3(clip) / clip.w;
}

glm::vec3 Viewport::unprojectNdc(const glm::vec3& ndc) const noexcept
{
    const glm::vec4 worldH = m_matInvViewProj * glm::vec4(ndc, 1.0f);

    // worldH.w == 0 indicates an invalid homogeneous coordinate.
    if (worldH.w == 0.0f)
        return glm::vec3(0.0f);

    return glm::vec3(worldH) / worldH.w;
}

un::ray Viewport::rayFromNdc(const glm::vec2& ndc) const
{
    // Unprojects near and far depths; works for both projections.
    const glm::vec3 nearPt = unprojectNdc(glm::vec3(ndc, 0.0f));
    const glm::vec3 farPt  = unprojectNdc(glm::vec3(ndc, 1.0f));

    // Perspective rays start at the eye so hits in front of the near plane still count.
    const glm::vec3 org = (m_viewMode == ViewMode::PERSPECTIVE) ? cameraPosition() : nearPt;

    return un::make_ray(org, farPt - nearPt);
}

glm::vec3 Viewport::cameraPosition() const
{
    return glm::vec3(m_matInvView[3]);
}

float Viewport::aspect() const noexcept
{
    if (m_width <= 0 || m_height <= 0)
        return 1.0f;
    return static_cast<float>(m_width) / static_cast<float>(m_height);
}

// -----------------------------------------------------------------------------
// apply()
// -----------------------------------------------------------------------------

void Viewport::apply() noexcept
{
    const float aspectRatio = aspect();

    if (m_viewMode == ViewMode::PERSPECTIVE)
    {
        m_matProj = glm::perspectiveRH_ZO(glm::radians(m_fovDeg), aspectRatio, m_near, m_far);
    }
    else
    {
        const float halfW = m_halfHeight * aspectRatio;
        m_matProj         = glm::orthoRH_ZO(-halfW, halfW, -m_halfHeight, m_halfHeight, m_near, m_far);
    }

    // Camera sits at +dist along its local Z, orbiting the target.
    m_matView = glm::translate(glm::mat4(1.0f), glm::vec3(0.f, 0.f, -m_dist));
    m_matView = glm::rotate(m_matView, glm::radians(m_rot.y), glm::vec3(1.f, 0.f, 0.f));
    m_matView = glm::rotate(m_matView, glm::radians(m_rot.x), glm::vec3(0.f, 1.f, 0.f));
    m_matView = m_matView * glm::translate(glm::mat4(1.0f), -m_target);

    m_matInvView     = glm::inverse(m_matView);
    m_matViewProj    = m_matProj * m_matView;
    m_matInvViewProj = glm::inverse(m_matViewProj);
}

namespace un
{
    glm::vec2 screen_position(const glm::vec3& world, const Viewport& camera, float width, float height) noexcept
    {
        const glm::vec3 ndc = camera.projectNdc(world);
        return glm::vec2((ndc.x * 0.5f + 0.5f) * width,
                         (-ndc.y * 0.5f + 0.5f) * height);
    }

} // namespace un
