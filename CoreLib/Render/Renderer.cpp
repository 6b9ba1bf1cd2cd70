//============================================================
// Renderer.cpp
//============================================================
#include "Renderer.hpp"

#include <algorithm>
#include <cmath>
#include <glm/gtc/constants.hpp>

#include "CoreUtilities.hpp"
#include "Image.hpp"
#include "Scene.hpp"
#include "SceneQuery.hpp"
#include "Viewport.hpp"

namespace
{
    constexpr float kMinRoughness  = 0.03f;
    constexpr float kMinClipW      = 1e-6f;
    constexpr int   kMaxLineRadius = 32;

    float linearToSrgb(float c) noexcept
    {
        c = std::clamp(c, 0.0f, 1.0f);
        if (c <= 0.0031308f)
            return c * 12.92f;
        return 1.055f * std::pow(c, 1.0f / 2.4f) - 0.055f;
    }

    uint8_t toByte(float c) noexcept
    {
        return static_cast<uint8_t>(std::clamp(c, 0.0f, 1.0f) * 255.0f + 0.5f);
    }

    // Smooth cutoff at `range` (0 = unlimited).
    float rangeWindow(float dist, float range) noexcept
    {
        if (range <= 0.0f)
            return 1.0f;

        const float r = dist / range;
        const float w = std::clamp(1.0f - r * r * r * r, 0.0f, 1.0f);
        return w * w;
    }

    float distanceFalloff(float dist, float decay, float range) noexcept
    {
        const float d = std::max(dist, 1e-3f);
        return rangeWindow(dist, range) / std::pow(d, decay);
    }

    // ------------------------------------------------------------
    // GGX / Smith / Schlick
    // ------------------------------------------------------------

    float ggxD(float NdotH, float alpha) noexcept
    {
        const float a2 = alpha * alpha;
        const float d  = NdotH * NdotH * (a2 - 1.0f) + 1.0f;
        return a2 / (glm::pi<float>() * d * d);
    }

    float smithG1(float NdotX, float alpha) noexcept
    {
        const float k = alpha * 0.5f;
        return NdotX / (NdotX * (1.0f - k) + k);
    }

    glm::vec3 fresnelSchlick(const glm::vec3& F0, float VdotH) noexcept
    {
        const float f = std::pow(1.0f - std::clamp(VdotH, 0.0f, 1.0f), 5.0f);
        return F0 + (glm::vec3(1.0f) - F0) * f;
    }

    glm::vec3 brdf(const glm::vec3& N,
                   const glm::vec3& V,
                   const glm::vec3& L,
                   const glm::vec3& albedo,
                   float            roughness,
                   float            metalness) noexcept
    {
        const float NdotL = glm::dot(N, L);
        const float NdotV = std::max(glm::dot(N, V), 1e-4f);
        if (NdotL <= 0.0f)
            return glm::vec3(0.0f);

        const glm::vec3 H     = un::safe_normalize(V + L, N);
        const float     NdotH = std::max(glm::dot(N, H), 0.0f);
        const float     VdotH = std::max(glm::dot(V, H), 0.0f);

        const float     rough = std::max(roughness, kMinRoughness);
        const float     alpha = rough * rough;
        const glm::vec3 F0    = glm::mix(glm::vec3(0.04f), albedo, metalness);
        const glm::vec3 F     = fresnelSchlick(F0, VdotH);

        const float     D    = ggxD(NdotH, alpha);
        const float     G    = smithG1(NdotL, alpha) * smithG1(NdotV, alpha);
        const glm::vec3 spec = F * (D * G / (4.0f * NdotL * NdotV));

        // Diffuse is normalized so a unit light facing the surface gives albedo.
        const glm::vec3 kd      = (glm::vec3(1.0f) - F) * (1.0f - metalness);
        const glm::vec3 diffuse = kd * albedo;

        return (diffuse + spec) * NdotL;
    }

    // Clip-space segment cut at the ZO near plane (z = 0). Returns false when
    // the whole segment lies behind it.
    bool clipToNear(glm::vec4& a, glm::vec4& b) noexcept
    {
        if (a.z < 0.0f && b.z < 0.0f)
            return false;

        if (a.z < 0.0f)
            a = glm::mix(a, b, a.z / (a.z - b.z));
        else if (b.z < 0.0f)
            b = glm::mix(b, a, b.z / (b.z - a.z));

        return a.w > kMinClipW && b.w > kMinClipW;
    }

    // Liang-Barsky against [lo, hi]. Returns false when nothing is inside.
    bool clipToRect(glm::vec2& a, glm::vec2& b, const glm::vec2& lo, const glm::vec2& hi) noexcept
    {
        const glm::vec2 d  = b - a;
        float           t0 = 0.0f;
        float           t1 = 1.0f;

        const float p[4] = {-d.x, d.x, -d.y, d.y};
        const float q[4] = {a.x - lo.x, hi.x - a.x, a.y - lo.y, hi.y - a.y};

        for (int i = 0; i < 4; ++i)
        {
            if (p[i] == 0.0f)
            {
                if (q[i] < 0.0f)
                    return false;
                continue;
            }

            const float t = q[i] / p[i];
            if (p[i] < 0.0f)
                t0 = std::max(t0, t);
            else
                t1 = std::min(t1, t);

            if (t0 > t1)
                return false;
        }

        const glm::vec2 start = a;
        a                     = start + d * t0;
        b                     = start + d * t1;
        return true;
    }

    // Pixel-space line with round-ish thickness and alpha blending.
    void blendPixel(Image& img, int x, int y, const glm::vec4& color) noexcept
    {
        const glm::u8vec4 dst = img.pixel(x, y);
        const float       a   = std::clamp(color.a, 0.0f, 1.0f);

        glm::u8vec4 out;
        for (int c = 0; c < 3; ++c)
        {
            const float src = linearToSrgb(color[c]);
            out[c]          = toByte(src * a + (dst[c] / 255.0f) * (1.0f - a));
        }
        out.a = toByte(a + (dst.a / 255.0f) * (1.0f - a));
        img.setPixel(x, y, out);
    }

    // Expects endpoints already clipped to the target (see clipToRect).
    void drawLine(Image& img, glm::vec2 a, glm::vec2 b, float thickness, const glm::vec4& color) noexcept
    {
        const float len   = glm::length(b - a);
        const int   steps = std::max(1, static_cast<int>(std::ceil(len)));
        const int   r     = std::clamp(static_cast<int>(std::floor(thickness * 0.5f)), 0, kMaxLineRadius);

        for (int i = 0; i <= steps; ++i)
        {
            const glm::vec2 p  = glm::mix(a, b, static_cast<float>(i) / steps);
            const int       cx = static_cast<int>(std::floor(p.x));
            const int       cy = static_cast<int>(std::floor(p.y));

            for (int dy = -r; dy <= r; ++dy)
                for (int dx = -r; dx <= r; ++dx)
                    blendPixel(img, cx + dx, cy + dy, color);
        }
    }

} // namespace

glm::vec3 Renderer::shade(const Scene&     scene,
                          const glm::vec3& position,
                          const glm::vec3& normal,
                          const glm::vec3& viewDir)
{
    const glm::vec3 albedo(1.0f); // white base color
    const float     roughness = scene.roughness();
    const float     metalness = scene.metalness();

    glm::vec3 color = scene.ambientColor() * scene.ambientIntensity() * albedo;

    const LightHandler& handler = scene.lightHandler();
    for (LightId id : handler.allLights())
    {
        const Light* light = handler.light(id);
        if (!light || !light->enabled || light->intensity <= 0.0f)
            continue;

        glm::vec3 L(0.0f);
        float     irradiance = light->intensity;

        switch (light->type)
        {
            case LightType::Directional:
            {
                // Aimed at the origin; fall back to the stored direction.
                L = un::safe_normalize(light->position, -light->direction);
                break;
            }
            case LightType::Point:
            case LightType::Spot:
            {
                const glm::vec3 toLight = light->position - position;
                const float     dist    = glm::length(toLight);
                if (dist <= 0.0f)
                    continue;

                L = toLight / dist;
                irradiance *= distanceFalloff(dist, light->decay, light->range);

                if (light->type == LightType::Spot)
                {
                    const glm::vec3 target  = scene.lightTarget(id).value_or(light->position + light->direction);
                    const glm::vec3 spotDir = un::safe_normalize(target - light->position, light->direction);

                    const float cosOuter = std::cos(light->spotAngleRad);
                    const float cosInner = std::cos(light->spotAngleRad * (1.0f - light->spotPenumbra));
                    const float cd       = glm::dot(-L, spotDir);

                    irradiance *= glm::smoothstep(cosOuter, std::max(cosInner, cosOuter + 1e-4f), cd);
                }
                break;
            }
        }

        if (irradiance <= 0.0f)
            continue;

        color += brdf(normal, viewDir, L, albedo, roughness, metalness) * light->color * irradiance;
    }

    return color;
}

void Renderer::render(const Scene& scene, const Viewport& camera, Image& target, float pixelRatio)
{
    if (!target.valid())
        return;

    const int w = target.width();
    const int h = target.height();

    const glm::u8vec4 background(toByte(linearToSrgb(m_settings.background.r)),
                                 toByte(linearToSrgb(m_settings.background.g)),
                                 toByte(linearToSrgb(m_settings.background.b)),
                                 toByte(m_settings.background.a));

    const SceneQuery& query = scene.sceneQuery();
    const SurfaceMask mask  = surfaceBit(TargetSurface::RenderSphere);

    for (int y = 0; y < h; ++y)
    {
        for (int x = 0; x < w; ++x)
        {
            const glm::vec2 ndc(((x + 0.5f) / w) * 2.0f - 1.0f,
                                -((y + 0.5f) / h) * 2.0f + 1.0f);

            const un::ray    ray = camera.rayFromNdc(ndc);
            const SurfaceHit hit = query.intersect(ray, mask);

            if (!hit.valid())
            {
                target.setPixel(x, y, background);
                continue;
            }

            glm::vec3 N = hit.smoothNormal;
            if (glm::dot(N, ray.dir) > 0.0f)
                N = -N;

            const glm::vec3 radiance = shade(scene, hit.point, N, -ray.dir) * m_settings.exposure;

            target.setPixel(x, y, glm::u8vec4(toByte(linearToSrgb(radiance.r)),
                                              toByte(linearToSrgb(radiance.g)),
                                              toByte(linearToSrgb(radiance.b)),
                                              255));
        }
    }

    if (m_settings.drawOverlays)
    {
        m_overlays.clear();
        scene.buildOverlays(m_overlays);
        drawOverlays(camera, target, pixelRatio);
    }
}

void Renderer::drawOverlays(const Viewport& camera, Image& target, float pixelRatio) const
{
    const glm::vec2 size(static_cast<float>(target.width()), static_cast<float>(target.height()));
    const glm::mat4 viewProj = camera.projection() * camera.view();

    for (const OverlayHandler::Overlay& o : m_overlays.overlays())
    {
        for (const OverlayHandler::Line& line : o.lines)
        {
            glm::vec4 ca = viewProj * glm::vec4(line.a, 1.0f);
            glm::vec4 cb = viewProj * glm::vec4(line.b, 1.0f);
            if (!clipToNear(ca, cb))
                continue;

            const glm::vec2 na = glm::vec2(ca) / ca.w;
            const glm::vec2 nb = glm::vec2(cb) / cb.w;

            glm::vec2 pa((na.x * 0.5f + 0.5f) * size.x, (-na.y * 0.5f + 0.5f) * size.y);
            glm::vec2 pb((nb.x * 0.5f + 0.5f) * size.x, (-nb.y * 0.5f + 0.5f) * size.y);
            if (!std::isfinite(pa.x) || !std::isfinite(pa.y) || !std::isfinite(pb.x) || !std::isfinite(pb.y))
                continue;

            const float thickness = line.thickness * pixelRatio;
            const float margin    = std::min(thickness, float(kMaxLineRadius)) + 1.0f;
            if (!clipToRect(pa, pb, glm::vec2(-margin), size + margin))
                continue;

            drawLine(target, pa, pb, thickness, line.color);
        }
    }
}
