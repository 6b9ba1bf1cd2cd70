//============================================================
// LightFactory.hpp
//============================================================
#pragma once

#include <functional>
#include <optional>
#include <unordered_map>

#include "Light.hpp"

/**
 * @brief A freshly constructed light plus its optional aim node.
 *
 * Spot lights aim at a separate target node that the scene tracks next to
 * the light. Other types leave `target` empty.
 */
struct LightInstance
{
    Light                    light  = {};
    std::optional<glm::vec3> target = std::nullopt;
};

/**
 * @brief Builds lights by type.
 *
 * Builders are registered per LightType; the constructor registers the
 * stock Point, Spot and Directional builders. Hosts may replace a builder
 * to change the defaults of newly placed lights.
 */
class LightFactory
{
public:
    using CreateFunc = std::function<LightInstance()>;

    LightFactory();

    /// Registers or replaces the builder for a type.
    void registerType(LightType type, CreateFunc createFunc);

    [[nodiscard]] bool hasType(LightType type) const noexcept;

    /**
     * @brief Creates a light of the given type.
     * @throws std::runtime_error if no builder is registered for the type.
     */
    [[nodiscard]] LightInstance create(LightType type) const;

    // Stock builders.
    static LightInstance createPoint();
    static LightInstance createSpot();
    static LightInstance createDirectional();

private:
    std::unordered_map<LightType, CreateFunc> m_registry;
};
