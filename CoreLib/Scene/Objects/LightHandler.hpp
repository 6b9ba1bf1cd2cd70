//============================================================
// LightHandler.hpp
//============================================================
#pragma once

#include <map>
#include <vector>

#include "ChangeCounter.hpp"
#include "Light.hpp"

/**
 * @brief Owns scene Light data with stable IDs.
 *
 * IDs are handed out monotonically and never reused, so a stale LightId
 * (for example one still referenced by a UI handle after a delete) can never
 * alias a newer light.
 */
class LightHandler final
{
public:
    LightHandler();
    ~LightHandler() = default;

    LightHandler(const LightHandler&)            = delete;
    LightHandler& operator=(const LightHandler&) = delete;

    void clear() noexcept;

    /**
     * @brief Creates a new Light by cloning a source Light.
     * @param src Source light data (its id is ignored).
     * @return Stable LightId for the created light.
     */
    [[nodiscard]] LightId createLight(const Light& src);

    bool destroyLight(LightId id) noexcept;

    [[nodiscard]] Light*       light(LightId id) noexcept;
    [[nodiscard]] const Light* light(LightId id) const noexcept;

    /**
     * @brief Returns all alive light IDs in creation order.
     */
    [[nodiscard]] std::vector<LightId> allLights() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_lights.size(); }

    /**
     * @brief Moves a light and marks the handler as changed.
     * @return False if the id is unknown.
     */
    bool setPosition(LightId id, const glm::vec3& position) noexcept;

    [[nodiscard]] ChangeCounterPtr changeCounter() const noexcept { return m_changeCounter; }

private:
    std::map<LightId, Light> m_lights = {};
    LightId                  m_nextId = 0;
    ChangeCounterPtr         m_changeCounter;

private:
    static void sanitize(Light& l) noexcept;
};
