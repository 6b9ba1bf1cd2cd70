//============================================================
// EditorConfig.hpp
//============================================================
#pragma once

#include <cstdint>
#include <filesystem>
#include <glm/vec3.hpp>

#include "CoreTypes.hpp"
#include "Light.hpp"

/**
 * @brief Editor configuration.
 *
 * Plain value passed to MatcapEditor at construction and re-applied with
 * MatcapEditor::applyConfig(). Components always read the latest applied
 * copy; nothing here is global.
 */
struct EditorConfig
{
    // --------------------------------------------------------
    // Lighting environment
    // --------------------------------------------------------
    struct Ambient
    {
        glm::vec3 color     = glm::vec3(1.0f);
        float     intensity = 0.2f;
    } ambient;

    struct Material
    {
        float roughness = 0.4f;
        float metalness = 0.0f;
    } material;

    // --------------------------------------------------------
    // New light placement
    // --------------------------------------------------------
    struct Create
    {
        float         distance  = 0.2f;
        LightType     lightType = LightType::Point;
        PlacementSide side      = PlacementSide::Front;
    } create;

    // --------------------------------------------------------
    // Output sizes
    // --------------------------------------------------------
    struct Sizes
    {
        int32_t exportSize  = 256;  // square, also the picking normalization size
        float   exportRatio = 4.0f; // pixel ratio used for exports
    } sizes;

    float displayRatio = 1.0f; // device pixel ratio of the canvas

    // --------------------------------------------------------
    // Cameras
    // --------------------------------------------------------
    struct View
    {
        float fovDeg   = 45.0f;
        float distance = 1.2f;
    } view;

    struct Capture
    {
        float halfSize = 0.3f;
        float nearClip = 0.5f;
        float farClip  = 200.0f;
        float distance = 1.0f; // camera sits at (0,0,distance)
    } capture;

    // --------------------------------------------------------
    // Snapshot / export
    // --------------------------------------------------------
    struct Snapshot
    {
        int32_t encodeTimeoutMs = 5000;
    } snapshot;

    std::filesystem::path exportPath = "matcap.png";

    bool isUILightVisible = false;
};

namespace config
{
    /// Largest render target edge in pixels, export density included.
    constexpr int32_t kMaxTargetEdge = 8192;

    /**
     * @brief Clamps every field into its valid range.
     *
     * Non-finite values fall back to the defaults. The export ratio is
     * lowered so that exportSize * exportRatio stays within kMaxTargetEdge.
     */
    void sanitize(EditorConfig& cfg) noexcept;

    /**
     * @brief Loads a config file.
     *
     * Line oriented `key value...` text; `#` and `//` start comments, strings
     * may be quoted. Unknown keys are skipped with a warning. On failure `cfg`
     * is left untouched and the reason is logged to std::cerr.
     */
    [[nodiscard]] bool loadEditorConfig(const std::filesystem::path& path, EditorConfig& cfg);

    /**
     * @brief Writes every key of `cfg`. Returns false if the file cannot be written.
     */
    [[nodiscard]] bool saveEditorConfig(const std::filesystem::path& path, const EditorConfig& cfg);

} // namespace config
