#ifndef LIGHTSPANEL_HPP
#define LIGHTSPANEL_HPP

#include <QWidget>
#include <cstdint>
#include <memory>

#include "ChangeCounter.hpp"
#include "EditorConfig.hpp"
#include "Light.hpp"

class MatcapEditor;
class QComboBox;
class QDoubleSpinBox;
class QLabel;
class QLineEdit;
class QListWidget;
class QPushButton;
class QSlider;
class QSpinBox;
struct EncodedImage;

/**
 * @class LightsPanel
 * @brief Side panel: placement settings, environment, placed lights, preview and export.
 *
 * Widget edits are pushed into the editor with MatcapEditor::applyConfig().
 * The panel pulls the config back when the editor's config counter moves,
 * guarded by m_blockUi to avoid feedback loops.
 */
class LightsPanel final : public QWidget
{
    Q_OBJECT

public:
    explicit LightsPanel(QWidget* parent = nullptr);
    ~LightsPanel() noexcept override = default;

    /**
     * @brief Periodic UI sync entry point.
     *
     * Pulls the config when it changed and rebuilds the light list when
     * markLightsDirty() was called since the last tick.
     */
    void idleEvent(MatcapEditor* editor);

    /// Light list needs a rebuild on the next idleEvent().
    void markLightsDirty() noexcept { m_lightsDirty = true; }

    /// Shows a freshly encoded preview PNG.
    void setPreview(const EncodedImage& image);

private:
    void buildUi();

    void pushToEditor();
    void pullFromEditor();
    void rebuildLightList();
    void syncSelection();

    void pickAmbientColor();
    void browseExportPath();

    [[nodiscard]] LightId selectedLight() const;

private:
    MatcapEditor* m_editor = nullptr;

    std::unique_ptr<ChangeMonitor> m_configMonitor;

    bool m_blockUi     = false;
    bool m_lightsDirty = true;

    glm::vec3 m_ambientColor = glm::vec3(1.0f);

    // Placement
    QComboBox*      m_typeCombo     = nullptr;
    QComboBox*      m_sideCombo     = nullptr;
    QDoubleSpinBox* m_distanceSpin  = nullptr;

    // Environment
    QPushButton*    m_ambientButton = nullptr;
    QDoubleSpinBox* m_ambientSpin   = nullptr;
    QSlider*        m_roughSlider   = nullptr;
    QSlider*        m_metalSlider   = nullptr;

    // Lights
    QListWidget*    m_lightList     = nullptr;
    QDoubleSpinBox* m_lightDistance = nullptr;
    QPushButton*    m_deleteButton  = nullptr;

    // Output
    QLabel*         m_preview       = nullptr;
    QSpinBox*       m_exportSize    = nullptr;
    QDoubleSpinBox* m_exportRatio   = nullptr;
    QLineEdit*      m_exportPath    = nullptr;
    QPushButton*    m_exportButton  = nullptr;
};

#endif // LIGHTSPANEL_HPP
