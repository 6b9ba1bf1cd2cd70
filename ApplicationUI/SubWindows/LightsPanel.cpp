//==============================================================
// LightsPanel.cpp
//==============================================================
#include "LightsPanel.hpp"

#include <QColorDialog>
#include <QComboBox>
#include <QDebug>
#include <QDoubleSpinBox>
#include <QFileDialog>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QPixmap>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSlider>
#include <QSpinBox>
#include <QVBoxLayout>

#include "ImageEncoder.hpp"
#include "MatcapEditor.hpp"

namespace
{
    QColor to_qcolor(const glm::vec3& c)
    {
        return QColor::fromRgbF(c.r, c.g, c.b);
    }

    void set_swatch(QPushButton* b, const glm::vec3& c)
    {
        b->setStyleSheet(QString("background-color: %1;").arg(to_qcolor(c).name()));
    }

    QString light_label(const LightRecord& rec)
    {
        return QString("%1 #%2  d=%3")
            .arg(QString::fromUtf8(lightTypeName(rec.type).data(), static_cast<int>(lightTypeName(rec.type).size())))
            .arg(rec.lightId)
            .arg(rec.distance, 0, 'f', 3);
    }

    constexpr int kPreviewSize = 160;

} // namespace

LightsPanel::LightsPanel(QWidget* parent) : QWidget(parent)
{
    buildUi();
}

void LightsPanel::buildUi()
{
    auto* root = new QVBoxLayout(this);
    root->setContentsMargins(8, 8, 8, 8);

    // ------------------------------------------------------------
    // Placement
    // ------------------------------------------------------------
    {
        auto* box  = new QGroupBox(tr("New light"), this);
        auto* form = new QFormLayout(box);

        m_typeCombo = new QComboBox(box);
        for (LightType t : {LightType::Point, LightType::Spot, LightType::Directional})
        {
            const std::string_view name = lightTypeName(t);
            m_typeCombo->addItem(QString::fromUtf8(name.data(), static_cast<int>(name.size())), static_cast<int>(t));
        }

        m_sideCombo = new QComboBox(box);
        m_sideCombo->addItem(tr("Front"), static_cast<int>(PlacementSide::Front));
        m_sideCombo->addItem(tr("Back"), static_cast<int>(PlacementSide::Back));

        m_distanceSpin = new QDoubleSpinBox(box);
        m_distanceSpin->setRange(0.0, 5.0);
        m_distanceSpin->setDecimals(3);
        m_distanceSpin->setSingleStep(0.01);

        form->addRow(tr("Type"), m_typeCombo);
        form->addRow(tr("Side"), m_sideCombo);
        form->addRow(tr("Distance"), m_distanceSpin);
        root->addWidget(box);
    }

    // ------------------------------------------------------------
    // Environment
    // ------------------------------------------------------------
    {
        auto* box  = new QGroupBox(tr("Environment"), this);
        auto* form = new QFormLayout(box);

        m_ambientButton = new QPushButton(box);
        m_ambientButton->setFixedWidth(48);

        m_ambientSpin = new QDoubleSpinBox(box);
        m_ambientSpin->setRange(0.0, 10.0);
        m_ambientSpin->setDecimals(2);
        m_ambientSpin->setSingleStep(0.05);

        m_roughSlider = new QSlider(Qt::Horizontal, box);
        m_roughSlider->setRange(0, 100);

        m_metalSlider = new QSlider(Qt::Horizontal, box);
        m_metalSlider->setRange(0, 100);

        form->addRow(tr("Ambient color"), m_ambientButton);
        form->addRow(tr("Ambient intensity"), m_ambientSpin);
        form->addRow(tr("Roughness"), m_roughSlider);
        form->addRow(tr("Metalness"), m_metalSlider);
        root->addWidget(box);
    }

    // ------------------------------------------------------------
    // Placed lights
    // ------------------------------------------------------------
    {
        auto* box = new QGroupBox(tr("Lights"), this);
        auto* lay = new QVBoxLayout(box);

        m_lightList = new QListWidget(box);
        m_lightList->setSelectionMode(QAbstractItemView::SingleSelection);
        m_lightList->setMinimumHeight(120);

        auto* row       = new QHBoxLayout();
        m_lightDistance = new QDoubleSpinBox(box);
        m_lightDistance->setRange(0.0, 5.0);
        m_lightDistance->setDecimals(3);
        m_lightDistance->setSingleStep(0.01);
        m_lightDistance->setEnabled(false);

        m_deleteButton = new QPushButton(tr("Delete"), box);
        m_deleteButton->setEnabled(false);

        row->addWidget(new QLabel(tr("Distance"), box));
        row->addWidget(m_lightDistance, 1);
        row->addWidget(m_deleteButton);

        lay->addWidget(m_lightList);
        lay->addLayout(row);
        root->addWidget(box);
    }

    // ------------------------------------------------------------
    // Preview / export
    // ------------------------------------------------------------
    {
        auto* box  = new QGroupBox(tr("Matcap"), this);
        auto* form = new QFormLayout(box);

        m_preview = new QLabel(box);
        m_preview->setFixedSize(kPreviewSize, kPreviewSize);
        m_preview->setAlignment(Qt::AlignCenter);
        m_preview->setStyleSheet("background-color: #202024;");

        m_exportSize = new QSpinBox(box);
        m_exportSize->setRange(16, 8192);

        m_exportRatio = new QDoubleSpinBox(box);
        m_exportRatio->setRange(1.0, 16.0);
        m_exportRatio->setDecimals(1);

        auto* pathRow  = new QHBoxLayout();
        m_exportPath   = new QLineEdit(box);
        auto* browse   = new QPushButton(tr("..."), box);
        browse->setFixedWidth(28);
        pathRow->addWidget(m_exportPath, 1);
        pathRow->addWidget(browse);

        m_exportButton = new QPushButton(tr("Export PNG"), box);

        form->addRow(m_preview);
        form->addRow(tr("Size"), m_exportSize);
        form->addRow(tr("Export ratio"), m_exportRatio);
        form->addRow(tr("File"), pathRow);
        form->addRow(m_exportButton);
        root->addWidget(box);

        connect(browse, &QPushButton::clicked, this, &LightsPanel::browseExportPath);
    }

    root->addStretch(1);

    // ------------------------------------------------------------
    // Wiring: any settings edit -> pushToEditor()
    // ------------------------------------------------------------
    auto push = [this]() {
        if (!m_blockUi)
            pushToEditor();
    };

    connect(m_typeCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, push);
    connect(m_sideCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, push);
    connect(m_distanceSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, push);
    connect(m_ambientSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, push);
    connect(m_roughSlider, &QSlider::valueChanged, this, push);
    connect(m_metalSlider, &QSlider::valueChanged, this, push);
    connect(m_exportRatio, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, push);
    connect(m_exportPath, &QLineEdit::editingFinished, this, push);

    // Export size also drives the canvas, so it is only applied on commit.
    connect(m_exportSize, &QSpinBox::editingFinished, this, push);

    connect(m_ambientButton, &QPushButton::clicked, this, &LightsPanel::pickAmbientColor);

    connect(m_lightList, &QListWidget::itemSelectionChanged, this, &LightsPanel::syncSelection);

    connect(m_lightDistance, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, [this](double v) {
        if (m_blockUi || !m_editor)
            return;

        const LightId id = selectedLight();
        if (id != kInvalidLightId)
            m_editor->setLightDistance(id, static_cast<float>(v));
    });

    connect(m_deleteButton, &QPushButton::clicked, this, [this]() {
        if (!m_editor)
            return;

        const LightId id = selectedLight();
        if (id != kInvalidLightId)
            m_editor->deleteLight(id);
    });

    connect(m_exportButton, &QPushButton::clicked, this, [this]() {
        if (m_editor)
            m_editor->requestExport();
    });
}

// ------------------------------------------------------------
// Idle sync
// ------------------------------------------------------------

void LightsPanel::idleEvent(MatcapEditor* editor)
{
    if (!editor)
        return;

    if (editor != m_editor)
    {
        m_editor        = editor;
        m_configMonitor = std::make_unique<ChangeMonitor>(m_editor->configCounter());
        m_lightsDirty   = true;
    }

    if (m_configMonitor->changed())
        pullFromEditor();

    if (m_lightsDirty)
    {
        rebuildLightList();
        m_lightsDirty = false;
    }
}

// ------------------------------------------------------------
// UI -> Editor
// ------------------------------------------------------------

void LightsPanel::pushToEditor()
{
    if (!m_editor)
        return;

    // Start from the live config so fields without a widget survive.
    EditorConfig cfg = m_editor->config();

    cfg.create.lightType = static_cast<LightType>(m_typeCombo->currentData().toInt());
    cfg.create.side      = static_cast<PlacementSide>(m_sideCombo->currentData().toInt());
    cfg.create.distance  = static_cast<float>(m_distanceSpin->value());

    cfg.ambient.color     = m_ambientColor;
    cfg.ambient.intensity = static_cast<float>(m_ambientSpin->value());

    cfg.material.roughness = m_roughSlider->value() / 100.0f;
    cfg.material.metalness = m_metalSlider->value() / 100.0f;

    cfg.sizes.exportSize  = m_exportSize->value();
    cfg.sizes.exportRatio = static_cast<float>(m_exportRatio->value());

    const QString path = m_exportPath->text().trimmed();
    if (!path.isEmpty())
        cfg.exportPath = path.toStdString();

    m_editor->applyConfig(cfg);
}

// ------------------------------------------------------------
// Editor -> UI
// ------------------------------------------------------------

void LightsPanel::pullFromEditor()
{
    if (!m_editor)
        return;

    const EditorConfig& cfg = m_editor->config();

    m_blockUi = true;

    m_typeCombo->setCurrentIndex(m_typeCombo->findData(static_cast<int>(cfg.create.lightType)));
    m_sideCombo->setCurrentIndex(m_sideCombo->findData(static_cast<int>(cfg.create.side)));
    m_distanceSpin->setValue(cfg.create.distance);

    m_ambientColor = cfg.ambient.color;
    set_swatch(m_ambientButton, m_ambientColor);
    m_ambientSpin->setValue(cfg.ambient.intensity);

    m_roughSlider->setValue(static_cast<int>(cfg.material.roughness * 100.0f + 0.5f));
    m_metalSlider->setValue(static_cast<int>(cfg.material.metalness * 100.0f + 0.5f));

    m_exportSize->setValue(cfg.sizes.exportSize);
    m_exportRatio->setValue(cfg.sizes.exportRatio);
    m_exportPath->setText(QString::fromStdString(cfg.exportPath.string()));

    m_blockUi = false;
}

void LightsPanel::rebuildLightList()
{
    if (!m_editor)
        return;

    const LightId selected = selectedLight();

    m_blockUi = true;
    {
        QSignalBlocker blocker(m_lightList);
        m_lightList->clear();

        for (const LightRecord* rec : m_editor->records())
        {
            auto* item = new QListWidgetItem(light_label(*rec), m_lightList);
            item->setData(Qt::UserRole, rec->lightId);

            if (rec->lightId == selected)
                item->setSelected(true);
        }
    }
    m_blockUi = false;

    syncSelection();
}

void LightsPanel::syncSelection()
{
    const LightId      id  = selectedLight();
    const LightRecord* rec = (m_editor && id != kInvalidLightId) ? m_editor->record(id) : nullptr;

    m_blockUi = true;
    m_lightDistance->setEnabled(rec != nullptr);
    m_deleteButton->setEnabled(rec != nullptr);
    if (rec)
        m_lightDistance->setValue(rec->distance);
    m_blockUi = false;
}

LightId LightsPanel::selectedLight() const
{
    const QList<QListWidgetItem*> items = m_lightList->selectedItems();
    if (items.isEmpty())
        return kInvalidLightId;
    return static_cast<LightId>(items.front()->data(Qt::UserRole).toInt());
}

// ------------------------------------------------------------
// Preview / dialogs
// ------------------------------------------------------------

void LightsPanel::setPreview(const EncodedImage& image)
{
    QPixmap pm;
    if (!pm.loadFromData(image.bytes.data(), static_cast<uint>(image.bytes.size()), "PNG"))
    {
        qWarning() << "LightsPanel: preview" << image.requestId << "is not a valid PNG";
        return;
    }

    m_preview->setPixmap(pm.scaled(m_preview->size(), Qt::KeepAspectRatio, Qt::SmoothTransformation));
}

void LightsPanel::pickAmbientColor()
{
    const QColor c = QColorDialog::getColor(to_qcolor(m_ambientColor), this, tr("Ambient color"));
    if (!c.isValid())
        return;

    m_ambientColor = glm::vec3(c.redF(), c.greenF(), c.blueF());
    set_swatch(m_ambientButton, m_ambientColor);
    pushToEditor();
}

void LightsPanel::browseExportPath()
{
    const QString path = QFileDialog::getSaveFileName(this, tr("Export matcap"), m_exportPath->text(), tr("PNG images (*.png)"));
    if (path.isEmpty())
        return;

    m_exportPath->setText(path);
    pushToEditor();
}
