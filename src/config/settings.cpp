// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/logging.h"
#include <KConfig>
#include <KConfigGroup>
#include <KSharedConfig>

#include <QStringList>

#include <cmath>

namespace TabDrop {

// ═══════════════════════════════════════════════════════════════════════════════
// Macros for setter patterns
// ═══════════════════════════════════════════════════════════════════════════════

// Simple setter: if changed, update member, emit specific signal, emit settingsChanged
#define SETTINGS_SETTER(Type, name, member, signal) \
    void Settings::set##name(Type value) \
    { \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

// Clamped setter: clamp value, then apply if changed
#define SETTINGS_SETTER_CLAMPED(Type, name, member, signal, minVal, maxVal) \
    void Settings::set##name(Type value) \
    { \
        value = qBound(minVal, value, maxVal); \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

namespace {
const QString ConfigFileName = QStringLiteral("tabdroprc");

const QString DragGroup = QStringLiteral("Drag");
const QString GeometryGroup = QStringLiteral("Geometry");
const QString PreviewGroup = QStringLiteral("Preview");
const QString FeedbackGroup = QStringLiteral("Feedback");
} // anonymous namespace

Settings::Settings(QObject* parent)
    : Settings(KSharedConfig::openConfig(ConfigFileName), parent)
{
}

Settings::Settings(KSharedConfig::Ptr config, QObject* parent)
    : IDragSettings(parent)
    , m_config(std::move(config))
{
    load();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═══════════════════════════════════════════════════════════════════════════════

int Settings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                               const char* settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

qreal Settings::readValidatedReal(const KConfigGroup& group, const char* key, qreal defaultValue, qreal min,
                                  qreal max, const char* settingName)
{
    qreal value = group.readEntry(QLatin1String(key), defaultValue);
    if (!std::isfinite(value) || value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Setters
// ═══════════════════════════════════════════════════════════════════════════════

SETTINGS_SETTER_CLAMPED(int, DragThreshold, m_dragThreshold, dragThresholdChanged, ConfigDefaults::dragThresholdMin(),
                        ConfigDefaults::dragThresholdMax())
SETTINGS_SETTER_CLAMPED(int, WindowEdgeHysteresis, m_windowEdgeHysteresis, windowEdgeHysteresisChanged,
                        ConfigDefaults::windowEdgeHysteresisMin(), ConfigDefaults::windowEdgeHysteresisMax())
SETTINGS_SETTER_CLAMPED(qreal, CellSize, m_cellSize, cellSizeChanged, ConfigDefaults::cellSizeMin(),
                        ConfigDefaults::cellSizeMax())
SETTINGS_SETTER_CLAMPED(qreal, CellSpacing, m_cellSpacing, cellSpacingChanged, ConfigDefaults::cellSpacingMin(),
                        ConfigDefaults::cellSpacingMax())
SETTINGS_SETTER_CLAMPED(qreal, IndicatorThickness, m_indicatorThickness, indicatorThicknessChanged,
                        ConfigDefaults::indicatorThicknessMin(), ConfigDefaults::indicatorThicknessMax())
SETTINGS_SETTER_CLAMPED(qreal, IndicatorInset, m_indicatorInset, indicatorInsetChanged,
                        ConfigDefaults::indicatorInsetMin(), ConfigDefaults::indicatorInsetMax())
SETTINGS_SETTER_CLAMPED(qreal, EmptyZoneIndicatorFraction, m_emptyZoneIndicatorFraction,
                        emptyZoneIndicatorFractionChanged, ConfigDefaults::emptyZoneIndicatorFractionMin(),
                        ConfigDefaults::emptyZoneIndicatorFractionMax())
SETTINGS_SETTER_CLAMPED(int, PreviewWidth, m_previewWidth, previewWidthChanged, ConfigDefaults::previewSizeMin(),
                        ConfigDefaults::previewSizeMax())
SETTINGS_SETTER_CLAMPED(int, PreviewHeight, m_previewHeight, previewHeightChanged, ConfigDefaults::previewSizeMin(),
                        ConfigDefaults::previewSizeMax())
SETTINGS_SETTER(bool, CenterPreviewInSidebar, m_centerPreviewInSidebar, centerPreviewInSidebarChanged)
SETTINGS_SETTER(bool, PreviewWindowEnabled, m_previewWindowEnabled, previewWindowEnabledChanged)
SETTINGS_SETTER(bool, FeedbackEnabled, m_feedbackEnabled, feedbackEnabledChanged)

// ═══════════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════════

void Settings::load()
{
    // Pick up changes written by other processes since the config was opened
    m_config->reparseConfiguration();

    KConfigGroup drag = m_config->group(DragGroup);
    KConfigGroup geometry = m_config->group(GeometryGroup);
    KConfigGroup preview = m_config->group(PreviewGroup);
    KConfigGroup feedback = m_config->group(FeedbackGroup);

    // Drag
    m_dragThreshold = readValidatedInt(drag, "Threshold", ConfigDefaults::dragThreshold(),
                                       ConfigDefaults::dragThresholdMin(), ConfigDefaults::dragThresholdMax(),
                                       "drag threshold");
    m_windowEdgeHysteresis = readValidatedInt(drag, "WindowEdgeHysteresis", ConfigDefaults::windowEdgeHysteresis(),
                                              ConfigDefaults::windowEdgeHysteresisMin(),
                                              ConfigDefaults::windowEdgeHysteresisMax(), "window edge hysteresis");

    // Geometry
    m_cellSize = readValidatedReal(geometry, "CellSize", ConfigDefaults::cellSize(), ConfigDefaults::cellSizeMin(),
                                   ConfigDefaults::cellSizeMax(), "cell size");
    m_cellSpacing = readValidatedReal(geometry, "CellSpacing", ConfigDefaults::cellSpacing(),
                                      ConfigDefaults::cellSpacingMin(), ConfigDefaults::cellSpacingMax(),
                                      "cell spacing");
    m_indicatorThickness = readValidatedReal(geometry, "IndicatorThickness", ConfigDefaults::indicatorThickness(),
                                             ConfigDefaults::indicatorThicknessMin(),
                                             ConfigDefaults::indicatorThicknessMax(), "indicator thickness");
    m_indicatorInset = readValidatedReal(geometry, "IndicatorInset", ConfigDefaults::indicatorInset(),
                                         ConfigDefaults::indicatorInsetMin(), ConfigDefaults::indicatorInsetMax(),
                                         "indicator inset");
    m_emptyZoneIndicatorFraction =
        readValidatedReal(geometry, "EmptyZoneIndicatorFraction", ConfigDefaults::emptyZoneIndicatorFraction(),
                          ConfigDefaults::emptyZoneIndicatorFractionMin(),
                          ConfigDefaults::emptyZoneIndicatorFractionMax(), "empty zone indicator fraction");

    // Preview
    m_previewWidth = readValidatedInt(preview, "Width", ConfigDefaults::previewWidth(),
                                      ConfigDefaults::previewSizeMin(), ConfigDefaults::previewSizeMax(),
                                      "preview width");
    m_previewHeight = readValidatedInt(preview, "Height", ConfigDefaults::previewHeight(),
                                       ConfigDefaults::previewSizeMin(), ConfigDefaults::previewSizeMax(),
                                       "preview height");
    m_centerPreviewInSidebar =
        preview.readEntry(QLatin1String("CenterInSidebar"), ConfigDefaults::centerPreviewInSidebar());
    m_previewWindowEnabled = preview.readEntry(QLatin1String("WindowEnabled"), ConfigDefaults::previewWindowEnabled());

    // Feedback
    m_feedbackEnabled = feedback.readEntry(QLatin1String("Enabled"), ConfigDefaults::feedbackEnabled());

    qCInfo(lcConfig) << "Settings loaded: threshold" << m_dragThreshold << "cell" << m_cellSize << "+"
                     << m_cellSpacing << "preview" << m_previewWidth << "x" << m_previewHeight;

    Q_EMIT settingsChanged();
}

void Settings::save()
{
    KConfigGroup drag = m_config->group(DragGroup);
    KConfigGroup geometry = m_config->group(GeometryGroup);
    KConfigGroup preview = m_config->group(PreviewGroup);
    KConfigGroup feedback = m_config->group(FeedbackGroup);

    // Drag
    drag.writeEntry(QLatin1String("Threshold"), m_dragThreshold);
    drag.writeEntry(QLatin1String("WindowEdgeHysteresis"), m_windowEdgeHysteresis);

    // Geometry
    geometry.writeEntry(QLatin1String("CellSize"), m_cellSize);
    geometry.writeEntry(QLatin1String("CellSpacing"), m_cellSpacing);
    geometry.writeEntry(QLatin1String("IndicatorThickness"), m_indicatorThickness);
    geometry.writeEntry(QLatin1String("IndicatorInset"), m_indicatorInset);
    geometry.writeEntry(QLatin1String("EmptyZoneIndicatorFraction"), m_emptyZoneIndicatorFraction);

    // Preview
    preview.writeEntry(QLatin1String("Width"), m_previewWidth);
    preview.writeEntry(QLatin1String("Height"), m_previewHeight);
    preview.writeEntry(QLatin1String("CenterInSidebar"), m_centerPreviewInSidebar);
    preview.writeEntry(QLatin1String("WindowEnabled"), m_previewWindowEnabled);

    // Feedback
    feedback.writeEntry(QLatin1String("Enabled"), m_feedbackEnabled);

    if (!m_config->sync()) {
        qCWarning(lcConfig) << "Failed to write settings to" << m_config->name();
    }
}

void Settings::reset()
{
    // Clear all config groups and reload with defaults
    const QStringList groups = {DragGroup, GeometryGroup, PreviewGroup, FeedbackGroup};
    for (const QString& groupName : groups) {
        m_config->deleteGroup(groupName);
    }
    if (!m_config->sync()) {
        qCWarning(lcConfig) << "Failed to write settings to" << m_config->name();
    }

    load();
    qCInfo(lcConfig) << "Settings reset to defaults";
}

} // namespace TabDrop
