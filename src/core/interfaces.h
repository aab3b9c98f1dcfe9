// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragoperation.h"
#include "tabdrop_export.h"
#include "types.h"
#include <QObject>
#include <QVector>

namespace TabDrop {

/**
 * @brief The collaborator that owns container membership
 *
 * Receives at most one call per completed drag. It validates the indices
 * against its own live state and performs the move atomically; the engine
 * neither retries nor checks the result.
 *
 * Pure virtual (no QObject) so a host's existing QObject model can implement
 * it without signal shadowing between bases.
 */
class TABDROP_EXPORT ITabOwner
{
public:
    ITabOwner() = default;
    virtual ~ITabOwner();

    virtual void applyDragOperation(const DragOperation& operation) = 0;
};

/**
 * @brief Window enumeration for screen-to-window resolution
 */
class TABDROP_EXPORT IWindowProvider
{
public:
    IWindowProvider() = default;
    virtual ~IWindowProvider();

    /// Visible windows with their screen frames, frontmost first
    virtual QVector<WindowInfo> visibleWindows() const = 0;
};

/**
 * @brief Settings consumed by the drag engine
 *
 * Settings implements this from tabdroprc. Tests and embedders can supply
 * their own.
 */
class TABDROP_EXPORT IDragSettings : public QObject
{
    Q_OBJECT

public:
    explicit IDragSettings(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~IDragSettings() override;

    // Drag
    virtual int dragThreshold() const = 0;
    virtual int windowEdgeHysteresis() const = 0;

    // Geometry
    virtual qreal cellSize() const = 0;
    virtual qreal cellSpacing() const = 0;
    virtual qreal indicatorThickness() const = 0;
    virtual qreal indicatorInset() const = 0;
    virtual qreal emptyZoneIndicatorFraction() const = 0;

    // Preview
    virtual int previewWidth() const = 0;
    virtual int previewHeight() const = 0;
    virtual bool centerPreviewInSidebar() const = 0;
    virtual bool previewWindowEnabled() const = 0;

    // Feedback
    virtual bool feedbackEnabled() const = 0;

Q_SIGNALS:
    void settingsChanged();
};

} // namespace TabDrop
