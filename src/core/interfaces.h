// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "paneldock_export.h"
#include "types.h"
#include <QList>
#include <QString>
#include <QVariant>

namespace PanelDock {

/**
 * @brief Abstract interface to the windowing host
 *
 * PanelDock never creates or destroys windows itself. Everything it knows
 * about windows, and every change it makes to them, goes through this
 * interface. The host is expected to serialize all calls on its UI thread.
 *
 * This is a pure abstract interface (no QObject) so that host bindings and
 * test fakes can implement it without signal shadowing issues.
 *
 * Window lifecycle on the host may be asynchronous: a window asked to close
 * can stay in windowsInView() for several event loop turns.
 */
class PANELDOCK_EXPORT IWindowHost
{
public:
    IWindowHost() = default;
    virtual ~IWindowHost();

    // ═══════════════════════════════════════════════════════════════════════════
    // Enumeration and focus
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Windows of the current view, in host enumeration order
     *
     * The order is significant: when several windows match a panel predicate,
     * the first one in this list is the panel's window.
     */
    virtual QList<WindowHandle> windowsInView() const = 0;
    virtual bool isWindowValid(WindowHandle window) const = 0;

    virtual WindowHandle currentWindow() const = 0;
    virtual void setCurrentWindow(WindowHandle window) = 0;

    /// Move focus to the previously focused window
    virtual void focusPreviousWindow() = 0;

    // ═══════════════════════════════════════════════════════════════════════════
    // Geometry
    // ═══════════════════════════════════════════════════════════════════════════

    virtual int windowWidth(WindowHandle window) const = 0;
    virtual int windowHeight(WindowHandle window) const = 0;
    virtual void setWindowWidth(WindowHandle window, int width) = 0;
    virtual void setWindowHeight(WindowHandle window, int height) = 0;

    /// Total columns of the editing surface
    virtual int totalColumns() const = 0;
    /// Total lines of the editing surface
    virtual int totalLines() const = 0;

    /**
     * @brief Move a window so it occupies the full extent of an edge
     *
     * Some hosts implement this on the focused window only; callers focus
     * the window first.
     */
    virtual void moveWindowToEdge(WindowHandle window, Edge edge) = 0;

    // ═══════════════════════════════════════════════════════════════════════════
    // Commands
    // ═══════════════════════════════════════════════════════════════════════════

    virtual void closeWindow(WindowHandle window) = 0;

    /// Run a host command verbatim (panel open/close commands)
    virtual void executeCommand(const QString& command) = 0;

    // ═══════════════════════════════════════════════════════════════════════════
    // Options and content
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Set a window-scoped option
     * @return false if the option does not exist for windows or the value is rejected
     */
    virtual bool setWindowOption(WindowHandle window, const QString& name, const QVariant& value) = 0;

    /**
     * @brief Set an option on the content shown in a window
     * @return false if the option does not exist for content or the value is rejected
     */
    virtual bool setContentOption(WindowHandle window, const QString& name, const QVariant& value) = 0;

    /// Type tag of the content shown in a window (e.g. "filetree", "help")
    virtual QString contentType(WindowHandle window) const = 0;
    /// Name of the content shown in a window
    virtual QString contentName(WindowHandle window) const = 0;

    virtual bool hasKeyMapping(WindowHandle window, const QString& key) const = 0;
    virtual void setKeyMapping(WindowHandle window, const QString& key, const QString& action) = 0;

    // ═══════════════════════════════════════════════════════════════════════════
    // Viewport preservation
    // ═══════════════════════════════════════════════════════════════════════════

    virtual ViewState saveView(WindowHandle window) const = 0;
    virtual void restoreView(WindowHandle window, const ViewState& state) = 0;

    /**
     * @brief Whether the host keeps viewports stable across splits by itself
     *
     * When true, view snapshots are skipped entirely.
     */
    virtual bool hasStableViewports() const = 0;

    // ═══════════════════════════════════════════════════════════════════════════
    // Views (tab pages)
    // ═══════════════════════════════════════════════════════════════════════════

    virtual int viewCount() const = 0;
    virtual void closeCurrentView() = 0;
    virtual void quit() = 0;
};

/**
 * @brief Cooperative wait primitive used while polling for closes
 *
 * waitFor() must hand control back to the host's event loop instead of
 * blocking the thread, since some panels close across several event loop
 * turns. Tests inject an implementation that advances instantly.
 */
class PANELDOCK_EXPORT IScheduler
{
public:
    IScheduler() = default;
    virtual ~IScheduler();

    /// Yield to the host for roughly @p intervalMs milliseconds
    virtual void waitFor(int intervalMs) = 0;

    /// Monotonic milliseconds, used to bound waits
    virtual qint64 elapsedMs() const = 0;
};

} // namespace PanelDock
