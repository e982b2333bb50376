// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "paneldock_export.h"
#include "interfaces.h"
#include <QElapsedTimer>

namespace PanelDock {

/**
 * @brief IScheduler that keeps the Qt event loop running while waiting
 *
 * waitFor() spins a local QEventLoop until a single-shot timer fires, so
 * queued host events (the ones that actually remove a closed window) are
 * delivered during the wait. Must be used from the thread owning the
 * host's event loop.
 */
class PANELDOCK_EXPORT EventLoopScheduler : public IScheduler
{
public:
    EventLoopScheduler();
    ~EventLoopScheduler() override;

    void waitFor(int intervalMs) override;
    qint64 elapsedMs() const override;

private:
    QElapsedTimer m_clock;
};

} // namespace PanelDock
