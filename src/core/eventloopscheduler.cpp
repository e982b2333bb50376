// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "eventloopscheduler.h"
#include <QEventLoop>
#include <QTimer>

namespace PanelDock {

EventLoopScheduler::EventLoopScheduler()
{
    m_clock.start();
}

EventLoopScheduler::~EventLoopScheduler() = default;

void EventLoopScheduler::waitFor(int intervalMs)
{
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(qMax(0, intervalMs));
    loop.exec();
}

qint64 EventLoopScheduler::elapsedMs() const
{
    return m_clock.elapsed();
}

} // namespace PanelDock
