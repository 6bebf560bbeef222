// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "taskscheduler.h"
#include <QTimer>

namespace TopNote {

QtTaskScheduler::QtTaskScheduler(QObject* parent)
    : QObject(parent)
{
    m_clock.start();
}

void QtTaskScheduler::schedule(int delayMs, Task task)
{
    if (!task) {
        return;
    }
    QTimer::singleShot(qMax(0, delayMs), this, std::move(task));
}

qint64 QtTaskScheduler::elapsedMs() const
{
    return m_clock.elapsed();
}

} // namespace TopNote
