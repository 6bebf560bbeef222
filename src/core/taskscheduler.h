// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "interfaces.h"
#include "topnote_export.h"
#include <QElapsedTimer>
#include <QObject>

namespace TopNote {

/**
 * @brief ITaskScheduler on top of the Qt event loop
 *
 * Each task is a single-shot timer owned by this object. Destroying the
 * scheduler cancels pending tasks and destroys their captures.
 */
class TOPNOTE_EXPORT QtTaskScheduler : public QObject, public ITaskScheduler
{
    Q_OBJECT

public:
    explicit QtTaskScheduler(QObject* parent = nullptr);
    ~QtTaskScheduler() override = default;

    void schedule(int delayMs, Task task) override;
    qint64 elapsedMs() const override;

private:
    QElapsedTimer m_clock;
};

} // namespace TopNote
