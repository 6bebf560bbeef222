// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <QAction>

namespace TopNote {

class Settings;

/**
 * @brief Registers the overlay toggle hotkey with KGlobalAccel
 *
 * The action is fire-and-forget: triggering it only emits
 * toggleOverlayRequested(), the debouncing lives in ToggleCoordinator.
 * Key presses are delivered on the GUI thread by the kglobalaccel service.
 */
class ShortcutManager : public QObject
{
    Q_OBJECT

public:
    explicit ShortcutManager(Settings* settings, QObject* parent = nullptr);
    ~ShortcutManager() override;

    /**
     * @brief Create the toggle action and register it globally
     * @return false if the global shortcut service rejected the registration
     */
    bool registerShortcuts();

    /**
     * @brief Re-apply the key sequence from settings
     */
    void updateShortcuts();

    /**
     * @brief Remove the global shortcut
     */
    void unregisterShortcuts();

    /**
     * @brief Key sequence currently bound to the toggle action, in portable text form
     */
    QString toggleOverlayShortcutText() const;

Q_SIGNALS:
    /**
     * @brief Emitted every time the toggle hotkey is pressed
     */
    void toggleOverlayRequested();

private Q_SLOTS:
    void onToggleOverlay();
    void updateToggleOverlayShortcut();

private:
    Settings* m_settings = nullptr;

    QAction* m_toggleOverlayAction = nullptr;
};

} // namespace TopNote
