// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <memory>

class QQmlEngine;
class QQuickWindow;

namespace TopNote {

class IWindowOverlayDriver;
class NoteSession;
class NoteStore;
class NotesAdaptor;
class OverlayAdaptor;
class OverlayController;
class OverlayEnforcer;
class OverlayPlacer;
class OverlayStateStore;
class QtTaskScheduler;
class Settings;
class ShortcutManager;
class ToggleCoordinator;

/**
 * @brief Owns and wires every TopNote component
 *
 * init() builds the panel and fails if any of the hard requirements is
 * missing: the QML panel, a supported display server, the overlay
 * conversion, the global hotkey and the session bus. start() and stop()
 * bracket the event loop.
 *
 * Note: This class does NOT use the singleton pattern.
 */
class Application : public QObject
{
    Q_OBJECT

public:
    explicit Application(QObject* parent = nullptr);
    ~Application() override;

    bool init();
    void start();
    void stop();

    bool isRunning() const
    {
        return m_running;
    }

    OverlayController* overlayController() const
    {
        return m_overlayController.get();
    }

private:
    bool createPanel();
    bool registerDBus();

    std::unique_ptr<Settings> m_settings;

    // Notes
    std::unique_ptr<NoteStore> m_noteStore;
    std::unique_ptr<NoteSession> m_noteSession;

    // Panel window, destroyed before the engine that created it
    std::unique_ptr<QQmlEngine> m_engine;
    std::unique_ptr<QQuickWindow> m_panel;

    // Overlay
    std::unique_ptr<IWindowOverlayDriver> m_driver;
    std::unique_ptr<QtTaskScheduler> m_scheduler;
    std::unique_ptr<OverlayStateStore> m_overlayState;
    std::unique_ptr<OverlayEnforcer> m_enforcer;
    std::unique_ptr<OverlayPlacer> m_placer;
    std::unique_ptr<ToggleCoordinator> m_toggleCoordinator;
    std::unique_ptr<OverlayController> m_overlayController;

    std::unique_ptr<ShortcutManager> m_shortcutManager;

    // D-Bus adaptors (owned by this via QObject parent)
    OverlayAdaptor* m_overlayAdaptor = nullptr;
    NotesAdaptor* m_notesAdaptor = nullptr;

    bool m_running = false;
};

} // namespace TopNote
