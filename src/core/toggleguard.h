// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "topnote_export.h"
#include <atomic>
#include <optional>

namespace TopNote {

/**
 * @brief Single-flight flag for toggle sequences
 *
 * At most one toggle runs at any time. A trigger that finds the guard held
 * is dropped, not queued. The flag is only reachable through Lease, so every
 * exit path of a sequence (including dropped continuations) releases it.
 *
 * Usage:
 *   if (auto lease = guard.tryAcquire()) {
 *       // ... sequence owns the guard until lease is released or destroyed
 *   }
 */
class TOPNOTE_EXPORT ToggleGuard
{
public:
    /**
     * @brief Move-only ownership of an acquired guard
     */
    class TOPNOTE_EXPORT Lease
    {
    public:
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        /**
         * @brief Release the guard now; later calls and the destructor are no-ops
         */
        void release();

        bool isActive() const
        {
            return m_guard != nullptr;
        }

    private:
        friend class ToggleGuard;
        explicit Lease(ToggleGuard* guard)
            : m_guard(guard)
        {
        }

        ToggleGuard* m_guard = nullptr;
    };

    ToggleGuard() = default;
    ToggleGuard(const ToggleGuard&) = delete;
    ToggleGuard& operator=(const ToggleGuard&) = delete;

    /**
     * @brief Compare-and-swap false -> true
     * @return A lease on success, std::nullopt if a sequence is already in flight
     */
    std::optional<Lease> tryAcquire();

    bool isHeld() const
    {
        return m_held.load(std::memory_order_acquire);
    }

private:
    void release();

    std::atomic<bool> m_held{false};
};

} // namespace TopNote
