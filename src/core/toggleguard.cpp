// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "toggleguard.h"

#include <utility>

namespace TopNote {

ToggleGuard::Lease::Lease(Lease&& other) noexcept
    : m_guard(std::exchange(other.m_guard, nullptr))
{
}

ToggleGuard::Lease& ToggleGuard::Lease::operator=(Lease&& other) noexcept
{
    if (this != &other) {
        release();
        m_guard = std::exchange(other.m_guard, nullptr);
    }
    return *this;
}

ToggleGuard::Lease::~Lease()
{
    release();
}

void ToggleGuard::Lease::release()
{
    if (auto* guard = std::exchange(m_guard, nullptr)) {
        guard->release();
    }
}

std::optional<ToggleGuard::Lease> ToggleGuard::tryAcquire()
{
    bool expected = false;
    if (!m_held.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return std::nullopt;
    }
    return Lease(this);
}

void ToggleGuard::release()
{
    m_held.store(false, std::memory_order_release);
}

} // namespace TopNote
