// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notesession.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include "../core/notestore.h"

namespace TopNote {

NoteSession::NoteSession(NoteStore* store, QObject* parent)
    : QObject(parent)
    , m_store(store)
{
    Q_ASSERT(store);

    m_autosaveTimer.setSingleShot(true);
    m_autosaveTimer.setInterval(Defaults::AutosaveDelayMs);
    connect(&m_autosaveTimer, &QTimer::timeout, this, [this]() {
        writeToStore();
    });
}

NoteSession::~NoteSession() = default;

void NoteSession::setText(const QString& text)
{
    if (m_text == text) {
        return;
    }
    m_text = text;
    Q_EMIT textChanged();

    // Loading assigns the text too; that is not an edit
    if (!m_loading) {
        m_dirty = true;
        m_autosaveTimer.start();
    }
}

bool NoteSession::load()
{
    setLoading(true);

    const NoteStore::LoadResult result = m_store->load();
    if (!result.success) {
        qCWarning(lcNotes) << "Failed to load note:" << result.errorMessage;
        setLastError(result.errorMessage);
        setLoading(false);
        return false;
    }

    setText(result.content);
    m_dirty = false;
    setLastError(QString());
    setLoading(false);
    qCDebug(lcNotes) << "Loaded note," << result.content.size() << "characters";
    return true;
}

bool NoteSession::flush()
{
    if (!m_dirty) {
        return true;
    }
    m_autosaveTimer.stop();
    return writeToStore();
}

QString NoteSession::saveNow(const QString& text)
{
    m_autosaveTimer.stop();
    if (m_text != text) {
        m_text = text;
        Q_EMIT textChanged();
    }
    m_dirty = true;
    writeToStore();
    return m_lastError;
}

bool NoteSession::writeToStore()
{
    const OperationResult result = m_store->save(m_text);
    if (!result) {
        qCDebug(lcNotes) << "Keeping unsaved edits after failed write";
        setLastError(result.errorMessage);
        return false;
    }

    m_dirty = false;
    setLastError(QString());
    Q_EMIT saved();
    return true;
}

void NoteSession::setLoading(bool loading)
{
    if (m_loading != loading) {
        m_loading = loading;
        Q_EMIT loadingChanged();
    }
}

void NoteSession::setLastError(const QString& error)
{
    if (m_lastError != error) {
        m_lastError = error;
        Q_EMIT lastErrorChanged();
    }
}

} // namespace TopNote
