// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <QString>
#include <QTimer>

namespace TopNote {

class NoteStore;

/**
 * @brief Note text shown in the panel, with debounced autosave
 *
 * Exposed to QML as "noteSession". Every edit restarts a
 * Defaults::AutosaveDelayMs timer; the note is written once the user stops
 * typing. Save failures are logged and kept in lastError, the text is never
 * discarded.
 */
class NoteSession : public QObject
{
    Q_OBJECT

    Q_PROPERTY(QString text READ text WRITE setText NOTIFY textChanged)
    Q_PROPERTY(bool loading READ isLoading NOTIFY loadingChanged)
    Q_PROPERTY(QString lastError READ lastError NOTIFY lastErrorChanged)

public:
    explicit NoteSession(NoteStore* store, QObject* parent = nullptr);
    ~NoteSession() override;

    QString text() const
    {
        return m_text;
    }
    void setText(const QString& text);

    bool isLoading() const
    {
        return m_loading;
    }

    QString lastError() const
    {
        return m_lastError;
    }

    bool hasPendingChanges() const
    {
        return m_dirty;
    }

    /**
     * @brief Read the note from disk, replacing the current text
     * @return false if the file exists but could not be read
     */
    Q_INVOKABLE bool load();

    /**
     * @brief Write pending edits immediately
     * @return false if the write failed
     */
    Q_INVOKABLE bool flush();

    /**
     * @brief Replace the text from outside the editor and persist it right away
     *
     * Used by the D-Bus surface, which expects a synchronous result.
     * @return Empty string on success, the error text otherwise
     */
    QString saveNow(const QString& text);

Q_SIGNALS:
    void textChanged();
    void loadingChanged();
    void lastErrorChanged();
    void saved();

private:
    bool writeToStore();
    void setLoading(bool loading);
    void setLastError(const QString& error);

    NoteStore* m_store = nullptr;
    QTimer m_autosaveTimer;
    QString m_text;
    QString m_lastError;
    bool m_loading = false;
    bool m_dirty = false;
};

} // namespace TopNote
