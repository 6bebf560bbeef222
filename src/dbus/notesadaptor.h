// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <QDBusAbstractAdaptor>
#include <QString>

namespace TopNote {

class NoteSession;

/**
 * @brief D-Bus adaptor for note persistence
 *
 * Provides D-Bus interface: org.topnote.Notes
 * Goes through NoteSession so the panel shows externally saved text.
 */
class NotesAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.topnote.Notes")

public:
    explicit NotesAdaptor(NoteSession* session, QObject* parent = nullptr);
    ~NotesAdaptor() override = default;

public Q_SLOTS:
    /**
     * @return Empty string on success, the error text otherwise
     */
    QString saveNote(const QString& content);
    QString loadNote();

Q_SIGNALS:
    void noteSaved();

private:
    NoteSession* m_session;
};

} // namespace TopNote
