// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notesadaptor.h"
#include "../app/notesession.h"
#include "../core/logging.h"

namespace TopNote {

NotesAdaptor::NotesAdaptor(NoteSession* session, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_session(session)
{
    Q_ASSERT(session);

    connect(m_session, &NoteSession::saved, this, &NotesAdaptor::noteSaved);
}

QString NotesAdaptor::saveNote(const QString& content)
{
    const QString error = m_session->saveNow(content);
    if (!error.isEmpty()) {
        qCWarning(lcDbus) << "saveNote failed:" << error;
    }
    return error;
}

QString NotesAdaptor::loadNote()
{
    // Unsaved edits in the panel win over the file
    return m_session->text();
}

} // namespace TopNote
