// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notestore.h"
#include "constants.h"
#include "logging.h"
#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QStandardPaths>

namespace TopNote {

NoteStore::NoteStore(const QString& directory)
    : m_directory(directory.isEmpty() ? QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) : directory)
{
}

QString NoteStore::filePath() const
{
    return m_directory + QLatin1Char('/') + Defaults::NotesFileName;
}

OperationResult NoteStore::save(const QString& content) const
{
    if (m_directory.isEmpty()) {
        return OperationResult::failure(QStringLiteral("Failed to get app data dir"));
    }

    QDir dir(m_directory);
    if (!dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcNotes) << "Failed to create notes directory:" << m_directory;
        return OperationResult::failure(QStringLiteral("Failed to create app data dir: %1").arg(m_directory));
    }

    const QString path = filePath();
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcNotes) << "Failed to open notes file:" << path << "Error:" << file.errorString();
        return OperationResult::failure(QStringLiteral("Failed to save note: %1").arg(file.errorString()));
    }

    const QByteArray data = content.toUtf8();
    if (file.write(data) != data.size()) {
        qCWarning(lcNotes) << "Failed to write notes file:" << path << "Error:" << file.errorString();
        file.cancelWriting();
        return OperationResult::failure(QStringLiteral("Failed to save note: %1").arg(file.errorString()));
    }

    if (!file.commit()) {
        qCWarning(lcNotes) << "Failed to commit notes file:" << path << "Error:" << file.errorString();
        return OperationResult::failure(QStringLiteral("Failed to save note: %1").arg(file.errorString()));
    }

    qCDebug(lcNotes) << "Saved note," << data.size() << "bytes to" << path;
    return OperationResult::ok();
}

NoteStore::LoadResult NoteStore::load() const
{
    LoadResult result;
    const QString path = filePath();
    QFile file(path);

    if (!file.exists()) {
        qCInfo(lcNotes) << "Notes file does not exist, starting empty:" << path;
        result.success = true;
        return result;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcNotes) << "Failed to open notes file:" << path << "Error:" << file.errorString();
        result.errorMessage = QStringLiteral("Failed to load note: %1").arg(file.errorString());
        return result;
    }

    result.content = QString::fromUtf8(file.readAll());
    result.success = true;
    return result;
}

} // namespace TopNote
