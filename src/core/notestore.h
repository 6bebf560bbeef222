// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "topnote_export.h"
#include "types.h"
#include <QString>

namespace TopNote {

/**
 * @brief Persists the note text in a single file
 *
 * The file lives in the application data directory unless a directory is
 * given explicitly. A missing file reads as an empty note.
 */
class TOPNOTE_EXPORT NoteStore
{
public:
    struct LoadResult {
        bool success = false;
        QString content;
        QString errorMessage;
    };

    /**
     * @param directory Storage directory; empty = QStandardPaths::AppDataLocation
     */
    explicit NoteStore(const QString& directory = QString());

    OperationResult save(const QString& content) const;
    LoadResult load() const;

    QString directory() const
    {
        return m_directory;
    }
    QString filePath() const;

private:
    QString m_directory;
};

} // namespace TopNote
