// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "app/notesession.h"
#include "core/constants.h"
#include "core/notestore.h"

using namespace TopNote;

/**
 * @brief Unit tests for NoteSession autosave
 *
 * Tests cover:
 * - Loading does not count as an edit
 * - Edits are saved once, after the autosave delay
 * - Rapid edits coalesce into one write
 * - flush() writes pending edits immediately
 * - saveNow() for external callers
 * - Write failures keep the text and expose lastError
 */
class TestNoteSession : public QObject
{
    Q_OBJECT

private Q_SLOTS:

    void test_load_isNotAnEdit()
    {
        QTemporaryDir dir;
        NoteStore store(dir.path());
        QVERIFY(store.save(QStringLiteral("existing")).success);

        NoteSession session(&store);
        QSignalSpy savedSpy(&session, &NoteSession::saved);
        QSignalSpy loadingSpy(&session, &NoteSession::loadingChanged);

        QVERIFY(session.load());
        QCOMPARE(session.text(), QStringLiteral("existing"));
        QVERIFY(!session.isLoading());
        QVERIFY(!session.hasPendingChanges());
        QCOMPARE(loadingSpy.count(), 2);

        QTest::qWait(Defaults::AutosaveDelayMs + 100);
        QCOMPARE(savedSpy.count(), 0);
    }

    void test_edit_autosavesAfterDelay()
    {
        QTemporaryDir dir;
        NoteStore store(dir.path());
        NoteSession session(&store);
        QSignalSpy savedSpy(&session, &NoteSession::saved);

        session.setText(QStringLiteral("draft"));
        QVERIFY(session.hasPendingChanges());
        QCOMPARE(savedSpy.count(), 0);

        QVERIFY(savedSpy.wait(Defaults::AutosaveDelayMs * 4));
        QCOMPARE(store.load().content, QStringLiteral("draft"));
        QVERIFY(!session.hasPendingChanges());
    }

    void test_rapidEdits_coalesce()
    {
        QTemporaryDir dir;
        NoteStore store(dir.path());
        NoteSession session(&store);
        QSignalSpy savedSpy(&session, &NoteSession::saved);

        session.setText(QStringLiteral("a"));
        session.setText(QStringLiteral("ab"));
        session.setText(QStringLiteral("abc"));

        QVERIFY(savedSpy.wait(Defaults::AutosaveDelayMs * 4));
        QTest::qWait(Defaults::AutosaveDelayMs);
        QCOMPARE(savedSpy.count(), 1);
        QCOMPARE(store.load().content, QStringLiteral("abc"));
    }

    void test_flush_writesImmediately()
    {
        QTemporaryDir dir;
        NoteStore store(dir.path());
        NoteSession session(&store);

        session.setText(QStringLiteral("urgent"));
        QVERIFY(session.flush());
        QCOMPARE(store.load().content, QStringLiteral("urgent"));

        // Nothing left for the timer
        QSignalSpy savedSpy(&session, &NoteSession::saved);
        QTest::qWait(Defaults::AutosaveDelayMs + 100);
        QCOMPARE(savedSpy.count(), 0);
    }

    void test_flush_withoutEdits_isNoop()
    {
        QTemporaryDir dir;
        NoteStore store(dir.path());
        NoteSession session(&store);
        QSignalSpy savedSpy(&session, &NoteSession::saved);

        QVERIFY(session.flush());
        QCOMPARE(savedSpy.count(), 0);
    }

    void test_saveNow_updatesText()
    {
        QTemporaryDir dir;
        NoteStore store(dir.path());
        NoteSession session(&store);
        QSignalSpy textSpy(&session, &NoteSession::textChanged);

        QVERIFY(session.saveNow(QStringLiteral("from outside")).isEmpty());
        QCOMPARE(session.text(), QStringLiteral("from outside"));
        QCOMPARE(textSpy.count(), 1);
        QCOMPARE(store.load().content, QStringLiteral("from outside"));
    }

    void test_writeFailure_keepsText()
    {
        QTemporaryDir dir;
        const QString blocker = dir.filePath(QStringLiteral("blocker"));
        QFile file(blocker);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.close();

        NoteStore store(blocker);
        NoteSession session(&store);
        QSignalSpy errorSpy(&session, &NoteSession::lastErrorChanged);

        session.setText(QStringLiteral("precious"));
        QVERIFY(!session.flush());
        QCOMPARE(session.text(), QStringLiteral("precious"));
        QVERIFY(session.hasPendingChanges());
        QVERIFY(!session.lastError().isEmpty());
        QCOMPARE(errorSpy.count(), 1);

        QVERIFY(!session.saveNow(QStringLiteral("still precious")).isEmpty());
    }
};

QTEST_MAIN(TestNoteSession)
#include "test_note_session.moc"
