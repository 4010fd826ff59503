
/************************************************************************\

    MediaFerry - Camera media transfer tool
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "CopyEngine.h"

#include <QByteArray>
#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>

#include "FileOperationUtils.h"
#include "PlatformUtils.h"
#include "TransferProgress.h"

/**
 * @brief Creates a copy engine.
 * @param progress Shared progress record updated after every buffer write, may be null.
 */
CopyEngine::CopyEngine(TransferProgress *progress)
    : m_progress(progress)
{
}

/**
 * @brief Streams one file to its target through a fixed-size buffer.
 *
 * The target is created or truncated. On any read, write or close failure the
 * partially written target is removed before returning.
 * @param sourcePath File to read.
 * @param targetPath File to create.
 * @param expectedSize Size recorded at scan time; a different byte count is a failure. Negative skips the check.
 * @param result Output bytes copied and elapsed time.
 * @param error Output error message.
 * @return True when the whole source was written and the target closed cleanly.
 */
bool CopyEngine::copyFile(const QString &sourcePath,
                          const QString &targetPath,
                          qint64 expectedSize,
                          CopyResult *result,
                          QString *error)
{
    QElapsedTimer timer;
    timer.start();
    if (m_progress) {
        m_progress->startFileClock();
    }

    QFile source(sourcePath);
    if (!source.open(QIODevice::ReadOnly)) {
        if (m_progress) {
            m_progress->stopFileClock();
        }
        if (error) {
            *error = QCoreApplication::translate("CopyEngine", "Cannot open %1: %2")
                         .arg(QDir::toNativeSeparators(sourcePath), source.errorString());
        }
        return false;
    }

    QFile target(targetPath);
    if (!target.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (m_progress) {
            m_progress->stopFileClock();
        }
        if (error) {
            *error = QCoreApplication::translate("CopyEngine", "Cannot create %1: %2")
                         .arg(QDir::toNativeSeparators(targetPath), target.errorString());
        }
        return false;
    }

    QByteArray buffer(int(bufferSize), Qt::Uninitialized);
    qint64 copied = 0;
    for (;;) {
        const qint64 read = source.read(buffer.data(), bufferSize);
        if (read < 0) {
            const QString message = QCoreApplication::translate("CopyEngine", "Read error on %1: %2")
                                        .arg(QDir::toNativeSeparators(sourcePath), source.errorString());
            target.close();
            return fail(targetPath, message, error);
        }
        if (read == 0) {
            break;
        }
        const qint64 written = target.write(buffer.constData(), read);
        if (written != read) {
            const QString message = QCoreApplication::translate("CopyEngine", "Write error on %1: %2")
                                        .arg(QDir::toNativeSeparators(targetPath), target.errorString());
            target.close();
            return fail(targetPath, message, error);
        }
        copied += written;
        if (m_progress) {
            m_progress->addFileBytes(written);
        }
    }

    source.close();
    if (expectedSize >= 0 && copied != expectedSize) {
        const QString message = QCoreApplication::translate("CopyEngine", "%1 changed during copy: expected %2 bytes, read %3")
                                    .arg(QDir::toNativeSeparators(sourcePath))
                                    .arg(expectedSize)
                                    .arg(copied);
        target.close();
        return fail(targetPath, message, error);
    }
    if (!target.flush()) {
        const QString message = QCoreApplication::translate("CopyEngine", "Write error on %1: %2")
                                    .arg(QDir::toNativeSeparators(targetPath), target.errorString());
        target.close();
        return fail(targetPath, message, error);
    }
    target.close();
    if (target.error() != QFileDevice::NoError) {
        const QString message = QCoreApplication::translate("CopyEngine", "Cannot close %1: %2")
                                    .arg(QDir::toNativeSeparators(targetPath), target.errorString());
        return fail(targetPath, message, error);
    }

    const bool timesPreserved = FileOperationUtils::applyFileTimes(QFileInfo(sourcePath), targetPath);

    if (m_progress) {
        m_progress->stopFileClock();
    }
    if (result) {
        result->bytesCopied = copied;
        result->elapsedMs = timer.elapsed();
        result->timesPreserved = timesPreserved;
    }
    return true;
}

bool CopyEngine::fail(const QString &targetPath, const QString &message, QString *error) const
{
    if (m_progress) {
        m_progress->stopFileClock();
    }
    QString removeError;
    QString fullMessage = message;
    if (QFileInfo::exists(targetPath) && !PlatformUtils::deletePermanently(targetPath, &removeError)) {
        fullMessage += QCoreApplication::translate("CopyEngine", " (partial file left in place: %1)").arg(removeError);
    }
    if (error) {
        *error = fullMessage;
    }
    return false;
}
