
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

#include "TransferLog.h"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>

namespace {
const char lineTimeFormat[] = "yyyy-MM-dd HH:mm:ss";
}

TransferLog::TransferLog(QObject *parent)
    : QObject(parent)
{
}

TransferLog::~TransferLog()
{
    QMutexLocker locker(&m_mutex);
    if (m_file.isOpen()) {
        m_file.close();
    }
}

/**
 * @brief Mirrors every subsequent line to a file, appending to existing content.
 * @param path Log file path; an empty path disables the file copy.
 * @param error Optional output error message.
 * @return True if the file is open for appending, or the file copy was disabled.
 */
bool TransferLog::setLogFilePath(const QString &path, QString *error)
{
    QMutexLocker locker(&m_mutex);
    if (m_file.isOpen()) {
        m_file.close();
    }
    if (path.isEmpty()) {
        return true;
    }
    const QString folder = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(folder)) {
        if (error) {
            *error = tr("Cannot create log folder: %1").arg(QDir::toNativeSeparators(folder));
        }
        return false;
    }
    m_file.setFileName(path);
    if (!m_file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        if (error) {
            *error = tr("Cannot open log file %1: %2").arg(QDir::toNativeSeparators(path), m_file.errorString());
        }
        return false;
    }
    return true;
}

QStringList TransferLog::lines() const
{
    QMutexLocker locker(&m_mutex);
    return m_lines;
}

LogCallback TransferLog::callback()
{
    return [this](const QString &message) { append(message); };
}

QString TransferLog::formatLine(const QDateTime &time, const QString &message)
{
    return QStringLiteral("[%1] %2").arg(time.toString(QLatin1String(lineTimeFormat)), message);
}

/**
 * @brief Timestamps and records a log line. Safe to call from any thread.
 * @param message Line content without timestamp.
 */
void TransferLog::append(const QString &message)
{
    const QString line = formatLine(QDateTime::currentDateTime(), message);
    {
        QMutexLocker locker(&m_mutex);
        m_lines.append(line);
        if (m_file.isOpen()) {
            const QByteArray bytes = line.toUtf8() + '\n';
            if (m_file.write(bytes) != bytes.size() || !m_file.flush()) {
                // Keep the in-memory log going; the file is abandoned.
                m_lines.append(formatLine(QDateTime::currentDateTime(),
                                          tr("Cannot write log file %1: %2")
                                              .arg(QDir::toNativeSeparators(m_file.fileName()), m_file.errorString())));
                m_file.close();
            }
        }
    }
    emit lineAppended(line);
}
