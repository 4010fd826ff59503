
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

#include "FileOperationUtils.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QIODevice>
#include <QRegularExpression>

namespace FileOperationUtils {

/**
 * @brief Copies modification and birth times from a source file to a target file.
 * @param sourceInfo Source file information.
 * @param targetPath Target file path.
 * @return True if the modification time was applied.
 */
bool applyFileTimes(const QFileInfo &sourceInfo, const QString &targetPath)
{
    QFile targetFile(targetPath);
    if (!targetFile.open(QIODevice::ReadWrite)) {
        return false;
    }
    const bool ok = targetFile.setFileTime(sourceInfo.lastModified(), QFileDevice::FileModificationTime);
    const QDateTime birthTime = sourceInfo.birthTime();
    if (birthTime.isValid()) {
        targetFile.setFileTime(birthTime, QFileDevice::FileBirthTime);
    }
    targetFile.close();
    return ok;
}

bool ensureFolder(const QString &path, const char *context, QString *error)
{
    const QFileInfo info(path);
    if (info.isDir()) {
        return true;
    }
    if (info.exists()) {
        if (error) {
            *error = QCoreApplication::translate(context, "Target exists and is not a folder: %1")
                         .arg(QDir::toNativeSeparators(path));
        }
        return false;
    }
    if (!QDir().mkpath(path)) {
        if (error) {
            *error = QCoreApplication::translate(context, "Cannot create target folder: %1")
                         .arg(QDir::toNativeSeparators(path));
        }
        return false;
    }
    return true;
}

/**
 * @brief Returns a path inside a folder that does not collide with an existing entry.
 * @param folder Target folder.
 * @param fileName Preferred file name.
 * @return folder/fileName, or folder/"base (N).ext" when that name is taken.
 */
QString uniqueTargetPath(const QString &folder, const QString &fileName)
{
    const QDir dir(folder);
    QString candidate = dir.filePath(fileName);
    if (!QFileInfo::exists(candidate)) {
        return candidate;
    }
    const QFileInfo info(fileName);
    const QString base = info.completeBaseName();
    const QString suffix = info.suffix();
    for (int attempt = 2;; ++attempt) {
        QString name = QStringLiteral("%1 (%2)").arg(base).arg(attempt);
        if (!suffix.isEmpty()) {
            name += QLatin1Char('.') + suffix;
        }
        candidate = dir.filePath(name);
        if (!QFileInfo::exists(candidate)) {
            return candidate;
        }
    }
}

/**
 * @brief Reverses the renaming done by uniqueTargetPath.
 *
 * "IMG_0001 (2).JPG" gives "IMG_0001.JPG". Names without a " (N)" marker
 * before the last suffix are returned unchanged.
 */
QString stripCollisionSuffix(const QString &fileName)
{
    static const QRegularExpression pattern(QStringLiteral("^(.+) \\((\\d+)\\)(\\.[^.]*)?$"));
    const QRegularExpressionMatch match = pattern.match(fileName);
    if (!match.hasMatch() || match.captured(2).toInt() < 2) {
        return fileName;
    }
    return match.captured(1) + match.captured(3);
}

} // namespace FileOperationUtils
