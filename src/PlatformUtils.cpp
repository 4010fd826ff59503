
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

#include "PlatformUtils.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStringList>

namespace PlatformUtils {

/**
 * @brief Normalizes a path for consistent comparisons across platforms.
 * @param path Input path to normalize.
 * @return Normalized absolute path using forward slashes.
 */
QString normalizePath(const QString &path)
{
    QString normalized = QDir::fromNativeSeparators(path);
    normalized = QDir(normalized).absolutePath();
#ifdef Q_OS_WIN
    normalized = normalized.toLower();
#endif
    return normalized;
}

/**
 * @brief Tells whether a mount point is where the system mounts external media.
 * @param rootPath Volume root path.
 * @return True for drives other than the system drive on Windows, and for
 *         volumes under the usual removable media mount folders elsewhere.
 */
bool isRemovableMountPoint(const QString &rootPath)
{
    const QString normalized = normalizePath(rootPath);
#ifdef Q_OS_WIN
    const QString systemRoot = normalizePath(QDir::rootPath());
    return !normalized.isEmpty() && normalized != systemRoot;
#else
    static const QStringList mediaRoots = {
        QStringLiteral("/media/"),
        QStringLiteral("/run/media/"),
        QStringLiteral("/mnt/"),
        QStringLiteral("/Volumes/"),
    };
    for (const QString &prefix : mediaRoots) {
        if (normalized.startsWith(prefix) && normalized.size() > prefix.size()) {
            return true;
        }
    }
    return false;
#endif
}

bool isPseudoFileSystem(const QByteArray &fileSystemType)
{
    static const QList<QByteArray> pseudoTypes = {
        QByteArrayLiteral("tmpfs"),
        QByteArrayLiteral("devtmpfs"),
        QByteArrayLiteral("proc"),
        QByteArrayLiteral("sysfs"),
        QByteArrayLiteral("overlay"),
        QByteArrayLiteral("squashfs"),
        QByteArrayLiteral("autofs"),
        QByteArrayLiteral("cgroup2"),
    };
    return pseudoTypes.contains(fileSystemType);
}

/**
 * @brief Deletes a file, bypassing the trash.
 * @param path File path to remove.
 * @param error Optional output error message.
 * @return True if removal succeeds, false otherwise.
 */
bool deletePermanently(const QString &path, QString *error)
{
    if (path.isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Path is empty");
        }
        return false;
    }
    if (!QFileInfo::exists(path)) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Source not found");
        }
        return false;
    }
    QFile file(path);
    if (!file.remove()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Failed to delete: %1").arg(file.errorString());
        }
        return false;
    }
    return true;
}

} // namespace PlatformUtils
