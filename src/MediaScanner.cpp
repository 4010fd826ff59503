
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

#include "MediaScanner.h"

#include <QCoreApplication>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

namespace {

bool checkRoot(const QString &rootPath, QString *error)
{
    const QFileInfo info(rootPath);
    if (rootPath.isEmpty() || !info.exists()) {
        *error = QCoreApplication::translate("MediaScanner", "Path not found");
        return false;
    }
    if (!info.isDir()) {
        *error = QCoreApplication::translate("MediaScanner", "Not a folder");
        return false;
    }
    if (!info.isReadable()) {
        *error = QCoreApplication::translate("MediaScanner", "Permission denied");
        return false;
    }
    return true;
}

MediaFile toMediaFile(const QFileInfo &info)
{
    MediaFile file;
    file.path = info.absoluteFilePath();
    file.name = info.fileName();
    const QString suffix = info.suffix();
    file.extension = suffix.isEmpty() ? QString() : QStringLiteral(".") + suffix;
    file.size = info.size();
    file.lastModified = info.lastModified();
    return file;
}

} // namespace

namespace MediaScanner {

/**
 * @brief Recursively lists media files under a root folder.
 * @param rootPath Folder to scan, typically the root of a volume.
 * @param classifier Classifier holding extension sets and enabled categories.
 * @param log Optional sink for the error line emitted when the tree cannot be read.
 * @return Files whose category is enabled; empty when the root or any folder below it cannot be read.
 */
QVector<MediaFile> scan(const QString &rootPath, const ExtensionClassifier &classifier, const LogCallback &log)
{
    QVector<MediaFile> files;
    QString error;
    if (!checkRoot(rootPath, &error)) {
        if (log) {
            log(QCoreApplication::translate("MediaScanner", "Error scanning %1: %2").arg(rootPath, error));
        }
        return files;
    }
    if (!classifier.hasEnabledCategory()) {
        return files;
    }

    QDirIterator it(rootPath,
                    QDir::Files | QDir::Dirs | QDir::Hidden | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        const QFileInfo info = it.fileInfo();
        if (info.isDir()) {
            if (!info.isSymLink() && !info.isReadable()) {
                if (log) {
                    log(QCoreApplication::translate("MediaScanner", "Error scanning %1: %2")
                            .arg(rootPath, QCoreApplication::translate("MediaScanner", "Permission denied on %1")
                                               .arg(info.filePath())));
                }
                return QVector<MediaFile>();
            }
            continue;
        }
        if (!info.isFile()) {
            continue;
        }
        if (classifier.categoryOf(info.suffix()) == MediaCategory::None) {
            continue;
        }
        files.append(toMediaFile(info));
    }
    return files;
}

bool hasMedia(const QString &rootPath, const ExtensionClassifier &classifier)
{
    return !scan(rootPath, classifier).isEmpty();
}

MediaFile snapshot(const QString &filePath)
{
    return toMediaFile(QFileInfo(filePath));
}

} // namespace MediaScanner
