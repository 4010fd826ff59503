
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

#include "DestinationIndex.h"

#include <QCoreApplication>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

#include "FileOperationUtils.h"

namespace {
const char transferredMediaFolder[] = "TransferredMedia";
} // namespace

QString DestinationIndex::archiveFolderName()
{
    return QLatin1String(transferredMediaFolder);
}

QString DestinationIndex::archivePath(const QString &destinationRoot)
{
    return QDir(destinationRoot).filePath(archiveFolderName());
}

/**
 * @brief Indexes every file already stored in the destination archive.
 *
 * All session folders are scanned, whatever the file category. A missing
 * archive folder is the first-run case and yields an empty index. A folder
 * that cannot be read anywhere in the archive is logged and also yields an
 * empty index.
 * @param destinationRoot Root of the destination volume.
 * @param log Optional sink for the summary line and for read errors.
 * @return Index keyed by file name and size.
 */
DestinationIndex DestinationIndex::build(const QString &destinationRoot, const LogCallback &log)
{
    DestinationIndex index;
    const QString path = archivePath(destinationRoot);
    const QFileInfo info(path);
    if (!info.exists()) {
        return index;
    }
    if (!info.isDir() || !info.isReadable()) {
        if (log) {
            log(QCoreApplication::translate("DestinationIndex", "Error indexing existing files: cannot read %1")
                    .arg(QDir::toNativeSeparators(path)));
        }
        return index;
    }

    int fileCount = 0;
    QDirIterator it(path, QDir::Files | QDir::Dirs | QDir::Hidden | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        const QFileInfo entry = it.fileInfo();
        if (entry.isDir()) {
            if (!entry.isSymLink() && !entry.isReadable()) {
                if (log) {
                    log(QCoreApplication::translate("DestinationIndex", "Error indexing existing files: cannot read %1")
                            .arg(QDir::toNativeSeparators(entry.filePath())));
                }
                return DestinationIndex();
            }
            continue;
        }
        if (!entry.isFile()) {
            continue;
        }
        // Same-name files of one session are stored as "name (N).ext"; index them under their source name too.
        index.insert(entry.fileName(), entry.size());
        const QString sourceName = FileOperationUtils::stripCollisionSuffix(entry.fileName());
        if (sourceName != entry.fileName()) {
            index.insert(sourceName, entry.size());
        }
        fileCount += 1;
    }

    if (log) {
        log(QCoreApplication::translate("DestinationIndex", "Found %1 existing file(s) on destination.")
                .arg(fileCount));
    }
    return index;
}

void DestinationIndex::insert(const QString &fileName, qint64 size)
{
    const IdentityKey key = IdentityKey::of(fileName, size);
    if (!m_entries.contains(key)) {
        m_entries.insert(key, size);
    }
}

bool DestinationIndex::contains(const IdentityKey &key) const
{
    return m_entries.contains(key);
}

bool DestinationIndex::contains(const MediaFile &file) const
{
    return contains(IdentityKey::of(file));
}
