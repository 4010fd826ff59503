
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

#include "VolumeCatalog.h"

#include <QCoreApplication>
#include <QDir>
#include <QSet>
#include <QStorageInfo>

#include "PlatformUtils.h"

namespace {
QString volumeLabel(const QString &displayName, const QString &rootPath)
{
    if (!displayName.isEmpty() && displayName != rootPath) {
        return QStringLiteral("%1 (%2)").arg(displayName, rootPath);
    }
    return rootPath;
}
} // namespace

/**
 * @brief Lists mounted volumes that look like removable media.
 * @return Volume entries in mount order, without duplicates.
 */
QVector<VolumeEntry> VolumeCatalog::mountedVolumes()
{
    QSet<QString> seen;
    QVector<VolumeEntry> entries;
    const auto volumes = QStorageInfo::mountedVolumes();
    for (const QStorageInfo &info : volumes) {
        if (!info.isValid() || !info.isReady() || info.isRoot()) {
            continue;
        }
        if (PlatformUtils::isPseudoFileSystem(info.fileSystemType())) {
            continue;
        }
        QString rootPath = info.rootPath();
        if (rootPath.isEmpty()) {
            continue;
        }
        rootPath = QDir::fromNativeSeparators(rootPath);
        if (seen.contains(rootPath) || !PlatformUtils::isRemovableMountPoint(rootPath)) {
            continue;
        }
        seen.insert(rootPath);

        VolumeEntry entry;
        entry.rootPath = rootPath;
        entry.label = volumeLabel(info.displayName().trimmed(), rootPath);
        entries.push_back(entry);
    }
    return entries;
}

/**
 * @brief Chooses the source and destination volumes for a run.
 *
 * The first volume holding media is the source and the first other volume is
 * the destination. Fewer than two volumes, or no media anywhere, is reported
 * as an informational outcome.
 * @param volumes Candidate volumes.
 * @param hasMedia Probe telling whether a volume root holds media.
 * @return Pairing outcome with the chosen volumes or a message.
 */
VolumeCatalog::Pairing VolumeCatalog::pickSourceAndDestination(const QVector<VolumeEntry> &volumes,
                                                               const MediaProbe &hasMedia)
{
    Pairing pairing;
    if (volumes.isEmpty()) {
        pairing.outcome = PairingOutcome::NoVolumes;
        pairing.message = QCoreApplication::translate("VolumeCatalog", "No removable drives detected.");
        return pairing;
    }
    if (volumes.size() == 1) {
        pairing.outcome = PairingOutcome::SingleVolume;
        pairing.message = QCoreApplication::translate("VolumeCatalog", "Only 1 removable drive detected: %1")
                              .arg(volumes.first().label);
        return pairing;
    }

    int sourceIndex = -1;
    for (int i = 0; i < volumes.size(); ++i) {
        if (hasMedia && hasMedia(volumes.at(i).rootPath)) {
            sourceIndex = i;
            break;
        }
    }
    if (sourceIndex < 0) {
        pairing.outcome = PairingOutcome::NoMedia;
        pairing.message = QCoreApplication::translate("VolumeCatalog", "No media files found on any removable drive.");
        return pairing;
    }

    const QString sourcePath = PlatformUtils::normalizePath(volumes.at(sourceIndex).rootPath);
    for (int i = 0; i < volumes.size(); ++i) {
        if (i == sourceIndex || PlatformUtils::normalizePath(volumes.at(i).rootPath) == sourcePath) {
            continue;
        }
        pairing.outcome = PairingOutcome::Ready;
        pairing.source = volumes.at(sourceIndex);
        pairing.destination = volumes.at(i);
        pairing.message = QCoreApplication::translate("VolumeCatalog", "Found %1 removable drives. Processing...")
                              .arg(volumes.size());
        return pairing;
    }
    pairing.outcome = PairingOutcome::SingleVolume;
    pairing.message = QCoreApplication::translate("VolumeCatalog", "Could not identify destination drive.");
    return pairing;
}

/**
 * @brief Finds the volume that contains a given path.
 * @param volumes Volumes to search.
 * @param path Path to resolve.
 * @return Index of the containing volume, or -1 if none matches.
 */
int VolumeCatalog::indexForPath(const QVector<VolumeEntry> &volumes, const QString &path)
{
    if (path.isEmpty()) {
        return -1;
    }
    const QString normalized = PlatformUtils::normalizePath(path);
    for (int i = 0; i < volumes.size(); ++i) {
        const QString entryPath = PlatformUtils::normalizePath(volumes.at(i).rootPath);
        if (entryPath == QLatin1String("/") || entryPath.isEmpty()) {
            if (normalized.startsWith(QLatin1Char('/'))) {
                return i;
            }
            continue;
        }
        if (normalized == entryPath || normalized.startsWith(entryPath + QLatin1Char('/'))) {
            return i;
        }
    }
    return -1;
}
