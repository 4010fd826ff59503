
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

#include "TransferPlanner.h"

#include <QCoreApplication>

#include <algorithm>

namespace TransferPlanner {

/**
 * @brief Splits a selection into files to copy and files already on the destination.
 * @param selection Files chosen by the selection policy.
 * @param index Identity keys of files already transferred.
 * @param classifier Classifier used for the category counts.
 * @param log Optional sink for skip notices.
 * @return Plan whose copy list is ordered oldest first.
 */
TransferPlan plan(const SelectionResult &selection,
                  const DestinationIndex &index,
                  const ExtensionClassifier &classifier,
                  const LogCallback &log)
{
    TransferPlan result;
    for (const MediaFile &file : selection.files) {
        const MediaCategory category = classifier.categoryOf(file);
        if (index.contains(file)) {
            result.skipped.append(file.name);
            result.skippedCounts.add(category);
            result.skippedBytes += file.size;
            if (log) {
                log(QCoreApplication::translate("TransferPlanner", "Skipping (already exists): %1").arg(file.name));
            }
            continue;
        }
        result.toCopy.append(file);
        result.copyCounts.add(category);
        result.copyBytes += file.size;
    }
    sortOldestFirst(result.toCopy);
    return result;
}

void sortOldestFirst(QVector<MediaFile> &files)
{
    std::sort(files.begin(), files.end(), [](const MediaFile &left, const MediaFile &right) {
        if (left.lastModified != right.lastModified) {
            return left.lastModified < right.lastModified;
        }
        return left.path < right.path;
    });
}

} // namespace TransferPlanner
