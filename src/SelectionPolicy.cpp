
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

#include "SelectionPolicy.h"

#include <QCoreApplication>

#include <algorithm>

#include "TransferSettings.h"

namespace {
constexpr int secondsPerMinute = 60;
const char logTimeFormat[] = "yyyy-MM-dd HH:mm:ss";

bool newerFirst(const MediaFile &left, const MediaFile &right)
{
    if (left.lastModified != right.lastModified) {
        return left.lastModified > right.lastModified;
    }
    return left.path < right.path;
}

QString categoryLabel(MediaCategory category)
{
    return category == MediaCategory::Video
        ? QCoreApplication::translate("SelectionPolicy", "video")
        : QCoreApplication::translate("SelectionPolicy", "photo");
}

QVector<MediaFile> filesInWindow(const QVector<MediaFile> &candidates,
                                 const ExtensionClassifier &classifier,
                                 MediaCategory category,
                                 int windowMinutes,
                                 const LogCallback &log)
{
    QVector<MediaFile> files;
    if (!classifier.isEnabled(category)) {
        return files;
    }

    const MediaFile *latest = nullptr;
    for (const MediaFile &file : candidates) {
        if (classifier.categoryOf(file) != category) {
            continue;
        }
        if (!latest || newerFirst(file, *latest)) {
            latest = &file;
        }
    }
    if (!latest) {
        return files;
    }

    const QDateTime cutoff = latest->lastModified.addSecs(-qint64(windowMinutes) * secondsPerMinute);
    for (const MediaFile &file : candidates) {
        if (classifier.categoryOf(file) == category && file.lastModified >= cutoff) {
            files.append(file);
        }
    }

    if (log) {
        const QString label = categoryLabel(category);
        log(QCoreApplication::translate("SelectionPolicy", "Latest %1: %2 at %3")
                .arg(label, latest->name, latest->lastModified.toString(QLatin1String(logTimeFormat))));
        log(QCoreApplication::translate("SelectionPolicy", "Cutoff time for %1s: %2 (last %3 minutes)")
                .arg(label, cutoff.toString(QLatin1String(logTimeFormat)))
                .arg(windowMinutes));
        log(QCoreApplication::translate("SelectionPolicy", "Found %1 %2(s) within time window.")
                .arg(files.size())
                .arg(label));
    }
    return files;
}

} // namespace

TimeWindowPolicy::TimeWindowPolicy(int windowMinutes)
    : m_windowMinutes(qMax(0, windowMinutes))
{
}

/**
 * @brief Selects files close in time to the latest file of their category.
 *
 * Videos and photos are windowed independently: each category gets its own
 * cutoff computed from its own latest file, and the subsets are concatenated.
 * @param candidates Scanned media files.
 * @param classifier Classifier used to split candidates by category.
 * @param log Optional sink for selection details.
 * @return Selected files with per-category counts.
 */
SelectionResult TimeWindowPolicy::select(const QVector<MediaFile> &candidates,
                                         const ExtensionClassifier &classifier,
                                         const LogCallback &log) const
{
    SelectionResult result;
    const MediaCategory categories[] = {MediaCategory::Video, MediaCategory::Photo};
    for (MediaCategory category : categories) {
        const QVector<MediaFile> files = filesInWindow(candidates, classifier, category, m_windowMinutes, log);
        for (const MediaFile &file : files) {
            result.files.append(file);
            result.counts.add(category);
        }
    }
    return result;
}

QString TimeWindowPolicy::description() const
{
    return QCoreApplication::translate("SelectionPolicy", "Using time-based mode: Last %1 minutes from latest file")
        .arg(m_windowMinutes);
}

FixedCountPolicy::FixedCountPolicy(int maxFiles)
    : m_maxFiles(qMax(0, maxFiles))
{
}

/**
 * @brief Selects the newest files regardless of category.
 * @param candidates Scanned media files.
 * @param classifier Classifier used to count categories and drop disabled ones.
 * @param log Unused.
 * @return Up to maxFiles files, newest first.
 */
SelectionResult FixedCountPolicy::select(const QVector<MediaFile> &candidates,
                                         const ExtensionClassifier &classifier,
                                         const LogCallback &log) const
{
    Q_UNUSED(log);
    QVector<MediaFile> sorted;
    sorted.reserve(candidates.size());
    for (const MediaFile &file : candidates) {
        if (classifier.categoryOf(file) != MediaCategory::None) {
            sorted.append(file);
        }
    }
    std::sort(sorted.begin(), sorted.end(), newerFirst);

    SelectionResult result;
    const int count = qMin(m_maxFiles, int(sorted.size()));
    result.files.reserve(count);
    for (int i = 0; i < count; ++i) {
        result.files.append(sorted.at(i));
        result.counts.add(classifier.categoryOf(sorted.at(i)));
    }
    return result;
}

QString FixedCountPolicy::description() const
{
    return QCoreApplication::translate("SelectionPolicy", "Using fixed count mode: Latest %1 files").arg(m_maxFiles);
}

std::unique_ptr<SelectionPolicy> createSelectionPolicy(const TransferSettings &settings)
{
    if (settings.mode() == TransferSettings::SelectionMode::FixedCount) {
        return std::make_unique<FixedCountPolicy>(settings.maxFiles());
    }
    return std::make_unique<TimeWindowPolicy>(settings.timeWindowMinutes());
}
