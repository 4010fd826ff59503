
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

#include "ExtensionClassifier.h"

#include <QStringList>

namespace {
const QChar extensionDot = QLatin1Char('.');
const QChar listSeparator = QLatin1Char(',');

QSet<QString> normalizeAll(const QSet<QString> &extensions)
{
    QSet<QString> normalized;
    normalized.reserve(extensions.size());
    for (const QString &extension : extensions) {
        const QString value = ExtensionClassifier::normalizeExtension(extension);
        if (!value.isEmpty()) {
            normalized.insert(value);
        }
    }
    return normalized;
}
} // namespace

ExtensionClassifier::ExtensionClassifier(const QSet<QString> &videoExtensions,
                                         const QSet<QString> &photoExtensions,
                                         EnabledCategories enabled)
    : m_videoExtensions(normalizeAll(videoExtensions))
    , m_photoExtensions(normalizeAll(photoExtensions))
    , m_enabled(enabled)
{
}

ExtensionClassifier::ExtensionClassifier(const QString &videoList,
                                         const QString &photoList,
                                         EnabledCategories enabled)
    : m_videoExtensions(parseExtensionList(videoList))
    , m_photoExtensions(parseExtensionList(photoList))
    , m_enabled(enabled)
{
}

/**
 * @brief Normalizes an extension to lower case with a single leading dot.
 * @param extension Extension with or without leading dot, e.g. "MP4" or ".mp4".
 * @return Normalized extension such as ".mp4", or an empty string.
 */
QString ExtensionClassifier::normalizeExtension(const QString &extension)
{
    QString value = extension.trimmed().toLower();
    while (value.startsWith(extensionDot)) {
        value.remove(0, 1);
    }
    if (value.isEmpty()) {
        return QString();
    }
    return extensionDot + value;
}

/**
 * @brief Parses a comma-separated extension list.
 * @param list Text such as ".mp4, MOV,.avi".
 * @return Set of normalized extensions; empty entries are dropped.
 */
QSet<QString> ExtensionClassifier::parseExtensionList(const QString &list)
{
    QSet<QString> extensions;
    const QStringList parts = list.split(listSeparator, Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const QString extension = normalizeExtension(part);
        if (!extension.isEmpty()) {
            extensions.insert(extension);
        }
    }
    return extensions;
}

/**
 * @brief Maps an extension to a media category.
 * @param extension Extension to classify, dotted or not, any case.
 * @param videoExtensions Normalized video extensions.
 * @param photoExtensions Normalized photo extensions.
 * @return Photo when listed as photo, Video when listed as video, None otherwise.
 *         An extension in both sets is a photo.
 */
MediaCategory ExtensionClassifier::classify(const QString &extension,
                                            const QSet<QString> &videoExtensions,
                                            const QSet<QString> &photoExtensions)
{
    const QString normalized = normalizeExtension(extension);
    if (normalized.isEmpty()) {
        return MediaCategory::None;
    }
    if (photoExtensions.contains(normalized)) {
        return MediaCategory::Photo;
    }
    if (videoExtensions.contains(normalized)) {
        return MediaCategory::Video;
    }
    return MediaCategory::None;
}

/**
 * @brief Classifies an extension, taking the enabled categories into account.
 * @param extension Extension to classify.
 * @return Category of the extension, or None when its category is disabled.
 */
MediaCategory ExtensionClassifier::categoryOf(const QString &extension) const
{
    const MediaCategory category = classify(extension, m_videoExtensions, m_photoExtensions);
    return isEnabled(category) ? category : MediaCategory::None;
}

MediaCategory ExtensionClassifier::categoryOf(const MediaFile &file) const
{
    return categoryOf(file.extension);
}

bool ExtensionClassifier::isEnabled(MediaCategory category) const
{
    switch (category) {
    case MediaCategory::Video:
        return m_enabled.videos;
    case MediaCategory::Photo:
        return m_enabled.photos;
    default:
        return false;
    }
}

bool ExtensionClassifier::hasEnabledCategory() const
{
    return m_enabled.videos || m_enabled.photos;
}
