
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

#include "TransferSettings.h"

#include <QSettings>

namespace {
const char settingsGroup[] = "transfer";
const char modeKey[] = "mode";
const char timeWindowKeyName[] = "timeWindowMinutes";
const char maxFilesKeyName[] = "maxFiles";
const char transferVideosKey[] = "transferVideos";
const char transferPhotosKey[] = "transferPhotos";
const char videoExtensionsKey[] = "videoExtensions";
const char photoExtensionsKey[] = "photoExtensions";
const char logFileKey[] = "logFile";

const char timeWindowModeName[] = "timeWindow";
const char fixedCountModeName[] = "fixedCount";

int parsePositive(const QString &text, int fallback, bool *coerced)
{
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    const bool valid = ok && value >= 1;
    if (coerced) {
        *coerced = !valid;
    }
    return valid ? value : fallback;
}
} // namespace

QString TransferSettings::defaultVideoExtensions()
{
    return QStringLiteral(".mp4,.mov,.avi,.mkv,.mts,.m2ts,.3gp,.wmv");
}

QString TransferSettings::defaultPhotoExtensions()
{
    return QStringLiteral(".jpg,.jpeg,.png,.heic,.raw,.cr2,.nef,.arw,.dng");
}

TransferSettings::TransferSettings()
    : m_timeWindowText(QString::number(defaultTimeWindowMinutes))
    , m_maxFilesText(QString::number(defaultMaxFiles))
    , m_videoExtensions(defaultVideoExtensions())
    , m_photoExtensions(defaultPhotoExtensions())
{
}

void TransferSettings::load(QSettings &settings)
{
    const TransferSettings defaults;
    settings.beginGroup(QLatin1String(settingsGroup));
    SelectionMode mode = defaults.m_mode;
    parseMode(settings.value(QLatin1String(modeKey), modeName(defaults.m_mode)).toString(), &mode);
    m_mode = mode;
    m_timeWindowText = settings.value(QLatin1String(timeWindowKeyName), defaults.m_timeWindowText).toString();
    m_maxFilesText = settings.value(QLatin1String(maxFilesKeyName), defaults.m_maxFilesText).toString();
    m_enabled.videos = settings.value(QLatin1String(transferVideosKey), defaults.m_enabled.videos).toBool();
    m_enabled.photos = settings.value(QLatin1String(transferPhotosKey), defaults.m_enabled.photos).toBool();
    m_videoExtensions = settings.value(QLatin1String(videoExtensionsKey), defaults.m_videoExtensions).toString();
    m_photoExtensions = settings.value(QLatin1String(photoExtensionsKey), defaults.m_photoExtensions).toString();
    m_logFilePath = settings.value(QLatin1String(logFileKey)).toString();
    settings.endGroup();
}

void TransferSettings::save(QSettings &settings) const
{
    settings.beginGroup(QLatin1String(settingsGroup));
    settings.setValue(QLatin1String(modeKey), modeName(m_mode));
    settings.setValue(QLatin1String(timeWindowKeyName), m_timeWindowText);
    settings.setValue(QLatin1String(maxFilesKeyName), m_maxFilesText);
    settings.setValue(QLatin1String(transferVideosKey), m_enabled.videos);
    settings.setValue(QLatin1String(transferPhotosKey), m_enabled.photos);
    settings.setValue(QLatin1String(videoExtensionsKey), m_videoExtensions);
    settings.setValue(QLatin1String(photoExtensionsKey), m_photoExtensions);
    settings.setValue(QLatin1String(logFileKey), m_logFilePath);
    settings.endGroup();
    settings.sync();
}

QString TransferSettings::modeName(SelectionMode mode)
{
    return mode == SelectionMode::FixedCount
        ? QLatin1String(fixedCountModeName)
        : QLatin1String(timeWindowModeName);
}

/**
 * @brief Parses a selection mode name.
 * @param name Mode name, "timeWindow" or "fixedCount" (case-insensitive).
 * @param mode Output mode, left untouched when the name is unknown.
 * @return True when the name was recognized.
 */
bool TransferSettings::parseMode(const QString &name, SelectionMode *mode)
{
    const QString trimmed = name.trimmed();
    if (trimmed.compare(QLatin1String(timeWindowModeName), Qt::CaseInsensitive) == 0) {
        *mode = SelectionMode::TimeWindow;
        return true;
    }
    if (trimmed.compare(QLatin1String(fixedCountModeName), Qt::CaseInsensitive) == 0) {
        *mode = SelectionMode::FixedCount;
        return true;
    }
    return false;
}

int TransferSettings::timeWindowMinutes() const
{
    return coerceTimeWindow(m_timeWindowText);
}

int TransferSettings::maxFiles() const
{
    return coerceMaxFiles(m_maxFilesText);
}

/**
 * @brief Parses a time window in minutes.
 * @param text User supplied value.
 * @param coerced Set to true when the default had to be used.
 * @return Parsed positive value, or the default window for empty, unparsable or non-positive text.
 */
int TransferSettings::coerceTimeWindow(const QString &text, bool *coerced)
{
    return parsePositive(text, defaultTimeWindowMinutes, coerced);
}

int TransferSettings::coerceMaxFiles(const QString &text, bool *coerced)
{
    return parsePositive(text, defaultMaxFiles, coerced);
}

/**
 * @brief Replaces an invalid numeric value of the active mode with its default.
 * @param key Output settings key of the rewritten value.
 * @param value Output effective value as stored.
 * @return True when a value was rewritten.
 */
bool TransferSettings::coerceActiveValue(QString *key, QString *value)
{
    bool coerced = false;
    if (m_mode == SelectionMode::FixedCount) {
        const int count = coerceMaxFiles(m_maxFilesText, &coerced);
        if (coerced) {
            m_maxFilesText = QString::number(count);
            *key = QLatin1String(maxFilesKeyName);
            *value = m_maxFilesText;
        }
        return coerced;
    }
    const int window = coerceTimeWindow(m_timeWindowText, &coerced);
    if (coerced) {
        m_timeWindowText = QString::number(window);
        *key = QLatin1String(timeWindowKeyName);
        *value = m_timeWindowText;
    }
    return coerced;
}

ExtensionClassifier TransferSettings::classifier() const
{
    return ExtensionClassifier(m_videoExtensions, m_photoExtensions, m_enabled);
}

void TransferSettings::writeBack(QSettings &settings, const QString &key, const QString &value)
{
    settings.beginGroup(QLatin1String(settingsGroup));
    settings.setValue(key, value);
    settings.endGroup();
    settings.sync();
}
