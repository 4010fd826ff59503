
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

#include "FormatUtils.h"

#include <QStringList>

#include <cmath>

namespace {
constexpr double unitScale = 1024.0;
constexpr int byteDecimals = 2;
constexpr qint64 secondsPerMinute = 60;
constexpr qint64 secondsPerHour = 3600;

QString trimTrailingZeros(QString number)
{
    if (!number.contains(QLatin1Char('.'))) {
        return number;
    }
    while (number.endsWith(QLatin1Char('0'))) {
        number.chop(1);
    }
    if (number.endsWith(QLatin1Char('.'))) {
        number.chop(1);
    }
    return number;
}
} // namespace

namespace FormatUtils {

/**
 * @brief Formats a byte count with binary units.
 * @param bytes Byte count.
 * @return Text such as "512 B", "1.5 KB" or "110 MB", at most two decimals.
 */
QString formatBytes(qint64 bytes)
{
    static const QStringList units = {
        QStringLiteral("B"),
        QStringLiteral("KB"),
        QStringLiteral("MB"),
        QStringLiteral("GB"),
    };
    double value = double(bytes);
    int order = 0;
    while (value >= unitScale && order < units.size() - 1) {
        order += 1;
        value /= unitScale;
    }
    const QString number = trimTrailingZeros(QString::number(value, 'f', byteDecimals));
    return QStringLiteral("%1 %2").arg(number, units.at(order));
}

/**
 * @brief Formats a duration, dropping leading zero units.
 * @param seconds Duration in seconds; fractions are truncated.
 * @return Text such as "1h 2m 3s", "4m 5s" or "6s".
 */
QString formatDuration(double seconds)
{
    if (!std::isfinite(seconds) || seconds < 0) {
        seconds = 0;
    }
    const qint64 total = qint64(seconds);
    const qint64 hours = total / secondsPerHour;
    const qint64 minutes = (total % secondsPerHour) / secondsPerMinute;
    const qint64 secs = total % secondsPerMinute;
    if (hours >= 1) {
        return QStringLiteral("%1h %2m %3s").arg(hours).arg(minutes).arg(secs);
    }
    if (total >= secondsPerMinute) {
        return QStringLiteral("%1m %2s").arg(minutes).arg(secs);
    }
    return QStringLiteral("%1s").arg(secs);
}

QString formatDurationMs(qint64 milliseconds)
{
    return formatDuration(double(milliseconds) / 1000.0);
}

} // namespace FormatUtils
