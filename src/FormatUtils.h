#pragma once

#include <QString>
#include <QtGlobal>

namespace FormatUtils {

QString formatBytes(qint64 bytes);
QString formatDuration(double seconds);
QString formatDurationMs(qint64 milliseconds);

} // namespace FormatUtils
