#pragma once

#include <QString>
#include <QVector>

#include "ExtensionClassifier.h"
#include "MediaTypes.h"

namespace MediaScanner {

QVector<MediaFile> scan(const QString &rootPath,
                        const ExtensionClassifier &classifier,
                        const LogCallback &log = LogCallback());
bool hasMedia(const QString &rootPath, const ExtensionClassifier &classifier);
MediaFile snapshot(const QString &filePath);

} // namespace MediaScanner
