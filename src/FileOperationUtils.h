#pragma once

#include <QString>

class QFileInfo;

namespace FileOperationUtils {

bool applyFileTimes(const QFileInfo &sourceInfo, const QString &targetPath);
bool ensureFolder(const QString &path, const char *context, QString *error);
QString uniqueTargetPath(const QString &folder, const QString &fileName);
QString stripCollisionSuffix(const QString &fileName);

} // namespace FileOperationUtils
