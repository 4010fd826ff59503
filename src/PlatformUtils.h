#pragma once

#include <QByteArray>
#include <QString>

namespace PlatformUtils {

QString normalizePath(const QString &path);
bool isRemovableMountPoint(const QString &rootPath);
bool isPseudoFileSystem(const QByteArray &fileSystemType);
bool deletePermanently(const QString &path, QString *error);

} // namespace PlatformUtils
