#pragma once

#include <QHash>
#include <QString>

#include "MediaTypes.h"

class DestinationIndex
{
public:
    static QString archiveFolderName();
    static QString archivePath(const QString &destinationRoot);

    static DestinationIndex build(const QString &destinationRoot, const LogCallback &log = LogCallback());

    void insert(const QString &fileName, qint64 size);
    bool contains(const IdentityKey &key) const;
    bool contains(const MediaFile &file) const;
    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }

private:
    QHash<IdentityKey, qint64> m_entries;
};
