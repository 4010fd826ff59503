#pragma once

#include <QDateTime>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#include <functional>

using LogCallback = std::function<void(const QString &)>;

enum class MediaCategory {
    None = 0,
    Video,
    Photo
};

struct EnabledCategories {
    bool videos = true;
    bool photos = true;
};

// Snapshot of a file taken at scan time.
struct MediaFile {
    QString path;
    QString name;
    QString extension;
    qint64 size = 0;
    QDateTime lastModified;
};

struct CategoryCounts {
    int videos = 0;
    int photos = 0;

    int total() const { return videos + photos; }
    void add(MediaCategory category)
    {
        if (category == MediaCategory::Video) {
            videos += 1;
        } else if (category == MediaCategory::Photo) {
            photos += 1;
        }
    }
};

struct SelectionResult {
    QVector<MediaFile> files;
    CategoryCounts counts;

    bool isEmpty() const { return files.isEmpty(); }
};

/**
 * @brief Deduplication fingerprint made of file name and byte length.
 *
 * Names compare case-insensitively because camera cards and backup sticks are
 * usually formatted with case-insensitive filesystems.
 */
struct IdentityKey {
    QString name;
    qint64 size = 0;

    static IdentityKey of(const QString &fileName, qint64 fileSize)
    {
        return IdentityKey{fileName.toCaseFolded(), fileSize};
    }

    static IdentityKey of(const MediaFile &file) { return of(file.name, file.size); }

    bool operator==(const IdentityKey &other) const
    {
        return size == other.size && name == other.name;
    }
    bool operator!=(const IdentityKey &other) const { return !(*this == other); }
};

inline size_t qHash(const IdentityKey &key, size_t seed = 0)
{
    return qHashMulti(seed, key.name, key.size);
}

struct TransferPlan {
    QVector<MediaFile> toCopy;
    QStringList skipped;
    CategoryCounts copyCounts;
    CategoryCounts skippedCounts;
    qint64 copyBytes = 0;
    qint64 skippedBytes = 0;

    bool isEmpty() const { return toCopy.isEmpty(); }
};
