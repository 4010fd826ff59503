#pragma once

#include <QString>
#include <QVector>

#include <functional>

struct VolumeEntry {
    QString rootPath;
    QString label;
};

class VolumeCatalog
{
public:
    enum class PairingOutcome {
        Ready = 0,
        NoVolumes,
        SingleVolume,
        NoMedia
    };

    struct Pairing {
        PairingOutcome outcome = PairingOutcome::NoVolumes;
        VolumeEntry source;
        VolumeEntry destination;
        QString message;
    };

    using MediaProbe = std::function<bool(const QString &rootPath)>;

    static QVector<VolumeEntry> mountedVolumes();
    static Pairing pickSourceAndDestination(const QVector<VolumeEntry> &volumes, const MediaProbe &hasMedia);
    static int indexForPath(const QVector<VolumeEntry> &volumes, const QString &path);
};
