
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

#include <catch2/catch_test_macros.hpp>

#include <QSet>

#include "PlatformUtils.h"
#include "VolumeCatalog.h"

namespace {
VolumeEntry volume(const QString &rootPath)
{
    VolumeEntry entry;
    entry.rootPath = rootPath;
    entry.label = QStringLiteral("CARD (%1)").arg(rootPath);
    return entry;
}

VolumeCatalog::MediaProbe mediaOn(const QSet<QString> &roots)
{
    return [roots](const QString &rootPath) { return roots.contains(rootPath); };
}
} // namespace

TEST_CASE("pickSourceAndDestination - informational outcomes", "[volumes]")
{
    SECTION("No volumes")
    {
        const VolumeCatalog::Pairing pairing = VolumeCatalog::pickSourceAndDestination({}, mediaOn({}));
        REQUIRE(pairing.outcome == VolumeCatalog::PairingOutcome::NoVolumes);
        REQUIRE(pairing.message == QStringLiteral("No removable drives detected."));
    }

    SECTION("A single volume")
    {
        const VolumeCatalog::Pairing pairing = VolumeCatalog::pickSourceAndDestination(
            {volume(QStringLiteral("/media/user/CARD"))}, mediaOn({QStringLiteral("/media/user/CARD")}));
        REQUIRE(pairing.outcome == VolumeCatalog::PairingOutcome::SingleVolume);
        REQUIRE(pairing.message == QStringLiteral("Only 1 removable drive detected: CARD (/media/user/CARD)"));
    }

    SECTION("No media anywhere")
    {
        const VolumeCatalog::Pairing pairing = VolumeCatalog::pickSourceAndDestination(
            {volume(QStringLiteral("/media/user/A")), volume(QStringLiteral("/media/user/B"))}, mediaOn({}));
        REQUIRE(pairing.outcome == VolumeCatalog::PairingOutcome::NoMedia);
        REQUIRE(pairing.message == QStringLiteral("No media files found on any removable drive."));
    }
}

TEST_CASE("pickSourceAndDestination - first volume with media is the source", "[volumes]")
{
    const QVector<VolumeEntry> volumes = {
        volume(QStringLiteral("/media/user/STICK")),
        volume(QStringLiteral("/media/user/CARD")),
        volume(QStringLiteral("/media/user/OTHER")),
    };

    SECTION("Destination is the first other volume")
    {
        const VolumeCatalog::Pairing pairing = VolumeCatalog::pickSourceAndDestination(
            volumes, mediaOn({QStringLiteral("/media/user/CARD"), QStringLiteral("/media/user/OTHER")}));
        REQUIRE(pairing.outcome == VolumeCatalog::PairingOutcome::Ready);
        REQUIRE(pairing.source.rootPath == QStringLiteral("/media/user/CARD"));
        REQUIRE(pairing.destination.rootPath == QStringLiteral("/media/user/STICK"));
        REQUIRE(pairing.message == QStringLiteral("Found 3 removable drives. Processing..."));
    }

    SECTION("Source first in the list")
    {
        const VolumeCatalog::Pairing pairing = VolumeCatalog::pickSourceAndDestination(
            volumes, mediaOn({QStringLiteral("/media/user/STICK")}));
        REQUIRE(pairing.source.rootPath == QStringLiteral("/media/user/STICK"));
        REQUIRE(pairing.destination.rootPath == QStringLiteral("/media/user/CARD"));
    }
}

TEST_CASE("pickSourceAndDestination - same mount listed twice", "[volumes]")
{
    const VolumeCatalog::Pairing pairing = VolumeCatalog::pickSourceAndDestination(
        {volume(QStringLiteral("/media/user/CARD")), volume(QStringLiteral("/media/user/CARD/"))},
        mediaOn({QStringLiteral("/media/user/CARD")}));
    REQUIRE(pairing.outcome == VolumeCatalog::PairingOutcome::SingleVolume);
    REQUIRE(pairing.message == QStringLiteral("Could not identify destination drive."));
}

TEST_CASE("indexForPath - path inside a mount", "[volumes]")
{
    const QVector<VolumeEntry> volumes = {
        volume(QStringLiteral("/media/user/CARD")),
        volume(QStringLiteral("/media/user/STICK")),
    };
    REQUIRE(VolumeCatalog::indexForPath(volumes, QStringLiteral("/media/user/STICK")) == 1);
    REQUIRE(VolumeCatalog::indexForPath(volumes, QStringLiteral("/media/user/CARD/DCIM")) == 0);
    REQUIRE(VolumeCatalog::indexForPath(volumes, QStringLiteral("/media/user/CARDIGAN")) == -1);
    REQUIRE(VolumeCatalog::indexForPath(volumes, QString()) == -1);
}

#ifndef Q_OS_WIN
TEST_CASE("isRemovableMountPoint - media mount roots", "[volumes]")
{
    REQUIRE(PlatformUtils::isRemovableMountPoint(QStringLiteral("/media/user/CARD")));
    REQUIRE(PlatformUtils::isRemovableMountPoint(QStringLiteral("/run/media/user/STICK")));
    REQUIRE(PlatformUtils::isRemovableMountPoint(QStringLiteral("/Volumes/EOS_DIGITAL")));
    REQUIRE_FALSE(PlatformUtils::isRemovableMountPoint(QStringLiteral("/")));
    REQUIRE_FALSE(PlatformUtils::isRemovableMountPoint(QStringLiteral("/home")));
    REQUIRE_FALSE(PlatformUtils::isRemovableMountPoint(QStringLiteral("/media/")));
}
#endif

TEST_CASE("isPseudoFileSystem - virtual mounts are ignored", "[volumes]")
{
    REQUIRE(PlatformUtils::isPseudoFileSystem(QByteArrayLiteral("tmpfs")));
    REQUIRE(PlatformUtils::isPseudoFileSystem(QByteArrayLiteral("proc")));
    REQUIRE_FALSE(PlatformUtils::isPseudoFileSystem(QByteArrayLiteral("vfat")));
    REQUIRE_FALSE(PlatformUtils::isPseudoFileSystem(QByteArrayLiteral("exfat")));
}
