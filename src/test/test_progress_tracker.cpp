
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

#include "FormatUtils.h"
#include "ProgressTracker.h"
#include "TransferProgress.h"

namespace {
constexpr qint64 megabyte = 1024 * 1024;

ProgressCounters copyingCounters()
{
    ProgressCounters counters;
    counters.currentFileIndex = 2;
    counters.totalFiles = 3;
    counters.currentFileName = QStringLiteral("vid2.mp4");
    counters.currentFileSize = 60 * megabyte;
    counters.currentFileBytesDone = 30 * megabyte;
    counters.totalBytesDone = 50 * megabyte;
    counters.totalBytesPlanned = 120 * megabyte;
    counters.fileElapsedMs = 3000;
    counters.runElapsedMs = 8000;
    counters.fileClockRunning = true;
    counters.runClockRunning = true;
    return counters;
}
} // namespace

TEST_CASE("formatBytes - binary units", "[format]")
{
    REQUIRE(FormatUtils::formatBytes(0) == QStringLiteral("0 B"));
    REQUIRE(FormatUtils::formatBytes(512) == QStringLiteral("512 B"));
    REQUIRE(FormatUtils::formatBytes(1536) == QStringLiteral("1.5 KB"));
    REQUIRE(FormatUtils::formatBytes(110 * megabyte) == QStringLiteral("110 MB"));
    REQUIRE(FormatUtils::formatBytes(3 * 1024 * megabyte + 256 * megabyte) == QStringLiteral("3.25 GB"));
    REQUIRE(FormatUtils::formatBytes(5LL * 1024 * 1024 * megabyte) == QStringLiteral("5120 GB"));
}

TEST_CASE("formatDuration - drops leading zero units", "[format]")
{
    REQUIRE(FormatUtils::formatDuration(0) == QStringLiteral("0s"));
    REQUIRE(FormatUtils::formatDuration(6.9) == QStringLiteral("6s"));
    REQUIRE(FormatUtils::formatDuration(245) == QStringLiteral("4m 5s"));
    REQUIRE(FormatUtils::formatDuration(3723) == QStringLiteral("1h 2m 3s"));
    REQUIRE(FormatUtils::formatDuration(3600) == QStringLiteral("1h 0m 0s"));
    REQUIRE(FormatUtils::formatDuration(-4) == QStringLiteral("0s"));
    REQUIRE(FormatUtils::formatDurationMs(61500) == QStringLiteral("1m 1s"));
}

TEST_CASE("computeSnapshot - mid-transfer rates and ETAs", "[progress]")
{
    const ProgressSnapshot snapshot = ProgressTracker::computeSnapshot(copyingCounters());

    REQUIRE(snapshot.currentFileIndex == 2);
    REQUIRE(snapshot.totalFiles == 3);
    REQUIRE(snapshot.currentFileName == QStringLiteral("vid2.mp4"));
    REQUIRE(snapshot.fileCounter == QStringLiteral("Overall: 2 of 3 files"));
    REQUIRE(snapshot.filePercent == 50);
    REQUIRE(snapshot.overallPercent == 66);

    // 30 MB in 3 s is 10 MB/s, leaving 30 MB.
    REQUIRE(snapshot.currentFileStatus == QStringLiteral("30 MB / 60 MB @ 10 MB/s"));
    REQUIRE(snapshot.currentFileEta == QStringLiteral("~3s remaining"));

    // 80 MB in 8 s is 10 MB/s, leaving 40 MB.
    REQUIRE(snapshot.overallEta == QStringLiteral("Total: ~4s remaining @ 10 MB/s"));
}

TEST_CASE("computeSnapshot - thresholds hold back early estimates", "[progress]")
{
    ProgressCounters counters = copyingCounters();

    SECTION("File clock under half a second")
    {
        counters.fileElapsedMs = ProgressTracker::fileEtaThresholdMs - 1;
        const ProgressSnapshot snapshot = ProgressTracker::computeSnapshot(counters);
        REQUIRE(snapshot.currentFileStatus.isEmpty());
        REQUIRE(snapshot.currentFileEta.isEmpty());
        REQUIRE_FALSE(snapshot.overallEta.isEmpty());
    }

    SECTION("Run clock under one second")
    {
        counters.runElapsedMs = ProgressTracker::overallEtaThresholdMs - 1;
        const ProgressSnapshot snapshot = ProgressTracker::computeSnapshot(counters);
        REQUIRE(snapshot.overallEta.isEmpty());
    }

    SECTION("Exactly at the thresholds")
    {
        counters.fileElapsedMs = ProgressTracker::fileEtaThresholdMs;
        counters.runElapsedMs = ProgressTracker::overallEtaThresholdMs;
        const ProgressSnapshot snapshot = ProgressTracker::computeSnapshot(counters);
        REQUIRE_FALSE(snapshot.currentFileEta.isEmpty());
        REQUIRE_FALSE(snapshot.overallEta.isEmpty());
    }

    SECTION("No bytes yet means no rate")
    {
        counters.currentFileBytesDone = 0;
        counters.totalBytesDone = 0;
        const ProgressSnapshot snapshot = ProgressTracker::computeSnapshot(counters);
        REQUIRE(snapshot.currentFileEta.isEmpty());
        REQUIRE(snapshot.overallEta.isEmpty());
        REQUIRE(snapshot.filePercent == 0);
    }

    SECTION("Stopped clocks")
    {
        counters.fileClockRunning = false;
        counters.runClockRunning = false;
        const ProgressSnapshot snapshot = ProgressTracker::computeSnapshot(counters);
        REQUIRE(snapshot.currentFileStatus.isEmpty());
        REQUIRE(snapshot.overallEta.isEmpty());
    }
}

TEST_CASE("computeSnapshot - percentages stay within bounds", "[progress]")
{
    ProgressCounters counters;
    REQUIRE(ProgressTracker::computeSnapshot(counters).overallPercent == 0);
    REQUIRE(ProgressTracker::computeSnapshot(counters).filePercent == 0);

    counters.currentFileSize = 10;
    counters.currentFileBytesDone = 15;
    counters.totalBytesPlanned = 10;
    counters.totalBytesDone = 10;
    REQUIRE(ProgressTracker::computeSnapshot(counters).filePercent == 100);
    REQUIRE(ProgressTracker::computeSnapshot(counters).overallPercent == 100);
}

TEST_CASE("computeSnapshot - finished file seen in both counters", "[progress]")
{
    ProgressCounters counters = copyingCounters();
    counters.currentFileIndex = 3;
    counters.currentFileSize = 10 * megabyte;
    counters.currentFileBytesDone = 10 * megabyte;
    counters.totalBytesDone = 120 * megabyte;

    const ProgressSnapshot snapshot = ProgressTracker::computeSnapshot(counters);
    REQUIRE(snapshot.overallPercent == 100);
    REQUIRE(snapshot.overallEta == QStringLiteral("Total: ~0s remaining @ 15 MB/s"));
}

TEST_CASE("TransferProgress - completed bytes counted once", "[progress]")
{
    TransferProgress progress;
    progress.beginRun(2, 300);
    progress.beginFile(1, QStringLiteral("a.mp4"), 100);
    progress.startFileClock();
    progress.addFileBytes(100);
    progress.stopFileClock();

    ProgressCounters counters = progress.counters();
    REQUIRE(counters.totalBytesDone + counters.currentFileBytesDone == 100);

    progress.completeFile(100);
    counters = progress.counters();
    REQUIRE(counters.totalBytesDone == 100);
    REQUIRE(counters.currentFileBytesDone == 0);
    REQUIRE(ProgressTracker::computeSnapshot(counters).overallPercent == 33);
}

TEST_CASE("TransferProgress - counters follow the copy loop", "[progress]")
{
    TransferProgress progress;
    REQUIRE(progress.counters().runElapsedMs == 0);
    REQUIRE_FALSE(progress.counters().runClockRunning);

    progress.beginRun(2, 300);
    progress.beginFile(1, QStringLiteral("a.mp4"), 100);
    progress.startFileClock();
    progress.addFileBytes(40);
    progress.addFileBytes(60);

    ProgressCounters counters = progress.counters();
    REQUIRE(counters.currentFileIndex == 1);
    REQUIRE(counters.totalFiles == 2);
    REQUIRE(counters.currentFileName == QStringLiteral("a.mp4"));
    REQUIRE(counters.currentFileBytesDone == 100);
    REQUIRE(counters.fileClockRunning);
    REQUIRE(counters.runClockRunning);

    progress.stopFileClock();
    progress.completeFile(100);
    progress.beginFile(2, QStringLiteral("b.jpg"), 200);
    counters = progress.counters();
    REQUIRE(counters.totalBytesDone == 100);
    REQUIRE(counters.currentFileBytesDone == 0);
    REQUIRE(counters.currentFileSize == 200);
    REQUIRE_FALSE(counters.fileClockRunning);

    progress.endRun();
    REQUIRE_FALSE(progress.counters().runClockRunning);
}

TEST_CASE("ProgressTracker - inactive record publishes nothing", "[progress]")
{
    TransferProgress progress;
    ProgressTracker tracker(&progress);
    int updates = 0;
    QObject::connect(&tracker, &ProgressTracker::progressUpdated, [&updates](const ProgressSnapshot &) {
        updates += 1;
    });

    progress.beginRun(1, 10);
    progress.beginFile(1, QStringLiteral("a.jpg"), 10);
    tracker.poll();
    REQUIRE(updates == 0);

    progress.setActive(true);
    tracker.poll();
    REQUIRE(updates == 1);
    REQUIRE(tracker.lastSnapshot().currentFileName == QStringLiteral("a.jpg"));

    progress.setActive(false);
    tracker.poll();
    REQUIRE(updates == 1);
}
