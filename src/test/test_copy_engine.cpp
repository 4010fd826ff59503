
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

#include <QFileInfo>
#include <QTemporaryDir>

#include "CopyEngine.h"
#include "FileOperationUtils.h"
#include "TestFixtures.h"
#include "TransferProgress.h"

using namespace TestFixtures;

TEST_CASE("copyFile - byte counts match the source", "[copy]")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QDir root(dir.path());
    TransferProgress progress;
    CopyEngine engine(&progress);

    SECTION("Small file")
    {
        const QString source = root.filePath(QStringLiteral("in/small.jpg"));
        const QString target = root.filePath(QStringLiteral("small.jpg"));
        REQUIRE(writeFile(source, 1234, minutesAfterBase(3)));

        progress.beginRun(1, 1234);
        progress.beginFile(1, QStringLiteral("small.jpg"), 1234);
        CopyResult result;
        QString error;
        REQUIRE(engine.copyFile(source, target, 1234, &result, &error));
        REQUIRE(error.isEmpty());
        REQUIRE(result.bytesCopied == 1234);
        REQUIRE(readAll(target) == readAll(source));
        REQUIRE(progress.counters().currentFileBytesDone == 1234);
        REQUIRE_FALSE(progress.counters().fileClockRunning);
    }

    SECTION("File larger than one buffer")
    {
        const qint64 size = CopyEngine::bufferSize * 2 + 777;
        const QString source = root.filePath(QStringLiteral("in/big.mov"));
        const QString target = root.filePath(QStringLiteral("big.mov"));
        REQUIRE(writeFile(source, size, minutesAfterBase(3)));

        progress.beginRun(1, size);
        progress.beginFile(1, QStringLiteral("big.mov"), size);
        CopyResult result;
        QString error;
        REQUIRE(engine.copyFile(source, target, size, &result, &error));
        REQUIRE(result.bytesCopied == size);
        REQUIRE(QFileInfo(target).size() == size);
        REQUIRE(readAll(target) == readAll(source));

        progress.completeFile(result.bytesCopied);
        REQUIRE(progress.counters().totalBytesDone == size);
        REQUIRE(progress.counters().currentFileBytesDone == 0);
    }

    SECTION("Empty file")
    {
        const QString source = root.filePath(QStringLiteral("in/empty.png"));
        const QString target = root.filePath(QStringLiteral("empty.png"));
        REQUIRE(writeFile(source, 0, minutesAfterBase(3)));
        CopyResult result;
        QString error;
        REQUIRE(engine.copyFile(source, target, 0, &result, &error));
        REQUIRE(result.bytesCopied == 0);
        REQUIRE(QFileInfo::exists(target));
    }
}

TEST_CASE("copyFile - modification time carried over", "[copy]")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QDir root(dir.path());
    const QString source = root.filePath(QStringLiteral("in/clip.mp4"));
    const QString target = root.filePath(QStringLiteral("clip.mp4"));
    REQUIRE(writeFile(source, 64, minutesAfterBase(-120)));

    CopyEngine engine;
    CopyResult result;
    QString error;
    REQUIRE(engine.copyFile(source, target, -1, &result, &error));
    REQUIRE(result.timesPreserved);
    REQUIRE(QFileInfo(target).lastModified() == minutesAfterBase(-120));
}

TEST_CASE("copyFile - failures", "[copy]")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QDir root(dir.path());
    CopyEngine engine;
    CopyResult result;
    QString error;

    SECTION("Missing source")
    {
        REQUIRE_FALSE(engine.copyFile(root.filePath(QStringLiteral("nope.mp4")),
                                      root.filePath(QStringLiteral("out.mp4")), 10, &result, &error));
        REQUIRE(error.startsWith(QStringLiteral("Cannot open")));
        REQUIRE_FALSE(QFileInfo::exists(root.filePath(QStringLiteral("out.mp4"))));
    }

    SECTION("Target folder missing")
    {
        const QString source = root.filePath(QStringLiteral("a.mp4"));
        REQUIRE(writeFile(source, 10, minutesAfterBase(0)));
        REQUIRE_FALSE(engine.copyFile(source, root.filePath(QStringLiteral("missing/a.mp4")), 10, &result, &error));
        REQUIRE(error.startsWith(QStringLiteral("Cannot create")));
    }

    SECTION("Source changed since the scan removes the partial target")
    {
        const QString source = root.filePath(QStringLiteral("grown.mp4"));
        const QString target = root.filePath(QStringLiteral("out/grown.mp4"));
        REQUIRE(writeFile(source, 4096, minutesAfterBase(0)));
        REQUIRE(QDir().mkpath(root.filePath(QStringLiteral("out"))));
        REQUIRE_FALSE(engine.copyFile(source, target, 1000, &result, &error));
        REQUIRE(error.contains(QStringLiteral("changed during copy")));
        REQUIRE_FALSE(QFileInfo::exists(target));
    }
}

TEST_CASE("uniqueTargetPath - never overwrites", "[copy]")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QDir root(dir.path());
    REQUIRE(FileOperationUtils::uniqueTargetPath(dir.path(), QStringLiteral("a.jpg")) == root.filePath(QStringLiteral("a.jpg")));

    REQUIRE(writeFile(root.filePath(QStringLiteral("a.jpg")), 1, minutesAfterBase(0)));
    REQUIRE(FileOperationUtils::uniqueTargetPath(dir.path(), QStringLiteral("a.jpg")) == root.filePath(QStringLiteral("a (2).jpg")));

    REQUIRE(writeFile(root.filePath(QStringLiteral("a (2).jpg")), 1, minutesAfterBase(0)));
    REQUIRE(FileOperationUtils::uniqueTargetPath(dir.path(), QStringLiteral("a.jpg")) == root.filePath(QStringLiteral("a (3).jpg")));
}

TEST_CASE("ensureFolder - creates nested folders and rejects files", "[copy]")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QDir root(dir.path());
    QString error;
    REQUIRE(FileOperationUtils::ensureFolder(root.filePath(QStringLiteral("x/y/z")), "test", &error));
    REQUIRE(QFileInfo(root.filePath(QStringLiteral("x/y/z"))).isDir());

    REQUIRE(writeFile(root.filePath(QStringLiteral("file")), 1, minutesAfterBase(0)));
    REQUIRE_FALSE(FileOperationUtils::ensureFolder(root.filePath(QStringLiteral("file")), "test", &error));
    REQUIRE(error.contains(QStringLiteral("not a folder")));
}
