#include <QtTest/QtTest>
#include "core/fs/file_scanner.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

class TestFileScanner : public QObject {
    Q_OBJECT

private slots:
    void testExtensionAllowList();
    void testRecursiveScanFindsImagesOnly();
    void testOrderIsDeterministic();
    void testMissingRootIsEmpty();
    void testSymlinkedDirectoryNotFollowed();
    void testDeniedDirectoryIsSkipped();
    void testCancelledScanStopsEarly();

private:
    static void touch(const QString& path);
};

void TestFileScanner::touch(const QString& path)
{
    QVERIFY(QDir().mkpath(QFileInfo(path).absolutePath()));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("x");
}

void TestFileScanner::testExtensionAllowList()
{
    QVERIFY(vl::FileScanner::isSupportedImage("photo.jpg"));
    QVERIFY(vl::FileScanner::isSupportedImage("PHOTO.JPEG"));
    QVERIFY(vl::FileScanner::isSupportedImage("scan.TiF"));
    QVERIFY(vl::FileScanner::isSupportedImage("shot.webp"));
    QVERIFY(vl::FileScanner::isSupportedImage("raw.CR2"));
    QVERIFY(vl::FileScanner::isSupportedImage("raw.nef"));
    QVERIFY(vl::FileScanner::isSupportedImage("raw.dng"));

    QVERIFY(!vl::FileScanner::isSupportedImage("notes.txt"));
    QVERIFY(!vl::FileScanner::isSupportedImage("movie.mp4"));
    QVERIFY(!vl::FileScanner::isSupportedImage("README"));
    QVERIFY(!vl::FileScanner::isSupportedImage("archive.png.zip"));

    QVERIFY(vl::FileScanner::rawExtensions().contains("arw"));
    QVERIFY(!vl::FileScanner::rasterExtensions().contains("arw"));
}

void TestFileScanner::testRecursiveScanFindsImagesOnly()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    touch(dir.filePath("a.png"));
    touch(dir.filePath("notes.txt"));
    touch(dir.filePath("trip/day1/b.jpg"));
    touch(dir.filePath("trip/day1/c.NEF"));
    touch(dir.filePath("trip/day2/deep/er/d.gif"));
    touch(dir.filePath(".hidden/e.png"));

    vl::FileScanner scanner;
    vl::ScanStats stats;
    const QStringList found = scanner.scanDirectory(dir.path(), nullptr, &stats);

    QCOMPARE(found.size(), 5);
    QCOMPARE(stats.candidates, static_cast<uint64_t>(5));
    QVERIFY(stats.ignored >= 1);
    for (const QString& path : found) {
        QVERIFY(QFileInfo(path).isAbsolute());
        QVERIFY(!path.endsWith(".txt"));
    }
    QVERIFY(found.contains(QDir::cleanPath(dir.filePath("trip/day2/deep/er/d.gif"))));
    QVERIFY(found.contains(QDir::cleanPath(dir.filePath(".hidden/e.png"))));
}

void TestFileScanner::testOrderIsDeterministic()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    touch(dir.filePath("c.png"));
    touch(dir.filePath("a.png"));
    touch(dir.filePath("b/x.png"));

    vl::FileScanner scanner;
    const QStringList first = scanner.scanDirectory(dir.path());
    const QStringList second = scanner.scanDirectory(dir.path());
    QCOMPARE(first, second);
    QCOMPARE(first.first(), QDir::cleanPath(dir.filePath("a.png")));
}

void TestFileScanner::testMissingRootIsEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    vl::FileScanner scanner;
    QVERIFY(scanner.scanDirectory(dir.filePath("does-not-exist")).isEmpty());

    touch(dir.filePath("file.png"));
    QVERIFY(scanner.scanDirectory(dir.filePath("file.png")).isEmpty());
}

void TestFileScanner::testSymlinkedDirectoryNotFollowed()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    touch(dir.filePath("real/a.png"));
    if (!QFile::link(dir.filePath("real"), dir.filePath("real/loop"))) {
        QSKIP("Symbolic links are not available on this host");
    }

    vl::FileScanner scanner;
    const QStringList found = scanner.scanDirectory(dir.path());
    QCOMPARE(found.size(), 1);
}

void TestFileScanner::testDeniedDirectoryIsSkipped()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    touch(dir.filePath("open/a.png"));
    touch(dir.filePath("locked/b.png"));

    const QString locked = dir.filePath("locked");
    QVERIFY(QFile::setPermissions(locked, QFileDevice::WriteOwner));
    if (QFileInfo(locked).isReadable()) {
        QFile::setPermissions(locked, QFileDevice::ReadOwner | QFileDevice::WriteOwner
                                          | QFileDevice::ExeOwner);
        QSKIP("Unable to produce an unreadable directory on this host");
    }

    vl::FileScanner scanner;
    vl::ScanStats stats;
    const QStringList found = scanner.scanDirectory(dir.path(), nullptr, &stats);

    QFile::setPermissions(locked, QFileDevice::ReadOwner | QFileDevice::WriteOwner
                                      | QFileDevice::ExeOwner);

    QCOMPARE(found.size(), 1);
    QVERIFY(found.first().endsWith("open/a.png"));
    QCOMPARE(stats.deniedDirectories, static_cast<uint64_t>(1));
}

void TestFileScanner::testCancelledScanStopsEarly()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    touch(dir.filePath("a/1.png"));
    touch(dir.filePath("b/2.png"));

    vl::CancellationToken token;
    token.cancel();

    vl::FileScanner scanner;
    QVERIFY(scanner.scanDirectory(dir.path(), &token).isEmpty());
}

QTEST_GUILESS_MAIN(TestFileScanner)
#include "test_file_scanner.moc"
