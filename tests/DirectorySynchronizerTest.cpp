#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <memory>

#include "ConnectionPool.h"
#include "FakeTransport.h"
#include "FileSessionManager.h"
#include "Sync/DirectorySynchronizer.h"
#include "Transfer/SessionTransferBackend.h"
#include "Transfer/TransferCoordinator.h"

static FileEntry fileEntry(const QString& path, qint64 size, const QDateTime& modified)
{
    FileEntry e;
    e.path = path;
    e.name = QFileInfo(path).fileName();
    e.size = size;
    e.modified = modified;
    e.type = FileEntry::Type::File;
    return e;
}

static FileEntry dirEntry(const QString& path)
{
    FileEntry e;
    e.path = path;
    e.name = QFileInfo(path).fileName();
    e.size = -1;
    e.type = FileEntry::Type::Directory;
    return e;
}

static bool writeFile(const QString& path, const QByteArray& data, const QDateTime& modified = QDateTime())
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    if (f.write(data) != data.size())
        return false;
    if (modified.isValid() && !f.setFileTime(modified, QFileDevice::FileModificationTime))
        return false;
    return true;
}

static const SyncItem* findItem(const QVector<SyncItem>& items, const QString& name)
{
    for (const SyncItem& it : items) {
        if (it.name == name)
            return &it;
    }
    return nullptr;
}

// ------------------------------------------------------------
// Classification
// ------------------------------------------------------------

class SyncClassifyTest : public ::testing::Test {
protected:
    QDateTime t = QDateTime::fromMSecsSinceEpoch(1700000000000LL, Qt::UTC);
    DirectorySynchronizer::EntryMap left;
    DirectorySynchronizer::EntryMap right;
    SyncOptions options;
};

TEST_F(SyncClassifyTest, NewerRightSideProducesUpdateToLeft) {
    left.insert("a.txt", fileEntry("/l/a.txt", 100, t));
    right.insert("a.txt", fileEntry("/r/a.txt", 100, t.addSecs(10)));

    const QVector<SyncItem> items = DirectorySynchronizer::classify(left, right, options);
    ASSERT_EQ(items.size(), 1);
    EXPECT_EQ(items[0].name, "a.txt");
    EXPECT_EQ(items[0].action, SyncItem::Action::Update);
    EXPECT_EQ(items[0].direction, SyncItem::Direction::RightToLeft);
    EXPECT_TRUE(items[0].reason.contains("right is newer"));
}

TEST_F(SyncClassifyTest, TimesWithinToleranceAreEqual) {
    left.insert("a.txt", fileEntry("/l/a.txt", 100, t));
    right.insert("a.txt", fileEntry("/r/a.txt", 100, t.addMSecs(1500)));

    EXPECT_TRUE(DirectorySynchronizer::classify(left, right, options).isEmpty());

    options.toleranceMs = 1000;
    EXPECT_EQ(DirectorySynchronizer::classify(left, right, options).size(), 1);
}

TEST_F(SyncClassifyTest, SizeDifferenceUsesNewerSideForDirection) {
    left.insert("a.txt", fileEntry("/l/a.txt", 120, t.addSecs(60)));
    right.insert("a.txt", fileEntry("/r/a.txt", 100, t));

    const QVector<SyncItem> items = DirectorySynchronizer::classify(left, right, options);
    ASSERT_EQ(items.size(), 1);
    EXPECT_EQ(items[0].direction, SyncItem::Direction::LeftToRight);
    EXPECT_TRUE(items[0].reason.startsWith("Size differs"));
    EXPECT_EQ(items[0].leftSize, 120);
    EXPECT_EQ(items[0].rightSize, 100);
}

TEST_F(SyncClassifyTest, DisabledCriteriaIgnoreDifferences) {
    left.insert("a.txt", fileEntry("/l/a.txt", 120, t.addSecs(60)));
    right.insert("a.txt", fileEntry("/r/a.txt", 100, t));

    options.compareSize = false;
    options.compareDate = false;
    EXPECT_TRUE(DirectorySynchronizer::classify(left, right, options).isEmpty());
}

TEST_F(SyncClassifyTest, OneSidedEntriesAreCopiedNeverDeleted) {
    left.insert("only-left.txt", fileEntry("/l/only-left.txt", 1, t));
    right.insert("only-right.txt", fileEntry("/r/only-right.txt", 1, t));
    right.insert("folder", dirEntry("/r/folder"));

    const QVector<SyncItem> items = DirectorySynchronizer::classify(left, right, options);
    ASSERT_EQ(items.size(), 3);

    const SyncItem* l = findItem(items, "only-left.txt");
    ASSERT_NE(l, nullptr);
    EXPECT_EQ(l->action, SyncItem::Action::Copy);
    EXPECT_EQ(l->direction, SyncItem::Direction::LeftToRight);
    EXPECT_TRUE(l->rightPath.isEmpty());

    const SyncItem* r = findItem(items, "only-right.txt");
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->direction, SyncItem::Direction::RightToLeft);

    const SyncItem* d = findItem(items, "folder");
    ASSERT_NE(d, nullptr);
    EXPECT_TRUE(d->isDirectory());

    for (const SyncItem& it : items)
        EXPECT_NE(it.action, SyncItem::Action::Delete);
}

TEST_F(SyncClassifyTest, TypeMismatchIsAConflict) {
    left.insert("x", fileEntry("/l/x", 5, t));
    right.insert("x", dirEntry("/r/x"));

    const QVector<SyncItem> items = DirectorySynchronizer::classify(left, right, options);
    ASSERT_EQ(items.size(), 1);
    EXPECT_EQ(items[0].direction, SyncItem::Direction::Conflict);
    EXPECT_EQ(items[0].action, SyncItem::Action::Skip);
    EXPECT_TRUE(items[0].reason.startsWith("Type mismatch"));
}

TEST_F(SyncClassifyTest, MatchingDirectoriesAreNotReported) {
    left.insert("d", dirEntry("/l/d"));
    right.insert("d", dirEntry("/r/d"));
    EXPECT_TRUE(DirectorySynchronizer::classify(left, right, options).isEmpty());
}

TEST_F(SyncClassifyTest, ItemsAreSortedByName) {
    left.insert("b", fileEntry("/l/b", 1, t));
    left.insert("a", fileEntry("/l/a", 1, t));
    left.insert("c/d", fileEntry("/l/c/d", 1, t));

    const QVector<SyncItem> items = DirectorySynchronizer::classify(left, right, options);
    ASSERT_EQ(items.size(), 3);
    EXPECT_EQ(items[0].name, "a");
    EXPECT_EQ(items[1].name, "b");
    EXPECT_EQ(items[2].name, "c/d");
}

TEST(SyncFilterTest, IncludeAndExcludeGlobs) {
    SyncOptions o;
    EXPECT_TRUE(DirectorySynchronizer::passesFilters("anything", o));

    o.includeGlob = "*.txt";
    EXPECT_TRUE(DirectorySynchronizer::passesFilters("notes.txt", o));
    EXPECT_FALSE(DirectorySynchronizer::passesFilters("notes.md", o));

    o.includeGlob.clear();
    o.excludeGlob = "*.log";
    EXPECT_FALSE(DirectorySynchronizer::passesFilters("server.log", o));
    EXPECT_TRUE(DirectorySynchronizer::passesFilters("server.txt", o));
}

TEST(SyncMirrorTest, TargetOnlyItemsBecomeDeletions) {
    QVector<SyncItem> items;
    SyncItem keep;
    keep.name = "new.txt";
    keep.action = SyncItem::Action::Copy;
    keep.direction = SyncItem::Direction::LeftToRight;
    items << keep;

    SyncItem oldDir;
    oldDir.name = "old";
    oldDir.type = FileEntry::Type::Directory;
    oldDir.action = SyncItem::Action::Copy;
    oldDir.direction = SyncItem::Direction::RightToLeft;
    items << oldDir;

    SyncItem oldFile;
    oldFile.name = "old/x.txt";
    oldFile.action = SyncItem::Action::Copy;
    oldFile.direction = SyncItem::Direction::RightToLeft;
    items << oldFile;

    SyncItem stray;
    stray.name = "stray.txt";
    stray.action = SyncItem::Action::Copy;
    stray.direction = SyncItem::Direction::RightToLeft;
    items << stray;

    const QVector<SyncItem> mirrored = DirectorySynchronizer::withDeletions(items, SyncItem::Direction::LeftToRight);
    ASSERT_EQ(mirrored.size(), 3);
    EXPECT_EQ(mirrored[0].action, SyncItem::Action::Copy);
    EXPECT_EQ(mirrored[1].name, "old");
    EXPECT_EQ(mirrored[1].action, SyncItem::Action::Delete);
    EXPECT_EQ(mirrored[1].direction, SyncItem::Direction::LeftToRight);
    EXPECT_EQ(mirrored[2].name, "stray.txt");
    EXPECT_EQ(mirrored[2].action, SyncItem::Action::Delete);

    EXPECT_EQ(DirectorySynchronizer::withDeletions(items, SyncItem::Direction::Conflict).size(), items.size());
}

// ------------------------------------------------------------
// Local folders
// ------------------------------------------------------------

class LocalSyncTest : public ::testing::Test {
protected:
    QTemporaryDir tmp;
    QString leftRoot;
    QString rightRoot;
    DirectorySynchronizer sync{nullptr, std::make_shared<QtLocalFileSystem>()};

    void SetUp() override {
        ASSERT_TRUE(tmp.isValid());
        leftRoot = tmp.filePath("left");
        rightRoot = tmp.filePath("right");
        QDir().mkpath(leftRoot);
        QDir().mkpath(rightRoot);
    }
};

TEST_F(LocalSyncTest, CompareAndExecuteBothDirections) {
    const QDateTime old = QDateTime::currentDateTime().addDays(-2);
    const QDateTime recent = QDateTime::currentDateTime().addDays(-1);

    ASSERT_TRUE(writeFile(leftRoot + "/a.txt", "left version", old));
    ASSERT_TRUE(writeFile(rightRoot + "/a.txt", "right version!", recent));
    ASSERT_TRUE(writeFile(leftRoot + "/docs/guide.md", "guide"));
    ASSERT_TRUE(writeFile(rightRoot + "/extra.bin", "xx"));

    const SyncSide left = SyncSide::local(leftRoot);
    const SyncSide right = SyncSide::local(rightRoot);

    QVector<SyncItem> items;
    RemoteError err;
    ASSERT_TRUE(sync.compare(left, right, SyncOptions(), &items, &err)) << err.toString().toStdString();

    const SyncItem* a = findItem(items, "a.txt");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->direction, SyncItem::Direction::RightToLeft);
    ASSERT_NE(findItem(items, "docs"), nullptr);
    ASSERT_NE(findItem(items, "docs/guide.md"), nullptr);
    ASSERT_NE(findItem(items, "extra.bin"), nullptr);

    SyncReport report;
    int steps = 0;
    ASSERT_TRUE(sync.execute(left, right, items, SyncOptions(),
                             [&](int, int, const QString&) { steps++; }, &report, &err))
        << err.toString().toStdString();

    EXPECT_EQ(report.executed, items.size());
    EXPECT_EQ(report.failed, 0);
    EXPECT_EQ(steps, items.size());

    QFile la(leftRoot + "/a.txt");
    ASSERT_TRUE(la.open(QIODevice::ReadOnly));
    EXPECT_EQ(la.readAll(), "right version!");
    EXPECT_TRUE(QFileInfo::exists(rightRoot + "/docs/guide.md"));
    EXPECT_TRUE(QFileInfo::exists(leftRoot + "/extra.bin"));

    SyncOptions sizeOnly;
    sizeOnly.compareDate = false;
    ASSERT_TRUE(sync.compare(left, right, sizeOnly, &items, &err));
    EXPECT_TRUE(items.isEmpty());
}

TEST_F(LocalSyncTest, FiltersApplyToBothTrees) {
    ASSERT_TRUE(writeFile(leftRoot + "/keep.txt", "k"));
    ASSERT_TRUE(writeFile(leftRoot + "/skip.log", "s"));
    ASSERT_TRUE(writeFile(rightRoot + "/other.log", "o"));

    SyncOptions o;
    o.excludeGlob = "*.log";

    QVector<SyncItem> items;
    ASSERT_TRUE(sync.compare(SyncSide::local(leftRoot), SyncSide::local(rightRoot), o, &items));
    ASSERT_EQ(items.size(), 1);
    EXPECT_EQ(items[0].name, "keep.txt");
}

TEST_F(LocalSyncTest, MirrorDeletesTargetOnlyEntries) {
    ASSERT_TRUE(writeFile(leftRoot + "/a.txt", "a"));
    ASSERT_TRUE(writeFile(rightRoot + "/a.txt", "a"));
    ASSERT_TRUE(writeFile(rightRoot + "/gone/deep/x.txt", "x"));
    ASSERT_TRUE(writeFile(rightRoot + "/stale.txt", "s"));

    SyncOptions o;
    o.compareDate = false;
    const SyncSide left = SyncSide::local(leftRoot);
    const SyncSide right = SyncSide::local(rightRoot);

    QVector<SyncItem> items;
    ASSERT_TRUE(sync.compare(left, right, o, &items));
    items = DirectorySynchronizer::withDeletions(items, SyncItem::Direction::LeftToRight);

    RemoteError err;
    ASSERT_TRUE(sync.execute(left, right, items, o, nullptr, nullptr, &err)) << err.toString().toStdString();
    EXPECT_FALSE(QFileInfo::exists(rightRoot + "/gone"));
    EXPECT_FALSE(QFileInfo::exists(rightRoot + "/stale.txt"));
    EXPECT_TRUE(QFileInfo::exists(rightRoot + "/a.txt"));
    EXPECT_TRUE(QFileInfo::exists(leftRoot + "/a.txt"));
}

TEST_F(LocalSyncTest, ConflictsAreSkipped) {
    ASSERT_TRUE(writeFile(leftRoot + "/x", "file"));
    ASSERT_TRUE(writeFile(rightRoot + "/x/inner.txt", "i"));

    QVector<SyncItem> items;
    ASSERT_TRUE(sync.compare(SyncSide::local(leftRoot), SyncSide::local(rightRoot), SyncOptions(), &items));

    SyncReport report;
    QVector<SyncItem> conflicts;
    for (const SyncItem& it : items) {
        if (it.direction == SyncItem::Direction::Conflict)
            conflicts << it;
    }
    ASSERT_EQ(conflicts.size(), 1);
    ASSERT_TRUE(sync.execute(SyncSide::local(leftRoot), SyncSide::local(rightRoot), conflicts, SyncOptions(),
                             nullptr, &report));
    EXPECT_EQ(report.skipped, 1);
    EXPECT_EQ(report.executed, 0);
}

TEST_F(LocalSyncTest, MissingRootFailsCompare) {
    QVector<SyncItem> items;
    RemoteError err;
    EXPECT_FALSE(sync.compare(SyncSide::local(tmp.filePath("nope")), SyncSide::local(rightRoot),
                              SyncOptions(), &items, &err));
    EXPECT_EQ(err.kind(), RemoteError::Kind::NotFound);
}

// ------------------------------------------------------------
// Local <-> remote through the in-memory host
// ------------------------------------------------------------

class RemoteSyncTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeServer> server = std::make_shared<FakeServer>();
    std::unique_ptr<ConnectionPool> pool;
    std::unique_ptr<FileSessionManager> sessions;
    QTemporaryDir tmp;
    HostDescriptor host = makeTestHost("h1");

    void SetUp() override {
        RemoteSettings s;
        s.retryInitialDelayMs = 5;
        s.retryMaxDelayMs = 20;
        s.chunkSize = 1024;
        pool = std::make_unique<ConnectionPool>(server->factory());
        sessions = std::make_unique<FileSessionManager>(pool.get(), std::make_shared<StaticCredentialResolver>(), s);
        sessions->setHealthMonitoring(false);
        sessions->setHosts({host});
    }

    void TearDown() override {
        sessions->dispose();
        sessions.reset();
        pool.reset();
    }
};

TEST_F(RemoteSyncTest, PushLocalTreeAndMirror) {
    const QString localRoot = tmp.filePath("site");
    ASSERT_TRUE(writeFile(localRoot + "/index.html", "<html>new</html>"));
    ASSERT_TRUE(writeFile(localRoot + "/css/site.css", "body{}"));

    server->addFile("/srv/site/index.html", "<html>old</html>!", QDateTime::currentDateTime().addDays(-1));
    server->addFile("/srv/site/stale.log", "zzz");

    DirectorySynchronizer sync(sessions.get(), std::make_shared<QtLocalFileSystem>());
    const SyncSide left = SyncSide::local(localRoot);
    const SyncSide right = SyncSide::remote(host, "/srv/site");

    QVector<SyncItem> items;
    RemoteError err;
    ASSERT_TRUE(sync.compare(left, right, SyncOptions(), &items, &err)) << err.toString().toStdString();
    EXPECT_EQ(findItem(items, "index.html")->direction, SyncItem::Direction::LeftToRight);

    items = DirectorySynchronizer::withDeletions(items, SyncItem::Direction::LeftToRight);
    SyncReport report;
    ASSERT_TRUE(sync.execute(left, right, items, SyncOptions(), nullptr, &report, &err))
        << err.toString().toStdString();

    EXPECT_EQ(server->fileData("/srv/site/index.html"), "<html>new</html>");
    EXPECT_EQ(server->fileData("/srv/site/css/site.css"), "body{}");
    EXPECT_FALSE(server->hasNode("/srv/site/stale.log"));
    EXPECT_EQ(report.queued, 0);
}

TEST_F(RemoteSyncTest, PullRemoteTreeIntoLocalFolder) {
    server->addFile("/home/alice/proj/a.txt", "A");
    server->addFile("/home/alice/proj/lib/b.txt", "BB");

    const QString localRoot = tmp.filePath("proj");
    QDir().mkpath(localRoot);

    DirectorySynchronizer sync(sessions.get(), std::make_shared<QtLocalFileSystem>());
    const SyncSide left = SyncSide::remote(host, "~/proj");
    const SyncSide right = SyncSide::local(localRoot);

    QVector<SyncItem> items;
    RemoteError err;
    ASSERT_TRUE(sync.compare(left, right, SyncOptions(), &items, &err)) << err.toString().toStdString();
    ASSERT_TRUE(sync.execute(left, right, items, SyncOptions(), nullptr, nullptr, &err))
        << err.toString().toStdString();

    QFile b(localRoot + "/lib/b.txt");
    ASSERT_TRUE(b.open(QIODevice::ReadOnly));
    EXPECT_EQ(b.readAll(), "BB");
}

TEST_F(RemoteSyncTest, LargeFilesAreQueuedOnTheCoordinator) {
    RemoteSettings s;
    s.schedulerTickMs = 600000;
    TransferCoordinator coordinator(std::make_shared<SessionTransferBackend>(sessions.get()), s);

    const QString localRoot = tmp.filePath("big");
    ASSERT_TRUE(writeFile(localRoot + "/small.txt", "s"));
    ASSERT_TRUE(writeFile(localRoot + "/large.bin", QByteArray(4096, 'L')));
    server->addDir("/srv/big");

    DirectorySynchronizer sync(sessions.get(), std::make_shared<QtLocalFileSystem>(), &coordinator);
    const SyncSide left = SyncSide::local(localRoot);
    const SyncSide right = SyncSide::remote(host, "/srv/big");

    SyncOptions o;
    o.largeFileThreshold = 1024;

    QVector<SyncItem> items;
    ASSERT_TRUE(sync.compare(left, right, o, &items));
    SyncReport report;
    RemoteError err;
    ASSERT_TRUE(sync.execute(left, right, items, o, nullptr, &report, &err)) << err.toString().toStdString();

    EXPECT_EQ(report.executed, 1);
    EXPECT_EQ(report.queued, 1);
    ASSERT_EQ(report.queuedJobIds.size(), 1);
    EXPECT_TRUE(server->hasNode("/srv/big/small.txt"));
    EXPECT_FALSE(server->hasNode("/srv/big/large.bin"));

    TransferJob job;
    ASSERT_TRUE(coordinator.job(report.queuedJobIds.first(), &job));
    EXPECT_EQ(job.kind, TransferJob::Kind::Upload);
    EXPECT_EQ(job.priority, o.queuedPriority);
    EXPECT_EQ(job.remotePath, "/srv/big/large.bin");

    coordinator.dispose();
}

TEST_F(RemoteSyncTest, SameHostCopiesServerSide) {
    server->addFile("/srv/a/x.txt", "X");
    server->addDir("/srv/b");

    DirectorySynchronizer sync(sessions.get(), std::make_shared<QtLocalFileSystem>());
    const SyncSide left = SyncSide::remote(host, "/srv/a");
    const SyncSide right = SyncSide::remote(host, "/srv/b");

    QVector<SyncItem> items;
    RemoteError err;
    ASSERT_TRUE(sync.compare(left, right, SyncOptions(), &items, &err));
    ASSERT_TRUE(sync.execute(left, right, items, SyncOptions(), nullptr, nullptr, &err))
        << err.toString().toStdString();

    EXPECT_EQ(server->fileData("/srv/b/x.txt"), "X");
    ASSERT_FALSE(server->commands().isEmpty());
    EXPECT_TRUE(server->commands().first().startsWith("cp -r "));
}
