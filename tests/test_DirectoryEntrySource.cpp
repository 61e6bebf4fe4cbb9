#include <gtest/gtest.h>

#include <QEventLoop>
#include <QSet>
#include <QTimer>

#include "DirectoryEntrySource.h"
#include "TestDirectory.h"

class DirectoryEntrySourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        QObject::connect(&source, &EntrySource::childrenChanged,
                         [this](const QString &) { ++changes; });
    }

    TestDirectory dir;
    DirectoryEntrySource source;
    int changes = 0;
};

TEST_F(DirectoryEntrySourceTest, ListsFilesAndFoldersButNotHiddenEntries) {
    dir.createFile("Foo");
    dir.createFolder("Bar");
    dir.createFile(".tags.json", "{}");

    source.setDirectory(dir.path());

    ASSERT_EQ(source.count(), 2);
    QSet<QString> names;
    for (const Entry &entry : source.children(dir.path())) {
        names.insert(entry.rawName);
    }
    EXPECT_EQ(names, (QSet<QString>{"Foo", "Bar"}));
    EXPECT_EQ(source.index(dir.path(".tags.json")), -1);
}

TEST_F(DirectoryEntrySourceTest, HandlesResolveBothWays) {
    dir.createFile("Foo");
    dir.createFile("DISABLED_Baz");
    source.setDirectory(dir.path());

    for (int handle = 0; handle < source.count(); ++handle) {
        const QString path = source.filePath(handle);
        EXPECT_EQ(source.index(path), handle);
        EXPECT_EQ(source.entry(handle).path, path);
    }

    const int disabled = source.index(dir.path("DISABLED_Baz"));
    ASSERT_NE(disabled, -1);
    EXPECT_TRUE(source.entry(disabled).isDisabled);
    EXPECT_EQ(source.entry(disabled).effectiveName, "Baz");
}

TEST_F(DirectoryEntrySourceTest, UnknownPathsAndHandlesAreNotResolvable) {
    dir.createFile("Foo");
    source.setDirectory(dir.path());

    EXPECT_EQ(source.index(dir.path("Missing")), -1);
    EXPECT_EQ(source.index(QString()), -1);
    EXPECT_TRUE(source.filePath(-1).isEmpty());
    EXPECT_TRUE(source.filePath(source.count()).isEmpty());
    EXPECT_FALSE(source.entry(source.count()).isValid());
}

TEST_F(DirectoryEntrySourceTest, ListsOtherDirectoriesOnDemand) {
    dir.createFile("Foo");
    const QString sub = dir.createFolder("Sub");
    dir.createFile("Sub/Inner");
    source.setDirectory(dir.path());

    const QVector<Entry> inner = source.children(sub);
    ASSERT_EQ(inner.size(), 1);
    EXPECT_EQ(inner.first().rawName, "Inner");
    EXPECT_EQ(source.count(), 2);
    EXPECT_TRUE(source.children(QString()).isEmpty());
}

TEST_F(DirectoryEntrySourceTest, RefreshAnnouncesOnlyRealChanges) {
    dir.createFile("Foo");
    source.setDirectory(dir.path());
    const int afterOpen = changes;
    EXPECT_EQ(afterOpen, 1);

    source.refresh();
    EXPECT_EQ(changes, afterOpen);

    dir.createFile("Bar");
    source.refresh();
    EXPECT_EQ(changes, afterOpen + 1);
    EXPECT_EQ(source.count(), 2);
    EXPECT_NE(source.index(dir.path("Bar")), -1);
}

TEST_F(DirectoryEntrySourceTest, SwitchingToSameDirectoryDoesNotReload) {
    source.setDirectory(dir.path());
    const int afterOpen = changes;

    source.setDirectory(dir.path());
    EXPECT_EQ(changes, afterOpen);
}

TEST_F(DirectoryEntrySourceTest, WatcherAnnouncesNewEntries) {
    source.setDirectory(dir.path());
    const int afterOpen = changes;

    dir.createFile("Foo");
    dir.createFile("Bar");

    QEventLoop loop;
    QObject::connect(&source, &EntrySource::childrenChanged, &loop, &QEventLoop::quit);
    QTimer::singleShot(5000, &loop, &QEventLoop::quit);
    loop.exec();

    EXPECT_GT(changes, afterOpen);
    EXPECT_NE(source.index(dir.path("Foo")), -1);
    EXPECT_NE(source.index(dir.path("Bar")), -1);
}
