#include <gtest/gtest.h>

#include <QFile>
#include <QIODevice>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "OperationError.h"
#include "PlatformUtils.h"
#include "TagStore.h"
#include "TestDirectory.h"

namespace {

QJsonObject readDocument(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QJsonObject();
    }
    return QJsonDocument::fromJson(file.readAll()).object();
}

} // namespace

class TagStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        storagePath = dir.path(".tags.json");
        ASSERT_TRUE(store.load(storagePath));
    }

    TestDirectory dir;
    QString storagePath;
    TagStore store;
};

TEST_F(TagStoreTest, MissingFileLoadsEmpty) {
    EXPECT_TRUE(store.paths().isEmpty());
    EXPECT_TRUE(store.tags("/m/x").isEmpty());
    EXPECT_FALSE(QFile::exists(storagePath));
}

TEST_F(TagStoreTest, AddThenRemoveSurvivesReload) {
    ASSERT_TRUE(store.addTag("/m/x", "armor"));
    EXPECT_EQ(store.tags("/m/x"), QStringList{"armor"});

    ASSERT_TRUE(store.removeTag("/m/x", "armor"));
    EXPECT_TRUE(store.tags("/m/x").isEmpty());

    TagStore reloaded;
    ASSERT_TRUE(reloaded.load(storagePath));
    EXPECT_TRUE(reloaded.tags("/m/x").isEmpty());
    EXPECT_FALSE(readDocument(storagePath).contains(PlatformUtils::normalizePath("/m/x")));
}

TEST_F(TagStoreTest, AddIsIdempotentAndOrdered) {
    store.addTag("/m/x", "armor");
    store.addTag("/m/x", "blue");
    store.addTag("/m/x", "armor");
    store.addTag("/m/x", "Armor");
    EXPECT_EQ(store.tags("/m/x"), (QStringList{"armor", "blue", "Armor"}));
}

TEST_F(TagStoreTest, BlankTagIsIgnored) {
    EXPECT_TRUE(store.addTag("/m/x", "  "));
    EXPECT_FALSE(store.hasTags("/m/x"));
}

TEST_F(TagStoreTest, TagTextIsTrimmedOnAddAndRemove) {
    store.addTag("/m/x", " armor ");
    EXPECT_EQ(store.tags("/m/x"), QStringList{"armor"});
    store.addTag("/m/x", "armor");
    EXPECT_EQ(store.tags("/m/x"), QStringList{"armor"});

    ASSERT_TRUE(store.removeTag("/m/x", " armor"));
    EXPECT_FALSE(store.hasTags("/m/x"));
}

TEST_F(TagStoreTest, RemovingAbsentTagIsNoOp) {
    store.addTag("/m/x", "armor");
    int changes = 0;
    QObject::connect(&store, &TagStore::tagsChanged, [&changes](const QString &) { ++changes; });

    EXPECT_TRUE(store.removeTag("/m/x", "weapon"));
    EXPECT_TRUE(store.removeTag("/m/y", "armor"));
    EXPECT_EQ(changes, 0);
    EXPECT_EQ(store.tags("/m/x"), QStringList{"armor"});
}

TEST_F(TagStoreTest, SetEmptyDeletesKeyFromDocument) {
    store.setTags("/m/x", {"a", "b", "a"});
    EXPECT_EQ(store.tags("/m/x"), (QStringList{"a", "b"}));
    EXPECT_TRUE(readDocument(storagePath).contains(PlatformUtils::normalizePath("/m/x")));

    ASSERT_TRUE(store.setTags("/m/x", {}));
    EXPECT_TRUE(store.tags("/m/x").isEmpty());
    EXPECT_FALSE(readDocument(storagePath).contains(PlatformUtils::normalizePath("/m/x")));
}

TEST_F(TagStoreTest, ClearTagsRemovesEverything) {
    store.setTags("/m/x", {"a", "b"});
    store.addTag("/m/y", "c");
    ASSERT_TRUE(store.clearTags("/m/x"));
    EXPECT_EQ(store.paths(), QStringList{PlatformUtils::normalizePath("/m/y")});
}

TEST_F(TagStoreTest, PathsAreNormalized) {
    store.addTag("/m/./sub/../x", "armor");
    EXPECT_EQ(store.tags("/m/x"), QStringList{"armor"});
    EXPECT_EQ(store.tags("/m//x/"), QStringList{"armor"});
}

TEST_F(TagStoreTest, DocumentIsFlatObjectOfStringArrays) {
    store.addTag("/m/x", "armor");
    store.addTag("/m/y", "weapon");

    const QJsonObject root = readDocument(storagePath);
    ASSERT_EQ(root.size(), 2);
    const QJsonArray tags = root.value(PlatformUtils::normalizePath("/m/x")).toArray();
    ASSERT_EQ(tags.size(), 1);
    EXPECT_EQ(tags.at(0).toString(), "armor");
}

TEST_F(TagStoreTest, MutationAnnouncesNormalizedPath) {
    QStringList announced;
    QObject::connect(&store, &TagStore::tagsChanged, [&announced](const QString &path) { announced.append(path); });

    store.addTag("/m/sub/../x", "armor");
    ASSERT_EQ(announced.size(), 1);
    EXPECT_EQ(announced.first(), PlatformUtils::normalizePath("/m/x"));
}

TEST_F(TagStoreTest, CorruptDocumentDegradesToEmpty) {
    QFile file(storagePath);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("{ \"/m/x\": [\"armor\"");
    file.close();

    TagStore corrupt;
    OperationError error;
    EXPECT_FALSE(corrupt.load(storagePath, &error));
    EXPECT_EQ(error.kind, OperationError::CorruptStore);
    EXPECT_TRUE(corrupt.paths().isEmpty());

    EXPECT_TRUE(corrupt.addTag("/m/y", "fresh"));
    EXPECT_EQ(corrupt.tags("/m/y"), QStringList{"fresh"});
}

TEST_F(TagStoreTest, NonObjectDocumentIsCorrupt) {
    QFile file(storagePath);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("[\"armor\"]");
    file.close();

    TagStore corrupt;
    OperationError error;
    EXPECT_FALSE(corrupt.load(storagePath, &error));
    EXPECT_EQ(error.kind, OperationError::CorruptStore);
}

TEST_F(TagStoreTest, InvalidValuesAreSkippedOnLoad) {
    QFile file(storagePath);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("{ \"/m/x\": \"armor\", \"/m/y\": [\"a\", 3, \"a\", \"b\"], \"/m/z\": [] }");
    file.close();

    TagStore loaded;
    ASSERT_TRUE(loaded.load(storagePath));
    EXPECT_TRUE(loaded.tags("/m/x").isEmpty());
    EXPECT_EQ(loaded.tags("/m/y"), (QStringList{"a", "b"}));
    EXPECT_FALSE(loaded.hasTags("/m/z"));
}

TEST_F(TagStoreTest, PersistFailureKeepsSessionState) {
    TagStore unwritable;
    ASSERT_TRUE(unwritable.load(dir.path("missing-folder/.tags.json")));

    OperationError error;
    EXPECT_FALSE(unwritable.addTag("/m/x", "armor", &error));
    EXPECT_EQ(error.kind, OperationError::PersistFailure);
    EXPECT_EQ(error.path, PlatformUtils::normalizePath("/m/x"));
    EXPECT_EQ(unwritable.tags("/m/x"), QStringList{"armor"});
}

TEST_F(TagStoreTest, MovePathCarriesEntriesBelowIt) {
    store.addTag("/m/Pack", "armor");
    store.addTag("/m/Pack/inner", "blue");
    store.addTag("/m/Pack/deep/leaf", "red");
    store.addTag("/m/Package", "other");

    int changes = 0;
    QObject::connect(&store, &TagStore::tagsChanged, [&changes](const QString &) { ++changes; });
    ASSERT_TRUE(store.movePath("/m/Pack", "/m/DISABLED_Pack"));

    EXPECT_EQ(changes, 1);
    EXPECT_EQ(store.tags("/m/DISABLED_Pack"), QStringList{"armor"});
    EXPECT_EQ(store.tags("/m/DISABLED_Pack/inner"), QStringList{"blue"});
    EXPECT_EQ(store.tags("/m/DISABLED_Pack/deep/leaf"), QStringList{"red"});
    EXPECT_FALSE(store.hasTags("/m/Pack"));
    EXPECT_FALSE(store.hasTags("/m/Pack/inner"));
    EXPECT_EQ(store.tags("/m/Package"), QStringList{"other"});

    TagStore reloaded;
    ASSERT_TRUE(reloaded.load(storagePath));
    EXPECT_EQ(reloaded.tags("/m/DISABLED_Pack/inner"), QStringList{"blue"});
}

TEST_F(TagStoreTest, MovingUntaggedPathChangesNothing) {
    store.addTag("/m/x", "armor");
    int changes = 0;
    QObject::connect(&store, &TagStore::tagsChanged, [&changes](const QString &) { ++changes; });

    EXPECT_TRUE(store.movePath("/m/y", "/m/z"));
    EXPECT_EQ(changes, 0);
    EXPECT_EQ(store.paths(), QStringList{PlatformUtils::normalizePath("/m/x")});
}
