#include <gtest/gtest.h>

#include <QStringList>

#include "DirectoryEntrySource.h"
#include "FilterLayer.h"
#include "SortLayer.h"
#include "TagStore.h"
#include "TestDirectory.h"

namespace {

QStringList effectiveNames(const ViewLayer &layer)
{
    QStringList names;
    for (int row = 0; row < layer.rowCount(); ++row) {
        names.append(layer.entryAt(row).effectiveName);
    }
    return names;
}

} // namespace

class FilterLayerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(mods.isValid());
        ASSERT_TRUE(state.isValid());
        ASSERT_TRUE(tags.load(state.path("tags.json")));
    }

    void open() {
        source.setDirectory(mods.path());
        source.refresh();
        sortLayer.invalidate();
        filterLayer.invalidate();
    }

    TestDirectory mods;
    TestDirectory state;
    TagStore tags;
    DirectoryEntrySource source;
    SortLayer sortLayer{&source};
    FilterLayer filterLayer{&sortLayer, &tags};
};

TEST_F(FilterLayerTest, EmptySearchKeepsEverything) {
    mods.createFile("alpha");
    mods.createFile("beta");
    mods.createFile("DISABLED_gamma");
    open();

    EXPECT_EQ(filterLayer.rowCount(), 3);
    for (int row = 0; row < 3; ++row) {
        EXPECT_EQ(filterLayer.mapToSource(row), row);
    }
}

TEST_F(FilterLayerTest, MatchesTagWhenNoNameMatches) {
    const QString x = mods.createFile("x");
    mods.createFile("y");
    mods.createFile("z");
    tags.addTag(x, "armor");
    open();

    filterLayer.setSearchText("arm");
    ASSERT_EQ(filterLayer.rowCount(), 1);
    EXPECT_EQ(filterLayer.pathForRow(0), x);
}

TEST_F(FilterLayerTest, MatchesEffectiveNameIgnoringCase) {
    mods.createFile("DISABLED_Armor Pack");
    mods.createFile("Weapons");
    open();

    filterLayer.setSearchText("ARMOR");
    EXPECT_EQ(effectiveNames(filterLayer), QStringList{"Armor Pack"});

    filterLayer.setSearchText("disabled");
    EXPECT_EQ(filterLayer.rowCount(), 0);
}

TEST_F(FilterLayerTest, TagMatchIgnoresCase) {
    const QString x = mods.createFile("x");
    mods.createFile("y");
    tags.addTag(x, "HeavyArmor");
    open();

    filterLayer.setSearchText("armor");
    EXPECT_EQ(filterLayer.rowCount(), 1);
}

TEST_F(FilterLayerTest, HiddenRowsAreNotFoundFromSource) {
    mods.createFile("apple");
    mods.createFile("banana");
    mods.createFile("cherry");
    open();

    filterLayer.setSearchText("an");
    ASSERT_EQ(effectiveNames(filterLayer), QStringList{"banana"});
    EXPECT_EQ(filterLayer.mapFromSource(0), ViewLayer::NotFound);
    EXPECT_EQ(filterLayer.mapFromSource(1), 0);
    EXPECT_EQ(filterLayer.mapFromSource(2), ViewLayer::NotFound);
    EXPECT_EQ(filterLayer.rowForPath(mods.path("cherry")), ViewLayer::NotFound);
}

TEST_F(FilterLayerTest, RefiningSearchNeverAddsRows) {
    const QString first = mods.createFile("armor_light");
    mods.createFile("armory");
    mods.createFile("army");
    mods.createFile("boots");
    tags.addTag(first, "armament");
    open();

    const QString refined = "armor_";
    int previous = filterLayer.rowCount();
    for (int length = 1; length <= refined.size(); ++length) {
        filterLayer.setSearchText(refined.left(length));
        const int count = filterLayer.rowCount();
        EXPECT_LE(count, previous) << refined.left(length).toStdString();
        previous = count;
    }
}

TEST_F(FilterLayerTest, TagEditsApplyAfterInvalidate) {
    const QString y = mods.createFile("y");
    mods.createFile("z");
    open();

    filterLayer.setSearchText("blue");
    EXPECT_EQ(filterLayer.rowCount(), 0);

    tags.addTag(y, "blue");
    filterLayer.invalidate();
    ASSERT_EQ(filterLayer.rowCount(), 1);
    EXPECT_EQ(filterLayer.pathForRow(0), y);
}

TEST_F(FilterLayerTest, EntriesOutsideRootPathAreNotFiltered) {
    mods.createFile("apple");
    mods.createFile("banana");
    open();

    filterLayer.setRootPath(state.path());
    filterLayer.setSearchText("zzz");
    EXPECT_EQ(filterLayer.rowCount(), 2);

    filterLayer.setRootPath(mods.path());
    EXPECT_EQ(filterLayer.rowCount(), 0);
}

TEST_F(FilterLayerTest, WorksWithoutTagStore) {
    mods.createFile("apple");
    mods.createFile("banana");
    open();

    filterLayer.setTagStore(nullptr);
    filterLayer.setSearchText("app");
    EXPECT_EQ(effectiveNames(filterLayer), QStringList{"apple"});
}
