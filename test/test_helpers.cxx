/// @file
/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#include <gtest/gtest.h>

#include <stash/archive/helpers.hxx>
#include <stash/json/json.hxx>
#include <stash/support/Finally.hxx>

#include <filesystem>

using namespace stash;

namespace {

void remove_memory_archives(std::initializer_list<const char*> names) {
    for (auto name : names)
        memory_storage()->remove(name);
}

} // namespace

TEST(Helpers, DumpLoadMap) {
    Finally cleanup{ [] () { remove_memory_archives({"helpers_dump_map"}); } };
    auto data = json::parse(R"({"x": [1, 2], "y": {"z": "w"}})");

    dump(data, "mem://helpers_dump_map"_uri);
    EXPECT_EQ(load("mem://helpers_dump_map"_uri), data);

    ArchiveReader reader{"mem://helpers_dump_map"_uri};
    EXPECT_EQ(reader.keys(), (std::vector<String>{"x", "y"}));
    EXPECT_FALSE(reader.has_root());
}

TEST(Helpers, DumpLoadRoot) {
    Finally cleanup{ [] () { remove_memory_archives({"helpers_dump_root"}); } };
    Value data = List{1, "two", 3.0};

    dump(data, "mem://helpers_dump_root"_uri);
    EXPECT_EQ(load("mem://helpers_dump_root"_uri), data);

    ArchiveReader reader{"mem://helpers_dump_root"_uri};
    EXPECT_TRUE(reader.has_root());
    EXPECT_EQ(reader.get_root(), data);
    EXPECT_EQ(reader.get("__root__[1]"_path), "two");
}

TEST(Helpers, DumpLoadMapWithReservedKeys) {
    Finally cleanup{ [] () { remove_memory_archives({"helpers_dump_reserved"}); } };
    Map data;
    data.insert({"", 1});
    data.insert({"__root__", List{2}});
    data.insert({"__metadata__", "m"});
    data.insert({"x", 3});

    dump(data, "mem://helpers_dump_reserved"_uri);
    EXPECT_EQ(load("mem://helpers_dump_reserved"_uri), data);

    ArchiveReader reader{"mem://helpers_dump_reserved"_uri};
    EXPECT_TRUE(reader.has_root());
    EXPECT_EQ(reader.keys(), (std::vector<String>{"__root__"}));
    EXPECT_EQ(reader.get({"__root__", ""}), 1);
    EXPECT_EQ(reader.get("__root__.__root__[0]"_path), 2);
    EXPECT_EQ(reader.get("__root__.x"_path), 3);
}

TEST(Helpers, DumpExisting) {
    Finally cleanup{ [] () { remove_memory_archives({"helpers_dump_existing"}); } };
    dump(1, "mem://helpers_dump_existing"_uri);
    EXPECT_THROW(dump(2, "mem://helpers_dump_existing"_uri), ArchiveExistsError);

    dump(2, "mem://helpers_dump_existing?clobber=true"_uri);
    EXPECT_EQ(load("mem://helpers_dump_existing"_uri), 2);
}

TEST(Helpers, LoadKeepsSharing) {
    Finally cleanup{ [] () { remove_memory_archives({"helpers_sharing"}); } };
    Value shared = List{1};
    Map data;
    data.insert({"a", shared});
    data.insert({"b", shared});

    dump(data, "mem://helpers_sharing"_uri);
    auto loaded = load("mem://helpers_sharing"_uri);
    EXPECT_TRUE(loaded.get("a").is(loaded.get("b")));
}

TEST(Helpers, OldIdentifier) {
    EXPECT_EQ(old_identifier("run.zip"), "run_old.zip");
    EXPECT_EQ(old_identifier("/data/run.v2.zip"), "/data/run.v2_old.zip");
    EXPECT_EQ(old_identifier("scratch"), "scratch_old");
}

TEST(Helpers, Replace) {
    Finally cleanup{ [] () { remove_memory_archives({"helpers_replace", "helpers_replace_old"}); } };
    dump(json::parse(R"({"a": 1, "b": [1, 2]})"), "mem://helpers_replace"_uri);

    Map updates;
    updates.insert({"c", 3});
    updates.insert({"b", "new"});
    replace("mem://helpers_replace"_uri, updates);

    auto loaded = load("mem://helpers_replace"_uri);
    EXPECT_EQ(loaded.keys(), (std::vector<String>{"a", "b", "c"}));
    EXPECT_EQ(loaded, json::parse(R"({"a": 1, "b": "new", "c": 3})"));
    EXPECT_FALSE(memory_storage()->exists("helpers_replace_old"));
}

TEST(Helpers, ReplaceSaveOld) {
    Finally cleanup{ [] () { remove_memory_archives({"helpers_save_old", "helpers_save_old_old"}); } };
    dump(json::parse(R"({"a": 1})"), "mem://helpers_save_old"_uri);

    Map updates;
    updates.insert({"a", 2});
    replace("mem://helpers_save_old"_uri, updates, true);

    EXPECT_EQ(load("mem://helpers_save_old"_uri).get("a"), 2);
    EXPECT_EQ(load("mem://helpers_save_old_old"_uri).get("a"), 1);
}

TEST(Helpers, ReplaceKeepsAttributesAndSharing) {
    Finally cleanup{ [] () { remove_memory_archives({"helpers_replace_attrs"}); } };
    Value shared = List{1};
    {
        ArchiveWriter writer{"mem://helpers_replace_attrs"_uri};
        writer.put("a", shared);
        writer.put("b", shared);
        writer.set_attribute("run", 7);
        writer.finalize();
    }

    Map updates;
    updates.insert({"c", 1});
    replace("mem://helpers_replace_attrs"_uri, updates);

    ArchiveReader reader{"mem://helpers_replace_attrs"_uri};
    EXPECT_EQ(reader.attributes().at("run"), 7);
    EXPECT_TRUE(reader.get("a"_path).is(reader.get("b"_path)));
    EXPECT_EQ(reader.get("c"_path), 1);
}

TEST(Helpers, ReplaceMissing) {
    EXPECT_THROW(replace("mem://helpers_replace_missing"_uri, Map{}), StorageError);
}

TEST(Helpers, FileArchive) {
    auto dir = std::filesystem::temp_directory_path() / "stash_test_helpers";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    Finally cleanup{ [&dir] () { std::filesystem::remove_all(dir); } };

    URI uri("file://" + (dir / "run.zip").string());
    dump(json::parse(R"({"a": 1})"), uri);
    EXPECT_TRUE(std::filesystem::exists(dir / "run.zip"));

    Map updates;
    updates.insert({"b", 2});
    replace(uri, updates, true);
    EXPECT_TRUE(std::filesystem::exists(dir / "run_old.zip"));
    EXPECT_EQ(load(uri), json::parse(R"({"a": 1, "b": 2})"));
    EXPECT_EQ(load(URI("file://" + (dir / "run_old.zip").string())), json::parse(R"({"a": 1})"));
}
