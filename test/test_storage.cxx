/// @file
/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#include <gtest/gtest.h>

#include <stash/storage/URI.hxx>
#include <stash/storage/Storage.hxx>
#include <stash/storage/ZipContainer.hxx>
#include <stash/archive/Options.hxx>
#include <stash/support/Finally.hxx>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace stash;

namespace {

std::filesystem::path make_temp_dir(const String& name) {
    auto dir = std::filesystem::temp_directory_path() / ("stash_test_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

String read_all(std::istream& stream) {
    std::stringstream ss;
    ss << stream.rdbuf();
    return ss.str();
}

} // namespace

TEST(URI, Basic) {
    URI uri("http://user@host:1234");
    ASSERT_TRUE(uri.is_valid());
    ASSERT_EQ(uri.size(), 4UL);
    EXPECT_EQ(uri.get("scheme"), "http");
    EXPECT_EQ(uri.get("user"), "user");
    EXPECT_EQ(uri.get("host"), "host");
    EXPECT_EQ(uri.get("port"), 1234);
}

TEST(URI, FileAbsolutePath) {
    URI uri("file:///tmp/run/a.zip");
    EXPECT_EQ(uri.scheme(), "file");
    EXPECT_EQ(uri.host(), "");
    EXPECT_EQ(uri.path(), "/tmp/run/a.zip");
}

TEST(URI, QueryParameters) {
    URI uri("file://?path=rel/a.zip&ids=false;clobber=true");
    EXPECT_EQ(uri.scheme(), "file");
    EXPECT_EQ(uri.path(), "");
    EXPECT_EQ(uri.query("path"), "rel/a.zip");
    EXPECT_EQ(uri.query("ids"), "false");
    EXPECT_EQ(uri.query("clobber"), "true");
    EXPECT_EQ(uri.query("missing"), nil);
    EXPECT_EQ(uri.query().size(), 3UL);
}

TEST(URI, Fragment) {
    URI uri("mem://name/part#frag");
    EXPECT_EQ(uri.host(), "name");
    EXPECT_EQ(uri.path(), "/part");
    EXPECT_EQ(uri.get("fragment"), "frag");
}

TEST(URI, Invalid) {
    URI uri("no scheme here");
    EXPECT_FALSE(uri.is_valid());
    EXPECT_EQ(uri.scheme(), "");
    EXPECT_EQ(uri.query("x"), nil);
    EXPECT_EQ(uri.spec(), "no scheme here");
}

TEST(Options, Defaults) {
    Options options;
    EXPECT_TRUE(options.track_identity);
    EXPECT_EQ(options.compression, Compression::DEFLATE);
    EXPECT_FALSE(options.clobber);
    EXPECT_FALSE(options.quiet);
    EXPECT_EQ(options.indent, 4);
}

TEST(Options, ConfigureFromURI) {
    Options options{.quiet = true};
    options.configure("mem://x?ids=false&compression=store&clobber=true&indent=0&path=ignored"_uri);
    EXPECT_FALSE(options.track_identity);
    EXPECT_EQ(options.compression, Compression::STORE);
    EXPECT_TRUE(options.clobber);
    EXPECT_TRUE(options.quiet);
    EXPECT_EQ(options.indent, 0);
}

TEST(Options, UnknownKeyIgnored) {
    Options options;
    options.configure("mem://x?colour=blue"_uri);
    EXPECT_TRUE(options.track_identity);
}

TEST(Options, InvalidCompression) {
    Options options;
    EXPECT_THROW(options.configure("mem://x?compression=zstd"_uri), StashException);
}

TEST(MemoryStorage, CommitMakesVisible) {
    MemoryStorage storage;
    auto p_sink = storage.open_for_write("a");
    p_sink->stream() << "tea";
    EXPECT_FALSE(storage.exists("a"));
    p_sink->commit();
    EXPECT_TRUE(storage.exists("a"));
    EXPECT_EQ(storage.buffer("a"), "tea");

    auto p_in = storage.open_for_read("a");
    EXPECT_EQ(read_all(*p_in), "tea");
}

TEST(MemoryStorage, UncommittedIsDiscarded) {
    MemoryStorage storage;
    {
        auto p_sink = storage.open_for_write("a");
        p_sink->stream() << "tea";
    }
    EXPECT_FALSE(storage.exists("a"));
    EXPECT_THROW(storage.open_for_read("a"), StorageError);
}

TEST(MemoryStorage, Remove) {
    MemoryStorage storage;
    storage.set_buffer("a", "x");
    storage.remove("a");
    EXPECT_FALSE(storage.exists("a"));
    storage.remove("a");
}

TEST(FileStorage, WriteCommitRead) {
    auto dir = make_temp_dir("file_storage");
    Finally finally{ [&dir] () { std::filesystem::remove_all(dir); } };

    FileStorage storage{dir};
    auto p_sink = storage.open_for_write("out.zip");
    p_sink->stream() << "payload";
    EXPECT_FALSE(storage.exists("out.zip"));
    p_sink->commit();
    EXPECT_TRUE(std::filesystem::exists(dir / "out.zip"));

    auto p_in = storage.open_for_read("out.zip");
    EXPECT_EQ(read_all(*p_in), "payload");
}

TEST(FileStorage, UncommittedLeavesNoFile) {
    auto dir = make_temp_dir("file_uncommitted");
    Finally finally{ [&dir] () { std::filesystem::remove_all(dir); } };

    FileStorage storage{dir};
    {
        auto p_sink = storage.open_for_write("out.zip");
        p_sink->stream() << "payload";
    }
    EXPECT_FALSE(storage.exists("out.zip"));
    EXPECT_TRUE(std::filesystem::is_empty(dir));
}

TEST(FileStorage, CommitReplacesExisting) {
    auto dir = make_temp_dir("file_replace");
    Finally finally{ [&dir] () { std::filesystem::remove_all(dir); } };

    FileStorage storage{dir};
    for (auto text : {"first", "second"}) {
        auto p_sink = storage.open_for_write("out.zip");
        p_sink->stream() << text;
        p_sink->commit();
    }
    auto p_in = storage.open_for_read("out.zip");
    EXPECT_EQ(read_all(*p_in), "second");
}

TEST(FileStorage, ReadMissing) {
    auto dir = make_temp_dir("file_missing");
    Finally finally{ [&dir] () { std::filesystem::remove_all(dir); } };

    FileStorage storage{dir};
    EXPECT_THROW(storage.open_for_read("nope.zip"), StorageError);
}

TEST(Storage, CopyArchive) {
    MemoryStorage from;
    MemoryStorage to;
    from.set_buffer("a", "bytes\0more"s);
    copy_archive(from, "a", to, "b");
    EXPECT_EQ(to.buffer("b"), "bytes\0more"s);
}

TEST(Storage, OpenFileScheme) {
    auto location = open_storage("file:///tmp/x.zip"_uri);
    EXPECT_EQ(location.identifier, "/tmp/x.zip");

    location = open_storage("file://?path=rel/x.zip"_uri);
    EXPECT_EQ(location.identifier, "rel/x.zip");
}

TEST(Storage, OpenMemScheme) {
    auto location = open_storage("mem://scratch"_uri);
    EXPECT_EQ(location.identifier, "scratch");
    EXPECT_TRUE(location.storage.get() == memory_storage().get());
}

TEST(Storage, OpenErrors) {
    EXPECT_THROW(open_storage("ftp://host/x.zip"_uri), StorageError);
    EXPECT_THROW(open_storage("file://"_uri), StorageError);
    EXPECT_THROW(open_storage("file:///a.zip?path=b.zip"_uri), StorageError);
    EXPECT_THROW(open_storage("garbage"_uri), StorageError);
}

TEST(Storage, RegisterScheme) {
    Ref<MemoryStorage> r_storage{new MemoryStorage()};
    register_storage_scheme("scratch", [r_storage] (const URI& uri) -> StorageLocation {
        return {r_storage, uri.host()};
    });
    Finally finally{ [] () { remove_storage_scheme("scratch"); } };

    auto location = open_storage("scratch://box"_uri);
    EXPECT_EQ(location.identifier, "box");
    EXPECT_TRUE(location.storage.get() == r_storage.get());
}

TEST(Zip, WriteRead) {
    ZipWriter writer;
    writer.add("__metadata__.json", String{"{}"}, Compression::DEFLATE);
    writer.add("a.bin", Bytes{0, 1, 2, 255}, Compression::STORE);

    std::stringstream ss;
    writer.write(ss);

    ZipReader reader{std::make_unique<std::istringstream>(ss.str())};
    EXPECT_EQ(reader.names(), (std::vector<String>{"__metadata__.json", "a.bin"}));
    EXPECT_TRUE(reader.contains("a.bin"));
    EXPECT_FALSE(reader.contains("b.bin"));
    EXPECT_EQ(reader.read_text("__metadata__.json"), "{}");
    EXPECT_EQ(reader.read("a.bin"), (Bytes{0, 1, 2, 255}));
    EXPECT_THROW(reader.read("b.bin"), ContainerError);
}

TEST(Zip, DuplicateMember) {
    ZipWriter writer;
    writer.add("a.bin", String{"x"}, Compression::STORE);
    EXPECT_THROW(writer.add("a.bin", String{"y"}, Compression::STORE), ContainerError);
}
