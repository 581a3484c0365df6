// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <segflow/disk/file_writer.hpp>
#include <segflow/disk/scratch_store.hpp>
#include "support/fakes.hpp"
#include <cerrno>
#include <filesystem>

using namespace segflow::disk;
using segflow::test::TempDir;
using segflow::test::from_bytes;
using segflow::test::read_file;
using segflow::test::to_bytes;

TEST_CASE("FileWriter append", "[disk]") {
    TempDir dir;
    FileWriter writer;
    CHECK(!writer.is_open());

    REQUIRE(!writer.open(dir.file("out.bin")));
    CHECK(writer.is_open());
    CHECK(writer.path() == dir.file("out.bin"));

    auto first = to_bytes("hello ");
    auto second = to_bytes("world");
    REQUIRE(!writer.append(first));
    REQUIRE(!writer.append(second));
    CHECK(writer.written() == 11);
    CHECK(!writer.flush());
    CHECK(!writer.close());
    CHECK(!writer.is_open());

    CHECK(read_file(dir.file("out.bin")) == "hello world");
}

TEST_CASE("FileWriter errors", "[disk]") {
    TempDir dir;
    FileWriter writer;

    SECTION("Append before open") {
        auto data = to_bytes("x");
        CHECK(writer.append(data) == DiskErrc::handle_invalid);
    }

    SECTION("Empty path") {
        CHECK(writer.open("") == DiskErrc::invalid_path);
    }

    SECTION("Missing parent directory") {
        CHECK(writer.open(dir.file("missing/out.bin")) == DiskErrc::file_not_found);
    }

    SECTION("Open twice") {
        REQUIRE(!writer.open(dir.file("a.bin")));
        CHECK(writer.open(dir.file("b.bin")) == DiskErrc::file_exists);
    }

    SECTION("Reopen truncates") {
        std::filesystem::path path = dir.file("t.bin");
        {
            FileWriter w;
            REQUIRE(!w.open(path.string()));
            REQUIRE(!w.append(to_bytes("old content")));
        }
        REQUIRE(!writer.open(path.string()));
        REQUIRE(!writer.close());
        CHECK(std::filesystem::file_size(path) == 0);
    }

    SECTION("Close is idempotent") {
        CHECK(!writer.close());
        CHECK(!writer.close());
    }
}

TEST_CASE("FileWriter move", "[disk]") {
    TempDir dir;
    FileWriter a;
    REQUIRE(!a.open(dir.file("m.bin")));
    REQUIRE(!a.append(to_bytes("abc")));

    FileWriter b(std::move(a));
    CHECK(!a.is_open());
    CHECK(b.is_open());
    CHECK(b.written() == 3);
    REQUIRE(!b.append(to_bytes("def")));
    REQUIRE(!b.close());

    CHECK(read_file(dir.file("m.bin")) == "abcdef");
}

TEST_CASE("errno_to_error_code", "[disk]") {
    CHECK(errno_to_error_code(ENOENT, DiskErrc::write_error) == DiskErrc::file_not_found);
    CHECK(errno_to_error_code(EACCES, DiskErrc::write_error) == DiskErrc::access_denied);
    CHECK(errno_to_error_code(ENOSPC, DiskErrc::write_error) == DiskErrc::disk_full);
    CHECK(errno_to_error_code(EIO, DiskErrc::read_error) == DiskErrc::read_error);
}

TEST_CASE("DirectoryScratchStore", "[disk][scratch]") {
    TempDir dir;
    DirectoryScratchStore store(dir.file("parts/nested"));
    REQUIRE(!store.prepare());
    CHECK(std::filesystem::is_directory(dir.file("parts/nested")));

    SECTION("Store, read, remove") {
        auto data = to_bytes("segment bytes");
        auto key = store.store(12, data);
        REQUIRE(key.has_value());
        CHECK(std::filesystem::path(*key).filename().string().starts_with("segment-12-"));

        auto read = store.read(*key);
        REQUIRE(read.has_value());
        CHECK(from_bytes(*read) == "segment bytes");

        CHECK(!store.remove(*key));
        CHECK(!std::filesystem::exists(*key));
        CHECK(store.remove(*key) == DiskErrc::file_not_found);
    }

    SECTION("Same index twice gets distinct keys") {
        auto data = to_bytes("x");
        auto a = store.store(1, data);
        auto b = store.store(1, data);
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        CHECK(*a != *b);
    }

    SECTION("Empty segment") {
        auto key = store.store(0, {});
        REQUIRE(key.has_value());
        auto read = store.read(*key);
        REQUIRE(read.has_value());
        CHECK(read->empty());
    }

    SECTION("Missing entry") {
        auto read = store.read(dir.file("parts/nested/nope"));
        REQUIRE(!read.has_value());
        CHECK(read.error() == DiskErrc::file_not_found);
    }

    SECTION("prepare() on a regular file") {
        {
            FileWriter w;
            REQUIRE(!w.open(dir.file("plain")));
        }
        DirectoryScratchStore bad(dir.file("plain"));
        CHECK(bad.prepare());
    }
}

TEST_CASE("MemoryScratchStore", "[disk][scratch]") {
    MemoryScratchStore store;

    auto a = store.store(0, to_bytes("aa"));
    auto b = store.store(0, to_bytes("bb"));
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(*a != *b);
    CHECK(store.size() == 2);

    CHECK(from_bytes(*store.read(*b)) == "bb");
    CHECK(!store.remove(*a));
    CHECK(store.size() == 1);
    CHECK(store.remove(*a) == DiskErrc::file_not_found);
    CHECK(store.read(*a).error() == DiskErrc::file_not_found);
}
