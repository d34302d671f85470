#include <doctest/doctest.h>
#include <upkg/bundle.hpp>
#include <upkg/platform.hpp>

#include "../support/bundle_builder.hpp"

#include <string>

using namespace upkg;
using namespace upkg::test;

namespace {

std::string read_all(ByteSource& source) {
    std::string out;
    uint8_t buf[4096];
    for (;;) {
        std::ptrdiff_t n = source.read(buf, sizeof(buf));
        if (n <= 0) break;
        out.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(n));
    }
    return out;
}

BundleBuilder sample_bundle() {
    BundleBuilder b;
    b.name("hello").version("2.12")
     .directory("usr/bin")
     .file("usr/bin/hello", "#!/bin/sh\necho hello\n", 0755, "executable")
     .file("etc/hello.conf", "greeting=hi\n", 0644, "config");
    return b;
}

} // namespace

TEST_CASE("open unpacked bundle directory") {
    TempDir temp;
    auto builder = sample_bundle();
    std::string dir = builder.write_directory(temp.sub("hello"));

    auto r = open_bundle(dir);
    REQUIRE(r.ok);
    CHECK(r.bundle.kind == BundleKind::Directory);
    CHECK(r.bundle.manifest.name == "hello");
    REQUIRE(r.bundle.manifest.version.has_value());
    CHECK(*r.bundle.manifest.version == "2.12");
    CHECK(r.bundle.manifest.files.size() == 3);
    CHECK(r.bundle.archive.name == "install.tar.xz");
    CHECK(r.bundle.archive.compression == Compression::Xz);

    std::string error;
    auto stream = r.bundle.archive.open(error);
    REQUIRE(stream);
    CHECK(read_all(*stream) == builder.tar());
}

TEST_CASE("open zip container") {
    TempDir temp;
    auto builder = sample_bundle();
    builder.compression(Compression::Gzip);
    std::string path = builder.write_container(temp.sub("hello-2.12-3-1-x86_64.eopkg"));

    auto r = open_bundle(path);
    REQUIRE(r.ok);
    CHECK(r.bundle.kind == BundleKind::Container);
    CHECK(r.bundle.archive.name == "install.tar.gz");
    CHECK(r.bundle.manifest.files[1].path == "usr/bin/hello");

    std::string error;
    auto stream = r.bundle.archive.open(error);
    REQUIRE(stream);
    CHECK(read_all(*stream) == builder.tar());
}

TEST_CASE("zip index lists stored and deflated members") {
    TempDir temp;
    write_text(temp.sub("stored.zip"), build_zip({{"a.txt", "alpha"}, {"b.txt", "beta"}}, false));
    auto index = read_zip_index(temp.sub("stored.zip"));
    REQUIRE(index.ok);
    REQUIRE(index.entries.size() == 2);
    CHECK(index.entries[0].name == "a.txt");
    CHECK(index.entries[0].method == 0);

    std::string error;
    auto content = read_zip_entry(temp.sub("stored.zip"), index.entries[1], error);
    REQUIRE(content.has_value());
    CHECK(*content == "beta");

    write_text(temp.sub("deflated.zip"), build_zip({{"c.txt", std::string(5000, 'c')}}));
    auto deflated = read_zip_index(temp.sub("deflated.zip"));
    REQUIRE(deflated.ok);
    CHECK(deflated.entries[0].method == 8);
    auto inflated = read_zip_entry(temp.sub("deflated.zip"), deflated.entries[0], error);
    REQUIRE(inflated.has_value());
    CHECK(*inflated == std::string(5000, 'c'));
}

TEST_CASE("zip member with corrupted content fails its CRC check") {
    TempDir temp;
    std::string zip = build_zip({{"metadata.xml", "<PISI/>"}}, false);
    auto at = zip.find("<PISI/>");
    REQUIRE(at != std::string::npos);
    zip[at + 1] = 'X';
    write_text(temp.sub("corrupt.zip"), zip);

    auto index = read_zip_index(temp.sub("corrupt.zip"));
    REQUIRE(index.ok);
    std::string error;
    CHECK_FALSE(read_zip_entry(temp.sub("corrupt.zip"), index.entries[0], error).has_value());
    CHECK(error.find("CRC") != std::string::npos);
}

TEST_CASE("missing package path is an IO error") {
    auto r = open_bundle("/nonexistent/upkg/hello.eopkg");
    CHECK_FALSE(r.ok);
    CHECK(r.error_kind == ErrorKind::IOError);
}

TEST_CASE("non-zip file is an archive error") {
    TempDir temp;
    write_text(temp.sub("junk.eopkg"), std::string(200, 'j'));
    auto r = open_bundle(temp.sub("junk.eopkg"));
    CHECK_FALSE(r.ok);
    CHECK(r.error_kind == ErrorKind::ArchiveError);
}

TEST_CASE("bundle without file list is a parse error") {
    TempDir temp;
    std::string dir = sample_bundle().write_directory(temp.sub("hello"));
    remove_file(dir + "/files.xml");
    auto r = open_bundle(dir);
    CHECK_FALSE(r.ok);
    CHECK(r.error_kind == ErrorKind::ParseError);
    CHECK(r.error.find("files.xml") != std::string::npos);
}

TEST_CASE("bundle without content archive is an archive error") {
    TempDir temp;
    std::string dir = sample_bundle().write_directory(temp.sub("hello"));
    remove_file(dir + "/install.tar.xz");
    auto r = open_bundle(dir);
    CHECK_FALSE(r.ok);
    CHECK(r.error_kind == ErrorKind::ArchiveError);
}

TEST_CASE("malformed descriptor is a parse error") {
    TempDir temp;
    std::string dir = sample_bundle().write_directory(temp.sub("hello"));
    write_text(dir + "/metadata.xml", "<PISI><Package>");
    auto r = open_bundle(dir);
    CHECK_FALSE(r.ok);
    CHECK(r.error_kind == ErrorKind::ParseError);
}
