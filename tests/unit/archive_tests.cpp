#include <doctest/doctest.h>
#include <upkg/archive.hpp>
#include <upkg/platform.hpp>

#include "../support/bundle_builder.hpp"

#include <string>

using namespace upkg;
using namespace upkg::test;

namespace {

ExtractResult extract(const std::string& tar, const std::string& dir,
                      const CancellationToken* cancel = nullptr) {
    MemoryByteSource source(tar);
    return extract_archive_safe(source, dir, cancel);
}

TarMemberSpec regular(const std::string& path, const std::string& data, uint32_t mode = 0644) {
    TarMemberSpec m;
    m.path = path;
    m.data = data;
    m.mode = mode;
    return m;
}

TarMemberSpec special(const std::string& path, char typeflag, const std::string& link = "") {
    TarMemberSpec m;
    m.path = path;
    m.typeflag = typeflag;
    m.link = link;
    return m;
}

} // namespace

// ============================================================================
// Path validation
// ============================================================================

TEST_CASE("extraction path validation") {
    SUBCASE("plain relative path is safe") {
        auto v = validate_extraction_path("usr/bin/app", "/staging");
        CHECK(v.safe);
        CHECK(v.normalized_path == "usr/bin/app");
    }
    SUBCASE("traversal is rejected") {
        auto v = validate_extraction_path("usr/../../../etc/passwd", "/staging");
        CHECK_FALSE(v.safe);
        CHECK(v.error.find("traversal") != std::string::npos);
    }
    SUBCASE("absolute path is rejected") {
        auto v = validate_extraction_path("/etc/passwd", "/staging");
        CHECK_FALSE(v.safe);
        CHECK(v.error.find("absolute") != std::string::npos);
    }
}

// ============================================================================
// Tar reader
// ============================================================================

TEST_CASE("tar reader yields members in order") {
    std::string tar = build_tar({
        special("usr/", '5'),
        regular("usr/app", "binary", 0755),
        special("usr/link", '2', "app"),
    });
    MemoryByteSource source(tar);
    TarReader reader(source);
    TarMember m;

    REQUIRE(reader.next(m) == TarReader::Status::Member);
    CHECK(m.path == "usr/");
    CHECK(m.type == MemberType::Directory);

    REQUIRE(reader.next(m) == TarReader::Status::Member);
    CHECK(m.path == "usr/app");
    CHECK(m.size == 6);
    CHECK(m.mode == 0755);

    REQUIRE(reader.next(m) == TarReader::Status::Member);
    CHECK(m.type == MemberType::Symlink);
    CHECK(m.link_target == "app");

    CHECK(reader.next(m) == TarReader::Status::End);
}

TEST_CASE("GNU long names are applied") {
    std::string long_path = "usr/share/" + std::string(120, 'n') + "/file.txt";
    MemoryByteSource source(build_tar({regular(long_path, "x")}));
    TarReader reader(source);
    TarMember m;
    REQUIRE(reader.next(m) == TarReader::Status::Member);
    CHECK(m.path == long_path);
}

TEST_CASE("corrupted header checksum is an archive error") {
    std::string tar = build_tar({regular("a.txt", "abc")});
    tar[0] = 'b';
    TempDir temp;
    auto r = extract(tar, temp.sub("stage"));
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("checksum") != std::string::npos);
}

TEST_CASE("missing end-of-archive marker is truncation") {
    TempDir temp;
    auto r = extract(build_tar({regular("a.txt", "abc")}, false), temp.sub("stage"));
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("truncated") != std::string::npos);
}

TEST_CASE("member data cut short is truncation") {
    std::string tar = build_tar({regular("a.txt", std::string(2000, 'a'))}, false);
    tar.resize(512 + 700);
    TempDir temp;
    auto r = extract(tar, temp.sub("stage"));
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("truncated") != std::string::npos);
}

// ============================================================================
// Safe extraction
// ============================================================================

TEST_CASE("extraction writes owner-only staged files") {
    TempDir temp;
    std::string stage = temp.sub("stage");
    auto r = extract(build_tar({
        special("./usr/", '5'),
        regular("./usr/bin/app", "#!/bin/sh\n", 0755),
        special("usr/bin/app-link", '2', "app"),
    }), stage);
    REQUIRE(r.ok);
    REQUIRE(r.members.size() == 3);
    CHECK(r.members[0].path == "usr");
    CHECK(r.members[1].path == "usr/bin/app");
    CHECK(r.members[1].size == 10);

    CHECK(read_text(stage + "/usr/bin/app") == "#!/bin/sh\n");
    CHECK(file_mode(stage + "/usr/bin/app") == 0600);
    CHECK(file_mode(stage + "/usr") == 0700);
    auto target = read_symlink(stage + "/usr/bin/app-link");
    REQUIRE(target.has_value());
    CHECK(*target == "app");
}

TEST_CASE("traversal member is rejected and nothing escapes") {
    TempDir temp;
    std::string stage = temp.sub("stage");
    auto r = extract(build_tar({regular("../escaped.txt", "pwned")}), stage);
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("traversal") != std::string::npos);
    CHECK_FALSE(path_exists(temp.sub("escaped.txt")));
}

TEST_CASE("absolute member is rejected") {
    TempDir temp;
    auto r = extract(build_tar({regular("/tmp/upkg-absolute-member", "pwned")}), temp.sub("stage"));
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("absolute") != std::string::npos);
}

TEST_CASE("hardlinks, devices and fifos are rejected") {
    TempDir temp;
    auto hard = extract(build_tar({regular("a", "x"), special("b", '1', "a")}), temp.sub("s1"));
    CHECK_FALSE(hard.ok);
    CHECK(hard.error.find("hardlink") != std::string::npos);

    auto chr = extract(build_tar({special("dev/null", '3')}), temp.sub("s2"));
    CHECK_FALSE(chr.ok);
    CHECK(chr.error.find("not permitted") != std::string::npos);

    auto fifo = extract(build_tar({special("pipe", '6')}), temp.sub("s3"));
    CHECK_FALSE(fifo.ok);
}

TEST_CASE("member below a staged symlink is rejected") {
    TempDir temp;
    std::string outside = temp.sub("outside");
    create_directories(outside);
    auto r = extract(build_tar({
        special("lib", '2', outside),
        regular("lib/evil.so", "payload"),
    }), temp.sub("stage"));
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("symlink") != std::string::npos);
    CHECK_FALSE(path_exists(outside + "/evil.so"));
}

TEST_CASE("later member replaces an earlier one") {
    TempDir temp;
    std::string stage = temp.sub("stage");
    auto r = extract(build_tar({regular("a.txt", "first"), regular("a.txt", "second")}), stage);
    REQUIRE(r.ok);
    CHECK(read_text(stage + "/a.txt") == "second");
}

TEST_CASE("extraction stops when cancelled") {
    TempDir temp;
    CancellationToken token;
    token.cancel();
    auto r = extract(build_tar({regular("a.txt", "abc")}), temp.sub("stage"), &token);
    CHECK_FALSE(r.ok);
    CHECK(r.cancelled);
}
