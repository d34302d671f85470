#include <doctest/doctest.h>
#include <upkg/install_record.hpp>
#include <upkg/platform.hpp>

#include "../support/bundle_builder.hpp"

using namespace upkg;
using namespace upkg::test;

namespace {

Manifest sample_manifest() {
    Manifest m;
    m.name = "hello";
    m.version = "2.12";
    m.release = "4";
    m.summary = "Says hello";
    m.license = "GPL-3.0";
    m.architecture = "x86_64";

    FileEntry bin;
    bin.path = "usr/bin/hello";
    bin.type = "executable";
    bin.mode = 0755;
    bin.size = 42;
    bin.hash = "a9993e364706816aba3e25717850c26c9cd0d89d";
    m.files.push_back(bin);

    FileEntry conf;
    conf.path = "etc/hello.conf";
    conf.type = "config";
    conf.mode = 0644;
    conf.hash = "da39a3ee5e6b4b0d3255bfef95601890afd80709";
    m.files.push_back(conf);
    return m;
}

} // namespace

TEST_CASE("record lists only installed entries") {
    auto record = make_install_record(sample_manifest(), {"usr/bin/hello"});
    CHECK(record.package.name == "hello");
    CHECK(record.package.version == "2.12");
    CHECK(record.package.release == "4");
    REQUIRE(record.files.size() == 1);
    CHECK(record.files[0].path == "usr/bin/hello");
    CHECK_FALSE(record.provenance.installed_at.empty());
    CHECK_FALSE(record.provenance.instance_id.empty());
}

TEST_CASE("serialized record parses back") {
    auto record = make_install_record(sample_manifest(), {"usr/bin/hello", "etc/hello.conf"});
    record.provenance.source = "/tmp/hello.eopkg";
    record.provenance.archive = "install.tar.xz";
    record.provenance.verification_policy = "strict";
    record.warnings.push_back({"size_mismatch", {{"path", "usr/bin/hello"}, {"declared", "42"}}});

    std::string json = serialize_install_record(record);
    CHECK(json.find("\"$schema\": \"upkg.install.v1\"") != std::string::npos);
    CHECK(json.find("\"mode\": \"0755\"") != std::string::npos);

    auto parsed = parse_install_record(json);
    REQUIRE(parsed.ok);
    CHECK(parsed.record.package.name == "hello");
    REQUIRE(parsed.record.files.size() == 2);
    CHECK(parsed.record.files[0].mode == 0755);
    CHECK(parsed.record.files[0].size == 42);
    CHECK(parsed.record.provenance.source == "/tmp/hello.eopkg");
    REQUIRE(parsed.record.warnings.size() == 1);
    CHECK(parsed.record.warnings[0].key == "size_mismatch");
    CHECK(parsed.record.warnings[0].fields.at("declared") == "42");
}

TEST_CASE("record parse errors") {
    CHECK_FALSE(parse_install_record("not json").ok);
    CHECK_FALSE(parse_install_record("[]").ok);
    CHECK(parse_install_record(R"({"package":{"name":"x"}})").error == "$schema missing");
    CHECK(parse_install_record(R"({"$schema":"other","package":{"name":"x"}})").error.find("mismatch") !=
          std::string::npos);
    CHECK(parse_install_record(R"({"$schema":"upkg.install.v1","package":{}})").error ==
          "package.name missing");
    CHECK(parse_install_record(R"({"$schema":"upkg.install.v1","package":{"name":"x"},"files":[{}]})")
              .error == "files[0].path missing");
}

TEST_CASE("record is written under the target root") {
    TempDir temp;
    auto record = make_install_record(sample_manifest(), {"usr/bin/hello"});
    auto written = write_install_record(temp.path(), record);
    REQUIRE(written.ok);
    CHECK(written.path == temp.path() + "/var/lib/upkg/installed/hello.json");
    CHECK(written.created_directory);
    CHECK(written.created_root == temp.path() + "/var");

    auto content = read_file(written.path);
    REQUIRE(content.has_value());
    CHECK(parse_install_record(*content).ok);

    // Second write reuses the directory
    auto again = write_install_record(temp.path(), record);
    REQUIRE(again.ok);
    CHECK_FALSE(again.created_directory);
}

TEST_CASE("unsafe package names are not used as record names") {
    TempDir temp;
    auto record = make_install_record(sample_manifest(), {});
    record.package.name = "../escape";
    auto written = write_install_record(temp.path(), record);
    CHECK_FALSE(written.ok);
    CHECK_FALSE(path_exists(temp.sub("var")));
}
