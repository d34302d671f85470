#include <doctest/doctest.h>
#include <upkg/engine.hpp>
#include <upkg/platform.hpp>

#include "../support/bundle_builder.hpp"

using namespace upkg;
using namespace upkg::test;

TEST_CASE("staging area is private and removed on destruction") {
    TempDir temp;
    std::string path;
    {
        StagingArea staging;
        std::string error;
        REQUIRE(staging.create(temp.path(), error));
        path = staging.path();
        CHECK(is_directory(path));
        CHECK(file_mode(path) == 0700);
        CHECK(staging.content_dir() == path + "/root");
        write_text(staging.content_dir() + "/usr/bin/app", "x");
    }
    CHECK_FALSE(path_exists(path));
}

TEST_CASE("two staging areas never share a directory") {
    TempDir temp;
    StagingArea a;
    StagingArea b;
    std::string error;
    REQUIRE(a.create(temp.path(), error));
    REQUIRE(b.create(temp.path(), error));
    CHECK(a.path() != b.path());
}

TEST_CASE("target lock is exclusive per target root") {
    TempDir temp;
    std::string error;

    TargetLock first;
    REQUIRE(first.acquire(temp.path(), "/srv/root-a", error));
    CHECK(first.held());

    TargetLock second;
    CHECK_FALSE(second.acquire(temp.path(), "/srv/root-a", error));
    CHECK(error.find("locked by another operation") != std::string::npos);

    // A different target root is independent
    TargetLock other;
    CHECK(other.acquire(temp.path(), "/srv/root-b", error));
}

TEST_CASE("lock is released on destruction") {
    TempDir temp;
    std::string error;
    {
        TargetLock lock;
        REQUIRE(lock.acquire(temp.path(), "/srv/root", error));
    }
    TargetLock again;
    CHECK(again.acquire(temp.path(), "/srv/root", error));
}

TEST_CASE("lock path lives in the staging root") {
    std::string path = TargetLock::lock_path_for("/var/tmp", "/srv/root");
    CHECK(path.rfind("/var/tmp/upkg-", 0) == 0);
    CHECK(path.size() == std::string("/var/tmp/upkg-").size() + 16 + 5);
    CHECK(path != TargetLock::lock_path_for("/var/tmp", "/srv/other"));
}
