#include <doctest/doctest.h>
#include <upkg/dispatch.hpp>

#include "../support/bundle_builder.hpp"

using namespace upkg;
using namespace upkg::test;

TEST_CASE("format detection by extension") {
    CHECK(detect_package_format("hello-2.12-4-1-x86_64.eopkg") == PackageFormat::Eopkg);
    CHECK(detect_package_format("/pool/HELLO.EOPKG") == PackageFormat::Eopkg);
    CHECK(detect_package_format("hello_2.12_amd64.deb") == PackageFormat::Deb);
    CHECK(detect_package_format("hello-2.12.x86_64.rpm") == PackageFormat::Rpm);
    CHECK(detect_package_format("hello-2.12-r0.apk") == PackageFormat::Apk);
    CHECK(detect_package_format("hello-2.12-1-x86_64.pkg.tar.zst") == PackageFormat::Pacman);
    CHECK(detect_package_format("hello.zip") == PackageFormat::Unknown);
}

TEST_CASE("unpacked bundle directory is detected") {
    TempDir temp;
    BundleBuilder().file("a", "a").write_directory(temp.sub("bundle"));
    CHECK(detect_package_format(temp.sub("bundle")) == PackageFormat::Eopkg);

    create_directories(temp.sub("empty"));
    CHECK(detect_package_format(temp.sub("empty")) == PackageFormat::Unknown);
}

TEST_CASE("backends") {
    CHECK(select_backend(PackageFormat::Eopkg) == Backend::Native);
    CHECK(select_backend(PackageFormat::Deb) == Backend::Foreign);
    CHECK(select_backend(PackageFormat::Pacman) == Backend::Foreign);
    CHECK(select_backend(PackageFormat::Unknown) == Backend::Unsupported);
}

TEST_CASE("foreign installer commands") {
    using V = std::vector<std::string>;
    CHECK(foreign_install_command(PackageFormat::Deb, "x.deb", false) == V{"dpkg", "-i", "x.deb"});
    CHECK(foreign_install_command(PackageFormat::Deb, "x.deb", true) ==
          V{"dpkg", "-i", "--force-all", "x.deb"});
    CHECK(foreign_install_command(PackageFormat::Rpm, "x.rpm", true) ==
          V{"rpm", "-i", "--force", "--nodeps", "x.rpm"});
    CHECK(foreign_install_command(PackageFormat::Apk, "x.apk", true) ==
          V{"apk", "add", "--allow-untrusted", "--force-overwrite", "x.apk"});
    CHECK(foreign_install_command(PackageFormat::Pacman, "x.pkg.tar.zst", true) ==
          V{"pacman", "-U", "--noconfirm", "--overwrite", "*", "x.pkg.tar.zst"});
    CHECK(foreign_install_command(PackageFormat::Eopkg, "x.eopkg", false).empty());
}

TEST_CASE("run_command reports exit status") {
    auto ok = run_command({"true"});
    REQUIRE(ok.ok);
    CHECK(ok.exit_code == 0);

    auto failed = run_command({"sh", "-c", "exit 3"});
    REQUIRE(failed.ok);
    CHECK(failed.exit_code == 3);

    auto env = run_command({"sh", "-c", "test \"$LANG\" = C"});
    REQUIRE(env.ok);
    CHECK(env.exit_code == 0);

    auto missing = run_command({"upkg-no-such-tool-xyz"});
    REQUIRE(missing.ok);
    CHECK(missing.exit_code == 127);

    CHECK_FALSE(run_command({}).ok);
}

TEST_CASE("no foreign installer for native packages") {
    auto r = run_foreign_installer(PackageFormat::Eopkg, "x.eopkg", false);
    CHECK_FALSE(r.ok);
    CHECK_FALSE(r.error.empty());
}
