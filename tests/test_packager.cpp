#include "minitest.hpp"
#include "app/Packager.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace penenv::app;

static fs::path make_dir(const char* tag) {
  auto dir = fs::temp_directory_path() / (std::string("penenv_test_pkg_") + tag + "_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static void put(const fs::path& p, const std::string& text) {
  fs::create_directories(p.parent_path());
  std::ofstream(p) << text;
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p);
  std::stringstream ss; ss << in.rdbuf();
  return ss.str();
}

TEST(pkg_menu_choice) {
  ASSERT_TRUE(parse_menu_choice("1") == PackageType::Deb);
  ASSERT_TRUE(parse_menu_choice(" 2\n") == PackageType::Rpm);
  ASSERT_TRUE(parse_menu_choice("3") == PackageType::Both);
  ASSERT_TRUE(!parse_menu_choice("4").has_value());
  ASSERT_TRUE(!parse_menu_choice("").has_value());
  ASSERT_TRUE(parse_package_type("DEB") == PackageType::Deb);
  ASSERT_TRUE(!parse_package_type("zip").has_value());
}

TEST(pkg_extract_version) {
  ASSERT_EQ(extract_version("cmake_minimum_required(VERSION 3.16)\nproject(penenv VERSION 0.1.0 LANGUAGES CXX)\n"),
            std::string("0.1.0"));
  ASSERT_EQ(extract_version("project (\n  demo\n  VERSION \"2.3.4\"\n)\n"), std::string("2.3.4"));
  ASSERT_EQ(extract_version("myproject(x VERSION 9.9)\nproject(y)\n"), std::string(""));
  ASSERT_EQ(extract_version("add_library(x a.cpp)\n"), std::string(""));
}

TEST(pkg_read_project_version_missing_file) {
  auto dir = make_dir("nover");
  std::string v, err;
  ASSERT_TRUE(!read_project_version(dir, v, err));
  ASSERT_EQ(err, std::string("Failed to extract version from CMakeLists.txt"));
}

TEST(pkg_debian_arch_mapping) {
  ASSERT_EQ(debian_arch("x86_64"), std::string("amd64"));
  ASSERT_EQ(debian_arch("aarch64"), std::string("arm64"));
  ASSERT_EQ(debian_arch("i686"), std::string("i386"));
  ASSERT_EQ(debian_arch("armv7l"), std::string("armhf"));
  ASSERT_EQ(debian_arch("riscv64"), std::string("riscv64"));
}

TEST(pkg_deb_control_fields) {
  PackageInfo info;
  info.version = "0.1.0";
  auto c = deb_control(info);
  ASSERT_TRUE(c.rfind("Package: penenv\n", 0) == 0);
  ASSERT_TRUE(c.find("Version: 0.1.0-1\n") != std::string::npos);
  ASSERT_TRUE(c.find("Architecture: amd64\n") != std::string::npos);
  ASSERT_TRUE(c.find("Depends: libgtk-3-0, libvte-2.91-0, bash\n") != std::string::npos);
  ASSERT_TRUE(c.find("\n .\n") != std::string::npos);
  ASSERT_TRUE(c.back() == '\n');
}

TEST(pkg_postinst_refreshes_caches) {
  auto p = deb_postinst();
  ASSERT_TRUE(p.rfind("#!/bin/bash\n", 0) == 0);
  ASSERT_TRUE(p.find("gtk-update-icon-cache") != std::string::npos);
  ASSERT_TRUE(p.find("update-desktop-database") != std::string::npos);
}

TEST(pkg_rpm_spec_replaces_version) {
  auto s = rpm_spec("Name: penenv\nVersion:        0.0.0\nRelease: 1\n", "1.2.3");
  ASSERT_EQ(s, std::string("Name: penenv\nVersion:        1.2.3\nRelease: 1\n"));
}

TEST(pkg_missing_tools_are_reported) {
  auto dir = make_dir("notools");
  PackageOptions opts;
  opts.source_dir = dir;
  std::string empty_path = (dir / "emptybin").string();
  opts.path_env = empty_path.c_str();
  PackageInfo info; info.version = "0.1.0";
  fs::path artifact;
  std::string err;
  ASSERT_TRUE(!build_deb(opts, info, artifact, err));
  ASSERT_EQ(err, std::string("dpkg-deb not found. Install with: sudo apt install dpkg-dev"));
  err.clear();
  ASSERT_TRUE(!build_rpm(opts, info, artifact, err));
  ASSERT_EQ(err, std::string("rpmbuild not found. Install with: sudo dnf install rpm-build"));
}

TEST(pkg_build_deb_with_stub_dpkg) {
  auto dir = make_dir("deb");
  auto src = dir / "src";
  put(src / "data/penenv.desktop", "[Desktop Entry]\nName=PenEnv\n");
  put(src / "images/penenv-icon.png", "png");
  put(src / "images/penenv-icon.svg", "<svg/>");
  put(src / "README.md", "# PenEnv\n");
  put(src / "LICENSE", "MIT\n");
  put(dir / "build/penenv", "#!/bin/sh\n");
  put(dir / "bin/dpkg-deb", "#!/bin/sh\n: > \"$2.deb\"\n");
  ::chmod((dir / "bin/dpkg-deb").c_str(), 0755);

  PackageOptions opts;
  opts.source_dir = src;
  opts.build_dir = dir / "build";
  opts.out_dir = dir / "dist";
  opts.build = false;
  std::string path = (dir / "bin").string();
  opts.path_env = path.c_str();
  PackageInfo info; info.version = "0.1.0";

  fs::path artifact;
  std::string err;
  ASSERT_TRUE(build_deb(opts, info, artifact, err));
  auto tree = dir / "dist/debian/penenv_0.1.0-1_amd64";
  ASSERT_EQ(artifact, fs::path(tree.string() + ".deb"));
  ASSERT_TRUE(fs::exists(artifact));
  ASSERT_TRUE(fs::exists(tree / "usr/bin/penenv"));
  ASSERT_TRUE(fs::exists(tree / "usr/share/applications/penenv.desktop"));
  ASSERT_TRUE(fs::exists(tree / "usr/share/icons/hicolor/256x256/apps/penenv.png"));
  ASSERT_TRUE(fs::exists(tree / "usr/share/icons/hicolor/scalable/apps/penenv.svg"));
  ASSERT_TRUE(fs::exists(tree / "usr/share/doc/penenv/LICENSE"));
  ASSERT_EQ(slurp(tree / "DEBIAN/control"), deb_control(info));
  auto perms = fs::status(tree / "DEBIAN/postinst").permissions();
  ASSERT_TRUE((perms & fs::perms::owner_exec) != fs::perms::none);
  auto bin_perms = fs::status(tree / "usr/bin/penenv").permissions();
  ASSERT_TRUE(bin_perms == fs::perms(0755));
}

TEST(pkg_build_deb_missing_binary_fails) {
  auto dir = make_dir("nobin");
  put(dir / "bin/dpkg-deb", "#!/bin/sh\nexit 0\n");
  ::chmod((dir / "bin/dpkg-deb").c_str(), 0755);
  PackageOptions opts;
  opts.source_dir = dir / "src";
  opts.build_dir = dir / "build";
  opts.out_dir = dir / "dist";
  opts.build = false;
  std::string path = (dir / "bin").string();
  opts.path_env = path.c_str();
  PackageInfo info; info.version = "0.1.0";
  fs::path artifact;
  std::string err;
  ASSERT_TRUE(!build_deb(opts, info, artifact, err));
  ASSERT_TRUE(err.rfind("cannot copy ", 0) == 0);
}

// Source tree with everything build_deb and build_rpm copy or archive.
static fs::path make_source_tree(const fs::path& dir, const std::string& version) {
  auto src = dir / "src";
  put(src / "CMakeLists.txt", "cmake_minimum_required(VERSION 3.16)\n\nproject(penenv VERSION " + version +
                                  " LANGUAGES CXX)\n");
  put(src / "data/penenv.desktop", "[Desktop Entry]\nName=PenEnv\n");
  put(src / "data/penenv.spec", "Name:           penenv\nVersion:        0.0.0\nRelease:        1%{?dist}\n");
  put(src / "images/penenv-icon.png", "png");
  put(src / "images/penenv-icon.svg", "<svg/>");
  put(src / "README.md", "# PenEnv\n");
  put(src / "LICENSE", "MIT\n");
  return src;
}

static void put_exec(const fs::path& p, const std::string& text) {
  put(p, text);
  ::chmod(p.c_str(), 0755);
}

TEST(pkg_deb_control_version_comes_from_project) {
  auto dir = make_dir("debver");
  auto src = make_source_tree(dir, "2.4.1");
  put(dir / "build/penenv", "#!/bin/sh\n");
  put_exec(dir / "bin/dpkg-deb", "#!/bin/sh\n: > \"$2.deb\"\n");

  PackageInfo info;
  std::string err;
  ASSERT_TRUE(read_project_version(src, info.version, err));
  ASSERT_EQ(info.version, std::string("2.4.1"));
  ASSERT_TRUE(deb_control(info).find("Version: 2.4.1-1\n") != std::string::npos);

  PackageOptions opts;
  opts.source_dir = src;
  opts.build_dir = dir / "build";
  opts.out_dir = dir / "dist";
  opts.build = false;
  std::string path = (dir / "bin").string();
  opts.path_env = path.c_str();
  fs::path artifact;
  ASSERT_TRUE(build_deb(opts, info, artifact, err));
  auto control = slurp(dir / "dist/debian/penenv_2.4.1-1_amd64/DEBIAN/control");
  ASSERT_TRUE(control.find("Version: 2.4.1-1\n") != std::string::npos);
}

// rpmbuild stand-in: the third argument is "_topdir <dir>".
static const char* kStubRpmbuild =
    "#!/bin/sh\n"
    "top=${3#_topdir }\n"
    "test -f \"$top/SOURCES/penenv-0.3.0.tar.gz\" || exit 3\n"
    "grep -q '^Version: *0.3.0$' \"$4\" || exit 4\n"
    "mkdir -p \"$top/RPMS/x86_64\"\n"
    ": > \"$top/RPMS/x86_64/penenv-0.3.0-1.x86_64.rpm\"\n";

static PackageOptions rpm_options(const fs::path& dir, const fs::path& src, std::string& path) {
  PackageOptions opts;
  opts.source_dir = src;
  opts.build_dir = dir / "build";
  opts.out_dir = dir / "dist";
  opts.rpm_top = dir / "rpmbuild";
  opts.build = false;
  // stub first, the system tar behind it
  path = (dir / "bin").string() + ":/usr/bin:/bin";
  opts.path_env = path.c_str();
  return opts;
}

TEST(pkg_build_rpm_with_stub_rpmbuild) {
  auto dir = make_dir("rpm");
  auto src = make_source_tree(dir, "0.3.0");
  put_exec(dir / "bin/rpmbuild", kStubRpmbuild);
  std::string path;
  auto opts = rpm_options(dir, src, path);
  PackageInfo info; info.version = "0.3.0";

  fs::path artifact;
  std::string err;
  ASSERT_TRUE(build_rpm(opts, info, artifact, err));
  ASSERT_EQ(artifact, dir / "dist/rpm/penenv-0.3.0-1.x86_64.rpm");
  ASSERT_TRUE(fs::exists(artifact));
  ASSERT_TRUE(fs::exists(dir / "rpmbuild/SOURCES/penenv-0.3.0.tar.gz"));
  auto spec = slurp(dir / "rpmbuild/SPECS/penenv.spec");
  ASSERT_TRUE(spec.find("Version:        0.3.0\n") != std::string::npos);
}

TEST(pkg_build_rpm_without_output_fails) {
  auto dir = make_dir("rpmnone");
  auto src = make_source_tree(dir, "0.3.0");
  put_exec(dir / "bin/rpmbuild", "#!/bin/sh\nexit 0\n");
  std::string path;
  auto opts = rpm_options(dir, src, path);
  PackageInfo info; info.version = "0.3.0";

  fs::path artifact;
  std::string err;
  ASSERT_TRUE(!build_rpm(opts, info, artifact, err));
  ASSERT_EQ(err, "RPM build may have failed. Check " + (dir / "rpmbuild/RPMS").string() + "/");
  ASSERT_TRUE(artifact.empty());
}
