#include "minitest.hpp"
#include "app/Installer.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace penenv::app;

static fs::path make_tree(const char* tag) {
  auto dir = fs::temp_directory_path() / (std::string("penenv_test_install_") + tag + "_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  for (const char* d : {"src/data", "src/images", "build", "home", "emptybin"}) fs::create_directories(dir / d);
  std::ofstream(dir / "src/data/penenv.desktop") << "[Desktop Entry]\nName=PenEnv\n";
  std::ofstream(dir / "src/images/penenv-icon.png") << "png";
  std::ofstream(dir / "src/images/penenv-icon.svg") << "<svg/>";
  std::ofstream(dir / "build/penenv") << "#!/bin/sh\n";
  return dir;
}

static InstallOptions options_for(const fs::path& dir, const std::string& path_env) {
  InstallOptions o;
  o.source_dir = dir / "src";
  o.binary = dir / "build/penenv";
  o.home = dir / "home";
  o.path_env = path_env.c_str();
  return o;
}

TEST(install_copies_files_under_local) {
  auto dir = make_tree("basic");
  std::string path = (dir / "emptybin").string();
  InstallReport r;
  std::string err;
  ASSERT_TRUE(install_local(options_for(dir, path), r, err));
  auto local = dir / "home/.local";
  ASSERT_EQ(r.bin_dir, local / "bin");
  ASSERT_EQ(r.installed.size(), 4u);
  ASSERT_TRUE(fs::exists(local / "bin/penenv"));
  ASSERT_TRUE(fs::exists(local / "share/applications/penenv.desktop"));
  ASSERT_TRUE(fs::exists(local / "share/icons/hicolor/256x256/apps/penenv.png"));
  ASSERT_TRUE(fs::exists(local / "share/icons/hicolor/scalable/apps/penenv.svg"));
  auto perms = fs::status(local / "bin/penenv").permissions();
  ASSERT_TRUE((perms & fs::perms::owner_exec) != fs::perms::none);
  ASSERT_TRUE(!r.desktop_db_updated);
  ASSERT_TRUE(!r.icon_cache_updated);
  ASSERT_TRUE(!r.bin_dir_on_path);
}

TEST(install_twice_is_harmless) {
  auto dir = make_tree("twice");
  std::string path = (dir / "emptybin").string();
  InstallReport r;
  std::string err;
  ASSERT_TRUE(install_local(options_for(dir, path), r, err));
  std::ofstream(dir / "build/penenv") << "#!/bin/sh\necho v2\n";
  ASSERT_TRUE(install_local(options_for(dir, path), r, err));
  ASSERT_EQ(r.installed.size(), 4u);
  std::ifstream in(dir / "home/.local/bin/penenv");
  std::string first, second;
  std::getline(in, first);
  std::getline(in, second);
  ASSERT_EQ(second, std::string("echo v2"));
}

TEST(install_reports_bin_dir_on_path) {
  auto dir = make_tree("onpath");
  std::string path = (dir / "emptybin").string() + ":" + (dir / "home/.local/bin/").string();
  InstallReport r;
  std::string err;
  ASSERT_TRUE(install_local(options_for(dir, path), r, err));
  ASSERT_TRUE(r.bin_dir_on_path);
}

TEST(install_missing_binary_fails) {
  auto dir = make_tree("nobinary");
  fs::remove(dir / "build/penenv");
  std::string path = (dir / "emptybin").string();
  InstallReport r;
  std::string err;
  ASSERT_TRUE(!install_local(options_for(dir, path), r, err));
  ASSERT_TRUE(err.rfind("binary not found: ", 0) == 0);
  ASSERT_TRUE(!fs::exists(dir / "home/.local/bin/penenv"));
}

TEST(install_dir_on_path_matching) {
  ASSERT_TRUE(dir_on_path("/home/u/.local/bin", "/usr/bin:/home/u/.local/bin"));
  ASSERT_TRUE(dir_on_path("/home/u/.local/bin", "/home/u/.local/bin/:/usr/bin"));
  ASSERT_TRUE(!dir_on_path("/home/u/.local/bin", "/usr/bin::/bin"));
  ASSERT_TRUE(!dir_on_path("/home/u/.local/bin", ""));
  ASSERT_TRUE(!dir_on_path("/home/u/.local/bin", nullptr));
}
