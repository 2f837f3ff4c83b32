#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace penenv::app {

struct PackageInfo {
  std::string name{"penenv"};
  std::string version;
  std::string revision{"1"};
  std::string arch{"amd64"};
  std::string maintainer{"undergroundbiscuitclub <noreply@example.com>"};
  std::string summary{"Pentesting environment with integrated shells and note-taking"};
  // Paragraphs of the long description; an empty entry is a paragraph break.
  std::vector<std::string> description{
    "PenEnv is a GTK desktop application for managing penetration testing",
    "environments with integrated shells, note-taking, and target management.",
    "",
    "Features multiple shell tabs with full bash functionality, markdown notes",
    "with syntax highlighting, and automatic command logging.",
  };
  std::vector<std::string> depends{"libgtk-3-0", "libvte-2.91-0", "bash"};
};

enum class PackageType { Deb, Rpm, Both };

// "1" DEB, "2" RPM, "3" both. Anything else is invalid.
std::optional<PackageType> parse_menu_choice(std::string_view choice);
// "deb", "rpm" or "both"
std::optional<PackageType> parse_package_type(std::string_view name);

// Version from the first project(... VERSION x.y.z ...) call; empty when absent.
std::string extract_version(std::string_view cmake_lists);
bool read_project_version(const std::filesystem::path& source_dir, std::string& version, std::string& err);

// uname machine to Debian architecture (x86_64 -> amd64, aarch64 -> arm64).
std::string debian_arch(std::string_view machine);

std::string deb_control(const PackageInfo& info);
std::string deb_postinst();
// Replace the Version: line of an RPM spec template.
std::string rpm_spec(std::string_view spec_template, std::string_view version);

struct PackageOptions {
  std::filesystem::path source_dir{"."};
  std::filesystem::path build_dir{"build"};   // holds the built penenv binary
  std::filesystem::path out_dir{"dist"};      // DEB tree and package, rpm/ copies
  std::filesystem::path rpm_top;              // default $HOME/rpmbuild
  bool build{true};                           // run cmake --build first
  const char* path_env{nullptr};              // PATH used for tool lookup
};

// Each returns the path of the produced package in artifact.
bool build_deb(const PackageOptions& opts, const PackageInfo& info,
               std::filesystem::path& artifact, std::string& err);
bool build_rpm(const PackageOptions& opts, const PackageInfo& info,
               std::filesystem::path& artifact, std::string& err);

} // namespace penenv::app
