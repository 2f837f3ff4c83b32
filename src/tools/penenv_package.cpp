// Builds DEB and/or RPM packages of penenv from a source tree.

#include "app/Packager.hpp"
#include "util/Process.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using penenv::app::PackageType;

static void usage(std::ostream& os) {
  os << "Usage: penenv-package [--type deb|rpm|both] [--source-dir DIR] [--build-dir DIR]\n"
        "                      [--out-dir DIR] [--no-build]\n"
        "Without --type an interactive menu is shown.\n";
}

static bool run_deb(const penenv::app::PackageOptions& opts, const penenv::app::PackageInfo& info) {
  std::cout << "\nBuilding DEB package...\n----------------------\n";
  fs::path artifact; std::string err;
  if (!penenv::app::build_deb(opts, info, artifact, err)) {
    std::cerr << "error: " << err << "\n";
    return false;
  }
  std::cout << "DEB package created: " << artifact.string() << "\n\n"
            << "Install with: sudo dpkg -i " << artifact.string() << "\n"
            << "             sudo apt-get install -f  # to fix dependencies if needed\n";
  return true;
}

static bool run_rpm(const penenv::app::PackageOptions& opts, const penenv::app::PackageInfo& info) {
  std::cout << "\nBuilding RPM package...\n----------------------\n";
  fs::path artifact; std::string err;
  if (!penenv::app::build_rpm(opts, info, artifact, err)) {
    std::cerr << "error: " << err << "\n";
    return false;
  }
  std::cout << "RPM package created: " << artifact.string() << "\n\n"
            << "Install with: sudo dnf install " << artifact.string() << "\n";
  return true;
}

int main(int argc, char** argv) {
  penenv::app::PackageOptions opts;
  std::string type_arg;
  bool out_set = false, build_set = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--type" && i + 1 < argc) type_arg = argv[++i];
    else if (a == "--source-dir" && i + 1 < argc) opts.source_dir = argv[++i];
    else if (a == "--build-dir" && i + 1 < argc) { opts.build_dir = argv[++i]; build_set = true; }
    else if (a == "--out-dir" && i + 1 < argc) { opts.out_dir = argv[++i]; out_set = true; }
    else if (a == "--no-build") opts.build = false;
    else if (a == "-h" || a == "--help") { usage(std::cout); return 0; }
    else {
      std::cerr << "penenv-package: unknown argument '" << a << "'\n";
      usage(std::cerr);
      return 2;
    }
  }
  if (!build_set) opts.build_dir = opts.source_dir / "build";
  if (!out_set) opts.out_dir = opts.source_dir / "dist";

  penenv::app::PackageInfo info;
  std::string err;
  if (!penenv::app::read_project_version(opts.source_dir, info.version, err)) {
    std::cerr << "error: " << err << "\n";
    return 1;
  }
  info.arch = penenv::app::debian_arch(penenv::util::host_machine());

  std::cout << "PenEnv Package Builder\n======================\nVersion: " << info.version << "\n\n";

  std::optional<PackageType> type;
  if (!type_arg.empty()) {
    type = penenv::app::parse_package_type(type_arg);
    if (!type) {
      std::cerr << "penenv-package: --type must be deb, rpm or both\n";
      return 2;
    }
  } else {
    std::cout << "Select package type to build:\n"
                 "1) DEB (Ubuntu/Debian)\n"
                 "2) RPM (Fedora/RHEL)\n"
                 "3) Both\n\n"
                 "Choice [1-3]: " << std::flush;
    std::string choice;
    std::getline(std::cin, choice);
    type = penenv::app::parse_menu_choice(choice);
    if (!type) {
      std::cerr << "Invalid choice\n";
      return 1;
    }
  }

  // stop at the first failing package, like a set -e script
  if (*type == PackageType::Deb || *type == PackageType::Both) {
    if (!run_deb(opts, info)) return 1;
  }
  if (*type == PackageType::Rpm || *type == PackageType::Both) {
    if (!run_rpm(opts, info)) return 1;
  }
  std::cout << "\nDone!\n";
  return 0;
}
