// Installs a built penenv into ~/.local for the current user.

#include "app/Installer.hpp"

#include <iostream>
#include <string>

static void usage(std::ostream& os) {
  os << "Usage: penenv-install [--source-dir DIR] [--binary PATH] [--prefix-home DIR]\n";
}

int main(int argc, char** argv) {
  penenv::app::InstallOptions opts;
  bool binary_set = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--source-dir" && i + 1 < argc) opts.source_dir = argv[++i];
    else if (a == "--binary" && i + 1 < argc) { opts.binary = argv[++i]; binary_set = true; }
    else if (a == "--prefix-home" && i + 1 < argc) opts.home = argv[++i];
    else if (a == "-h" || a == "--help") { usage(std::cout); return 0; }
    else {
      std::cerr << "penenv-install: unknown argument '" << a << "'\n";
      usage(std::cerr);
      return 2;
    }
  }
  if (!binary_set) opts.binary = opts.source_dir / "build" / "penenv";

  std::cout << "Installing PenEnv...\n";
  penenv::app::InstallReport report;
  std::string err;
  if (!penenv::app::install_local(opts, report, err)) {
    std::cerr << "error: " << err << "\n";
    return 1;
  }
  for (const auto& p : report.installed) std::cout << "  " << p.string() << "\n";
  if (report.desktop_db_updated) std::cout << "Updated desktop database\n";
  if (report.icon_cache_updated) std::cout << "Updated icon cache\n";

  std::cout << "\nInstallation complete!\n\n"
            << "PenEnv has been installed to: " << (report.bin_dir / "penenv").string() << "\n"
            << "Run 'penenv' from a terminal or launch it from your application menu.\n";
  if (!report.bin_dir_on_path) {
    std::cout << "\nNote: " << report.bin_dir.string() << " is not in your PATH\n"
              << "   Add this line to your ~/.bashrc or ~/.zshrc:\n"
              << "   export PATH=\"$HOME/.local/bin:$PATH\"\n";
  }
  return 0;
}
