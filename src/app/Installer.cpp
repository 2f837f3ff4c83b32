#include "app/Installer.hpp"
#include "util/Log.hpp"
#include "util/Process.hpp"

#include <cstdlib>
#include <string_view>

namespace penenv::app {

namespace fs = std::filesystem;

bool dir_on_path(const fs::path& dir, const char* path_env) {
  if (!path_env) return false;
  std::string_view rest(path_env);
  const std::string want = dir.lexically_normal().string();
  while (true) {
    auto colon = rest.find(':');
    auto entry = rest.substr(0, colon);
    if (!entry.empty()) {
      auto norm = fs::path(entry).lexically_normal().string();
      if (!norm.empty() && norm.size() > 1 && norm.back() == '/') norm.pop_back();
      if (norm == want) return true;
    }
    if (colon == std::string_view::npos) break;
    rest.remove_prefix(colon + 1);
  }
  return false;
}

static bool install_file(const fs::path& from, const fs::path& to, fs::perms mode,
                         InstallReport& report, std::string& err) {
  std::error_code ec;
  fs::create_directories(to.parent_path(), ec);
  if (ec) { err = "cannot create " + to.parent_path().string() + ": " + ec.message(); return false; }
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) { err = "cannot copy " + from.string() + " to " + to.string() + ": " + ec.message(); return false; }
  fs::permissions(to, mode, fs::perm_options::replace, ec);
  if (ec) { err = "cannot set mode on " + to.string() + ": " + ec.message(); return false; }
  report.installed.push_back(to);
  return true;
}

bool install_local(const InstallOptions& opts, InstallReport& report, std::string& err) {
  fs::path home = opts.home;
  if (home.empty()) {
    const char* h = std::getenv("HOME");
    if (!h || !*h) { err = "HOME is not set"; return false; }
    home = h;
  }
  const fs::path local = home / ".local";
  const fs::path apps = local / "share/applications";
  const fs::path icons = local / "share/icons/hicolor";
  report = InstallReport{};
  report.bin_dir = local / "bin";

  std::error_code ec;
  if (!fs::is_regular_file(opts.binary, ec)) {
    err = "binary not found: " + opts.binary.string() + " (build it first)";
    return false;
  }

  const auto rw = fs::perms(0644);
  PENENV_LOG_INFO("installing binary to %s", (report.bin_dir / "penenv").c_str());
  if (!install_file(opts.binary, report.bin_dir / "penenv", fs::perms(0755), report, err)) return false;
  if (!install_file(opts.source_dir / "images/penenv-icon.png", icons / "256x256/apps/penenv.png", rw, report, err))
    return false;
  if (!install_file(opts.source_dir / "images/penenv-icon.svg", icons / "scalable/apps/penenv.svg", rw, report, err))
    return false;
  if (!install_file(opts.source_dir / "data/penenv.desktop", apps / "penenv.desktop", rw, report, err))
    return false;

  const char* path_env = opts.path_env ? opts.path_env : std::getenv("PATH");
  if (auto tool = penenv::util::find_executable("update-desktop-database", path_env)) {
    int rc = penenv::util::run_process({tool->string(), apps.string()});
    if (rc != 0) PENENV_LOG_WARN("update-desktop-database exited with %d", rc);
    report.desktop_db_updated = rc == 0;
  }
  if (auto tool = penenv::util::find_executable("gtk-update-icon-cache", path_env)) {
    int rc = penenv::util::run_process({tool->string(), "-f", "-t", icons.string()});
    if (rc != 0) PENENV_LOG_WARN("gtk-update-icon-cache exited with %d", rc);
    report.icon_cache_updated = rc == 0;
  }
  report.bin_dir_on_path = dir_on_path(report.bin_dir, path_env);
  return true;
}

} // namespace penenv::app
