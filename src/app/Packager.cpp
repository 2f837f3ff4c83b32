#include "app/Packager.hpp"
#include "app/Workspace.hpp"
#include "util/AsciiLower.hpp"
#include "util/Log.hpp"
#include "util/Process.hpp"
#include "util/Procfs.hpp"

#include <cctype>
#include <cstdlib>

namespace penenv::app {

namespace fs = std::filesystem;
using penenv::util::find_executable;
using penenv::util::run_process;

std::optional<PackageType> parse_menu_choice(std::string_view choice) {
  while (!choice.empty() && (choice.back() == '\n' || choice.back() == '\r' || choice.back() == ' '))
    choice.remove_suffix(1);
  while (!choice.empty() && choice.front() == ' ') choice.remove_prefix(1);
  if (choice == "1") return PackageType::Deb;
  if (choice == "2") return PackageType::Rpm;
  if (choice == "3") return PackageType::Both;
  return std::nullopt;
}

std::optional<PackageType> parse_package_type(std::string_view name) {
  auto n = penenv::util::ascii_lower(name);
  if (n == "deb") return PackageType::Deb;
  if (n == "rpm") return PackageType::Rpm;
  if (n == "both") return PackageType::Both;
  return std::nullopt;
}

static bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

std::string extract_version(std::string_view text) {
  // first "project(" that is not part of a longer identifier
  const std::string lower = penenv::util::ascii_lower(text);
  std::size_t pos = 0;
  while (true) {
    pos = lower.find("project", pos);
    if (pos == std::string::npos) return {};
    bool word_start = pos == 0 || !(std::isalnum(static_cast<unsigned char>(text[pos - 1])) || text[pos - 1] == '_');
    std::size_t p = pos + 7;
    while (p < text.size() && is_space(text[p])) ++p;
    if (word_start && p < text.size() && text[p] == '(') { pos = p + 1; break; }
    pos += 7;
  }
  auto close = text.find(')', pos);
  std::string_view args = text.substr(pos, close == std::string_view::npos ? std::string_view::npos : close - pos);
  // tokenise the argument list
  std::vector<std::string_view> toks;
  std::size_t i = 0;
  while (i < args.size()) {
    while (i < args.size() && is_space(args[i])) ++i;
    std::size_t s = i;
    while (i < args.size() && !is_space(args[i])) ++i;
    if (i > s) toks.push_back(args.substr(s, i - s));
  }
  for (std::size_t k = 0; k + 1 < toks.size(); ++k) {
    if (toks[k] == "VERSION") {
      auto v = toks[k + 1];
      if (v.size() >= 2 && v.front() == '"' && v.back() == '"') v = v.substr(1, v.size() - 2);
      return std::string(v);
    }
  }
  return {};
}

bool read_project_version(const fs::path& source_dir, std::string& version, std::string& err) {
  auto text = read_text(source_dir / "CMakeLists.txt");
  if (text) version = extract_version(*text);
  if (!text || version.empty()) {
    err = "Failed to extract version from CMakeLists.txt";
    return false;
  }
  return true;
}

std::string debian_arch(std::string_view machine) {
  if (machine == "x86_64" || machine == "amd64") return "amd64";
  if (machine == "aarch64" || machine == "arm64") return "arm64";
  if (machine.size() == 4 && machine[0] == 'i' && machine.substr(2) == "86") return "i386";
  if (machine.starts_with("armv7")) return "armhf";
  return std::string(machine);
}

std::string deb_control(const PackageInfo& info) {
  std::string out;
  out += "Package: " + info.name + "\n";
  out += "Version: " + info.version + "-" + info.revision + "\n";
  out += "Section: utils\n";
  out += "Priority: optional\n";
  out += "Architecture: " + info.arch + "\n";
  out += "Depends: ";
  for (std::size_t i = 0; i < info.depends.size(); ++i) {
    if (i) out += ", ";
    out += info.depends[i];
  }
  out += "\n";
  out += "Maintainer: " + info.maintainer + "\n";
  out += "Description: " + info.summary + "\n";
  for (const auto& line : info.description) out += line.empty() ? " .\n" : " " + line + "\n";
  return out;
}

std::string deb_postinst() {
  return "#!/bin/bash\n"
         "set -e\n"
         "if [ \"$1\" = \"configure\" ]; then\n"
         "    gtk-update-icon-cache -f -t /usr/share/icons/hicolor 2>/dev/null || true\n"
         "    update-desktop-database /usr/share/applications 2>/dev/null || true\n"
         "fi\n";
}

std::string rpm_spec(std::string_view tmpl, std::string_view version) {
  std::string out;
  out.reserve(tmpl.size() + 16);
  penenv::util::for_each_line(tmpl, [&](std::string_view line) {
    if (line.starts_with("Version:")) {
      out += "Version:        ";
      out += version;
    } else {
      out += line;
    }
    out += '\n';
  });
  return out;
}

static bool make_dirs(const fs::path& p, std::string& err) {
  std::error_code ec;
  fs::create_directories(p, ec);
  if (ec) { err = "cannot create " + p.string() + ": " + ec.message(); return false; }
  return true;
}

static bool copy_into(const fs::path& from, const fs::path& to, std::string& err) {
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) { err = "cannot copy " + from.string() + " to " + to.string() + ": " + ec.message(); return false; }
  return true;
}

static bool write_file(const fs::path& p, const std::string& text, std::string& err) {
  return write_text(p, text, err);
}

static bool build_binary(const PackageOptions& opts, std::string& err) {
  if (!opts.build) return true;
  auto cmake = find_executable("cmake", opts.path_env);
  if (!cmake) { err = "cmake not found. Install CMake to build the release binary"; return false; }
  PENENV_LOG_INFO("building release binary in %s", opts.build_dir.c_str());
  int rc = run_process({cmake->string(), "-S", opts.source_dir.string(), "-B", opts.build_dir.string(),
                        "-DCMAKE_BUILD_TYPE=Release"});
  if (rc == 0) rc = run_process({cmake->string(), "--build", opts.build_dir.string(), "--target", "penenv"});
  if (rc != 0) { err = "release build failed (exit " + std::to_string(rc) + ")"; return false; }
  return true;
}

bool build_deb(const PackageOptions& opts, const PackageInfo& info, fs::path& artifact, std::string& err) {
  auto dpkg = find_executable("dpkg-deb", opts.path_env);
  if (!dpkg) {
    err = "dpkg-deb not found. Install with: sudo apt install dpkg-dev";
    return false;
  }
  if (!build_binary(opts, err)) return false;

  const std::string stem = info.name + "_" + info.version + "-" + info.revision + "_" + info.arch;
  const fs::path pkg = opts.out_dir / "debian" / stem;
  const fs::path share = pkg / "usr/share";
  const fs::path doc = share / "doc" / info.name;
  for (const auto& d : {pkg / "DEBIAN", pkg / "usr/bin", share / "applications",
                        share / "icons/hicolor/256x256/apps", share / "icons/hicolor/scalable/apps", doc}) {
    if (!make_dirs(d, err)) return false;
  }

  const fs::path& src = opts.source_dir;
  if (!copy_into(opts.build_dir / "penenv", pkg / "usr/bin/penenv", err)) return false;
  if (!copy_into(src / "data/penenv.desktop", share / "applications/penenv.desktop", err)) return false;
  if (!copy_into(src / "images/penenv-icon.png", share / "icons/hicolor/256x256/apps/penenv.png", err)) return false;
  if (!copy_into(src / "images/penenv-icon.svg", share / "icons/hicolor/scalable/apps/penenv.svg", err)) return false;
  if (!copy_into(src / "README.md", doc / "README.md", err)) return false;
  if (!copy_into(src / "LICENSE", doc / "LICENSE", err)) return false;

  std::error_code ec;
  fs::permissions(pkg / "usr/bin/penenv", fs::perms(0755), fs::perm_options::replace, ec);
  if (ec) { err = "cannot chmod penenv binary: " + ec.message(); return false; }
  if (!write_file(pkg / "DEBIAN/control", deb_control(info), err)) return false;
  if (!write_file(pkg / "DEBIAN/postinst", deb_postinst(), err)) return false;
  fs::permissions(pkg / "DEBIAN/postinst", fs::perms(0755), fs::perm_options::replace, ec);
  if (ec) { err = "cannot chmod postinst: " + ec.message(); return false; }

  int rc = run_process({dpkg->string(), "--build", pkg.string()});
  if (rc != 0) { err = "dpkg-deb --build failed (exit " + std::to_string(rc) + ")"; return false; }
  artifact = pkg;
  artifact += ".deb";
  if (!fs::exists(artifact, ec)) { err = "dpkg-deb did not produce " + artifact.string(); return false; }
  return true;
}

static fs::path default_rpm_top() {
  const char* home = std::getenv("HOME");
  return fs::path(home && *home ? home : ".") / "rpmbuild";
}

// Top-level entries that go into the source tarball.
static std::vector<std::string> tarball_entries(const PackageOptions& opts, std::string& err) {
  std::vector<std::string> out;
  std::error_code ec;
  auto canon_build = fs::weakly_canonical(opts.build_dir, ec);
  auto canon_out = fs::weakly_canonical(opts.out_dir, ec);
  for (const auto& e : fs::directory_iterator(opts.source_dir, ec)) {
    auto name = e.path().filename().string();
    if (name.empty() || name[0] == '.') continue;
    if (name == "build" || name.ends_with(".deb") || name.ends_with(".rpm")) continue;
    auto canon = fs::weakly_canonical(e.path(), ec);
    if (canon == canon_build || canon == canon_out) continue;
    out.push_back(name);
  }
  if (ec) err = "cannot list " + opts.source_dir.string() + ": " + ec.message();
  return out;
}

bool build_rpm(const PackageOptions& opts, const PackageInfo& info, fs::path& artifact, std::string& err) {
  auto rpmbuild = find_executable("rpmbuild", opts.path_env);
  if (!rpmbuild) {
    err = "rpmbuild not found. Install with: sudo dnf install rpm-build";
    return false;
  }
  auto tar = find_executable("tar", opts.path_env);
  if (!tar) { err = "tar not found"; return false; }

  const fs::path top = opts.rpm_top.empty() ? default_rpm_top() : opts.rpm_top;
  for (const char* d : {"BUILD", "RPMS", "SOURCES", "SPECS", "SRPMS"}) {
    if (!make_dirs(top / d, err)) return false;
  }

  const std::string prefix = info.name + "-" + info.version;
  const fs::path tarball = top / "SOURCES" / (prefix + ".tar.gz");
  auto entries = tarball_entries(opts, err);
  if (!err.empty()) return false;
  if (entries.empty()) { err = "nothing to package in " + opts.source_dir.string(); return false; }
  std::vector<std::string> tar_argv{tar->string(), "--exclude=.git", "--exclude=build",
                                    "--exclude=*.deb", "--exclude=*.rpm",
                                    "--transform", "s,^," + prefix + "/,",
                                    "-czf", tarball.string(), "-C", opts.source_dir.string()};
  tar_argv.insert(tar_argv.end(), entries.begin(), entries.end());
  PENENV_LOG_INFO("creating source tarball %s", tarball.c_str());
  if (int rc = run_process(tar_argv); rc != 0) {
    err = "tar failed (exit " + std::to_string(rc) + ")";
    return false;
  }

  auto tmpl = read_text(opts.source_dir / "data/penenv.spec");
  if (!tmpl) { err = "cannot read " + (opts.source_dir / "data/penenv.spec").string(); return false; }
  const fs::path spec = top / "SPECS/penenv.spec";
  if (!write_file(spec, rpm_spec(*tmpl, info.version), err)) return false;

  int rc = run_process({rpmbuild->string(), "-bb", "--define", "_topdir " + top.string(), spec.string()});
  if (rc != 0) { err = "rpmbuild failed (exit " + std::to_string(rc) + ")"; return false; }

  const fs::path dest = opts.out_dir / "rpm";
  if (!make_dirs(dest, err)) return false;
  for (const char* arch : {"x86_64", "aarch64"}) {
    std::error_code ec;
    fs::path dir = top / "RPMS" / arch;
    if (!fs::is_directory(dir, ec)) continue;
    bool copied = false;
    for (const auto& e : fs::directory_iterator(dir, ec)) {
      auto name = e.path().filename().string();
      if (!name.starts_with(prefix + "-") || !name.ends_with(".rpm")) continue;
      if (!copy_into(e.path(), dest / name, err)) return false;
      artifact = dest / name;
      copied = true;
    }
    if (copied) return true;
  }
  err = "RPM build may have failed. Check " + (top / "RPMS").string() + "/";
  return false;
}

} // namespace penenv::app
