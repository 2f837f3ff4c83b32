// PenEnv: terminals, notes, targets and command templates for a pentest
// working directory.

#include <gtk/gtk.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "app/CommandStore.hpp"
#include "app/Settings.hpp"
#include "app/Workspace.hpp"
#include "ui/AppContext.hpp"
#include "ui/Dialogs.hpp"
#include "ui/MainWindow.hpp"
#include "util/Log.hpp"

namespace fs = std::filesystem;

static const char* const kAppId = "com.penenv.app";

struct StartOptions {
  std::optional<fs::path> base_dir;
};

static void usage(std::ostream& os) {
  os << "Usage: penenv [--base-dir DIR]\n"
     << "Without --base-dir a dialog asks for the working directory.\n"
     << "Environment: PENENV_LOG=debug|info|warn|error\n";
}

static void on_activate(GtkApplication* app, gpointer data) {
  auto& ctx = penenv::ui::app_context();
  if (ctx.window) {
    gtk_window_present(ctx.window);
    return;
  }
  auto* opts = static_cast<StartOptions*>(data);
  std::optional<fs::path> base = opts->base_dir;
  if (!base) base = penenv::ui::choose_base_dir(app);
  if (!base) {
    PENENV_LOG_INFO("no base directory chosen, exiting");
    g_application_quit(G_APPLICATION(app));
    return;
  }
  ctx.app = app;
  ctx.workspace.set_base_dir(*base);
  penenv::ui::reload_templates(ctx);
  penenv::ui::build_main_window(ctx);
}

int main(int argc, char** argv) {
  StartOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--base-dir" && i + 1 < argc) opts.base_dir = fs::path(argv[++i]);
    else if (a == "-h" || a == "--help") { usage(std::cout); return 0; }
    else {
      std::cerr << "penenv: unknown argument '" << a << "'\n";
      usage(std::cerr);
      return 2;
    }
  }
  if (opts.base_dir) {
    std::error_code ec;
    if (!fs::is_directory(*opts.base_dir, ec)) {
      std::cerr << "penenv: not a directory: " << opts.base_dir->string() << "\n";
      return 1;
    }
    fs::path abs = fs::absolute(*opts.base_dir, ec);
    if (!ec) opts.base_dir = abs;
  }

  penenv::app::SettingsStore::instance().load(penenv::app::settings_path().string());

  GtkApplication* app = gtk_application_new(kAppId, G_APPLICATION_NON_UNIQUE);
  g_signal_connect(app, "activate", G_CALLBACK(on_activate), &opts);
  // options are handled above; GApplication sees only the program name
  int status = g_application_run(G_APPLICATION(app), 1, argv);
  g_object_unref(app);
  return status;
}
