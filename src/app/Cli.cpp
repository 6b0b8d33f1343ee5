#include "app/Cli.hpp"
#include "app/RecordSource.hpp"
#include "app/Viewer.hpp"
#include "ui/Config.hpp"
#include "ui/Terminal.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <signal.h>
#include <unistd.h>

namespace binview::app {

static void print_usage() {
  std::cout << "Usage: binview [--init-config] [FILE|-]...\n";
  std::cout << "Reads FILEs (or stdin) and shows them as hex and text.\n";
  std::cout << "Keys: arrows/hjkl/C-n C-p C-b C-f move  0 ^ C-a line start  $ C-e line end\n";
  std::cout << "      < first row  > last row  C-l redraw  q/ESC quit\n";
  std::cout << "Config: " << ui::config_file_path() << "\n";
}

static bool run_viewer(const std::vector<std::string>& paths, std::string& err) {
  model::Dataset data;
  if (!load_dataset(paths, data, err)) return false;

  const auto& cfg = ui::config();
  const int out_fd = (cfg.output == "stdout") ? STDOUT_FILENO : STDERR_FILENO;
  ui::g_out_fd.store(out_fd);

  ui::TtyTerminal term(out_fd);
  if (!term.open(err)) return false;

  ui::CursorGuard cursor{out_fd};
  // No SA_RESTART: the blocking key read must return so the loop can stop.
  struct sigaction sa{};
  sa.sa_handler = ui::on_sigint;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
  std::atexit(&ui::on_atexit_restore);

  Viewer viewer(data, term, ui::make_palette(cfg.colors));
  return viewer.run(err);
}

int run_cli(const std::vector<std::string>& args) {
  std::vector<std::string> paths;
  bool init_config = false;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    if (a == "-h" || a == "--help") {
      print_usage();
      return 0;
    }
    else if (a == "--init-config") init_config = true;
    else if (a == "--") { paths.insert(paths.end(), args.begin() + static_cast<long>(i) + 1, args.end()); break; }
    else if (a.size() > 1 && a[0] == '-') {
      std::fprintf(stderr, "binview: unknown option %s\n", a.c_str());
      return 2;
    }
    else paths.push_back(a);
  }

  std::string err;
  if (init_config) {
    auto path = ui::config_file_path();
    if (!ui::write_default_config(path, err)) {
      std::fprintf(stderr, "binview: %s\n", err.c_str());
      return 1;
    }
    std::fprintf(stderr, "binview: wrote %s\n", path.c_str());
    return 0;
  }

  if (!run_viewer(paths, err)) {
    std::fprintf(stderr, "binview: %s\n", err.c_str());
    return 1;
  }
  return 0;
}

} // namespace binview::app
