#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "tracker.hpp"
#include "food.hpp"
#include "log.hpp"
#include "config.hpp"
#include <cstdio>
#include <exception>
#include <string>
#include <vector>

int main() {
  (void)log_open(MT_LOG_PATH); // logging stays off when the file can not be opened
  std::vector<FoodRecord> foods;
  CatalogStats stats;
  std::string msg;
  if (!load_catalog(MT_CATALOG_PATH, foods, stats, msg)) {
    LOG_ERROR("{}", msg);
    log_close();
    std::fprintf(stderr, "macrotrack: %s\n", msg.c_str());
    return 1;
  }
  LOG_INFO("{}", msg);

  try {
    Terminal term;
    NcursesTerminal screen;
    Tracker tracker(screen, std::move(foods));
    tracker.start();
    term.enable_raw();
    tracker.run();
  } catch (const std::exception& e) {
    LOG_ERROR("fatal: {}", e.what());
    log_close();
    std::fprintf(stderr, "macrotrack: %s\n", e.what());
    return 1;
  }
  LOG_INFO("bye");
  log_close();
  return 0;
}
