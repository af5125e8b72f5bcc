#include "app/Config.hpp"
#include "app/Progress.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Simulated parallel build driving a progress tree.

static char g_draw_buffer[4096];

static int parse_int(const char* s, int defv) {
  try { return std::stoi(s); } catch (const std::logic_error&) { return defv; }
}

static void run_worker(const tally::app::Node& parent, int worker, int jobs, int items, int step_ms) {
  auto w = parent.start("worker " + std::to_string(worker), static_cast<size_t>(jobs));
  for (int j = 0; j < jobs; ++j) {
    char name[32];
    std::snprintf(name, sizeof(name), "job %d.%d", worker, j);
    auto job = w.start(name, static_cast<size_t>(items));
    for (int i = 0; i < items; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(step_ms));
      job.complete_one();
    }
    job.end();
  }
  w.end();
}

int main(int argc, char** argv) {
  tally::app::Options defaults;
  defaults.draw_buffer = g_draw_buffer;
  defaults.root_name = "build";
  auto options = tally::app::apply_config(defaults);

  int workers = 4;
  int jobs = 3;
  int items = 20;
  int step_ms = 25;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--workers" && i + 1 < argc) workers = parse_int(argv[++i], workers);
    else if (a == "--jobs" && i + 1 < argc) jobs = parse_int(argv[++i], jobs);
    else if (a == "--items" && i + 1 < argc) items = parse_int(argv[++i], items);
    else if (a == "--step-ms" && i + 1 < argc) step_ms = parse_int(argv[++i], step_ms);
    else if (a == "--refresh-ms" && i + 1 < argc)
      options.refresh_rate = std::chrono::milliseconds(std::max(10, parse_int(argv[++i], 60)));
    else if (a == "--initial-delay-ms" && i + 1 < argc)
      options.initial_delay = std::chrono::milliseconds(std::max(0, parse_int(argv[++i], 500)));
    else if (a == "-h" || a == "--help") {
      std::cout << "Usage: tally-demo [--workers N] [--jobs N] [--items N] [--step-ms MS]\n"
                   "                  [--refresh-ms MS] [--initial-delay-ms MS]\n";
      std::cout << "Env: TALLY_REFRESH_MS, TALLY_INITIAL_DELAY_MS, TALLY_NODE_CAPACITY, TALLY_DISABLE\n";
      return 0;
    }
  }
  if (workers < 1) workers = 1;
  if (jobs < 0) jobs = 0;
  if (items < 0) items = 0;
  if (step_ms < 0) step_ms = 0;

  options.estimated_total_items = static_cast<size_t>(workers);
  tally::app::Progress progress(options);
  auto root = progress.start();

  std::vector<std::thread> pool;
  pool.reserve(static_cast<size_t>(workers));
  for (int w = 0; w < workers; ++w)
    pool.emplace_back(run_worker, std::cref(root), w, jobs, items, step_ms);
  for (auto& t : pool) t.join();

  root.end();
  std::cout << "done: " << workers << " workers, " << workers * jobs << " jobs\n";
  return 0;
}
