#include "view/reporter.hpp"
#include "view/cli.hpp"
#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

static bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

void test_render_state() {
  std::cout << "Running test_render_state..." << std::endl;
  Config cfg;
  cfg.num_frames = 2;
  MemoryService service(cfg, 1);
  service.create_process(2);
  service.access_page(1, 0, FIFO);
  service.access_page(1, 0, FIFO);

  Reporter reporter(service);
  auto state = service.snapshot();

  auto frames = Reporter::render_frames(state);
  assert(contains(frames, "P1"));
  assert(contains(frames, "hsl(137, 70%, 60%)"));
  assert(contains(frames, "(free)"));

  auto stats = Reporter::render_stats(state);
  assert(contains(stats, "Page Hits: 1"));
  assert(contains(stats, "Page Faults: 1"));
  assert(contains(stats, "Hit Ratio: 50.0%"));
  assert(contains(stats, "FIFO Queue: [0]"));

  auto log = Reporter::render_log(state);
  assert(contains(log, "Process P1 created (2 pages)"));
  assert(contains(log, "Page hit: P1 page 0"));

  auto smi = reporter.get_process_smi();
  assert(contains(smi, "P1 (1/2 resident) [0:F0 1:-]"));

  auto report = reporter.build_report();
  assert(contains(report, "[Recent Events]"));
  std::cout << "test_render_state PASSED" << std::endl;
}

void test_render_empty() {
  std::cout << "Running test_render_empty..." << std::endl;
  Config cfg;
  MemoryService service(cfg, 1);
  auto state = service.snapshot();
  assert(contains(Reporter::render_processes(state), "(none)"));
  assert(contains(Reporter::render_log(state), "(empty)"));
  assert(contains(Reporter::render_stats(state), "Hit Ratio: 0.0%"));
  std::cout << "test_render_empty PASSED" << std::endl;
}

void test_cli_session() {
  std::cout << "Running test_cli_session..." << std::endl;
  std::istringstream in(
      "create\n"
      "initialize\n"
      "create 2\n"
      "create 0\n"
      "access P1 0\n"
      "access 1 0 lru\n"
      "access 1 5\n"
      "access 9 0\n"
      "policy lru\n"
      "remove 1\n"
      "remove 1\n"
      "simulate\n"
      "bogus\n"
      "exit\n"
      "create\n");
  std::ostringstream out;
  CLI cli(in, out);
  assert(cli.run() == 0);

  const std::string text = out.str();
  assert(contains(text, "Please run initialize first."));
  assert(contains(text, "Created process P1 with 2 pages."));
  assert(contains(text, "Error: Invalid page count"));
  assert(contains(text, "Page fault: loaded into frame 0."));
  assert(contains(text, "Page hit (frame 0)."));
  assert(contains(text, "Error: Invalid page\n"));
  assert(contains(text, "Error: Process not found"));
  assert(contains(text, "Policy set to LRU."));
  assert(contains(text, "Removed P1, freed 1 frames."));
  assert(contains(text, "Error: No processes running"));
  assert(contains(text, "Unknown command: bogus"));
  assert(contains(text, "Goodbye."));
  // Nothing after exit runs
  assert(!contains(text, "Created process P2"));
  std::cout << "test_cli_session PASSED" << std::endl;
}

int main() {
  test_render_state();
  test_render_empty();
  test_cli_session();
  std::cout << "All Reporter tests PASSED!" << std::endl;
  return 0;
}
