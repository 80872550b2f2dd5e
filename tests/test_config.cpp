#include "config.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static fs::path write_config(const std::string &name, const std::string &body) {
  fs::path path = fs::temp_directory_path() / name;
  std::ofstream out(path);
  out << body;
  return path;
}

void test_missing_file_keeps_defaults() {
  std::cout << "Running test_missing_file_keeps_defaults..." << std::endl;
  Config cfg = load_config("does-not-exist/config.txt");
  assert(cfg.num_frames == 16);
  assert(cfg.replacement_policy == FIFO);
  assert(cfg.min_pages_per_proc == 2);
  assert(cfg.max_pages_per_proc == 4);
  assert(cfg.log_capacity == 50);
  assert(cfg.recent_log_count == 10);
  std::cout << "test_missing_file_keeps_defaults PASSED" << std::endl;
}

void test_all_keys() {
  std::cout << "Running test_all_keys..." << std::endl;
  auto path = write_config("pagesim_all_keys.txt",
                           "num-frames 8\n"
                           "replacement-policy LRU\n"
                           "min-pages-per-proc 1\n"
                           "max-pages-per-proc 6\n"
                           "log-capacity 20\n"
                           "recent-log-count 5\n"
                           "access-delay-ms 15\n");
  Config cfg = load_config(path.string());
  assert(cfg.num_frames == 8);
  assert(cfg.replacement_policy == LRU);
  assert(cfg.min_pages_per_proc == 1);
  assert(cfg.max_pages_per_proc == 6);
  assert(cfg.log_capacity == 20);
  assert(cfg.recent_log_count == 5);
  assert(cfg.access_delay_ms == 15);
  fs::remove(path);
  std::cout << "test_all_keys PASSED" << std::endl;
}

void test_invalid_values() {
  std::cout << "Running test_invalid_values..." << std::endl;
  auto path = write_config("pagesim_invalid.txt",
                           "num-frames 0\n"
                           "replacement-policy clock\n"
                           "log-capacity abc\n"
                           "min-pages-per-proc 5\n"
                           "max-pages-per-proc 3\n"
                           "unknown-key 1\n");
  Config cfg = load_config(path.string());
  assert(cfg.num_frames == 16);
  assert(cfg.replacement_policy == FIFO);
  assert(cfg.log_capacity == 50);
  assert(cfg.min_pages_per_proc == 3);
  assert(cfg.max_pages_per_proc == 5);
  fs::remove(path);
  std::cout << "test_invalid_values PASSED" << std::endl;
}

int main() {
  test_missing_file_keeps_defaults();
  test_all_keys();
  test_invalid_values();
  std::cout << "All config tests PASSED!" << std::endl;
  return 0;
}
