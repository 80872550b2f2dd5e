#pragma once
#include <cstdint>
#include <string>

enum ReplacementPolicy {
  FIFO,
  LRU
};

struct Config {
  uint32_t num_frames = 16;
  ReplacementPolicy replacement_policy = FIFO; // "fifo" or "lru"

  // Page count drawn for create_process() without an explicit size
  uint32_t min_pages_per_proc = 2;
  uint32_t max_pages_per_proc = 4;

  // Event log
  uint32_t log_capacity = 50;
  uint32_t recent_log_count = 10;

  // Access generator period
  uint32_t access_delay_ms = 200;
};

Config load_config(const std::string &path);
