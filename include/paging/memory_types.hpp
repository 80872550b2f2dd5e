#pragma once
#include <cstdint>
#include <ctime>
#include <ostream>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"

// A physical frame. Empty frames keep process_id = page_number = 0.
struct Frame {
  uint32_t id;
  bool free = true;
  uint32_t process_id = 0;
  uint32_t page_number = 0;

  bool operator==(const Frame &other) const = default;
};

// Composite page-table key; orders by pid first, then page.
struct PageKey {
  uint32_t process_id;
  uint32_t page_number;

  bool operator==(const PageKey &other) const = default;
  bool operator<(const PageKey &other) const {
    if (process_id != other.process_id) return process_id < other.process_id;
    return page_number < other.page_number;
  }
};

// Present only while the page is resident.
struct PageTableEntry {
  uint32_t frame_number = 0;
  uint64_t allocated_at = 0;
  uint64_t last_used_at = 0;
};

enum class MemoryError {
  ProcessNotFound,
  InvalidPage,
  InvalidPageCount,
  NoFramesAvailable,
  NoProcesses,
};

std::string to_string(MemoryError err);

struct MemoryStats {
  uint64_t hits = 0;
  uint64_t faults = 0;
  uint64_t evictions = 0;

  double hit_ratio() const {
    uint64_t total = hits + faults;
    return total ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
  }
  bool operator==(const MemoryStats &other) const = default;
};

struct AccessOutcome {
  bool success = false;
  bool hit = false;
  std::optional<MemoryError> error;
  uint32_t frame_idx = 0;
  std::optional<PageKey> evicted_page;
};

struct RemoveOutcome {
  bool success = false;
  std::optional<MemoryError> error;
  uint32_t frames_freed = 0;
};

struct LogEntry {
  uint64_t seq = 0;
  uint64_t tick = 0;
  std::time_t time = 0;
  std::string message;

  bool operator==(const LogEntry &other) const = default;
};

std::ostream& operator<<(std::ostream& os, const LogEntry& entry);
