#pragma once
#include <mutex>
#include <random>
#include "paging/memory_manager.hpp"

// Transport-side owner of a MemoryManager. Every call takes the one exclusive
// lock, so the CLI thread and the access generator can share a simulation.
class MemoryService {
public:
  explicit MemoryService(const Config &cfg);
  MemoryService(const Config &cfg, uint32_t seed);

  CreateOutcome create_process();
  CreateOutcome create_process(uint32_t page_count);
  AccessOutcome access_page(uint32_t pid, uint32_t page_num, ReplacementPolicy policy);
  RemoveOutcome remove_process(uint32_t pid);
  MemoryState snapshot();
  void reset();

  // Random existing process, random page within it. NoProcesses when empty.
  AccessOutcome simulate_access(ReplacementPolicy policy);

  size_t frame_count();
  std::optional<std::string> check_invariants(bool fifo_only = false);

private:
  std::mutex mtx_;
  MemoryManager mm_;
  uint32_t seed_;
  std::mt19937 rng_;
};
