#include "paging/memory_service.hpp"
#include "util.hpp"

MemoryService::MemoryService(const Config &cfg)
    : MemoryService(cfg, std::random_device{}()) {}

MemoryService::MemoryService(const Config &cfg, uint32_t seed)
    : mm_(cfg, seed), seed_(seed), rng_(seed) {}

CreateOutcome MemoryService::create_process() {
  std::lock_guard<std::mutex> lock(mtx_);
  return mm_.create_process();
}

CreateOutcome MemoryService::create_process(uint32_t page_count) {
  std::lock_guard<std::mutex> lock(mtx_);
  return mm_.create_process(page_count);
}

AccessOutcome MemoryService::access_page(uint32_t pid, uint32_t page_num, ReplacementPolicy policy) {
  std::lock_guard<std::mutex> lock(mtx_);
  return mm_.access_page(pid, page_num, policy);
}

RemoveOutcome MemoryService::remove_process(uint32_t pid) {
  std::lock_guard<std::mutex> lock(mtx_);
  return mm_.remove_process(pid);
}

MemoryState MemoryService::snapshot() {
  std::lock_guard<std::mutex> lock(mtx_);
  return mm_.snapshot();
}

void MemoryService::reset() {
  std::lock_guard<std::mutex> lock(mtx_);
  mm_.reset();
  rng_.seed(seed_);
}

AccessOutcome MemoryService::simulate_access(ReplacementPolicy policy) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto pids = mm_.process_ids();
  if (pids.empty())
    return {false, false, MemoryError::NoProcesses, 0, std::nullopt};

  uint32_t pid = pids[rand_range(rng_, 0, static_cast<uint32_t>(pids.size() - 1))];
  const Process *proc = mm_.find_process(pid);
  uint32_t page = rand_range(rng_, 0, proc->page_count() - 1);
  return mm_.access_page(pid, page, policy);
}

size_t MemoryService::frame_count() {
  std::lock_guard<std::mutex> lock(mtx_);
  return mm_.frame_count();
}

std::optional<std::string> MemoryService::check_invariants(bool fifo_only) {
  std::lock_guard<std::mutex> lock(mtx_);
  return mm_.check_invariants(fifo_only);
}
