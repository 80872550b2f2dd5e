#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "config.hpp"
#include "memory_types.hpp"
#include "page_replacement_policy.hpp"
#include "processes/process.hpp"
#include "data_structures/event_log.hpp"

struct CreateOutcome {
  bool success = false;
  std::optional<MemoryError> error;
  std::optional<Process> process;
};

// Read-only projection returned by MemoryManager::snapshot().
struct MemoryState {
  std::vector<Frame> frames;
  std::vector<Process> processes; // ordered by pid
  MemoryStats stats;
  std::vector<uint32_t> fifo_queue; // front = next FIFO victim
  uint64_t tick = 0;
  std::vector<LogEntry> recent_log; // oldest first

  bool operator==(const MemoryState &other) const = default;
};

// Owns the frame pool, process table, page table and replacement state of one
// simulation. Single-threaded: callers sharing an instance must serialize
// access themselves (see MemoryService).
class MemoryManager {
public:
    explicit MemoryManager(const Config& cfg = Config{});
    MemoryManager(const Config& cfg, uint32_t seed);

    MemoryManager(const MemoryManager&) = delete;
    MemoryManager& operator=(const MemoryManager&) = delete;

    // Page count drawn uniformly from [min_pages_per_proc, max_pages_per_proc].
    CreateOutcome create_process();
    // Any page_count >= 1; 0 fails with InvalidPageCount.
    CreateOutcome create_process(uint32_t page_count);

    // Hit refreshes last_used_at. Fault takes the lowest free frame, or evicts
    // the victim chosen by `policy`. Fails without mutating anything.
    AccessOutcome access_page(uint32_t pid, uint32_t page_num, ReplacementPolicy policy);

    RemoveOutcome remove_process(uint32_t pid);

    MemoryState snapshot() const;
    MemoryState snapshot(size_t recent) const;

    void reset();

    // Queries
    size_t frame_count() const { return frames_.size(); }
    size_t free_frame_count() const;
    size_t resident_count() const { return page_table_.size(); }
    size_t process_count() const { return processes_.size(); }
    const Process* find_process(uint32_t pid) const;
    std::vector<uint32_t> process_ids() const;
    std::optional<PageTableEntry> residency(uint32_t pid, uint32_t page_num) const;
    const MemoryStats& stats() const { return stats_; }
    uint64_t current_tick() const { return tick_; }
    const Config& config() const { return cfg_; }

    // First violated table invariant, or nullopt when consistent. With
    // fifo_only set, every occupied frame must also sit in the FIFO queue,
    // which holds only for runs that never used LRU.
    std::optional<std::string> check_invariants(bool fifo_only = false) const;

private:
    Config cfg_;
    std::vector<Frame> frames_;
    std::map<uint32_t, Process> processes_;
    PageTable page_table_;

    FifoReplacement fifo_;
    LRUReplacement lru_;

    MemoryStats stats_;
    EventLog<LogEntry> log_;
    uint64_t log_seq_ = 0;
    uint64_t tick_ = 0;
    uint32_t next_pid_ = 1;

    uint32_t seed_;
    std::mt19937 rng_;

    void initialize_frames();
    PageReplacementPolicy& policy_for(ReplacementPolicy policy);
    std::optional<uint32_t> find_free_frame() const;
    void evict_frame(uint32_t frame_idx);
    void release_frame(uint32_t frame_idx);
    void add_log(const std::string& message);
};
