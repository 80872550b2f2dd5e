#pragma once
#include "memory_types.hpp"
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

using PageTable = std::map<PageKey, PageTableEntry>;

// Picks the frame to evict when no frame is free. Policies only see the frame
// pool and the page table; the MemoryManager performs the eviction.
class PageReplacementPolicy {
public:
    virtual std::optional<uint32_t> select_victim(const std::vector<Frame>& frames,
                                                  const PageTable& table) const = 0;
    virtual void on_admit(uint32_t frame_id) = 0;
    virtual void on_release(uint32_t frame_id) = 0;
    virtual void clear() = 0;
    virtual ReplacementPolicy kind() const = 0;
    virtual ~PageReplacementPolicy() = default;
};


// Evicts in admission order. Hits do not reorder the queue.
class FifoReplacement : public PageReplacementPolicy {
    std::deque<uint32_t> admission_queue_; // front = oldest admitted frame
public:
    std::optional<uint32_t> select_victim(const std::vector<Frame>& frames,
                                          const PageTable& table) const override;
    void on_admit(uint32_t frame_id) override;
    void on_release(uint32_t frame_id) override;
    void clear() override { admission_queue_.clear(); }
    ReplacementPolicy kind() const override { return FIFO; }

    const std::deque<uint32_t>& queue() const { return admission_queue_; }
};


// Evicts the resident page with the oldest last_used_at, lowest frame on ties.
class LRUReplacement : public PageReplacementPolicy {
public:
    std::optional<uint32_t> select_victim(const std::vector<Frame>& frames,
                                          const PageTable& table) const override;
    void on_admit(uint32_t) override {}
    void on_release(uint32_t) override {}
    void clear() override {}
    ReplacementPolicy kind() const override { return LRU; }
};

std::optional<ReplacementPolicy> parse_policy(const std::string& name);
std::string policy_to_string(ReplacementPolicy policy);
