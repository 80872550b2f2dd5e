#include "paging/page_replacement_policy.hpp"
#include "util.hpp"
#include <algorithm>

std::optional<uint32_t> FifoReplacement::select_victim(const std::vector<Frame>& frames,
                                                       const PageTable&) const {
    for (auto id : admission_queue_) {
        if (id < frames.size() && !frames[id].free)
            return id;
    }
    return std::nullopt;
}

void FifoReplacement::on_admit(uint32_t frame_id) {
    admission_queue_.push_back(frame_id);
}

void FifoReplacement::on_release(uint32_t frame_id) {
    admission_queue_.erase(
        std::remove(admission_queue_.begin(), admission_queue_.end(), frame_id),
        admission_queue_.end()
    );
}

std::optional<uint32_t> LRUReplacement::select_victim(const std::vector<Frame>&,
                                                      const PageTable& table) const {
    const PageTableEntry* oldest = nullptr;
    for (const auto& [key, entry] : table) {
        if (!oldest
            || entry.last_used_at < oldest->last_used_at
            || (entry.last_used_at == oldest->last_used_at && entry.frame_number < oldest->frame_number))
            oldest = &entry;
    }
    if (!oldest) return std::nullopt;
    return oldest->frame_number;
}

std::optional<ReplacementPolicy> parse_policy(const std::string& name) {
    std::string v = to_lower(name);
    if (v == "fifo") return FIFO;
    if (v == "lru") return LRU;
    return std::nullopt;
}

std::string policy_to_string(ReplacementPolicy policy) {
    switch (policy) {
    case FIFO:
        return "FIFO";
    case LRU:
        return "LRU";
    default:
        return "UNKNOWN";
    }
}
