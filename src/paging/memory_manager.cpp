#include "paging/memory_manager.hpp"
#include "paging/page_replacement_policy.hpp"
#include "util.hpp"
#include <algorithm>
#include <ctime>
#include <iostream>
#include <set>
#include <sstream>

std::string to_string(MemoryError err) {
    switch (err) {
    case MemoryError::ProcessNotFound:
        return "Process not found";
    case MemoryError::InvalidPage:
        return "Invalid page";
    case MemoryError::InvalidPageCount:
        return "Invalid page count";
    case MemoryError::NoFramesAvailable:
        return "No frames available";
    case MemoryError::NoProcesses:
        return "No processes running";
    default:
        return "Unknown error";
    }
}

std::ostream& operator<<(std::ostream& os, const LogEntry& entry) {
    return os << "#" << entry.seq << " t=" << entry.tick << " " << entry.message;
}

MemoryManager::MemoryManager(const Config& cfg)
    : MemoryManager(cfg, std::random_device{}())
{
}

MemoryManager::MemoryManager(const Config& cfg, uint32_t seed)
    : cfg_(cfg),
      log_(cfg.log_capacity),
      seed_(seed),
      rng_(seed)
{
    initialize_frames();
}

void MemoryManager::initialize_frames() {
    uint32_t num_frames = cfg_.num_frames == 0 ? 1 : cfg_.num_frames;
    frames_.clear();
    frames_.reserve(num_frames);
    for (uint32_t i = 0; i < num_frames; i++) {
        frames_.push_back(Frame{
          .id=i,
          .free=true,
          .process_id=0,
          .page_number=0
        });
    }
}

void MemoryManager::reset() {
    initialize_frames();
    processes_.clear();
    page_table_.clear();
    fifo_.clear();
    lru_.clear();
    stats_ = MemoryStats{};
    log_.clear();
    log_seq_ = 0;
    tick_ = 0;
    next_pid_ = 1;
    rng_.seed(seed_);
}

void MemoryManager::add_log(const std::string& message) {
    log_.push(LogEntry{++log_seq_, tick_, std::time(nullptr), message});
    DEBUG_PRINT(DEBUG_MEMORY_MANAGER, "%s", message.c_str());
}

PageReplacementPolicy& MemoryManager::policy_for(ReplacementPolicy policy) {
    if (policy == LRU) return lru_;
    return fifo_;
}

/**************** Process Lifecycle ****************/

CreateOutcome MemoryManager::create_process() {
    uint32_t pages = rand_range(rng_, cfg_.min_pages_per_proc, cfg_.max_pages_per_proc);
    return create_process(pages == 0 ? 1 : pages);
}

CreateOutcome MemoryManager::create_process(uint32_t page_count) {
    if (page_count == 0)
        return {false, MemoryError::InvalidPageCount, std::nullopt};

    uint32_t pid = next_pid_++;
    auto [it, inserted] = processes_.emplace(pid, Process(pid, page_count));
    (void)inserted;

    std::ostringstream msg;
    msg << "Process P" << pid << " created (" << page_count << " pages)";
    add_log(msg.str());

    return {true, std::nullopt, it->second};
}

RemoveOutcome MemoryManager::remove_process(uint32_t pid) {
    auto proc = processes_.find(pid);
    if (proc == processes_.end())
        return {false, MemoryError::ProcessNotFound, 0};

    uint32_t freed = 0;
    for (auto& frame : frames_) {
        if (!frame.free && frame.process_id == pid) {
            release_frame(frame.id);
            ++freed;
        }
    }

    // Entries of pid are contiguous since PageKey orders by pid first
    auto first = page_table_.lower_bound(PageKey{pid, 0});
    auto last = first;
    while (last != page_table_.end() && last->first.process_id == pid) ++last;
    page_table_.erase(first, last);

    processes_.erase(proc);
    add_log("Process P" + std::to_string(pid) + " terminated");

    return {true, std::nullopt, freed};
}

/**************** Page Access ****************/

AccessOutcome MemoryManager::access_page(uint32_t pid, uint32_t page_num, ReplacementPolicy policy) {
    auto proc = processes_.find(pid);
    if (proc == processes_.end())
        return {false, false, MemoryError::ProcessNotFound, 0, std::nullopt};
    if (!proc->second.has_page(page_num))
        return {false, false, MemoryError::InvalidPage, 0, std::nullopt};

    const PageKey key{pid, page_num};

    auto resident = page_table_.find(key);
    if (resident != page_table_.end()) {
        ++tick_;
        ++stats_.hits;
        resident->second.last_used_at = tick_;
        add_log("Page hit: P" + std::to_string(pid) + " page " + std::to_string(page_num));
        return {true, true, std::nullopt, resident->second.frame_number, std::nullopt};
    }

    // Page fault: pick the frame before touching any state
    auto& replacement = policy_for(policy);
    std::optional<uint32_t> frame_idx = find_free_frame();
    bool needs_eviction = false;

    if (!frame_idx) {
        frame_idx = replacement.select_victim(frames_, page_table_);
        needs_eviction = true;
    }

    if (!frame_idx) {
        std::cerr << "FATAL: no victim frame under " << policy_to_string(policy)
                  << " (frames=" << frames_.size()
                  << ", resident=" << page_table_.size() << ")\n";
        std::cerr << "  Requested by PID " << pid << ", page " << page_num << "\n";
        return {false, false, MemoryError::NoFramesAvailable, 0, std::nullopt};
    }

    ++tick_;
    ++stats_.faults;

    std::optional<PageKey> evicted;
    if (needs_eviction) {
        const Frame& victim = frames_[*frame_idx];
        evicted = PageKey{victim.process_id, victim.page_number};
        evict_frame(*frame_idx);
    }

    Frame& frame = frames_[*frame_idx];
    frame.free = false;
    frame.process_id = pid;
    frame.page_number = page_num;

    page_table_[key] = PageTableEntry{*frame_idx, tick_, tick_};
    proc->second.update_page_table(page_num, *frame_idx);

    if (policy == FIFO)
        fifo_.on_admit(*frame_idx);

    std::ostringstream msg;
    msg << "Allocated P" << pid << " page " << page_num << " to frame " << *frame_idx;
    add_log(msg.str());

    return {true, false, std::nullopt, *frame_idx, evicted};
}

// Lowest-indexed free frame
std::optional<uint32_t> MemoryManager::find_free_frame() const {
    for (const auto& frame : frames_) {
        if (frame.free)
            return frame.id;
    }
    return std::nullopt;
}

void MemoryManager::evict_frame(uint32_t frame_idx) {
    const Frame& victim = frames_[frame_idx];
    uint32_t vpid = victim.process_id;
    uint32_t vpage = victim.page_number;

    page_table_.erase(PageKey{vpid, vpage});
    release_frame(frame_idx);
    ++stats_.evictions;

    add_log("Page fault: Evicting P" + std::to_string(vpid) + " page " + std::to_string(vpage));
}

// Clears the frame, its FIFO slot and the owner's page descriptor.
// The page-table entry is the caller's to remove.
void MemoryManager::release_frame(uint32_t frame_idx) {
    Frame& frame = frames_[frame_idx];
    auto owner = processes_.find(frame.process_id);
    if (owner != processes_.end())
        owner->second.invalidate_page(frame.page_number);

    fifo_.on_release(frame_idx);
    lru_.on_release(frame_idx);

    frame.free = true;
    frame.process_id = 0;
    frame.page_number = 0;
}

/**************** Queries ****************/

MemoryState MemoryManager::snapshot() const {
    return snapshot(cfg_.recent_log_count);
}

MemoryState MemoryManager::snapshot(size_t recent) const {
    MemoryState state;
    state.frames = frames_;
    state.processes.reserve(processes_.size());
    for (const auto& [pid, proc] : processes_)
        state.processes.push_back(proc);
    state.stats = stats_;
    state.fifo_queue.assign(fifo_.queue().begin(), fifo_.queue().end());
    state.tick = tick_;
    state.recent_log = log_.tail(recent);
    return state;
}

size_t MemoryManager::free_frame_count() const {
    return static_cast<size_t>(std::count_if(frames_.begin(), frames_.end(),
                                             [](const Frame& f) { return f.free; }));
}

const Process* MemoryManager::find_process(uint32_t pid) const {
    auto it = processes_.find(pid);
    return it != processes_.end() ? &it->second : nullptr;
}

std::vector<uint32_t> MemoryManager::process_ids() const {
    std::vector<uint32_t> ids;
    ids.reserve(processes_.size());
    for (const auto& [pid, proc] : processes_)
        ids.push_back(pid);
    return ids;
}

std::optional<PageTableEntry> MemoryManager::residency(uint32_t pid, uint32_t page_num) const {
    auto it = page_table_.find(PageKey{pid, page_num});
    if (it == page_table_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> MemoryManager::check_invariants(bool fifo_only) const {
    std::set<uint32_t> claimed;
    for (const auto& [key, entry] : page_table_) {
        if (entry.frame_number >= frames_.size())
            return "entry P" + std::to_string(key.process_id) + "-" + std::to_string(key.page_number)
                   + " points past the frame pool";
        if (!claimed.insert(entry.frame_number).second)
            return "frame " + std::to_string(entry.frame_number) + " claimed by two entries";

        const Frame& frame = frames_[entry.frame_number];
        if (frame.free || frame.process_id != key.process_id || frame.page_number != key.page_number)
            return "frame " + std::to_string(entry.frame_number) + " does not hold its page-table entry";

        auto proc = processes_.find(key.process_id);
        if (proc == processes_.end())
            return "entry references missing process P" + std::to_string(key.process_id);
        if (!proc->second.is_resident(key.page_number)
            || *proc->second.pages()[key.page_number].frame_idx != entry.frame_number)
            return "descriptor of P" + std::to_string(key.process_id) + " disagrees with page table";

        if (entry.last_used_at < entry.allocated_at)
            return "last_used_at precedes allocated_at for frame " + std::to_string(entry.frame_number);
    }

    if (frames_.size() - free_frame_count() != page_table_.size())
        return "occupied frames and page-table entries differ in count";

    std::set<uint32_t> queued;
    for (auto id : fifo_.queue()) {
        if (id >= frames_.size() || frames_[id].free)
            return "FIFO queue holds free frame " + std::to_string(id);
        if (!queued.insert(id).second)
            return "FIFO queue holds frame " + std::to_string(id) + " twice";
    }

    if (fifo_only) {
        for (const auto& frame : frames_) {
            if (!frame.free && !queued.count(frame.id))
                return "occupied frame " + std::to_string(frame.id) + " missing from FIFO queue";
        }
    }

    if (log_.size() > log_.capacity())
        return "event log exceeds its capacity";

    return std::nullopt;
}
