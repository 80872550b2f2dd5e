#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * A simulated process: a fixed number of virtual pages, each either resident
 * in some frame or not. Frames are assigned lazily by the MemoryManager.
 */
class Process {
public:
  struct PageEntry {
    uint32_t page_num{0};
    std::optional<uint32_t> frame_idx; // nullopt = not resident

    bool operator==(const PageEntry &other) const = default;
  };

  Process(uint32_t id, uint32_t page_count);

  uint32_t id() const;
  uint32_t page_count() const;
  const std::string &display_tag() const;
  const std::vector<PageEntry> &pages() const;

  bool has_page(uint32_t page_num) const noexcept;
  bool is_resident(uint32_t page_num) const;

  // Called by the MemoryManager after a frame is assigned to a page
  void update_page_table(uint32_t page_num, uint32_t frame_idx);

  // Called by the MemoryManager when a page is evicted
  void invalidate_page(uint32_t page_num);

  struct MemoryStats {
    uint32_t active_pages;
    uint32_t total_pages;
  };
  MemoryStats get_memory_stats() const;

  std::string summary_line() const; // for process-smi

  bool operator==(const Process &other) const = default;

private:
  uint32_t m_id;
  std::string m_tag;
  std::vector<PageEntry> m_pages;
};

// Colour tag derived from the pid; neighbouring pids land far apart on the wheel.
std::string make_display_tag(uint32_t pid);
