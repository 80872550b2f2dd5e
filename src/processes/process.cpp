#include "processes/process.hpp"
#include <sstream>
#include <stdexcept>

std::string make_display_tag(uint32_t pid) {
  std::ostringstream oss;
  oss << "hsl(" << (static_cast<uint64_t>(pid) * 137) % 360 << ", 70%, 60%)";
  return oss.str();
}

Process::Process(uint32_t id, uint32_t page_count)
    : m_id(id), m_tag(make_display_tag(id)) {
  m_pages.reserve(page_count);
  for (uint32_t i = 0; i < page_count; ++i)
    m_pages.push_back(PageEntry{i, std::nullopt});
}

uint32_t Process::id() const { return m_id; }

uint32_t Process::page_count() const { return static_cast<uint32_t>(m_pages.size()); }

const std::string &Process::display_tag() const { return m_tag; }

const std::vector<Process::PageEntry> &Process::pages() const { return m_pages; }

bool Process::has_page(uint32_t page_num) const noexcept {
  return page_num < m_pages.size();
}

bool Process::is_resident(uint32_t page_num) const {
  return has_page(page_num) && m_pages[page_num].frame_idx.has_value();
}

void Process::update_page_table(uint32_t page_num, uint32_t frame_idx) {
  if (!has_page(page_num))
    throw std::out_of_range("page " + std::to_string(page_num) + " outside P" + std::to_string(m_id));
  m_pages[page_num].frame_idx = frame_idx;
}

void Process::invalidate_page(uint32_t page_num) {
  if (has_page(page_num))
    m_pages[page_num].frame_idx.reset();
}

Process::MemoryStats Process::get_memory_stats() const {
  MemoryStats stats{0, page_count()};
  for (const auto &page : m_pages)
    if (page.frame_idx) ++stats.active_pages;
  return stats;
}

std::string Process::summary_line() const {
  auto stats = get_memory_stats();
  std::ostringstream oss;
  oss << "P" << m_id << " (" << stats.active_pages << "/" << stats.total_pages
      << " resident) [";
  for (size_t i = 0; i < m_pages.size(); ++i) {
    if (i) oss << " ";
    oss << i << ":";
    if (m_pages[i].frame_idx) oss << "F" << *m_pages[i].frame_idx;
    else oss << "-";
  }
  oss << "]";
  return oss.str();
}
