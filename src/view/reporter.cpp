#include "view/reporter.hpp"
#include "util.hpp"
#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

Reporter::Reporter(MemoryService &service) : service_(service) {}

static size_t count_free(const MemoryState &state) {
  return static_cast<size_t>(std::count_if(state.frames.begin(), state.frames.end(),
                                           [](const Frame &f) { return f.free; }));
}

static const Process *owner_of(const MemoryState &state, uint32_t pid) {
  for (const auto &p : state.processes)
    if (p.id() == pid) return &p;
  return nullptr;
}

std::string Reporter::render_frames(const MemoryState &state) {
  std::ostringstream oss;
  oss << "-----------------------------------------------------\n";
  oss << "| Frame | Process | Page | Tag                      |\n";
  oss << "-----------------------------------------------------\n";
  for (const auto &f : state.frames) {
    oss << "| " << std::left << std::setw(6) << f.id;
    if (f.free) {
      oss << "| " << std::setw(8) << "-"
          << "| " << std::setw(5) << "-"
          << "| " << std::setw(25) << "(free)" << "|\n";
      continue;
    }
    const Process *owner = owner_of(state, f.process_id);
    oss << "| " << std::setw(8) << ("P" + std::to_string(f.process_id))
        << "| " << std::setw(5) << f.page_number
        << "| " << std::setw(25) << (owner ? owner->display_tag() : "?") << "|\n";
  }
  oss << "-----------------------------------------------------\n";
  return oss.str();
}

std::string Reporter::render_processes(const MemoryState &state) {
  std::ostringstream oss;
  oss << "------------------------------------------------------------------\n";
  oss << "| Process ID | Active Pages | Total Pages | Tag                  |\n";
  oss << "------------------------------------------------------------------\n";
  for (const auto &p : state.processes) {
    auto stats = p.get_memory_stats();
    oss << "| " << std::left << std::setw(11) << ("P" + std::to_string(p.id()))
        << "| " << std::setw(13) << stats.active_pages
        << "| " << std::setw(12) << stats.total_pages
        << "| " << std::setw(21) << p.display_tag() << "|\n";
  }
  if (state.processes.empty())
    oss << "| (none)                                                         |\n";
  oss << "------------------------------------------------------------------\n";
  return oss.str();
}

std::string Reporter::render_stats(const MemoryState &state) {
  size_t total = state.frames.size();
  size_t free_frames = count_free(state);

  std::ostringstream oss;
  oss << "Total Frames: " << total << "\n";
  oss << "Used Frames: " << total - free_frames << "\n";
  oss << "Free Frames: " << free_frames << "\n";
  oss << "Page Hits: " << state.stats.hits << "\n";
  oss << "Page Faults: " << state.stats.faults << "\n";
  oss << "Evictions: " << state.stats.evictions << "\n";
  oss << "Hit Ratio: " << std::fixed << std::setprecision(1)
      << state.stats.hit_ratio() * 100.0 << "%\n";
  oss << "Tick: " << state.tick << "\n";
  oss << "FIFO Queue: [";
  for (size_t i = 0; i < state.fifo_queue.size(); ++i) {
    if (i) oss << ", ";
    oss << state.fifo_queue[i];
  }
  oss << "]\n";
  return oss.str();
}

std::string Reporter::render_log(const MemoryState &state) {
  std::ostringstream oss;
  oss << "[Recent Events]\n";
  if (state.recent_log.empty()) {
    oss << " (empty)\n";
    return oss.str();
  }
  for (const auto &entry : state.recent_log)
    oss << "  " << now_string(entry.time) << " " << entry << "\n";
  return oss.str();
}

std::string Reporter::build_report() {
  auto state = service_.snapshot();
  std::ostringstream oss;
  oss << render_frames(state) << "\n"
      << render_processes(state) << "\n"
      << render_stats(state) << "\n"
      << render_log(state);
  return oss.str();
}

std::string Reporter::get_process_smi() {
  auto state = service_.snapshot();
  std::ostringstream oss;
  size_t free_frames = count_free(state);
  oss << "\n";
  oss << "Memory: total=" << state.frames.size() << " frames, used="
      << state.frames.size() - free_frames << " frames, free=" << free_frames << " frames\n";
  oss << render_processes(state);
  for (const auto &p : state.processes)
    oss << "  " << p.summary_line() << "\n";
  return oss.str();
}

std::string Reporter::get_vmstat() {
  auto state = service_.snapshot();
  return "\n" + render_stats(state);
}

void Reporter::write_log(const std::string &path) {
  std::ofstream out(path, std::ios::app);
  if (!out) {
    std::cerr << "Warning: cannot open " << path << " for writing.\n";
    return;
  }
  out << "===== Report at " << now_string(std::time(nullptr)) << " =====\n"
      << build_report()
      << "============================================\n\n";
}
