#pragma once
#include "paging/memory_service.hpp"
#include <string>

class Reporter {
public:
  Reporter(MemoryService &service);
  std::string build_report(); // frames, processes, stats, log
  std::string get_process_smi();
  std::string get_vmstat();
  void write_log(const std::string &path);

  // Renderers over an already-taken snapshot
  static std::string render_frames(const MemoryState &state);
  static std::string render_processes(const MemoryState &state);
  static std::string render_stats(const MemoryState &state);
  static std::string render_log(const MemoryState &state);

private:
  MemoryService &service_;
};
