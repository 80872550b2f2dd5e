#include "config.hpp"
#include "paging/page_replacement_policy.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>
#include <algorithm>
#include <iostream>
#include <optional>

static std::string trim(std::string s) {
  auto notspace = [](int ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notspace));
  s.erase(std::find_if(s.rbegin(), s.rend(), notspace).base(), s.end());
  return s;
}

static std::optional<uint32_t> parse_u32(const std::string &key, const std::string &value) {
  try {
    size_t used = 0;
    unsigned long v = std::stoul(value, &used);
    if (used == value.size() && v <= UINT32_MAX)
      return static_cast<uint32_t>(v);
  } catch (const std::exception &) {
    // fall through to warning
  }
  std::cerr << "Warning: " << key << " has invalid value '" << value << "', keeping default.\n";
  return std::nullopt;
}

Config load_config(const std::string &path) {

  Config cfg{};
  std::ifstream in(path);

  if (!in) {
    // keep defaults if file missing
    return cfg;
  }

  std::string key, value;

  while (in >> key >> value)
  {
    key = trim(key), value = trim(value);

    if (key == "replacement-policy") {
      auto policy = parse_policy(value);
      if (policy) cfg.replacement_policy = *policy;
      else std::cerr << "Warning: unknown replacement-policy '" << value << "', keeping "
                     << policy_to_string(cfg.replacement_policy) << ".\n";
      continue;
    }

    uint32_t *field = nullptr;
    if (key == "num-frames")              field = &cfg.num_frames;
    else if (key == "min-pages-per-proc") field = &cfg.min_pages_per_proc;
    else if (key == "max-pages-per-proc") field = &cfg.max_pages_per_proc;
    else if (key == "log-capacity")       field = &cfg.log_capacity;
    else if (key == "recent-log-count")   field = &cfg.recent_log_count;
    else if (key == "access-delay-ms")    field = &cfg.access_delay_ms;
    else {
      std::cerr << "Warning: unknown config key '" << key << "' ignored.\n";
      continue;
    }

    if (auto v = parse_u32(key, value)) *field = *v;
  }

  // Validation
  const Config defaults{};
  if (cfg.num_frames == 0) {
    std::cerr << "Warning: num-frames must be at least 1, using " << defaults.num_frames << ".\n";
    cfg.num_frames = defaults.num_frames;
  }
  if (cfg.log_capacity == 0) {
    std::cerr << "Warning: log-capacity must be at least 1, using " << defaults.log_capacity << ".\n";
    cfg.log_capacity = defaults.log_capacity;
  }
  if (cfg.min_pages_per_proc == 0) {
    std::cerr << "Warning: min-pages-per-proc must be at least 1, using 1.\n";
    cfg.min_pages_per_proc = 1;
  }
  if (cfg.min_pages_per_proc > cfg.max_pages_per_proc) {
    std::cerr << "Warning: min-pages-per-proc (" << cfg.min_pages_per_proc
              << ") exceeds max-pages-per-proc (" << cfg.max_pages_per_proc << "), swapping.\n";
    std::swap(cfg.min_pages_per_proc, cfg.max_pages_per_proc);
  }

  return cfg;
}
