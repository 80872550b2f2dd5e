#include "view/cli.hpp"
#include "config.hpp"
#include "paging/page_replacement_policy.hpp"
#include "util.hpp"
#include <optional>
#include <sstream>
#include <vector>

// util funcs

static std::vector<std::string> split(const std::string &line) {
  std::istringstream iss(line);
  std::vector<std::string> out;
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

static std::optional<uint32_t> parse_number(const std::string &s) {
  try {
    size_t used = 0;
    unsigned long v = std::stoul(s, &used);
    if (used == s.size() && v <= UINT32_MAX) return static_cast<uint32_t>(v);
  } catch (const std::exception &) {
  }
  return std::nullopt;
}

// Accepts "P3" as well as "3"
static std::optional<uint32_t> parse_pid(const std::string &s) {
  if (!s.empty() && (s[0] == 'P' || s[0] == 'p')) return parse_number(s.substr(1));
  return parse_number(s);
}

static void print_banner(std::ostream &out) {
  out << "=============================================\n"
      << "       VIRTUAL MEMORY PAGING SIMULATOR\n"
      << "=============================================\n"
      << "Type 'initialize' to load config.txt, 'help' for commands.\n"
      << "---------------------------------------------\n\n";
}

// CLI class implementation

CLI::CLI(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

CLI::~CLI() {
  if (generator_) generator_->stop();
}

// helper member funcs

bool CLI::require_init() const {
  if (!initialized_) {
    out_ << "Please run initialize first.\n";
    return false;
  }
  return true;
}

void CLI::initialize_system() {
  if (generator_) generator_->stop();

  cfg_ = load_config("config.txt");
  policy_ = cfg_.replacement_policy;

  // Generator and reporter hold references into the service
  generator_.reset();
  reporter_.reset();
  service_ = std::make_unique<MemoryService>(cfg_);
  generator_ = std::make_unique<AccessGenerator>(cfg_, *service_);
  reporter_ = std::make_unique<Reporter>(*service_);

  initialized_ = true;
  out_ << "Initialized " << cfg_.num_frames << " frames, policy "
       << policy_to_string(policy_) << ".\n";
}

void CLI::print_access(const AccessOutcome &outcome) {
  if (!outcome.success) {
    out_ << "Error: " << to_string(*outcome.error) << "\n";
    return;
  }
  if (outcome.hit) {
    out_ << "Page hit (frame " << outcome.frame_idx << ").\n";
    return;
  }
  out_ << "Page fault: loaded into frame " << outcome.frame_idx;
  if (outcome.evicted_page)
    out_ << ", evicted P" << outcome.evicted_page->process_id
         << " page " << outcome.evicted_page->page_number;
  out_ << ".\n";
}

void CLI::handle_create(const std::vector<std::string> &args) {
  CreateOutcome outcome;
  if (args.size() >= 2) {
    auto pages = parse_number(args[1]);
    if (!pages) { out_ << "Invalid page count.\n"; return; }
    outcome = service_->create_process(*pages);
  } else {
    outcome = service_->create_process();
  }

  if (!outcome.success) {
    out_ << "Error: " << to_string(*outcome.error) << "\n";
    return;
  }
  out_ << "Created process P" << outcome.process->id() << " with "
       << outcome.process->page_count() << " pages.\n";
}

void CLI::handle_access(const std::vector<std::string> &args) {
  if (args.size() < 3) { out_ << "Usage: access <pid> <page> [fifo|lru]\n"; return; }
  auto pid = parse_pid(args[1]);
  auto page = parse_number(args[2]);
  if (!pid || !page) { out_ << "Invalid pid or page.\n"; return; }

  ReplacementPolicy policy = policy_;
  if (args.size() >= 4) {
    auto parsed = parse_policy(args[3]);
    if (!parsed) { out_ << "Unknown policy. Use fifo|lru\n"; return; }
    policy = *parsed;
  }
  print_access(service_->access_page(*pid, *page, policy));
}

void CLI::handle_remove(const std::vector<std::string> &args) {
  if (args.size() < 2) { out_ << "Usage: remove <pid>\n"; return; }
  auto pid = parse_pid(args[1]);
  if (!pid) { out_ << "Invalid pid.\n"; return; }

  auto outcome = service_->remove_process(*pid);
  if (!outcome.success) {
    out_ << "Error: " << to_string(*outcome.error) << "\n";
    return;
  }
  out_ << "Removed P" << *pid << ", freed " << outcome.frames_freed << " frames.\n";
}

void CLI::handle_simulate(const std::vector<std::string> &args) {
  uint32_t count = 1;
  if (args.size() >= 2) {
    auto parsed = parse_number(args[1]);
    if (!parsed || *parsed == 0) { out_ << "Invalid count.\n"; return; }
    count = *parsed;
  }

  uint32_t hits = 0, faults = 0;
  for (uint32_t i = 0; i < count; ++i) {
    auto outcome = service_->simulate_access(policy_);
    if (!outcome.success) {
      out_ << "Error: " << to_string(*outcome.error) << "\n";
      return;
    }
    if (count == 1) print_access(outcome);
    if (outcome.hit) ++hits;
    else ++faults;
  }
  if (count > 1)
    out_ << "Simulated " << count << " accesses: " << hits << " hits, " << faults << " faults.\n";
}

void CLI::handle_policy(const std::vector<std::string> &args) {
  if (args.size() < 2) {
    out_ << "Current policy: " << policy_to_string(policy_) << "\n"
         << "Usage: policy <fifo|lru>\n";
    return;
  }
  auto parsed = parse_policy(args[1]);
  if (!parsed) { out_ << "Unknown policy. Use fifo|lru\n"; return; }
  policy_ = *parsed;
  generator_->set_policy(policy_);
  out_ << "Policy set to " << policy_to_string(policy_) << ".\n";
}

bool CLI::handle_command(const std::string &line) {
  const auto args = split(line);
  if (args.empty()) return true;

  const std::string cmd = to_lower(args[0]);

  if (cmd == "exit") {
    out_ << "Goodbye.\n";
    return false;
  }
  else if (cmd == "initialize") {
    initialize_system();
  }
  else if (cmd == "create") {
    if (require_init()) handle_create(args);
  }
  else if (cmd == "access") {
    if (require_init()) handle_access(args);
  }
  else if (cmd == "remove") {
    if (require_init()) handle_remove(args);
  }
  else if (cmd == "simulate") {
    if (require_init()) handle_simulate(args);
  }
  else if (cmd == "simulate-start") {
    if (require_init()) { generator_->start(); out_ << "Access generator started.\n"; }
  }
  else if (cmd == "simulate-stop") {
    if (require_init()) {
      generator_->stop();
      out_ << "Access generator stopped after " << generator_->issued() << " accesses.\n";
    }
  }
  else if (cmd == "policy") {
    if (require_init()) handle_policy(args);
  }
  else if (cmd == "state") {
    if (require_init()) out_ << reporter_->build_report();
  }
  else if (cmd == "process-smi") {
    if (require_init()) out_ << reporter_->get_process_smi();
  }
  else if (cmd == "vmstat") {
    if (require_init()) out_ << reporter_->get_vmstat();
  }
  else if (cmd == "report") {
    if (require_init()) {
      out_ << reporter_->build_report();
      reporter_->write_log("pagesim-log.txt");
    }
  }
  else if (cmd == "reset") {
    if (require_init()) {
      generator_->stop();
      service_->reset();
      out_ << "Memory reset.\n";
    }
  }
  else if (cmd == "help") {
    out_ << "initialize: loads config.txt and builds the frame pool\n"
         << "create [pages]: creates a process (random page count if omitted)\n"
         << "access <pid> <page> [fifo|lru]: accesses one page\n"
         << "remove <pid>: terminates a process and frees its frames\n"
         << "simulate [count]: random accesses on existing processes\n"
         << "simulate-start / simulate-stop: background access generator\n"
         << "policy <fifo|lru>: sets the replacement policy\n"
         << "state: frames, processes, stats and recent events\n"
         << "process-smi: per-process residency\n"
         << "vmstat: hit/fault statistics\n"
         << "report: prints the state and appends it to pagesim-log.txt\n"
         << "reset: clears all processes, frames and statistics\n"
         << "exit: quits\n";
  }
  else {
    out_ << "Unknown command: " << line << "\n";
  }
  return true;
}

int CLI::run() {
  print_banner(out_);

  std::string line;
  while (true) {
    out_ << "pagesim> " << std::flush;
    if (!std::getline(in_, line)) break;
    if (!handle_command(line)) break;
  }

  if (generator_) generator_->stop();
  return 0;
}
