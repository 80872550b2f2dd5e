#pragma once
#include "config.hpp"
#include "paging/memory_service.hpp"
#include "processes/access_generator.hpp"
#include "view/reporter.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

class CLI {
public:
  CLI(std::istream &in = std::cin, std::ostream &out = std::cout);
  ~CLI();
  int run(); // main loop; returns exit code

  // Runs one command line; false once the user asks to exit
  bool handle_command(const std::string &line);

private:
  std::istream &in_;
  std::ostream &out_;
  Config cfg_;
  bool initialized_{false};
  ReplacementPolicy policy_{FIFO};
  std::unique_ptr<MemoryService> service_;
  std::unique_ptr<AccessGenerator> generator_;
  std::unique_ptr<Reporter> reporter_;

  bool require_init() const;
  void initialize_system();
  void handle_create(const std::vector<std::string> &args);
  void handle_access(const std::vector<std::string> &args);
  void handle_remove(const std::vector<std::string> &args);
  void handle_simulate(const std::vector<std::string> &args);
  void handle_policy(const std::vector<std::string> &args);
  void print_access(const AccessOutcome &outcome);
};
