#include "processes/access_generator.hpp"
#include "util.hpp"
#include <chrono>
#include <iostream>

AccessGenerator::AccessGenerator(const Config &cfg, MemoryService &service)
    : cfg_(cfg), service_(service), policy_(cfg.replacement_policy) {}

AccessGenerator::~AccessGenerator() { stop(); }

/**
 * Start the access thread
 *
 * No-op when already running. Must be paired with stop(), which the
 * destructor also calls.
 */
void AccessGenerator::start() {
  if (running_.exchange(true))
    return;
  DEBUG_PRINT(DEBUG_ACCESS_GENERATOR, "starting");
  thread_ = std::thread(&AccessGenerator::loop, this);
}

/**
 * Stop the access thread
 *
 * Blocks until the thread joins. Safe to call repeatedly; the generator can
 * be restarted afterwards.
 */
void AccessGenerator::stop() {
  running_.store(false);
  DEBUG_PRINT(DEBUG_ACCESS_GENERATOR, "stopping");
  if (thread_.joinable())
    thread_.join();
}

bool AccessGenerator::is_running() const { return running_.load(); }

void AccessGenerator::set_policy(ReplacementPolicy policy) { policy_.store(policy); }

ReplacementPolicy AccessGenerator::policy() const { return policy_.load(); }

uint64_t AccessGenerator::issued() const { return issued_.load(); }

/**
 * Generator loop
 *
 * Each period picks a random existing process and page through the
 * MemoryService, which serializes against the CLI. Periods with no processes
 * are skipped without counting.
 */
void AccessGenerator::loop() {
  while (running_.load()) {
    auto outcome = service_.simulate_access(policy_.load());
    if (outcome.success) {
      issued_.fetch_add(1);
    } else if (outcome.error && *outcome.error != MemoryError::NoProcesses) {
      std::cerr << "access generator: " << to_string(*outcome.error) << "\n";
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.access_delay_ms));
  }
}
