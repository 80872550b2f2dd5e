#pragma once
#include <atomic>
#include <cstdint>
#include <thread>
#include "config.hpp"
#include "paging/memory_service.hpp"

// Background driver issuing one random page access every access_delay_ms.
class AccessGenerator {
public:
  AccessGenerator(const Config &cfg, MemoryService &service);
  ~AccessGenerator();

  AccessGenerator(const AccessGenerator &) = delete;
  AccessGenerator &operator=(const AccessGenerator &) = delete;

  void start();
  void stop();
  bool is_running() const;

  void set_policy(ReplacementPolicy policy);
  ReplacementPolicy policy() const;
  uint64_t issued() const;

private:
  void loop();
  Config cfg_;
  MemoryService &service_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<ReplacementPolicy> policy_;
  std::atomic<uint64_t> issued_{0};
};
