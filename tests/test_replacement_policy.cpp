#include "paging/page_replacement_policy.hpp"
#include <cassert>
#include <iostream>
#include <vector>

static std::vector<Frame> occupied_frames(uint32_t n) {
  std::vector<Frame> frames;
  for (uint32_t i = 0; i < n; ++i)
    frames.push_back(Frame{.id = i, .free = false, .process_id = 1, .page_number = i});
  return frames;
}

int main() {
  std::cout << "Running replacement policy unit tests...\n";

  // === Test 1: FIFO evicts in admission order ===
  {
    auto frames = occupied_frames(3);
    PageTable table;
    FifoReplacement fifo;
    fifo.on_admit(2);
    fifo.on_admit(0);
    fifo.on_admit(1);

    assert(fifo.select_victim(frames, table) == 2u);
    fifo.on_release(2);
    assert(fifo.select_victim(frames, table) == 0u);
    assert(fifo.queue().size() == 2);

    // Releasing an unknown frame is harmless
    fifo.on_release(7);
    assert(fifo.queue().size() == 2);

    fifo.clear();
    assert(!fifo.select_victim(frames, table).has_value());
    std::cout << "Test 1 passed: FIFO admission order OK.\n";
  }

  // === Test 2: FIFO skips frames that are no longer occupied ===
  {
    auto frames = occupied_frames(2);
    frames[0].free = true;
    PageTable table;
    FifoReplacement fifo;
    fifo.on_admit(0);
    fifo.on_admit(1);
    assert(fifo.select_victim(frames, table) == 1u);
    std::cout << "Test 2 passed: FIFO skips free frames.\n";
  }

  // === Test 3: LRU picks the oldest last_used_at ===
  {
    auto frames = occupied_frames(3);
    PageTable table;
    table[PageKey{1, 0}] = PageTableEntry{0, 1, 9};
    table[PageKey{1, 1}] = PageTableEntry{1, 2, 4};
    table[PageKey{1, 2}] = PageTableEntry{2, 3, 6};
    LRUReplacement lru;
    assert(lru.select_victim(frames, table) == 1u);
    std::cout << "Test 3 passed: LRU oldest access OK.\n";
  }

  // === Test 4: LRU ties go to the lowest frame index ===
  {
    auto frames = occupied_frames(4);
    PageTable table;
    // Key order (pid 1 before pid 2) differs from frame order on purpose
    table[PageKey{1, 0}] = PageTableEntry{3, 1, 5};
    table[PageKey{2, 0}] = PageTableEntry{1, 2, 5};
    table[PageKey{2, 1}] = PageTableEntry{2, 2, 7};
    LRUReplacement lru;
    assert(lru.select_victim(frames, table) == 1u);
    std::cout << "Test 4 passed: LRU tie-break OK.\n";
  }

  // === Test 5: LRU with nothing resident has no victim ===
  {
    std::vector<Frame> frames;
    PageTable table;
    LRUReplacement lru;
    assert(!lru.select_victim(frames, table).has_value());
    assert(lru.kind() == LRU);
    std::cout << "Test 5 passed: LRU empty table OK.\n";
  }

  // === Test 6: policy names ===
  {
    assert(parse_policy("fifo") == FIFO);
    assert(parse_policy("LRU") == LRU);
    assert(parse_policy("Fifo") == FIFO);
    assert(!parse_policy("clock").has_value());
    assert(policy_to_string(FIFO) == "FIFO");
    assert(policy_to_string(LRU) == "LRU");
    std::cout << "Test 6 passed: policy parsing OK.\n";
  }

  std::cout << "All replacement policy tests passed.\n";
  return 0;
}
