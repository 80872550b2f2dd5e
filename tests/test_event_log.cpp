#include "data_structures/event_log.hpp"
#include <cassert>
#include <iostream>
#include <string>

void test_fill_below_capacity() {
  std::cout << "Running test_fill_below_capacity..." << std::endl;
  EventLog<int> log(4);
  assert(log.isEmpty());
  log.push(1);
  log.push(2);
  assert(log.size() == 2);
  assert(log.entries() == (std::vector<int>{1, 2}));
  assert(log.tail(1) == (std::vector<int>{2}));
  assert(log.tail(10) == (std::vector<int>{1, 2}));
  std::cout << "test_fill_below_capacity PASSED" << std::endl;
}

void test_overwrite_oldest() {
  std::cout << "Running test_overwrite_oldest..." << std::endl;
  EventLog<int> log(3);
  for (int i = 1; i <= 7; ++i) {
    log.push(i);
    assert(log.size() <= log.capacity());
  }
  assert(log.size() == 3);
  assert(log.entries() == (std::vector<int>{5, 6, 7}));
  assert(log.tail(2) == (std::vector<int>{6, 7}));
  assert(log.snapshot() == "[5, 6, 7]");
  std::cout << "test_overwrite_oldest PASSED" << std::endl;
}

void test_clear_and_reuse() {
  std::cout << "Running test_clear_and_reuse..." << std::endl;
  EventLog<std::string> log(2);
  log.push("a");
  log.push("b");
  log.push("c");
  log.clear();
  assert(log.isEmpty());
  assert(log.tail(5).empty());
  log.push("d");
  assert(log.entries() == (std::vector<std::string>{"d"}));
  std::cout << "test_clear_and_reuse PASSED" << std::endl;
}

void test_zero_capacity_clamped() {
  std::cout << "Running test_zero_capacity_clamped..." << std::endl;
  EventLog<int> log(0);
  assert(log.capacity() == 1);
  log.push(1);
  log.push(2);
  assert(log.entries() == (std::vector<int>{2}));
  std::cout << "test_zero_capacity_clamped PASSED" << std::endl;
}

int main() {
  test_fill_below_capacity();
  test_overwrite_oldest();
  test_clear_and_reuse();
  test_zero_capacity_clamped();
  std::cout << "All EventLog tests PASSED!" << std::endl;
  return 0;
}
