#pragma once
#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

// Fixed-capacity ring buffer. Once full, each push overwrites the oldest entry,
// so size() <= capacity() always holds. Not thread safe; the owner locks.
template<typename T>
class EventLog {
  public:
    explicit EventLog(size_t capacity = 50)
        : buf_(capacity == 0 ? 1 : capacity) {};
    void push(const T& entry);
    std::vector<T> tail(size_t n) const; // newest n, oldest first
    std::vector<T> entries() const;
    void clear();
    size_t size() const { return size_; }
    size_t capacity() const { return buf_.size(); }
    bool isEmpty() const { return size_ == 0; }
    std::string snapshot() const;
  private:
    std::vector<T> buf_;
    size_t head_ = 0; // index of the oldest entry
    size_t size_ = 0;
};


template<typename T>
void EventLog<T>::push(const T& entry) {
  if (size_ < buf_.size()) {
    buf_[(head_ + size_) % buf_.size()] = entry;
    ++size_;
  } else {
    // full: overwrite oldest
    buf_[head_] = entry;
    head_ = (head_ + 1) % buf_.size();
  }
}

template<typename T>
std::vector<T> EventLog<T>::tail(size_t n) const {
  if (n > size_) n = size_;
  std::vector<T> out;
  out.reserve(n);
  for (size_t i = size_ - n; i < size_; ++i)
    out.push_back(buf_[(head_ + i) % buf_.size()]);
  return out;
}

template<typename T>
std::vector<T> EventLog<T>::entries() const {
  return tail(size_);
}

template<typename T>
void EventLog<T>::clear() {
  for (auto &slot : buf_) slot = T{};
  head_ = 0;
  size_ = 0;
}

template<typename T>
std::string EventLog<T>::snapshot() const {
  std::ostringstream oss;
  oss << "[";
  bool first = true;
  for (const auto& item : entries()) {
    if (!first) oss << ", ";
    first = false;
    oss << item;
  }
  oss << "]";
  return oss.str();
}
