#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <utility>

uint32_t rand_range(std::mt19937 &rng, uint32_t min, uint32_t max) {
  if (min > max)
    std::swap(min, max);
  std::uniform_int_distribution<uint32_t> dist(min, max);
  return dist(rng);
}

std::string now_string(std::time_t t) {
  std::tm tm_buf{};
#ifdef _WIN32
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return std::string(buf);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}
