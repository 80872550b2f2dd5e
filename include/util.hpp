#pragma once
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <random>
#include <string>

// Uniform integer in [min, max]; swaps the bounds if given in reverse.
uint32_t rand_range(std::mt19937 &rng, uint32_t min, uint32_t max);
std::string now_string(std::time_t t);
std::string to_lower(std::string s);


//#define DEBUG 
#define DEBUG_MEMORY_MANAGER false
#define DEBUG_ACCESS_GENERATOR false

#ifdef DEBUG
    #warning "Debug-printing is active"
    #define DEBUG_PRINT(condition, msg, ...) \
      if (condition) \
        printf("[%s:%s():%d] " msg "\n", __FILE__, __func__, __LINE__, ##__VA_ARGS__);
#else 
    #define DEBUG_PRINT(condition, msg, ...) 
#endif
