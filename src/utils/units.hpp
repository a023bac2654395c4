#pragma once
#include <chrono>
#include <cstdint>
#include <string>

std::string seconds2human(uint64_t seconds, size_t maxUnits = 2);
std::string elapsed2human(std::chrono::steady_clock::duration elapsed, size_t maxUnits = 2);
