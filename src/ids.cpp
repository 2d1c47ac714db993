#include "ids.hpp"

#include <chrono>
#include <cstdint>
#include <random>
#include <sstream>

namespace chatgen {
namespace {

static std::string Hex(uint64_t v) {
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

}  // namespace

std::string NewId(const std::string& prefix) {
  auto now = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
          .count());
  return prefix + "-" + Hex(now) + "-" + Hex(Rand64());
}

std::string MessageIdForGeneration(const std::string& generation_id) {
  return "msg-" + generation_id;
}

}  // namespace chatgen
