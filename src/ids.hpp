#pragma once

#include <string>

namespace chatgen {

// "<prefix>-<hex unix ms>-<hex random64>"
std::string NewId(const std::string& prefix);

// Stored message id for a generation or ledger row; fixed so a replayed save is a no-op.
std::string MessageIdForGeneration(const std::string& generation_id);

}  // namespace chatgen
