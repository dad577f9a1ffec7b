#pragma once

#include "runlog/runlog.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace putman {

// ─── Canonical encoding ───────────────────────────────────────
// JSON-compatible text with object keys sorted, so the encoding of a
// mapping never depends on insertion or iteration order. Numbers use
// the shortest round-trip form ("1", "0.25", "1e-7").

namespace canonical {

std::string number(double value);
std::string string(const std::string& value);

/// Items are already-encoded values.
std::string array(const std::vector<std::string>& items);
std::string stringArray(const std::vector<std::string>& values);

/// Fields are (key, already-encoded value) pairs in any order.
std::string object(std::vector<std::pair<std::string, std::string>> fields);
std::string numberMap(const std::map<std::string, double>& values);

} // namespace canonical

// ─── Runlog Hasher ────────────────────────────────────────────
// 32-bit FNV-1a over the canonical encoding, as 8 lowercase hex digits.

class RunlogHasher {
public:
    static constexpr uint32_t kOffsetBasis = 2166136261u;
    static constexpr uint32_t kPrime = 16777619u;

    static std::string canonicalize(const RunLog& runlog);
    static std::string canonicalize(const StepRunLog& step);
    static std::string canonicalize(const PipelineParams& params);

    static uint32_t fnv1a(const std::string& text);

    /// fnv1a of the canonical encoding, zero-padded hex.
    static std::string hash(const RunLog& runlog);

    static std::string toHex(uint32_t value);
};

/// Canonical 8-hex-digit hash of a runlog.
inline std::string runlogHash(const RunLog& runlog) {
    return RunlogHasher::hash(runlog);
}

} // namespace putman
