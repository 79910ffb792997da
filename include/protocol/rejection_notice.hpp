#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "model/frame.hpp"

namespace stt_integrity::protocol {

// "length mismatch (expected 4, got 5); checksum mismatch (expected 10, got 11)"
std::string describe_mismatch(const model::VerificationVerdict& verdict);

// {"type":"error","error":"data_corruption","message":...,"action":"disconnect"}
nlohmann::json make_rejection_notice(const model::VerificationVerdict& verdict, std::uint32_t failure_count,
                                     std::uint32_t corruption_threshold);

}  // namespace stt_integrity::protocol
