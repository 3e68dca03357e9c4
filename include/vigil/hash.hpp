#pragma once

#include <string>
#include <string_view>

namespace vigil {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

// Core BLAKE3 hashing. Returns a 64-char lowercase hex digest.
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing. "pol:" is the policy snapshot domain and "aud:" the
// audit chain domain; the prefixes are part of the on-disk contract.
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string policy_digest(std::string_view canonical_policy_json);
std::string audit_chain_digest(std::string_view audit_line);

}  // namespace vigil
