#include "vigil/version.hpp"

#include "vigil/hash.hpp"
#include "vigil/jsonlite.hpp"

namespace vigil {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.hash_primitive = hash_runtime_info().primitive;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object o;
  o["engine_semver"] = m.engine_semver;
  o["report_format"] = m.report_format;
  o["progress_framing"] = m.progress_framing;
  o["audit_log"] = m.audit_log;
  o["hash_algorithm"] = m.hash_algorithm;
  o["hash_primitive"] = m.hash_primitive;
  o["build_timestamp"] = m.build_timestamp;
  return jsonlite::to_json(o);
}

}  // namespace version
}  // namespace vigil
