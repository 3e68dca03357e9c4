#pragma once

// vigil/diff.hpp — Structured diff between two JSON values.
//
// Used by the assertion engine on failure only. Paths use JSONPath notation
// rooted at "$": identifiers as ".key", other keys as "['key']", list
// positions as "[i]". Object keys are visited in sorted order.

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "vigil/jsonlite.hpp"

namespace vigil {

enum class DiffChange {
  added,
  removed,
  changed,
  type,
};

std::string to_string(DiffChange change);

struct DiffEntry {
  std::string path;
  DiffChange change{DiffChange::changed};
  jsonlite::Value expected;
  jsonlite::Value actual;

  jsonlite::Object to_json() const;
};

struct DiffLimits {
  size_t max_depth{32};
  size_t max_entries{250};
};

std::vector<DiffEntry> diff_json(const jsonlite::Value& expected, const jsonlite::Value& actual,
                                 DiffLimits limits = {});

// Human-readable form: "@@ <path>" then "-"/"+" lines per entry.
// nullopt when entries is empty. Output past max_characters is cut and
// suffixed with "\n... diff truncated".
std::optional<std::string> format_diff(const std::vector<DiffEntry>& entries,
                                       size_t max_characters = 8000);

// "$.a" / "$['a b']" / "$[\"\"]" extension of base by an object key.
std::string extend_diff_path(const std::string& base, const std::string& key);

}  // namespace vigil
