#pragma once

// vigil/context.hpp — Per-run execution context and template rendering.
//
// Lifetime: one case run or one suite run. Not shared between threads.
//
// Template grammar: "{{ root.segment.segment }}" where root is one of
//   variables | env | secret | row | response | prev.<alias> | steps.<alias>
// Anything else resolves against `variables` using the full path. A segment is
// an object key, a list index (negative counts from the end), or
// jsonpath('<expr>'), which applies JSONPath to the current node's "json"
// member (or the node itself when it has none).
//
// Rendering is lenient: a placeholder that cannot be resolved is left in the
// output verbatim. A string that is exactly one placeholder renders to the
// resolved value with its type; placeholders embedded in text are stringified,
// with null rendering as "".

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "vigil/jsonlite.hpp"

namespace vigil {

struct Resolution {
  bool found{false};
  jsonlite::Value value;
};

struct ExecutionContext {
  jsonlite::Object variables;
  jsonlite::Object environment;
  jsonlite::Object secrets;
  std::optional<jsonlite::Object> dataset_row;
  std::optional<jsonlite::Value> current_response;
  std::map<std::string, jsonlite::Value> step_history;

  void remember_step(const std::string& alias, jsonlite::Value snapshot);
  void set_current_response(std::optional<jsonlite::Value> response);

  // Resolve a single expression (without the braces).
  Resolution resolve(const std::string& expr) const;

  // Recursively render strings inside objects/arrays. Non-string leaves pass through.
  jsonlite::Value render(const jsonlite::Value& value) const;

  // Text of every string, number and bool under `secrets`, for payload masking.
  std::vector<std::string> secret_values() const;
};

// Nested-dict update: keys of `overrides` replace those in `base`, except that
// an object under the same key in both is updated key by key (one level).
jsonlite::Object merge_inputs(const jsonlite::Object& base, const jsonlite::Object& overrides);

// Splits "a.b['c.d'].jsonpath('$.x.y')" on top-level dots only.
std::vector<std::string> split_template_path(const std::string& expr);

}  // namespace vigil
