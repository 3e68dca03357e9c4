#pragma once

// vigil/jsonpath.hpp — JSONPath subset over jsonlite values.
//
// Supported:
//   $  .name  ['name']  ["name"]  [n] (negative from end)  [*]  .*
//   ..name  ..*  ..[...]   [a,b] / ['a','b'] unions   [start:end:step] slices
//   [?(@.field op literal)] with == != < <= > >=,  [?(@.field)] existence
// A path without a leading '$' is treated as relative to the root.
// Malformed expressions are reported through *error; nothing throws.

#include <string>
#include <vector>

#include "vigil/jsonlite.hpp"

namespace vigil::jsonpath {

// All matches, in document order. Empty on error (and *error is set).
std::vector<jsonlite::Value> find_all(const std::string& expr, const jsonlite::Value& root,
                                      std::string* error = nullptr);

// Collapsed result: no match -> null, one match -> that value, several -> array.
jsonlite::Value query(const std::string& expr, const jsonlite::Value& root,
                      std::string* error = nullptr);

jsonlite::Value collapse(std::vector<jsonlite::Value> matches);

}  // namespace vigil::jsonpath
