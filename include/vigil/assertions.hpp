#pragma once

// vigil/assertions.hpp — Declarative response checks.
//
// Evaluation is total: malformed definitions, unknown operators, bad regex
// patterns and type mismatches all become failing AssertionResults. Nothing
// here throws to the caller.
//
// A definition is an object {name?, operator, expected?, actual?, path?,
// message?, enabled?}. `actual`, `expected` and `path` are rendered through
// the ExecutionContext before use, with the response under evaluation
// installed as `response.*`.
//
// std::regex matching recurses per subject character, so regex operators
// refuse subjects longer than kMaxRegexSubjectBytes with a failing result.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "vigil/context.hpp"
#include "vigil/jsonlite.hpp"

namespace vigil {

inline constexpr std::size_t kMaxRegexSubjectBytes = 4096;

enum class AssertionOperator {
  status_code,
  equals,
  not_equals,
  contains,
  not_contains,
  regex,
  regex_match,
  length,
  gt,
  lt,
  jsonpath_equals,
  jsonpath_contains,
};

std::string to_string(AssertionOperator op);

// Case-insensitive, surrounding whitespace ignored.
std::optional<AssertionOperator> parse_assertion_operator(const std::string& name);

struct AssertionResult {
  std::string name;
  std::string op;  // as written, lowercased; "unknown" when missing
  bool passed{false};
  jsonlite::Value actual;
  jsonlite::Value expected;
  std::optional<std::string> message;
  std::optional<std::string> path;
  std::optional<jsonlite::Value> diff;  // {entries:[...], text}; failures only

  jsonlite::Object to_json() const;
};

struct AssertionOutcome {
  bool passed{true};
  std::vector<AssertionResult> results;

  // {passed, results:[...]}
  jsonlite::Object to_json() const;
};

// Accepts a list of definitions, {items:[...]}, or a shorthand object
// {<operator>: <expected>, ...}. Non-object list entries are dropped.
std::vector<jsonlite::Object> normalize_assertions(const jsonlite::Value& assertions);

class AssertionEngine {
 public:
  // response_context is the executor's context_data ({status_code, headers,
  // body, json}). It becomes context.current_response.
  AssertionOutcome evaluate(const jsonlite::Value& assertions, const jsonlite::Value& response_context,
                            ExecutionContext& context) const;

  AssertionResult evaluate_one(const jsonlite::Object& definition, const ExecutionContext& context,
                               size_t index) const;
};

}  // namespace vigil
