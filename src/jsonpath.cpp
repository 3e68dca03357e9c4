#include "vigil/jsonpath.hpp"

#include <cctype>
#include <cstdlib>
#include <iterator>
#include <optional>

namespace vigil::jsonpath {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

namespace {

enum class SegKind { names, indices, wildcard, slice, filter };

struct Filter {
  std::vector<std::string> field;   // path below @
  std::string op;                   // empty = existence test
  Value literal;
};

struct Segment {
  SegKind kind{SegKind::wildcard};
  bool recursive{false};
  std::vector<std::string> names;
  std::vector<long long> indices;
  std::optional<long long> start, end;
  long long step{1};
  Filter filter;
};

class Compiler {
 public:
  explicit Compiler(const std::string& expr) : s_(expr) {}

  std::optional<std::vector<Segment>> compile(std::string* error) {
    std::vector<Segment> out;
    ws();
    if (i_ < s_.size() && s_[i_] == '$') {
      ++i_;
    } else if (i_ < s_.size() && s_[i_] != '.' && s_[i_] != '[') {
      // Relative form "a.b": read the first name directly.
      Segment seg;
      seg.kind = SegKind::names;
      seg.names.push_back(read_name());
      if (seg.names.back().empty()) return fail(error, "expected a member name");
      out.push_back(std::move(seg));
    }
    while (true) {
      ws();
      if (i_ >= s_.size()) break;
      bool recursive = false;
      if (s_.compare(i_, 2, "..") == 0) {
        recursive = true;
        i_ += 2;
        if (i_ < s_.size() && s_[i_] == '[') {
          auto seg = parse_bracket(error);
          if (!seg) return std::nullopt;
          seg->recursive = true;
          out.push_back(std::move(*seg));
          continue;
        }
      } else if (s_[i_] == '.') {
        ++i_;
      } else if (s_[i_] == '[') {
        auto seg = parse_bracket(error);
        if (!seg) return std::nullopt;
        out.push_back(std::move(*seg));
        continue;
      } else {
        return fail(error, std::string("unexpected character '") + s_[i_] + "' at offset " +
                               std::to_string(i_));
      }
      Segment seg;
      seg.recursive = recursive;
      if (i_ < s_.size() && s_[i_] == '*') {
        ++i_;
        seg.kind = SegKind::wildcard;
      } else {
        seg.kind = SegKind::names;
        seg.names.push_back(read_name());
        if (seg.names.back().empty()) return fail(error, "expected a member name at offset " + std::to_string(i_));
      }
      out.push_back(std::move(seg));
    }
    return out;
  }

 private:
  const std::string& s_;
  size_t i_{0};

  static std::nullopt_t fail(std::string* error, const std::string& msg) {
    if (error) *error = "invalid JSONPath: " + msg;
    return std::nullopt;
  }

  void ws() { while (i_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_; }

  std::string read_name() {
    size_t b = i_;
    while (i_ < s_.size() && s_[i_] != '.' && s_[i_] != '[' && !std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
    return s_.substr(b, i_ - b);
  }

  std::optional<std::string> read_quoted() {
    const char q = s_[i_++];
    std::string o;
    while (i_ < s_.size()) {
      char c = s_[i_++];
      if (c == '\\' && i_ < s_.size()) { o += s_[i_++]; continue; }
      if (c == q) return o;
      o += c;
    }
    return std::nullopt;
  }

  std::optional<long long> read_int() {
    ws();
    size_t b = i_;
    if (i_ < s_.size() && (s_[i_] == '-' || s_[i_] == '+')) ++i_;
    while (i_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[i_]))) ++i_;
    if (i_ == b || (i_ == b + 1 && !std::isdigit(static_cast<unsigned char>(s_[b])))) {
      i_ = b;
      return std::nullopt;
    }
    return std::strtoll(s_.substr(b, i_ - b).c_str(), nullptr, 10);
  }

  std::optional<Segment> parse_bracket(std::string* error) {
    ++i_;  // '['
    ws();
    Segment seg;
    if (i_ >= s_.size()) return fail(error, "unterminated bracket");

    if (s_[i_] == '*') {
      ++i_;
      seg.kind = SegKind::wildcard;
    } else if (s_[i_] == '?') {
      if (!parse_filter(seg, error)) return std::nullopt;
    } else if (s_[i_] == '\'' || s_[i_] == '"') {
      seg.kind = SegKind::names;
      while (true) {
        ws();
        if (i_ >= s_.size() || (s_[i_] != '\'' && s_[i_] != '"')) return fail(error, "expected quoted name");
        auto name = read_quoted();
        if (!name) return fail(error, "unterminated quoted name");
        seg.names.push_back(*name);
        ws();
        if (i_ < s_.size() && s_[i_] == ',') { ++i_; continue; }
        break;
      }
    } else {
      auto first = read_int();
      ws();
      if (i_ < s_.size() && s_[i_] == ':') {
        seg.kind = SegKind::slice;
        seg.start = first;
        ++i_;
        seg.end = read_int();
        ws();
        if (i_ < s_.size() && s_[i_] == ':') {
          ++i_;
          auto step = read_int();
          if (step) seg.step = *step;
          if (seg.step == 0) return fail(error, "slice step must not be zero");
        }
      } else {
        if (!first) return fail(error, "expected index, name, '*' or filter in brackets");
        seg.kind = SegKind::indices;
        seg.indices.push_back(*first);
        while (i_ < s_.size() && s_[i_] == ',') {
          ++i_;
          auto next = read_int();
          if (!next) return fail(error, "expected index after ','");
          seg.indices.push_back(*next);
          ws();
        }
      }
    }
    ws();
    if (i_ >= s_.size() || s_[i_] != ']') return fail(error, "expected ']'");
    ++i_;
    return seg;
  }

  bool parse_filter(Segment& seg, std::string* error) {
    // ?( @.a.b op literal )
    ++i_;
    ws();
    if (i_ >= s_.size() || s_[i_] != '(') { fail(error, "expected '(' after '?'"); return false; }
    ++i_;
    ws();
    if (i_ >= s_.size() || s_[i_] != '@') { fail(error, "filter must start with '@'"); return false; }
    ++i_;
    seg.kind = SegKind::filter;
    while (i_ < s_.size() && (s_[i_] == '.' || s_[i_] == '[')) {
      if (s_[i_] == '.') {
        ++i_;
        size_t b = i_;
        while (i_ < s_.size() && (std::isalnum(static_cast<unsigned char>(s_[i_])) || s_[i_] == '_' || s_[i_] == '-')) ++i_;
        if (b == i_) { fail(error, "expected field name in filter"); return false; }
        seg.filter.field.push_back(s_.substr(b, i_ - b));
      } else {
        ++i_;
        ws();
        if (i_ >= s_.size() || (s_[i_] != '\'' && s_[i_] != '"')) { fail(error, "expected quoted field in filter"); return false; }
        auto name = read_quoted();
        if (!name) { fail(error, "unterminated quoted field in filter"); return false; }
        seg.filter.field.push_back(*name);
        ws();
        if (i_ >= s_.size() || s_[i_] != ']') { fail(error, "expected ']' in filter"); return false; }
        ++i_;
      }
    }
    ws();
    for (const char* op : {"==", "!=", "<=", ">=", "<", ">"}) {
      if (s_.compare(i_, std::char_traits<char>::length(op), op) == 0) {
        seg.filter.op = op;
        i_ += seg.filter.op.size();
        break;
      }
    }
    if (!seg.filter.op.empty()) {
      ws();
      if (i_ < s_.size() && (s_[i_] == '\'' || s_[i_] == '"')) {
        auto lit = read_quoted();
        if (!lit) { fail(error, "unterminated string literal in filter"); return false; }
        seg.filter.literal = *lit;
      } else {
        size_t b = i_;
        while (i_ < s_.size() && s_[i_] != ')' && !std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
        std::optional<jsonlite::JsonError> err;
        seg.filter.literal = jsonlite::parse_value(s_.substr(b, i_ - b), &err);
        if (err) { fail(error, "invalid literal in filter"); return false; }
      }
    }
    ws();
    if (i_ >= s_.size() || s_[i_] != ')') { fail(error, "expected ')' to close filter"); return false; }
    ++i_;
    return true;
  }
};

long long norm_index(long long idx, size_t size) {
  return idx < 0 ? idx + static_cast<long long>(size) : idx;
}

bool filter_matches(const Filter& f, const Value& node) {
  const Value* cur = &node;
  for (const auto& k : f.field) {
    cur = cur->find(k);
    if (!cur) return false;
  }
  if (f.op.empty()) return true;
  if (f.op == "==") return jsonlite::values_equal(*cur, f.literal);
  if (f.op == "!=") return !jsonlite::values_equal(*cur, f.literal);
  if (cur->is_number() && f.literal.is_number()) {
    const double a = cur->as_number();
    const double b = f.literal.as_number();
    if (f.op == "<") return a < b;
    if (f.op == "<=") return a <= b;
    if (f.op == ">") return a > b;
    if (f.op == ">=") return a >= b;
  }
  if (cur->is_string() && f.literal.is_string()) {
    const int c = cur->as_string().compare(f.literal.as_string());
    if (f.op == "<") return c < 0;
    if (f.op == "<=") return c <= 0;
    if (f.op == ">") return c > 0;
    if (f.op == ">=") return c >= 0;
  }
  return false;
}

void collect_descendants(const Value* node, std::vector<const Value*>& out) {
  out.push_back(node);
  if (node->is_object()) {
    for (const auto& [k, v] : node->as_object()) collect_descendants(&v, out);
  } else if (node->is_array()) {
    for (const auto& v : node->as_array()) collect_descendants(&v, out);
  }
}

void apply(const Segment& seg, const Value* node, std::vector<const Value*>& out) {
  switch (seg.kind) {
    case SegKind::names:
      for (const auto& n : seg.names) {
        if (const Value* v = node->find(n)) out.push_back(v);
      }
      break;
    case SegKind::wildcard:
      if (node->is_object()) {
        for (const auto& [k, v] : node->as_object()) out.push_back(&v);
      } else if (node->is_array()) {
        for (const auto& v : node->as_array()) out.push_back(&v);
      }
      break;
    case SegKind::indices:
      if (node->is_array()) {
        const auto& arr = node->as_array();
        for (long long raw : seg.indices) {
          const long long idx = norm_index(raw, arr.size());
          if (idx >= 0 && idx < static_cast<long long>(arr.size())) out.push_back(&arr[static_cast<size_t>(idx)]);
        }
      }
      break;
    case SegKind::slice:
      if (node->is_array()) {
        const auto& arr = node->as_array();
        const long long n = static_cast<long long>(arr.size());
        auto clamp_idx = [&](long long v, long long lo, long long hi) { return v < lo ? lo : (v > hi ? hi : v); };
        if (seg.step > 0) {
          long long b = seg.start ? clamp_idx(norm_index(*seg.start, arr.size()), 0, n) : 0;
          long long e = seg.end ? clamp_idx(norm_index(*seg.end, arr.size()), 0, n) : n;
          for (long long k = b; k < e; k += seg.step) out.push_back(&arr[static_cast<size_t>(k)]);
        } else {
          long long b = seg.start ? clamp_idx(norm_index(*seg.start, arr.size()), -1, n - 1) : n - 1;
          long long e = seg.end ? clamp_idx(norm_index(*seg.end, arr.size()), -1, n - 1) : -1;
          for (long long k = b; k > e; k += seg.step) out.push_back(&arr[static_cast<size_t>(k)]);
        }
      }
      break;
    case SegKind::filter:
      if (node->is_array()) {
        for (const auto& v : node->as_array()) {
          if (filter_matches(seg.filter, v)) out.push_back(&v);
        }
      } else if (node->is_object()) {
        for (const auto& [k, v] : node->as_object()) {
          if (filter_matches(seg.filter, v)) out.push_back(&v);
        }
      }
      break;
  }
}

}  // namespace

std::vector<Value> find_all(const std::string& expr, const Value& root, std::string* error) {
  std::string err;
  auto segments = Compiler(expr).compile(&err);
  if (!segments) {
    if (error) *error = err;
    return {};
  }
  std::vector<const Value*> current{&root};
  for (const auto& seg : *segments) {
    std::vector<const Value*> next;
    for (const Value* node : current) {
      if (seg.recursive) {
        std::vector<const Value*> all;
        collect_descendants(node, all);
        // "..*" excludes the starting node itself.
        if (seg.kind == SegKind::wildcard) {
          for (size_t k = 1; k < all.size(); ++k) next.push_back(all[k]);
          continue;
        }
        for (const Value* d : all) apply(seg, d, next);
      } else {
        apply(seg, node, next);
      }
    }
    current = std::move(next);
  }
  std::vector<Value> out;
  out.reserve(current.size());
  for (const Value* v : current) out.push_back(*v);
  return out;
}

Value collapse(std::vector<Value> matches) {
  if (matches.empty()) return Value{};
  if (matches.size() == 1) return std::move(matches.front());
  return Value{Array(std::make_move_iterator(matches.begin()), std::make_move_iterator(matches.end()))};
}

Value query(const std::string& expr, const Value& root, std::string* error) {
  return collapse(find_all(expr, root, error));
}

}  // namespace vigil::jsonpath
