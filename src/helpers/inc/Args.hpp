#ifndef ECHOBENCH_HELPERS_ARGS_HPP
#define ECHOBENCH_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Fixed-arity flag parser for the command-line tools. Every flag has a long
 * spelling ("--length") and an optional short one ("-l"). Tokens that match
 * no flag are rejected so mistyped options never fall through silently.
 *
 * @note Cold-path: Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>

namespace echobench {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;      ///< Long flag string, e.g. "--length"
  std::string_view shortFlag; ///< Short alias, e.g. "-l" (empty if none)
  std::uint8_t nargs;         ///< Number of values required after the flag
  bool required;              ///< True if flag must be provided
  std::string_view desc{};    ///< Description for help output (optional)
  std::string_view meta{};    ///< Value placeholder for help output, e.g. "<n>"
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

namespace detail {

/// Compact, parse-ready view of an argument definition.
struct ArgDefView {
  std::uint8_t key;
  std::uint8_t need;
  std::string_view flag;
};

/// Spelling of a flag as shown in usage output ("-l, --length <n>").
inline std::string flagColumn(const ArgDef& def) {
  std::string out;
  if (!def.shortFlag.empty()) {
    out.append(def.shortFlag);
    out.append(", ");
  } else {
    out.append("    ");
  }
  out.append(def.flag);
  if (def.nargs > 0) {
    out.push_back(' ');
    out.append(def.meta.empty() ? std::string_view{"<value>"} : def.meta);
    if (def.nargs > 1) {
      out.append(" ...");
    }
  }
  return out;
}

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * Fixed-arity parser: when a flag is matched (long or short spelling), it
 * consumes the next nargs tokens literally as its values. A repeated flag
 * overwrites the earlier values.
 *
 * @param args   Argument list (non-owning views; must outlive the call).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output map of parsed values (entries are overwritten per key).
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success; false on error (and sets error if provided).
 * @note Cold-path: Allocates internally.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) noexcept {
  const std::size_t N = args.size();

  // Reverse LUT: both spellings -> compact view
  std::unordered_map<std::string_view, detail::ArgDefView> lut;
  lut.reserve(map.size() * 2);
  for (const auto& KV : map) {
    const detail::ArgDefView VIEW{KV.first, KV.second.nargs, KV.second.flag};
    lut.emplace(KV.second.flag, VIEW);
    if (!KV.second.shortFlag.empty()) {
      lut.emplace(KV.second.shortFlag, VIEW);
    }
  }

  std::bitset<256> seen;

  for (std::size_t i = 0; i < N; ++i) {
    const std::string_view TOK = args[i];
    auto it = lut.find(TOK);
    if (it == lut.end()) {
      if (error) {
        error->get() = fmt::format("Unknown argument '{}'", TOK);
      }
      return false;
    }

    const detail::ArgDefView& D = it->second;

    // Need tokens in [i+1, i+D.need]
    if (i + static_cast<std::size_t>(D.need) >= N) {
      if (error) {
        error->get() =
            fmt::format("Argument out of bounds: expected {} values for flag '{}'", D.need, D.flag);
      }
      return false;
    }

    auto& out = pargs[D.key];
    out.clear();
    out.reserve(D.need);
    for (std::uint8_t k = 0; k < D.need; ++k) {
      out.emplace_back(args[i + 1 + k]);
    }

    seen.set(D.key);
    i += D.need;
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      if (error) {
        error->get() = fmt::format("Missing required argument '{}'", KV.second.flag);
      }
      return false;
    }
  }

  return true;
}

/**
 * @brief Build usage text for a CLI tool.
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 * @return Formatted, newline-terminated usage text.
 * @note Cold-path: Allocates.
 */
[[nodiscard]] inline std::string formatUsage(std::string_view progName,
                                             std::string_view description, const ArgMap& map) {
  std::string out = fmt::format("Usage: {} [OPTIONS]\n\n", progName);

  if (!description.empty()) {
    out += fmt::format("{}\n\n", description);
  }

  out += "Options:\n";

  // Sorted by long flag for stable output
  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  std::vector<std::string> columns;
  columns.reserve(entries.size());
  std::size_t width = 16;
  for (const ArgDef* def : entries) {
    columns.push_back(detail::flagColumn(*def));
    width = std::max(width, columns.back().size());
  }
  width = std::min<std::size_t>(width, 30);

  for (std::size_t i = 0; i < entries.size(); ++i) {
    const ArgDef& DEF = *entries[i];
    out += fmt::format("  {:<{}}  {}", columns[i], width, DEF.desc);
    if (DEF.required) {
      out += DEF.desc.empty() ? "(required)" : " (required)";
    }
    out += "\n";
  }

  return out;
}

/**
 * @brief Print usage information for a CLI tool to stdout.
 * @note Cold-path: Performs I/O.
 */
inline void printUsage(std::string_view progName, std::string_view description,
                       const ArgMap& map) {
  fmt::print("{}", formatUsage(progName, description, map));
}

} // namespace args
} // namespace helpers
} // namespace echobench

#endif // ECHOBENCH_HELPERS_ARGS_HPP
