#pragma once

#include <textscrub/rules.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace textscrub::server {

/**
 * Server configuration.
 */
struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 8080;
  uint32_t threads = 0;  // 0 = auto-detect CPU cores
  std::string log_level = "info";
  std::string cors_allow_origin = "*";
};

/**
 * Request limits.
 */
struct LimitsConfig {
  /// Largest value Validate accepts for max_text_bytes (1 GiB)
  static constexpr uint64_t kMaxTextBytesLimit = uint64_t{1} << 30;

  uint64_t max_text_bytes = 1024 * 1024;
};

/**
 * What the clean endpoint does when the character diff is over budget.
 */
enum class LimitPolicy {
  kReject,  // 413 resource_limit_exceeded
  kLines,   // Retry with line granularity
  kOmit     // Return the cleaned text with "diff": null
};

const char* LimitPolicyName(LimitPolicy policy);

/** Parse "reject", "lines" or "omit". Returns false on anything else. */
bool ParseLimitPolicy(const std::string& text, LimitPolicy* policy);

/**
 * Differencer configuration.
 */
struct DiffConfig {
  uint64_t max_alignment_cells = 64ull * 1024ull * 1024ull;  // 0 = unlimited
  LimitPolicy on_limit = LimitPolicy::kLines;
};

/**
 * Metrics configuration.
 */
struct MetricsConfig {
  bool enabled = true;
  std::string path = "/metrics";
};

/**
 * Parse a plain decimal number; signs, spaces and trailing junk are rejected.
 * @throws std::runtime_error naming `what` on bad input or overflow.
 */
uint64_t ParseUnsigned(const std::string& value, const std::string& what);

/**
 * Complete server configuration.
 */
struct Config {
  ServerConfig server;
  LimitsConfig limits;
  DiffConfig diff;
  RuleOptions normalizer;
  MetricsConfig metrics;

  /**
   * Load configuration from a YAML file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments.
   * A --config file is loaded first; explicit flags override it.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;

  /**
   * Build the rule set described by the normalizer section.
   * @throws std::runtime_error on a bad remove_codepoints entry.
   */
  RuleSet BuildRuleSet() const;
};

}  // namespace textscrub::server
