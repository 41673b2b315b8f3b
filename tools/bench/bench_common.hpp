#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "spantag/spantag.h"

namespace spantag::bench {

struct config {
  std::uint64_t iterations = 0;
  std::uint64_t runs = 0;
  std::uint64_t warmup_iterations = 0;
  std::uint64_t warmup_runs = 0;
};

struct result {
  std::string name;
  std::int32_t tokens = 0;
  double ns_per_token = 0.0;
  double best_ns_per_token = 0.0;
  std::uint64_t requests = 0;
  std::uint64_t failed_requests = 0;
};

/**
 * Times `fn` over whole tag sequences of `tokens` tokens and reports the
 * median and best cost per token across runs. `fn` returns the request
 * status; every non-OK status is counted, warmup included.
 */
template <class Fn>
result measure_case(const char * name, const std::int32_t tokens, const config & cfg, Fn && fn) {
  result out;
  out.name = name;
  out.tokens = tokens;

  for (std::uint64_t run = 0; run < cfg.warmup_runs; ++run) {
    for (std::uint64_t i = 0; i < cfg.warmup_iterations; ++i) {
      out.failed_requests += fn() != SPANTAG_OK ? 1u : 0u;
    }
  }

  const double tokens_per_run =
      static_cast<double>(cfg.iterations) * static_cast<double>(std::max<std::int32_t>(tokens, 1));
  std::vector<double> per_token;
  per_token.reserve(static_cast<std::size_t>(cfg.runs));
  for (std::uint64_t run = 0; run < cfg.runs; ++run) {
    const auto start = std::chrono::steady_clock::now();
    for (std::uint64_t i = 0; i < cfg.iterations; ++i) {
      out.failed_requests += fn() != SPANTAG_OK ? 1u : 0u;
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count();
    per_token.push_back(static_cast<double>(ns) / tokens_per_run);
  }
  out.requests = (cfg.warmup_runs * cfg.warmup_iterations) + (cfg.runs * cfg.iterations);

  if (!per_token.empty()) {
    std::sort(per_token.begin(), per_token.end());
    out.ns_per_token = per_token[per_token.size() / 2];
    out.best_ns_per_token = per_token.front();
  }
  return out;
}

}  // namespace spantag::bench
