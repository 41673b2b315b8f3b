#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <vector>

#include "bench_cases.hpp"

namespace {

struct env_setting {
  const char * name = nullptr;
  std::uint64_t spantag::bench::config::*field = nullptr;
  std::uint64_t fallback = 0;
  std::uint64_t limit = 0;
  bool allow_zero = false;
};

constexpr env_setting k_settings[] = {
  {"SPANTAG_BENCH_ITERS", &spantag::bench::config::iterations, 10000, 10000000, false},
  {"SPANTAG_BENCH_RUNS", &spantag::bench::config::runs, 5, 25, false},
  {"SPANTAG_BENCH_WARMUP_ITERS", &spantag::bench::config::warmup_iterations, 100, 1000000, true},
  {"SPANTAG_BENCH_WARMUP_RUNS", &spantag::bench::config::warmup_runs, 1, 25, true},
};

// Unset, unparsable or disallowed zero values keep the fallback; large
// values are clamped to the setting's limit.
std::uint64_t read_setting(const env_setting & setting) {
  const char * value = std::getenv(setting.name);
  if (value == nullptr || value[0] == '\0') {
    return setting.fallback;
  }
  char * end = nullptr;
  const unsigned long long parsed = std::strtoull(value, &end, 10);
  if (end == value || *end != '\0') {
    std::fprintf(stderr, "warning: ignoring %s=%s\n", setting.name, value);
    return setting.fallback;
  }
  if (parsed == 0 && !setting.allow_zero) {
    return setting.fallback;
  }
  return parsed > setting.limit ? setting.limit : static_cast<std::uint64_t>(parsed);
}

spantag::bench::config read_config() {
  spantag::bench::config cfg{};
  for (const env_setting & setting : k_settings) {
    cfg.*setting.field = read_setting(setting);
  }
  return cfg;
}

}  // namespace

int main() {
  const spantag::bench::config cfg = read_config();

  std::vector<spantag::bench::result> results;
  if (!spantag::bench::append_parser_cases(results, cfg) ||
      !spantag::bench::append_encoder_cases(results, cfg) ||
      !spantag::bench::append_converter_cases(results, cfg)) {
    std::fprintf(stderr, "error: could not build bench inputs\n");
    return 1;
  }

  int status = 0;
  for (const auto & entry : results) {
    std::printf("%s tokens=%" PRId32 " ns_per_token=%.3f best=%.3f requests=%" PRIu64 "\n",
                entry.name.c_str(),
                entry.tokens,
                entry.ns_per_token,
                entry.best_ns_per_token,
                entry.requests);
    if (entry.failed_requests != 0) {
      std::fprintf(stderr, "error: %s failed %" PRIu64 " requests\n", entry.name.c_str(),
                   entry.failed_requests);
      status = 1;
    }
  }
  return status;
}
