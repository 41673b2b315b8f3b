#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#include "spantag/converter/events.hpp"
#include "spantag/machines.hpp"
#include "spantag/parser/events.hpp"
#include "spantag/spantag.h"
#include "spantag/types.hpp"

// Input layout: one selector byte (scheme, policy and conversion target)
// followed by whitespace separated tags.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
  if (size == 0) {
    return 0;
  }
  const uint8_t selector = data[0];
  const auto scheme = static_cast<spantag::scheme_kind>(selector % SPANTAG_SCHEME_COUNT);
  const auto policy = static_cast<spantag::repair_policy>((selector / 5u) % 3u);
  const auto target = static_cast<spantag::scheme_kind>((selector / 15u) % SPANTAG_SCHEME_COUNT);

  std::vector<std::string> tags;
  std::string_view input(reinterpret_cast<const char *>(data + 1), size - 1);
  while (!input.empty()) {
    const size_t cut = input.find_first_of(" \t\n");
    if (cut != 0) {
      tags.emplace_back(input.substr(0, cut));
    }
    if (cut == std::string_view::npos) {
      break;
    }
    input.remove_prefix(cut + 1);
  }

  spantag::Parser parser{};
  std::vector<spantag::span> spans;
  std::vector<spantag::repair> repairs;
  int32_t err = SPANTAG_OK;
  (void)parser.process_event(spantag::parser::event::parse{
    .tags = tags,
    .scheme = scheme,
    .policy = policy,
    .spans_out = &spans,
    .repairs_out = &repairs,
    .error_out = &err,
  });

  if (err != SPANTAG_OK) {
    if (!spans.empty() || !repairs.empty()) {
      std::abort();
    }
    return 0;
  }

  const int32_t length = static_cast<int32_t>(tags.size());
  int32_t previous_end = 0;
  for (const auto & s : spans) {
    if (s.type.empty() || s.start < previous_end || s.start >= s.end || s.end > length ||
        s.tokens.size() != static_cast<size_t>(s.end - s.start)) {
      std::abort();
    }
    previous_end = s.end;
  }

  if (parser.repair_count() != 0) {
    return 0;
  }

  spantag::Converter converter{};
  std::vector<std::string> there;
  std::vector<std::string> back;
  (void)converter.process_event(spantag::converter::event::convert{
    .tags = tags,
    .source = scheme,
    .target = target,
    .tags_out = &there,
    .error_out = &err,
  });
  if (err != SPANTAG_OK) {
    std::abort();
  }
  (void)converter.process_event(spantag::converter::event::convert{
    .tags = there,
    .source = target,
    .target = scheme,
    .tags_out = &back,
    .error_out = &err,
  });
  if (err != SPANTAG_OK || back != tags) {
    std::abort();
  }
  return 0;
}
