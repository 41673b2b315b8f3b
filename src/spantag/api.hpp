#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "spantag/converter/events.hpp"
#include "spantag/encoder/events.hpp"
#include "spantag/machines.hpp"
#include "spantag/parser/events.hpp"
#include "spantag/spantag.h"
#include "spantag/transition/detail.hpp"
#include "spantag/types.hpp"

namespace spantag {

// Repair and detail views point into the caller's tag storage, so the
// entry points below refuse temporary tag and span vectors.
struct parse_result {
  std::vector<span> spans = {};
  std::vector<repair> repairs = {};
  int32_t error = SPANTAG_OK;
  error_detail detail = {};
};

struct tags_result {
  std::vector<std::string> tags = {};
  std::vector<repair> repairs = {};
  int32_t error = SPANTAG_OK;
  error_detail detail = {};
};

inline parse_result parse_spans(std::span<const std::string> tags, const scheme_kind scheme,
                                const repair_policy policy = repair_policy::strict) {
  parse_result out{};
  Parser machine{};
  machine.process_event(parser::event::parse{
    .tags = tags,
    .scheme = scheme,
    .policy = policy,
    .spans_out = &out.spans,
    .repairs_out = &out.repairs,
    .error_out = &out.error,
    .detail_out = &out.detail,
  });
  return out;
}

parse_result parse_spans(std::vector<std::string> && tags, scheme_kind scheme,
                         repair_policy policy = repair_policy::strict) = delete;

// Span views in the detail of an encode failure point into `spans`.
inline tags_result write_tags(std::span<const span> spans, const int32_t token_count,
                              const scheme_kind scheme) {
  tags_result out{};
  Encoder machine{};
  machine.process_event(encoder::event::encode{
    .spans = spans,
    .token_count = token_count,
    .scheme = scheme,
    .tags_out = &out.tags,
    .error_out = &out.error,
    .detail_out = &out.detail,
  });
  return out;
}

tags_result write_tags(std::vector<span> && spans, int32_t token_count,
                       scheme_kind scheme) = delete;

/**
 * Parses under `source` and re-encodes under `target` with the input
 * length. Encoder detail views do not outlive the call; only the status is
 * meaningful for an encode-phase failure.
 */
inline tags_result convert_tags(std::span<const std::string> tags, const scheme_kind source,
                                const scheme_kind target,
                                const repair_policy policy = repair_policy::strict) {
  tags_result out{};
  Converter machine{};
  machine.process_event(converter::event::convert{
    .tags = tags,
    .source = source,
    .target = target,
    .policy = policy,
    .tags_out = &out.tags,
    .repairs_out = &out.repairs,
    .error_out = &out.error,
    .detail_out = &out.detail,
  });
  if (out.error != SPANTAG_OK && out.detail.index >= 0 &&
      out.detail.status != SPANTAG_ERR_MALFORMED_TAG &&
      out.detail.status != SPANTAG_ERR_INVALID_TRANSITION) {
    const int32_t status = out.detail.status;
    out.detail.reset();
    out.detail.status = status;
  }
  return out;
}

tags_result convert_tags(std::vector<std::string> && tags, scheme_kind source,
                         scheme_kind target,
                         repair_policy policy = repair_policy::strict) = delete;

inline bool is_valid_sequence(std::span<const std::string> tags, const scheme_kind scheme,
                              int32_t & error_out, error_detail * detail_out = nullptr) {
  bool valid = false;
  error_out = transition::detail::validate_sequence(scheme, tags, valid, detail_out);
  return valid;
}

bool is_valid_sequence(std::vector<std::string> && tags, scheme_kind scheme, int32_t & error_out,
                       error_detail * detail_out = nullptr) = delete;

}  // namespace spantag
