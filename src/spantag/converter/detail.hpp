#pragma once

#include <cstdint>
#include <span>

#include "spantag/converter/context.hpp"
#include "spantag/converter/events.hpp"
#include "spantag/encoder/events.hpp"
#include "spantag/parser/events.hpp"
#include "spantag/spantag.h"

namespace spantag::converter::detail {

inline int32_t parse_phase(const event::convert & ev, action::context & ctx) {
  int32_t err = SPANTAG_OK;
  const parser::event::parse request{
    .tags = ev.tags,
    .scheme = ev.source,
    .policy = ev.policy,
    .spans_out = &ctx.spans,
    .repairs_out = ev.repairs_out,
    .error_out = &err,
    .detail_out = ev.detail_out,
  };
  if (!ctx.parse_machine.process_event(request) && err == SPANTAG_OK) {
    return SPANTAG_ERR_BACKEND;
  }
  ctx.span_count = ctx.parse_machine.span_count();
  return err;
}

// The tag count is the input length so trailing outside tags survive.
inline int32_t encode_phase(const event::convert & ev, action::context & ctx) {
  int32_t err = SPANTAG_OK;
  const encoder::event::encode request{
    .spans = std::span<const span>(ctx.spans),
    .token_count = static_cast<int32_t>(ev.tags.size()),
    .scheme = ev.target,
    .tags_out = ev.tags_out,
    .error_out = &err,
    .detail_out = ev.detail_out,
  };
  if (!ctx.encode_machine.process_event(request) && err == SPANTAG_OK) {
    return SPANTAG_ERR_BACKEND;
  }
  ctx.tag_count = ctx.encode_machine.tag_count();
  return err;
}

inline int32_t convert_tags(const event::convert & ev, action::context & ctx) {
  ev.tags_out->clear();
  ctx.spans.clear();
  ctx.span_count = 0;
  ctx.tag_count = 0;

  int32_t err = parse_phase(ev, ctx);
  if (err == SPANTAG_OK) {
    err = encode_phase(ev, ctx);
  }
  if (err != SPANTAG_OK) {
    ev.tags_out->clear();
    if (ev.repairs_out != nullptr) {
      ev.repairs_out->clear();
    }
    ctx.span_count = 0;
    ctx.tag_count = 0;
  }
  return err;
}

}  // namespace spantag::converter::detail
