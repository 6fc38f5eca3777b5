#include <explorer/query/pagination.hpp>
#include <explorer/schema/encoding/scale/encoder.hpp>

#include <algorithm>
#include <tuple>

namespace explorer::query {

using namespace explorer::schema;

namespace {

using encoder_t = encoding::encoder<encoding::scale_encoder_tag>;
using cursor_tuple_t = std::tuple<uint8_t, bytes_t, uint64_t>;

resolution<page_plan> invalid_cursor(std::string log) {
  return failed<page_plan>(query_error_code::invalid_cursor, std::move(log));
}

}  // namespace

std::string encode_cursor(const sequence_key& key, const uint64_t position) {
  auto encoder = encoder_t{};
  return to_base64(encoder.encode(
      cursor_tuple_t{static_cast<uint8_t>(key.kind), key.scope, position}));
}

std::optional<uint64_t> decode_cursor(const sequence_key& key,
                                      const std::string_view cursor) {
  auto raw = try_from_base64(cursor);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<cursor_tuple_t>(make_bytes_view(*raw));
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  const auto& [kind, scope, position] = *decoded;
  if (kind != static_cast<uint8_t>(key.kind) || scope != key.scope) {
    return std::nullopt;
  }
  return position;
}

resolution<page_plan> plan_page(const sequence_key& key,
                                const sequence_bounds& bounds,
                                const pagination_arguments& arguments,
                                const uint64_t max_page_size) {
  auto plan = page_plan{};
  plan.total_count = bounds.size();

  auto within = [&](const uint64_t position) {
    return !bounds.empty() && position >= bounds.lower &&
           position <= *bounds.upper;
  };

  // Window [lo, hi) in positions; half open so an empty window needs no
  // special value.
  auto lo = bounds.lower;
  auto hi = bounds.empty() ? bounds.lower : *bounds.upper + 1;

  if (arguments.after.has_value()) {
    auto position = decode_cursor(key, *arguments.after);
    if (!position.has_value() || !within(*position)) {
      return invalid_cursor("after cursor does not name an element of this "
                            "sequence");
    }
    lo = std::max(lo, *position + 1);
  }
  if (arguments.before.has_value()) {
    auto position = decode_cursor(key, *arguments.before);
    if (!position.has_value() || !within(*position)) {
      return invalid_cursor("before cursor does not name an element of this "
                            "sequence");
    }
    hi = std::min(hi, *position);
  }
  hi = std::max(hi, lo);

  auto limit = max_page_size;
  auto from_back = false;
  if (arguments.first.has_value()) {
    if (arguments.last.has_value()) {
      spdlog::debug("Both first and last given; ignoring last");
    }
    limit = std::min(*arguments.first, max_page_size);
  } else if (arguments.last.has_value()) {
    limit = std::min(*arguments.last, max_page_size);
    from_back = true;
  }

  auto count = std::min(limit, hi - lo);
  auto begin = from_back ? hi - count : lo;
  for (auto position = begin; position < begin + count; ++position) {
    plan.positions.push_back(position);
  }

  if (bounds.empty()) {
    return resolved(std::move(plan));
  }
  if (!plan.positions.empty()) {
    plan.has_previous_page = plan.positions.front() > bounds.lower;
    plan.has_next_page = plan.positions.back() < *bounds.upper;
  } else {
    // Empty page: report what lies on either side of the window anchor.
    auto anchor = from_back ? hi : lo;
    plan.has_previous_page = anchor > bounds.lower;
    plan.has_next_page = anchor <= *bounds.upper;
  }
  return resolved(std::move(plan));
}

}  // namespace explorer::query
