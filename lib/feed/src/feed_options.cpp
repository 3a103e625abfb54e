#include <feed/feed_options.hpp>

namespace relay_feed::feed {

auto to_string(query_shape shape) -> std::string_view
{
  switch (shape) {
  case query_shape::global:
    return "global";
  case query_shape::single_author:
    return "single_author";
  case query_shape::multi_author:
    return "multi_author";
  case query_shape::following:
    return "following";
  }
  return "unknown";
}

auto classify(const nostr::protocol::filter &filter, const shape_thresholds &thresholds) -> query_shape
{
  const auto count = filter.authors ? filter.authors->size() : 0;
  if (count == 0) { return query_shape::global; }
  if (count == 1) { return query_shape::single_author; }
  if (count > thresholds.following_author_threshold) { return query_shape::following; }
  return query_shape::multi_author;
}

}// namespace relay_feed::feed
