#include <feed/content_filter.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace relay_feed::feed {

namespace {

  auto to_lower(std::string_view text) -> std::string
  {
    std::string lowered(text);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char character) {
      return static_cast<char>(std::tolower(character));
    });
    return lowered;
  }

  auto is_word_char(char character) -> bool
  {
    const auto byte = static_cast<unsigned char>(character);
    return byte < 0x80 and std::isalnum(byte) != 0;
  }

  // Substring match that requires non-alphanumeric characters on both sides
  auto contains_word(std::string_view haystack, std::string_view word) -> bool
  {
    if (word.empty()) { return false; }
    for (auto pos = haystack.find(word); pos != std::string_view::npos; pos = haystack.find(word, pos + 1)) {
      const auto end = pos + word.size();
      const bool left_ok = pos == 0 or not is_word_char(haystack[pos - 1]);
      const bool right_ok = end == haystack.size() or not is_word_char(haystack[end]);
      if (left_ok and right_ok) { return true; }
    }
    return false;
  }

  auto contains_ci(const std::vector<std::string> &values, std::string_view needle) -> bool
  {
    const auto lowered = to_lower(needle);
    return std::ranges::any_of(values, [&lowered](const auto &value) { return to_lower(value) == lowered; });
  }

  auto is_blank(std::string_view text) -> bool
  {
    return std::ranges::all_of(text, [](unsigned char character) { return std::isspace(character) != 0; });
  }

}// namespace

content_flagger::content_flagger(flag_lists lists) : lists_(std::move(lists)) {}

auto content_flagger::is_flagged(const nostr::protocol::event_data &event) const -> bool
{
  if (std::ranges::find(lists_.blocked_authors, event.pubkey) != lists_.blocked_authors.end()) { return true; }

  for (const auto &hashtag : event.tag_values("t")) {
    if (contains_ci(lists_.hashtags, hashtag)) { return true; }
  }

  const auto content = to_lower(event.content);
  return std::ranges::any_of(lists_.words, [&content](const auto &word) { return contains_word(content, to_lower(word)); });
}

auto is_reply(const nostr::protocol::event_data &event) -> bool { return event.has_tag("e"); }

auto is_repost(const nostr::protocol::event_data &event) -> bool
{
  using nostr::protocol::kind;
  if (event.kind == kind::repost or event.kind == kind::generic_repost) { return true; }
  return event.kind == kind::text_note and event.has_tag("q");
}

content_filter::content_filter(filter_options options, content_flagger flagger)
  : options_(std::move(options)), flagger_(std::move(flagger))
{}

auto content_filter::is_visible(const nostr::protocol::event_data &event) const -> bool
{
  if (is_blank(event.content)) { return false; }
  if (not options_.show_replies and is_reply(event)) { return false; }
  if (not options_.show_reposts and is_repost(event)) { return false; }
  if (options_.block_flagged and flagger_.is_flagged(event)) { return false; }
  if (std::ranges::find(options_.muted_authors, event.pubkey) != options_.muted_authors.end()) { return false; }

  if (not options_.hashtags.empty()) {
    const auto tags = event.tag_values("t");
    return std::ranges::any_of(tags, [this](const auto &tag) { return contains_ci(options_.hashtags, tag); });
  }
  return true;
}

auto content_filter::apply(std::span<const nostr::protocol::event_data> events) const
  -> std::vector<nostr::protocol::event_data>
{
  std::vector<nostr::protocol::event_data> visible;
  std::ranges::copy_if(events, std::back_inserter(visible), [this](const auto &event) { return is_visible(event); });
  return visible;
}

auto content_filter::oldest_visible(std::span<const nostr::protocol::event_data> events) const
  -> std::optional<std::uint64_t>
{
  std::optional<std::uint64_t> oldest;
  for (const auto &event : events) {
    if (not is_visible(event)) { continue; }
    if (not oldest or event.created_at < *oldest) { oldest = event.created_at; }
  }
  return oldest;
}

}// namespace relay_feed::feed
