#pragma once

#include <nostr/protocol.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace relay_feed::feed {

/**
 * @brief Lists that mark an event as flagged content.
 */
struct flag_lists
{
  std::vector<std::string> hashtags{ "nsfw", "adult", "explicit", "18+" };
  std::vector<std::string> words{ "nsfw", "porn", "xxx", "nude", "nudes", "explicit", "onlyfans", "18+" };
  std::vector<std::string> blocked_authors;
};

/**
 * @brief Detects flagged content by hashtag, whole word or author.
 *
 * Matching is ASCII case-insensitive. A word matches only when bounded by
 * non-alphanumeric characters or the ends of the content.
 */
class content_flagger
{
public:
  explicit content_flagger(flag_lists lists = {});

  [[nodiscard]] auto is_flagged(const nostr::protocol::event_data &event) const -> bool;
  [[nodiscard]] auto lists() const -> const flag_lists & { return lists_; }

private:
  flag_lists lists_;
};

/// Live, user-facing visibility toggles
struct filter_options
{
  bool show_replies{ true };
  bool show_reposts{ true };
  bool block_flagged{ true };
  std::vector<std::string> hashtags;///< When non-empty, a matching "t" tag is required
  std::vector<std::string> muted_authors;
};

/// Carries an "e" tag
[[nodiscard]] auto is_reply(const nostr::protocol::event_data &event) -> bool;

/// Kind 6 or 16, or a text note quoting another through a "q" tag
[[nodiscard]] auto is_repost(const nostr::protocol::event_data &event) -> bool;

/**
 * @brief Decides which aggregated events are shown.
 *
 * Events with blank content are never visible.
 */
class content_filter
{
public:
  explicit content_filter(filter_options options = {}, content_flagger flagger = content_flagger{});

  auto set_options(filter_options options) -> void { options_ = std::move(options); }
  [[nodiscard]] auto options() const -> const filter_options & { return options_; }
  [[nodiscard]] auto flagger() const -> const content_flagger & { return flagger_; }

  [[nodiscard]] auto is_visible(const nostr::protocol::event_data &event) const -> bool;

  [[nodiscard]] auto apply(std::span<const nostr::protocol::event_data> events) const
    -> std::vector<nostr::protocol::event_data>;

  /// Oldest created_at among the visible events
  [[nodiscard]] auto oldest_visible(std::span<const nostr::protocol::event_data> events) const
    -> std::optional<std::uint64_t>;

private:
  filter_options options_;
  content_flagger flagger_;
};

}// namespace relay_feed::feed
