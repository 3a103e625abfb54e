#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace relay_feed::nostr::protocol {

/**
 * @brief Nostr event kind identifiers.
 *
 * Only the kinds the feed logic distinguishes are named; any other
 * value received on the wire is carried through unchanged.
 */
enum class kind : std::uint16_t {
  profile_metadata = 0,///< User profile metadata (NIP-01)
  text_note = 1,///< Text note/post (NIP-01)
  recommend_relay = 2,///< Relay recommendation (NIP-01)
  contact_list = 3,///< Contact list (NIP-02)
  encrypted_dm = 4,///< Encrypted direct message (NIP-04)
  deletion = 5,///< Event deletion (NIP-09)
  repost = 6,///< Repost of a text note (NIP-18)
  reaction = 7,///< Reaction to an event (NIP-25)
  generic_repost = 16,///< Repost of any other kind (NIP-18)
  long_form = 30023,///< Long-form article (NIP-23)
};

/**
 * @brief Nostr event data structure.
 *
 * Represents a complete Nostr event with all required fields per NIP-01.
 * The signature is carried but never verified.
 */
struct event_data
{
  std::string id;///< Event ID (32-byte hex hash)
  std::string pubkey;///< Public key of event creator (32-byte hex)
  std::uint64_t created_at{};///< Unix timestamp
  enum kind kind {};///< Event kind identifier
  std::vector<std::vector<std::string>> tags;///< Event tags (arbitrary string arrays)
  std::string content;///< Event content
  std::string sig;///< Schnorr signature (64-byte hex)

  /**
   * @brief Deserializes event data from byte array.
   *
   * @param bytes Raw bytes containing JSON event data
   * @return Parsed event_data or std::nullopt on failure
   */
  static auto deserialize(std::span<const std::byte> bytes) -> std::optional<event_data>;

  /**
   * @brief Deserializes event data from JSON string.
   *
   * @param json JSON string
   * @return Parsed event_data or std::nullopt on failure
   */
  static auto deserialize(const std::string &json) -> std::optional<event_data>;

  /**
   * @brief Builds event data from an already parsed JSON object.
   *
   * @return Parsed event_data or std::nullopt if a required field is missing or mistyped
   */
  static auto from_json(const nlohmann::json &json_obj) -> std::optional<event_data>;

  [[nodiscard]] auto to_json() const -> nlohmann::json;

  /**
   * @brief Serializes event data to byte array.
   *
   * @return Serialized event as byte vector
   */
  [[nodiscard]] auto serialize() const -> std::vector<std::byte>;

  /**
   * @brief Returns the first value of every tag with the given name.
   *
   * @param name Tag name such as "e", "p" or "t"
   */
  [[nodiscard]] auto tag_values(std::string_view name) const -> std::vector<std::string>;

  [[nodiscard]] auto has_tag(std::string_view name) const -> bool;
};

/// Receives events delivered to a live subscription
using event_callback = std::function<void(const event_data &)>;

/**
 * @brief NIP-01 subscription filter.
 *
 * Unset fields are omitted from the wire form and match everything.
 */
struct filter
{
  std::optional<std::vector<std::string>> ids;///< Event IDs
  std::optional<std::vector<std::string>> authors;///< Author public keys
  std::optional<std::vector<int>> kinds;///< Event kinds
  std::map<char, std::vector<std::string>> tags;///< Single-letter tag filters ("#e", "#t", ...)
  std::optional<std::uint64_t> since;///< Inclusive lower time bound
  std::optional<std::uint64_t> until;///< Inclusive upper time bound
  std::optional<std::size_t> limit;///< Maximum events per relay

  [[nodiscard]] auto to_json() const -> nlohmann::json;

  /**
   * @brief Parses a filter object.
   *
   * @return Parsed filter or std::nullopt when a field has the wrong shape
   */
  static auto from_json(const nlohmann::json &json_obj) -> std::optional<filter>;

  /**
   * @brief Evaluates the filter locally against an event.
   */
  [[nodiscard]] auto matches(const event_data &evt) const -> bool;

  /**
   * @brief Canonical JSON with since, until and limit removed.
   *
   * Two filters that differ only in their time window share a signature.
   */
  [[nodiscard]] auto signature() const -> std::string;

  auto operator==(const filter &) const -> bool = default;
};

/**
 * @brief Nostr OK response message.
 *
 * Sent by relays to indicate acceptance/rejection of a submitted event.
 */
struct ok
{
  std::string event_id;///< ID of the event this responds to
  bool accepted{};///< Whether the event was accepted
  std::string message;///< Human-readable status message

  /**
   * @brief Deserializes OK message from JSON.
   *
   * @param json JSON string in format ["OK", event_id, accepted, message]
   * @return Parsed ok or std::nullopt on failure
   */
  static auto deserialize(const std::string &json) -> std::optional<ok>;
};

/**
 * @brief End of Stored Events marker.
 */
struct eose
{
  std::string subscription_id;///< Subscription this EOSE applies to

  static auto deserialize(const std::string &json) -> std::optional<eose>;
};

/**
 * @brief Relay-side subscription termination (NIP-01 CLOSED).
 */
struct closed
{
  std::string subscription_id;///< Subscription the relay dropped
  std::string message;///< Reason given by the relay
};

/**
 * @brief Human-readable relay notice.
 */
struct notice
{
  std::string message;
};

/**
 * @brief Nostr REQ subscription request.
 */
struct req
{
  std::string subscription_id;///< Unique identifier for this subscription
  std::vector<filter> filters;///< Filter criteria, OR-ed together by the relay

  /**
   * @brief Serializes REQ to JSON string.
   *
   * @return JSON string in format ["REQ", subscription_id, ...filters]
   */
  [[nodiscard]] auto serialize() const -> std::string;

  static auto deserialize(const std::string &json) -> std::optional<req>;
};

/**
 * @brief Nostr CLOSE message ending a subscription.
 */
struct close
{
  std::string subscription_id;

  [[nodiscard]] auto serialize() const -> std::string;
};

/**
 * @brief Nostr EVENT message wrapper.
 *
 * Relay-to-client messages carry a subscription ID; client-to-relay
 * publishes leave it empty.
 */
struct event
{
  std::string subscription_id;///< Subscription this event matches
  event_data data;///< The event itself

  static auto from_event_data(const event_data &evt) -> event;

  /**
   * @brief Serializes event to JSON string.
   *
   * @return ["EVENT", subscription_id, event_data] or ["EVENT", event_data] when unsubscribed
   */
  [[nodiscard]] auto serialize() const -> std::string;

  static auto deserialize(const std::string &json) -> std::optional<event>;
};

/// Any message a relay can send to a client
using relay_message = std::variant<event, ok, eose, closed, notice>;

/**
 * @brief Parses an incoming relay frame.
 *
 * @param json Raw text frame
 * @return The decoded message, or std::nullopt for malformed or unknown frames
 */
auto parse_relay_message(const std::string &json) -> std::optional<relay_message>;

/// Maximum allowed subscription ID length
constexpr std::size_t max_subscription_id_length = 64;

/**
 * @brief Validates a subscription ID.
 *
 * @param subscription_id ID to validate
 * @throws std::invalid_argument if ID is empty or exceeds maximum length
 */
inline auto validate_subscription_id(const std::string &subscription_id) -> void
{
  if (subscription_id.empty()) { throw std::invalid_argument("Subscription ID cannot be empty"); }
  if (subscription_id.length() > max_subscription_id_length) {
    throw std::invalid_argument("Subscription ID exceeds maximum length of 64 characters");
  }
}

}// namespace relay_feed::nostr::protocol
