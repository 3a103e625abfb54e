#include <nostr/protocol.hpp>

#include <algorithm>
#include <bit>
#include <iterator>
#include <limits>

namespace relay_feed::nostr::protocol {

namespace {

  // Kinds are 16-bit; larger values are rejected rather than narrowed
  auto kind_value(const nlohmann::json &json_obj) -> std::optional<std::uint16_t>
  {
    if (not json_obj.is_number_integer()) { return std::nullopt; }
    if (not json_obj.is_number_unsigned() and json_obj.get<std::int64_t>() < 0) { return std::nullopt; }
    const auto value = json_obj.get<std::uint64_t>();
    if (value > std::numeric_limits<std::uint16_t>::max()) { return std::nullopt; }
    return static_cast<std::uint16_t>(value);
  }

  auto string_list(const nlohmann::json &json_obj) -> std::optional<std::vector<std::string>>
  {
    if (not json_obj.is_array()) { return std::nullopt; }
    std::vector<std::string> values;
    values.reserve(json_obj.size());
    for (const auto &element : json_obj) {
      if (not element.is_string()) { return std::nullopt; }
      values.push_back(element.get<std::string>());
    }
    return values;
  }

  auto contains(const std::vector<std::string> &haystack, const std::string &needle) -> bool
  {
    return std::ranges::find(haystack, needle) != haystack.end();
  }

}// namespace

auto event_data::deserialize(std::span<const std::byte> bytes) -> std::optional<event_data>
{
  std::string json_str;
  json_str.resize(bytes.size());
  std::ranges::transform(bytes, json_str.begin(), [](std::byte byte_val) { return std::bit_cast<char>(byte_val); });
  return deserialize(json_str);
}

auto event_data::deserialize(const std::string &json) -> std::optional<event_data>
{
  try {
    return from_json(nlohmann::json::parse(json));
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

auto event_data::from_json(const nlohmann::json &json_obj) -> std::optional<event_data>
{
  if (not json_obj.is_object()) { return std::nullopt; }

  event_data event;

  if (not json_obj.contains("id") or not json_obj["id"].is_string()) { return std::nullopt; }
  event.id = json_obj["id"].get<std::string>();

  if (not json_obj.contains("pubkey") or not json_obj["pubkey"].is_string()) { return std::nullopt; }
  event.pubkey = json_obj["pubkey"].get<std::string>();

  if (not json_obj.contains("created_at") or not json_obj["created_at"].is_number_unsigned()) { return std::nullopt; }
  event.created_at = json_obj["created_at"].get<std::uint64_t>();

  if (not json_obj.contains("kind")) { return std::nullopt; }
  const auto kind_number = kind_value(json_obj["kind"]);
  if (not kind_number) { return std::nullopt; }
  event.kind = static_cast<enum kind>(*kind_number);

  if (not json_obj.contains("content") or not json_obj["content"].is_string()) { return std::nullopt; }
  event.content = json_obj["content"].get<std::string>();

  if (json_obj.contains("sig")) {
    if (not json_obj["sig"].is_string()) { return std::nullopt; }
    event.sig = json_obj["sig"].get<std::string>();
  }

  if (json_obj.contains("tags")) {
    if (not json_obj["tags"].is_array()) { return std::nullopt; }
    for (const auto &tag_json : json_obj["tags"]) {
      auto tag = string_list(tag_json);
      if (not tag) { return std::nullopt; }
      event.tags.push_back(std::move(*tag));
    }
  }

  return event;
}

auto event_data::to_json() const -> nlohmann::json
{
  nlohmann::json json_obj;

  json_obj["id"] = id;
  json_obj["pubkey"] = pubkey;
  json_obj["created_at"] = created_at;
  json_obj["kind"] = static_cast<std::uint16_t>(kind);
  json_obj["content"] = content;
  json_obj["sig"] = sig;

  json_obj["tags"] = nlohmann::json::array();
  for (const auto &tag : tags) {
    nlohmann::json tag_json = nlohmann::json::array();
    std::ranges::copy(tag, std::back_inserter(tag_json));
    json_obj["tags"].push_back(tag_json);
  }

  return json_obj;
}

auto event_data::serialize() const -> std::vector<std::byte>
{
  auto json_str = to_json().dump();
  std::vector<std::byte> bytes;
  bytes.resize(json_str.size());
  std::ranges::transform(json_str, bytes.begin(), [](char character) { return std::bit_cast<std::byte>(character); });
  return bytes;
}

auto event_data::tag_values(std::string_view name) const -> std::vector<std::string>
{
  std::vector<std::string> values;
  for (const auto &tag : tags) {
    if (tag.size() >= 2 and tag[0] == name) { values.push_back(tag[1]); }
  }
  return values;
}

auto event_data::has_tag(std::string_view name) const -> bool
{
  return std::ranges::any_of(tags, [name](const auto &tag) { return not tag.empty() and tag[0] == name; });
}

auto filter::to_json() const -> nlohmann::json
{
  nlohmann::json json_obj = nlohmann::json::object();

  if (ids) { json_obj["ids"] = *ids; }
  if (authors) { json_obj["authors"] = *authors; }
  if (kinds) { json_obj["kinds"] = *kinds; }
  for (const auto &[letter, values] : tags) { json_obj[std::string{ '#', letter }] = values; }
  if (since) { json_obj["since"] = *since; }
  if (until) { json_obj["until"] = *until; }
  if (limit) { json_obj["limit"] = *limit; }

  return json_obj;
}

auto filter::from_json(const nlohmann::json &json_obj) -> std::optional<filter>
{
  if (not json_obj.is_object()) { return std::nullopt; }

  filter result;
  for (const auto &[key, value] : json_obj.items()) {
    if (key == "ids" or key == "authors") {
      auto values = string_list(value);
      if (not values) { return std::nullopt; }
      (key == "ids" ? result.ids : result.authors) = std::move(*values);
    } else if (key == "kinds") {
      if (not value.is_array()) { return std::nullopt; }
      std::vector<int> kinds;
      for (const auto &element : value) {
        const auto kind_number = kind_value(element);
        if (not kind_number) { return std::nullopt; }
        kinds.push_back(*kind_number);
      }
      result.kinds = std::move(kinds);
    } else if (key == "since" or key == "until" or key == "limit") {
      if (not value.is_number_unsigned()) { return std::nullopt; }
      if (key == "since") {
        result.since = value.get<std::uint64_t>();
      } else if (key == "until") {
        result.until = value.get<std::uint64_t>();
      } else {
        result.limit = value.get<std::size_t>();
      }
    } else if (key.size() == 2 and key[0] == '#') {
      auto values = string_list(value);
      if (not values) { return std::nullopt; }
      result.tags[key[1]] = std::move(*values);
    }
  }
  return result;
}

auto filter::matches(const event_data &evt) const -> bool
{
  if (ids and not contains(*ids, evt.id)) { return false; }
  if (authors and not contains(*authors, evt.pubkey)) { return false; }
  if (kinds and std::ranges::find(*kinds, static_cast<int>(evt.kind)) == kinds->end()) { return false; }
  if (since and evt.created_at < *since) { return false; }
  if (until and evt.created_at > *until) { return false; }

  for (const auto &[letter, values] : tags) {
    const auto present = evt.tag_values(std::string{ letter });
    const bool any = std::ranges::any_of(present, [&values](const auto &value) { return contains(values, value); });
    if (not any) { return false; }
  }
  return true;
}

auto filter::signature() const -> std::string
{
  auto canonical = *this;
  canonical.since.reset();
  canonical.until.reset();
  canonical.limit.reset();
  if (canonical.ids) { std::ranges::sort(*canonical.ids); }
  if (canonical.authors) { std::ranges::sort(*canonical.authors); }
  if (canonical.kinds) { std::ranges::sort(*canonical.kinds); }
  for (auto &[letter, values] : canonical.tags) { std::ranges::sort(values); }
  return canonical.to_json().dump();
}

auto ok::deserialize(const std::string &json) -> std::optional<ok>
{
  try {
    auto json_obj = nlohmann::json::parse(json);

    if (not json_obj.is_array() or json_obj.size() < 3) { return std::nullopt; }
    if (not json_obj[0].is_string() or json_obj[0].get<std::string>() != "OK") { return std::nullopt; }
    if (not json_obj[1].is_string()) { return std::nullopt; }
    if (not json_obj[2].is_boolean()) { return std::nullopt; }

    ok result;
    result.event_id = json_obj[1].get<std::string>();
    result.accepted = json_obj[2].get<bool>();
    result.message = (json_obj.size() > 3 and json_obj[3].is_string()) ? json_obj[3].get<std::string>() : "";

    return result;
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

auto eose::deserialize(const std::string &json) -> std::optional<eose>
{
  try {
    auto json_obj = nlohmann::json::parse(json);

    if (not json_obj.is_array() or json_obj.size() < 2) { return std::nullopt; }
    if (not json_obj[0].is_string() or json_obj[0].get<std::string>() != "EOSE") { return std::nullopt; }
    if (not json_obj[1].is_string()) { return std::nullopt; }

    return eose{ .subscription_id = json_obj[1].get<std::string>() };
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

auto req::serialize() const -> std::string
{
  nlohmann::json json_array = nlohmann::json::array();
  json_array.push_back("REQ");
  json_array.push_back(subscription_id);
  for (const auto &item : filters) { json_array.push_back(item.to_json()); }
  return json_array.dump();
}

auto req::deserialize(const std::string &json) -> std::optional<req>
{
  try {
    auto json_obj = nlohmann::json::parse(json);

    if (not json_obj.is_array() or json_obj.size() < 3) { return std::nullopt; }
    if (not json_obj[0].is_string() or json_obj[0].get<std::string>() != "REQ") { return std::nullopt; }
    if (not json_obj[1].is_string()) { return std::nullopt; }

    req result;
    result.subscription_id = json_obj[1].get<std::string>();
    for (std::size_t index = 2; index < json_obj.size(); ++index) {
      auto parsed = filter::from_json(json_obj[index]);
      if (not parsed) { return std::nullopt; }
      result.filters.push_back(std::move(*parsed));
    }

    return result;
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

auto close::serialize() const -> std::string { return nlohmann::json::array({ "CLOSE", subscription_id }).dump(); }

auto event::from_event_data(const event_data &evt) -> event { return event{ .subscription_id = "", .data = evt }; }

auto event::serialize() const -> std::string
{
  nlohmann::json message = nlohmann::json::array();
  message.push_back("EVENT");
  if (not subscription_id.empty()) { message.push_back(subscription_id); }
  message.push_back(data.to_json());

  return message.dump();
}

auto event::deserialize(const std::string &json) -> std::optional<event>
{
  try {
    auto parsed = parse_relay_message(json);
    if (not parsed or not std::holds_alternative<event>(*parsed)) {
      auto json_obj = nlohmann::json::parse(json);
      // Client-to-relay form without a subscription ID
      if (json_obj.is_array() and json_obj.size() == 2 and json_obj[0] == "EVENT") {
        auto data = event_data::from_json(json_obj[1]);
        if (data) { return event{ .subscription_id = "", .data = std::move(*data) }; }
      }
      return std::nullopt;
    }
    return std::get<event>(std::move(*parsed));
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

auto parse_relay_message(const std::string &json) -> std::optional<relay_message>
{
  try {
    auto json_obj = nlohmann::json::parse(json);
    if (not json_obj.is_array() or json_obj.empty() or not json_obj[0].is_string()) { return std::nullopt; }

    const auto type = json_obj[0].get<std::string>();

    if (type == "EVENT") {
      if (json_obj.size() < 3 or not json_obj[1].is_string()) { return std::nullopt; }
      auto data = event_data::from_json(json_obj[2]);
      if (not data) { return std::nullopt; }
      return event{ .subscription_id = json_obj[1].get<std::string>(), .data = std::move(*data) };
    }
    if (type == "OK") {
      auto parsed = ok::deserialize(json);
      if (not parsed) { return std::nullopt; }
      return *parsed;
    }
    if (type == "EOSE") {
      auto parsed = eose::deserialize(json);
      if (not parsed) { return std::nullopt; }
      return *parsed;
    }
    if (type == "CLOSED") {
      if (json_obj.size() < 2 or not json_obj[1].is_string()) { return std::nullopt; }
      const auto message = (json_obj.size() > 2 and json_obj[2].is_string()) ? json_obj[2].get<std::string>() : "";
      return closed{ .subscription_id = json_obj[1].get<std::string>(), .message = message };
    }
    if (type == "NOTICE") {
      if (json_obj.size() < 2 or not json_obj[1].is_string()) { return std::nullopt; }
      return notice{ .message = json_obj[1].get<std::string>() };
    }
    return std::nullopt;
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

}// namespace relay_feed::nostr::protocol
