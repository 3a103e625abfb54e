#include <core/uuid_generator.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace relay_feed::core {

auto uuid_generator::generate() -> std::string
{
  static thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

auto uuid_generator::subscription_id(std::string_view prefix) -> std::string
{
  static constexpr std::size_t max_prefix_length = 16;
  auto id = std::string(prefix.substr(0, max_prefix_length));
  id += ':';
  id += generate();
  return id;
}

}// namespace relay_feed::core
