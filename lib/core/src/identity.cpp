#include <core/identity.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace tether::core {

namespace {
  auto random_uuid() -> std::string
  {
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
  }
}// namespace

auto new_peer_id() -> std::string { return random_uuid(); }

auto new_endpoint_id() -> std::string { return random_uuid(); }

}// namespace tether::core
