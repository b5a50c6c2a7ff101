#pragma once

#include <security/trust_policy.hpp>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace tether::transport {

/// A single GET request.
struct http_request
{
  std::string url;
  security::trust_policy trust;
  std::chrono::seconds timeout{ 30 };
  std::vector<std::pair<std::string, std::string>> headers;
};

struct http_response
{
  unsigned status{ 0 };
  std::string body;
};

}// namespace tether::transport
