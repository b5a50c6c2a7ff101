#pragma once

namespace tether::core {

/**
 * @brief Builds a visitor out of lambdas, one per variant alternative.
 *
 * @code
 * std::visit(overload{
 *   [](const session::state::connected &) { ... },
 *   [](const session::state::error &err) { ... },
 *   [](const auto &) { ... },
 * }, state);
 * @endcode
 */
template<class... Visitors> struct overload : Visitors...
{
  using Visitors::operator()...;
};

template<class... Visitors> overload(Visitors...) -> overload<Visitors...>;

}// namespace tether::core
