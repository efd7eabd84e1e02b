#pragma once

namespace pulse::util {

// Builds a std::visit visitor out of lambdas.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace pulse::util
