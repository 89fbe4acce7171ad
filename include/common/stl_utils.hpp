#pragma once

namespace ptyrun {

/**
 * @brief Builds a visitor for std::visit out of several lambdas
 */
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;

}  // namespace ptyrun
