// variant_utils.h - Helpers for exhaustive std::visit dispatch

#ifndef TESSERA_VARIANT_UTILS_H
#define TESSERA_VARIANT_UTILS_H

namespace tessera {

// Builds a visitor from a set of lambdas, one per variant alternative
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace tessera

#endif  // TESSERA_VARIANT_UTILS_H
