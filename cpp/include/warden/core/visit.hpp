#pragma once

namespace warden::core {

    // Lambda set for exhaustive std::visit over subject variants.
    template <typename... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };
    template <typename... Ts>
    Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace warden::core
