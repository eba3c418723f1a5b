#ifndef IDPICK_UTIL_HPP_INCLUDED
#define IDPICK_UTIL_HPP_INCLUDED

#include <functional>
#include <string>

namespace idpick {
    std::string file_contents(const std::string& filename);

    // Switches a piece of global state (a GL capability, say) to value and puts the
    // previous value back when the scope ends, also when it ends by an exception
    class scoped_toggle {
        std::function<void(bool)> apply;
        bool previous;
    public:
        scoped_toggle(bool previous, bool value, std::function<void(bool)> apply);
        scoped_toggle(const scoped_toggle&) = delete;
        scoped_toggle& operator=(const scoped_toggle&) = delete;
        ~scoped_toggle();
    };
}

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

#endif
