#include <idpick/util.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

std::string idpick::file_contents(const std::string& filename) {
    std::ifstream file_in {filename, std::ios_base::in};
    if (!file_in) {
        throw std::runtime_error(fmt::format("Couldn't open {}", filename));
    }
    std::ostringstream sstr;
    std::copy (
        std::istreambuf_iterator<char>(file_in.rdbuf()),
        std::istreambuf_iterator<char>(),
        std::ostreambuf_iterator<char>(sstr)
    );
    return sstr.str();
}

idpick::scoped_toggle::scoped_toggle(const bool previous, const bool value, std::function<void(bool)> apply) :
    apply(std::move(apply)),
    previous(previous)
{
    this->apply(value);
}

idpick::scoped_toggle::~scoped_toggle() {
    apply(previous);
}
