#include <a2s/util/assert.hpp>
#include <a2s/Log.hpp>
#include <fmt/format.h>
#include <stdexcept>

void a2s::_assertionFail(std::string_view what, std::string_view file, int line) {
    a2s::log::error("Assertion failed ({} at {}:{})", what, file, line);

    throw std::runtime_error(fmt::format("Assertion failed ({}) at {}:{}", what, file, line));
}
