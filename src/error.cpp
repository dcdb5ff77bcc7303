#include "sieve/error.hpp"

namespace Sieve {

    ParseError ParseError::make(code c, size_t o, size_t l, size_t col, std::string_view m) {
        return ParseError{ .errc = c, .offset = o, .line = l, .column = col, .msg = std::string{ m } };
    }

} // namespace Sieve
