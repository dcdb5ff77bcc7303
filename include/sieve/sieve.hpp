#pragma once


/*
    -----------------------------------------------------------------
    Sieve - Typed JSON decoders and encoders over a generic value tree
    -----------------------------------------------------------------

    This is the main public header for Sieve

    It brings together:
        - The generic JSON tree:        `Sieve::value`
        - Text boundary:                `Sieve::parse(...)`, `Sieve::dump(...)`
        - Parse errors and options:     `Sieve::ParseError`,
                                        `Sieve::ParseOptions`,
                                        `Sieve::WriteOptions`
        - Decoders:                     `Sieve::decoder<T>`, `Sieve::Decode::*`
        - Decode errors:                `Sieve::DecodeError`,
                                        `Sieve::DecodeException`
        - Record builders:              `Sieve::Decode::object`,
                                        `Sieve::Decode::pipeline`
        - Encoders:                     `Sieve::Encode::*`
        - Lossless scalars:             `big_integer`, `decimal`, `guid`,
                                        `date_time`, `date_time_offset`

    -------------------
    High-Level Overview
    -------------------
    - Decoding:
        * A `decoder<T>` maps a `const value&` to `std::expected<T, DecodeError>`
        * Decoders compose: navigation (`field`, `at`, `index`), collections,
          alternatives (`one_of`, `option`), chaining (`and_then`, `map`)
        * Failures are data. They are rendered to text only on request
    - Encoding:
        * Plain functions building a `value`; `Encode::to_string(v, indent)`
    - Boundary:
        * `decode_string(d, text)` parses, then decodes
        * `unwrap(d, v)` throws `DecodeException` for call sites that
          cannot recover

    -----
    Usage
    -----
        #include <sieve/sieve.hpp>

        struct user { std::string name; int age; };

        int main() {
            auto user_decoder = Sieve::Decode::object([](const Sieve::Decode::getters& get) {
                return user{
                    get.required.field("firstname", Sieve::Decode::string()),
                    get.required.field("age", Sieve::Decode::int32()),
                };
            });

            auto r = Sieve::decode_string(user_decoder, R"({"firstname":"maxime","age":25})");
            if (!r) {
                std::println("{}", r.error());
                return 1;
            }
            std::println("{} is {}", r->name, r->age);
        }

    Include this header for the full API, or the individual headers
    (`value.hpp`, `json.hpp`, `decoder.hpp`, `builder.hpp`, `encode.hpp`,
    `extended.hpp`) directly.
*/

#include "sieve/config.hpp"
#include "sieve/value.hpp"
#include "sieve/error.hpp"
#include "sieve/options.hpp"
#include "sieve/json.hpp"
#include "sieve/decode_error.hpp"
#include "sieve/extended.hpp"
#include "sieve/decoder.hpp"
#include "sieve/builder.hpp"
#include "sieve/encode.hpp"
