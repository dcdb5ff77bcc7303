#include <print>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "sieve/sieve.hpp"

struct address {
    std::string street;
    std::string city;
};

struct user {
    std::string name;
    int age;
    std::optional<std::string> email;
    address home;
    std::vector<std::string> tags;
};

int main(int argc, char** argv) {
    using namespace Sieve;

    auto address_decoder = Decode::map(
        [](std::string street, std::string city) { return address{ std::move(street), std::move(city) }; },
        Decode::field("street", Decode::string()),
        Decode::field("city", Decode::string()));

    auto user_decoder = Decode::object([&](const Decode::getters& get) {
        return user{
            get.required.field("firstname", Decode::string()),
            get.required.field("age", Decode::int32()),
            get.optional.field("email", Decode::option(Decode::string()), std::nullopt),
            get.required.field("address", address_decoder),
            get.optional.field("tags", Decode::array(Decode::string()), {}),
        };
    });

    std::string text = R"({
        "firstname": "maxime",
        "age": 25,
        "address": { "street": "main road", "city": "Bordeaux" },
        "tags": ["f#", "c++"]
    })";

    if (argc > 1) {
        std::ifstream ifs(argv[1]);
        if (!ifs) {
            std::println("Failed to open {}", argv[1]);
            return -1;
        }
        text.assign(std::istreambuf_iterator<char>{ ifs }, std::istreambuf_iterator<char>{});
    }

    auto r = decode_string(user_decoder, text);
    if (!r) {
        std::println("Decode error!\n{}", r.error());
        return 1;
    }

    std::println("{} ({}) lives in {}, {}", r->name, r->age, r->home.street, r->home.city);
    std::println("email: {}", r->email.value_or("<none>"));
    for (const auto& tag : r->tags) std::println("  #{}", tag);

    // Back to JSON
    auto encoded = Encode::object({
        { "firstname", Encode::string(r->name) },
        { "age", Encode::int32(r->age) },
        { "email", Encode::option(Encode::string, r->email) },
        { "address", Encode::object({
            { "street", Encode::string(r->home.street) },
            { "city", Encode::string(r->home.city) },
        }) },
        { "tags", Encode::seq(Encode::string, r->tags) },
    });
    std::println("{}", Encode::to_string(encoded, 4));

    // A failing decode shows the offending value
    auto bad = decode_string(user_decoder, R"({ "firstname": "maxime", "age": "25" })");
    if (!bad) std::println("\n{}", bad.error());

    return 0;
}
