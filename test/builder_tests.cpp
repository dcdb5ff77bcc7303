#include <catch2/catch_all.hpp>

#include "sieve/sieve.hpp"

#include <memory_resource>
#include <stdexcept>
#include <utility>

using namespace Catch;

namespace {

    Sieve::value json(std::string_view text) {
        auto r = Sieve::parse(text);
        REQUIRE(r);
        return *std::move(r);
    }

    // Counts what the values built on it allocate
    class counting_resource : public std::pmr::memory_resource {
    public:
        size_t allocations = 0;

    private:
        void* do_allocate(size_t bytes, size_t align) override {
            allocations++;
            return std::pmr::new_delete_resource()->allocate(bytes, align);
        }

        void do_deallocate(void* p, size_t bytes, size_t align) override {
            std::pmr::new_delete_resource()->deallocate(p, bytes, align);
        }

        bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override { return this == &other; }
    };

    struct user {
        std::string name;
        int age;
        std::string email;
    };

    struct address {
        std::string street;
        std::string city;
    };

    struct person {
        std::string name;
        address home;
    };

    Sieve::decoder<user> user_object() {
        return Sieve::Decode::object([](const Sieve::Decode::getters& get) {
            return user{
                get.required.field("firstname", Sieve::Decode::string()),
                get.required.field("age", Sieve::Decode::int32()),
                get.optional.field("email", Sieve::Decode::string(), "none"),
            };
        });
    }

    Sieve::decoder<user> user_pipeline() {
        return Sieve::Decode::pipeline<>{}
            .required("firstname", Sieve::Decode::string())
            .required("age", Sieve::Decode::int32())
            .optional("email", Sieve::Decode::string(), "none")
            .into([](std::string name, int age, std::string email) {
                return user{ std::move(name), age, std::move(email) };
            });
    }
}

using Sieve::DecodeError;
namespace Decode = Sieve::Decode;


TEST_CASE("object Builds a Record From Required Fields") {
    auto r = user_object()(json(R"({"firstname":"maxime","age":25})"));
    REQUIRE(r);
    REQUIRE(r->name == "maxime");
    REQUIRE(r->age == 25);
    REQUIRE(r->email == "none");
}

TEST_CASE("object Reports the Missing Required Field") {
    auto r = user_object()(json(R"({"firstname":"maxime"})"));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == DecodeError::code::bad_field);
    REQUIRE(r.error().message().find("`age`") != std::string::npos);
}

TEST_CASE("object Stops at the First Failing Getter") {
    int calls = 0;
    Sieve::decoder<int> counted{ [&calls](const Sieve::value& v) -> Sieve::decode_result<int> {
        calls++;
        return Decode::int32()(v);
    } };

    struct pair { int first; int second; };
    auto d = Decode::object([&](const Decode::getters& get) {
        return pair{
            get.required.field("missing", Decode::int32()),
            get.required.field("x", counted),
        };
    });

    auto r = d(json(R"({"x":1})"));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().expected == "an object with a field named `missing`");
    REQUIRE(calls == 0);

    auto reversed = Decode::object([&](const Decode::getters& get) {
        return pair{
            get.required.field("x", counted),
            get.required.field("y", counted),
        };
    });
    REQUIRE(reversed(json(R"({"x":1,"y":2})")));
    REQUIRE(calls == 2);
}

TEST_CASE("object Required Getters by Path and Index") {
    auto d = Decode::object([](const Decode::getters& get) {
        return std::pair{
            get.required.at({ "user", "name" }, Decode::string()),
            get.required.index(1, Decode::int32()),
        };
    });

    auto by_path = Decode::object([](const Decode::getters& get) {
        return get.required.at({ "user", "name" }, Decode::string());
    });
    REQUIRE(by_path(json(R"({"user":{"name":"maxime"}})")) == "maxime");

    auto by_index = Decode::object([](const Decode::getters& get) {
        return get.required.index(1, Decode::int32());
    });
    REQUIRE(by_index(json("[10,20]")) == 20);
    REQUIRE(by_index(json("[10]")).error().errc == DecodeError::code::too_small_array);

    REQUIRE(d(json("[10,20]")).error().errc == DecodeError::code::bad_type);
}

TEST_CASE("object Optional Getters Fall Back on Absence") {
    auto d = Decode::object([](const Decode::getters& get) {
        return user{
            get.optional.field("firstname", Decode::string(), "anonymous"),
            get.optional.at({ "stats", "age" }, Decode::int32(), -1),
            get.optional.field("email", Decode::string(), "none"),
        };
    });

    auto empty = d(json("{}"));
    REQUIRE(empty);
    REQUIRE(empty->name == "anonymous");
    REQUIRE(empty->age == -1);
    REQUIRE(empty->email == "none");

    auto missing_leaf = d(json(R"({"stats":{}})"));
    REQUIRE(missing_leaf);
    REQUIRE(missing_leaf->age == -1);

    auto full = d(json(R"({"firstname":"maxime","stats":{"age":25},"email":"m@x.fr"})"));
    REQUIRE(full);
    REQUIRE(full->name == "maxime");
    REQUIRE(full->age == 25);
    REQUIRE(full->email == "m@x.fr");
}

TEST_CASE("object Optional Getters Treat null as Absent") {
    auto d = Decode::object([](const Decode::getters& get) {
        return get.optional.field("age", Decode::int32(), 0);
    });
    REQUIRE(d(json(R"({"age":null})")) == 0);

    // A decoder that accepts null keeps its own result
    auto nil_aware = Decode::object([](const Decode::getters& get) {
        return get.optional.field("age", Decode::nil(7), 0);
    });
    REQUIRE(nil_aware(json(R"({"age":null})")) == 7);
}

TEST_CASE("object Optional Getters Reject Malformed Data") {
    auto field = Decode::object([](const Decode::getters& get) {
        return get.optional.field("age", Decode::int32(), 0);
    });
    REQUIRE(field(json(R"({"age":"25"})")).error().errc == DecodeError::code::bad_primitive);
    REQUIRE(field(json("[1]")).error().errc == DecodeError::code::bad_type);

    auto path = Decode::object([](const Decode::getters& get) {
        return get.optional.at({ "stats", "age" }, Decode::int32(), 0);
    });
    auto mid_path = path(json(R"({"stats":5})"));
    REQUIRE_FALSE(mid_path);
    REQUIRE(mid_path.error().errc == DecodeError::code::bad_type);
    REQUIRE(mid_path.error().expected == "an object at `stats`");

    auto index = Decode::object([](const Decode::getters& get) {
        return get.optional.index(3, Decode::int32(), 0);
    });
    REQUIRE(index(json("[1]")) == 0);
    REQUIRE(index(json("[1,2,3,4]")) == 4);
    REQUIRE(index(json(R"({"3":1})")).error().errc == DecodeError::code::bad_primitive);
}

TEST_CASE("object Nests With Independent Aborts") {
    auto address_decoder = Decode::object([](const Decode::getters& get) {
        return address{
            get.required.field("street", Decode::string()),
            get.required.field("city", Decode::string()),
        };
    });

    auto person_decoder = Decode::object([&](const Decode::getters& get) {
        return person{
            get.required.field("name", Decode::string()),
            get.required.field("address", address_decoder),
        };
    });

    auto ok = person_decoder(json(R"({"name":"maxime","address":{"street":"main road","city":"Bordeaux"}})"));
    REQUIRE(ok);
    REQUIRE(ok->home.city == "Bordeaux");

    auto inner = person_decoder(json(R"({"name":"maxime","address":{"street":"main road"}})"));
    REQUIRE_FALSE(inner);
    REQUIRE(inner.error().errc == DecodeError::code::bad_field);
    REQUIRE(inner.error().expected == "an object with a field named `city`");
}

TEST_CASE("object Inner Builder Using Outer Getters Stops at the Outer Decode") {
    auto outer = Decode::object([](const Decode::getters& outer_get) {
        auto inner = Decode::object([&outer_get](const Decode::getters&) {
            return outer_get.required.field("root_only", Decode::int32());
        });
        return outer_get.required.field("child", inner);
    });

    auto r = outer(json(R"({"child":{}})"));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == DecodeError::code::bad_field);
    REQUIRE(r.error().expected == "an object with a field named `root_only`");

    REQUIRE(outer(json(R"({"child":{},"root_only":3})")) == 3);
}

TEST_CASE("one_of Falls Through When an Outer Getter Fails in an Alternative") {
    auto outer = Decode::object([](const Decode::getters& outer_get) {
        auto borrowed = Decode::object([&outer_get](const Decode::getters&) {
            return outer_get.required.field("missing", Decode::int32());
        });
        return outer_get.required.field("child", Decode::one_of({ borrowed, Decode::succeed(5) }));
    });

    REQUIRE(outer(json(R"({"child":{}})")) == 5);
    REQUIRE(outer(json(R"({"child":{},"missing":2})")) == 2);

    auto every_alternative_fails = Decode::object([](const Decode::getters& outer_get) {
        auto borrowed = Decode::object([&outer_get](const Decode::getters&) {
            return outer_get.required.field("missing", Decode::int32());
        });
        return outer_get.required.field("child", Decode::one_of({ borrowed, Decode::fail<int>("no luck") }));
    });

    auto r = every_alternative_fails(json(R"({"child":{}})"));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == DecodeError::code::bad_one_of);
    REQUIRE(r.error().messages.size() == 2);
    REQUIRE(r.error().messages[0].starts_with("Expecting an object with a field named `missing` but instead got:"));
    REQUIRE(r.error().messages[1] == "I run into a `fail` decoder.\nno luck");
}

TEST_CASE("one_of Inside a Builder Keeps Its Own Alternatives") {
    auto d = Decode::one_of({
        Decode::object([](const Decode::getters& get) { return get.required.field("a", Decode::int32()); }),
        Decode::succeed(7),
    });
    REQUIRE(d(json("{}")) == 7);
}

TEST_CASE("object Lets Builder Exceptions Reach run") {
    auto d = Decode::object([](const Decode::getters& get) -> int {
        if (get.required.field("age", Decode::int32()) < 0) throw std::invalid_argument("negative age");
        return 1;
    });

    auto r = Sieve::run(d, json(R"({"age":-3})"));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == DecodeError::code::direct);
    REQUIRE(r.error().message() == "negative age");

    auto aborted = Sieve::run(d, json(R"({})"));
    REQUIRE(aborted.error().errc == DecodeError::code::bad_field);
}

TEST_CASE("pipeline Matches the object Builder") {
    for (auto text : {
        R"({"firstname":"maxime","age":25})",
        R"({"firstname":"maxime","age":25,"email":"m@x.fr"})",
        R"({"firstname":"maxime","age":25,"email":null})",
    }) {
        INFO("decoding: " << text);
        auto a = user_object()(json(text));
        auto b = user_pipeline()(json(text));
        REQUIRE(a);
        REQUIRE(b);
        REQUIRE(a->name == b->name);
        REQUIRE(a->age == b->age);
        REQUIRE(a->email == b->email);
    }
}

TEST_CASE("pipeline Steps Run Left to Right and Stop at the First Failure") {
    auto d = user_pipeline();

    auto no_name = d(json(R"({"age":"x"})"));
    REQUIRE_FALSE(no_name);
    REQUIRE(no_name.error().expected == "an object with a field named `firstname`");

    auto bad_age = d(json(R"({"firstname":"maxime","age":"x"})"));
    REQUIRE_FALSE(bad_age);
    REQUIRE(bad_age.error().errc == DecodeError::code::bad_primitive);

    auto bad_email = d(json(R"({"firstname":"maxime","age":1,"email":5})"));
    REQUIRE_FALSE(bad_email);
    REQUIRE(bad_email.error().errc == DecodeError::code::bad_primitive);
}

TEST_CASE("pipeline Paths Custom Steps and Constants") {
    struct row {
        std::string city;
        int zip;
        std::string source;
        int count;
    };

    auto d = Decode::pipeline<>{}
        .required_at({ "address", "city" }, Decode::string())
        .optional_at({ "address", "zip" }, Decode::int32(), 0)
        .hardcoded(std::string{ "import" })
        .custom(Decode::field("items", Decode::map([](const std::vector<int>& v) { return static_cast<int>(v.size()); }, Decode::array(Decode::int32()))))
        .into([](std::string city, int zip, std::string source, int count) {
            return row{ std::move(city), zip, std::move(source), count };
        });

    auto r = d(json(R"({"address":{"city":"Bordeaux"},"items":[1,2,3]})"));
    REQUIRE(r);
    REQUIRE(r->city == "Bordeaux");
    REQUIRE(r->zip == 0);
    REQUIRE(r->source == "import");
    REQUIRE(r->count == 3);

    auto missing_city = d(json(R"({"address":{},"items":[]})"));
    REQUIRE(missing_city.error().errc == DecodeError::code::bad_path);

    auto bad_zip = d(json(R"({"address":{"city":"Bordeaux","zip":{"code":1}},"items":[]})"));
    REQUIRE(bad_zip.error().errc == DecodeError::code::bad_primitive);
}

TEST_CASE("pipeline Optional Requires an Object") {
    auto d = Decode::pipeline<>{}
        .optional("a", Decode::int32(), 1)
        .into([](int a) { return a; });

    REQUIRE(d(json("{}")) == 1);
    REQUIRE(d(json(R"({"a":null})")) == 1);
    REQUIRE(d(json(R"({"a":2})")) == 2);

    auto not_object = d(json("[1]"));
    REQUIRE_FALSE(not_object);
    REQUIRE(not_object.error().errc == DecodeError::code::bad_type);
    REQUIRE(not_object.error().expected == "an object");

    auto path = Decode::pipeline<>{}
        .optional_at({ "a", "b" }, Decode::int32(), 1)
        .into([](int b) { return b; });

    REQUIRE(path(json(R"({"a":{}})")) == 1);
    REQUIRE(path(json("null")).error().errc == DecodeError::code::bad_type);
    REQUIRE(path(json(R"({"a":[]})")).error().expected == "an object at `a`");
}

TEST_CASE("Optional Lookups Recover From Absence Without Copying the Input") {
    counting_resource counter;
    Sieve::value doc{ &counter };
    doc["name"] = Sieve::value{ "a string long enough to need its own allocation", &counter };
    doc["tags"].as_array().emplace_back(1.0);

    auto getters_decoder = Decode::object([](const Decode::getters& get) {
        return std::pair{
            get.optional.field("email", Decode::string(), "none"),
            get.optional.at({ "meta", "id" }, Decode::int32(), 0),
        };
    });
    auto pipeline_decoder = Decode::pipeline<>{}
        .optional("email", Decode::string(), "none")
        .optional_at({ "meta", "id" }, Decode::int32(), 0)
        .into([](std::string email, int id) { return std::pair{ std::move(email), id }; });

    const size_t before = counter.allocations;

    auto from_getters = getters_decoder(doc);
    REQUIRE(from_getters);
    REQUIRE(from_getters->first == "none");
    REQUIRE(from_getters->second == 0);

    auto from_pipeline = pipeline_decoder(doc);
    REQUIRE(from_pipeline);
    REQUIRE(from_pipeline->first == "none");

    REQUIRE(counter.allocations == before);
}

TEST_CASE("Copies of an Error Share the Reported Value") {
    counting_resource counter;
    Sieve::value doc{ &counter };
    doc["name"] = Sieve::value{ "a string long enough to need its own allocation", &counter };

    auto missing = Decode::field("email", Decode::string())(doc);
    REQUIRE_FALSE(missing);
    const size_t after_error = counter.allocations;

    DecodeError copy = missing.error();
    REQUIRE(copy.actual == missing.error().actual);
    REQUIRE(*copy.actual == doc);
    REQUIRE(counter.allocations == after_error);
}
