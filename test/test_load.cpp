#include <catch2/catch_all.hpp>
#include <ms/marshal.h>

#include "test_models.h"

using namespace ms;
using Catch::Approx;

namespace {
    std::shared_ptr<const SchemaClass> user_factory_schema() {
        static auto cls = SchemaBuilder("UserFactorySchema")
                                      .inherit(models::user_schema())
                                      .objectFactory([](const Dictionary& data) {
                                          auto user = models::make_user(data.get("name", "").asString(),
                                                                        data.get("age", Dictionary::null()));
                                          return models::ref(user);
                                      })
                                      .build();
        return cls;
    }

    std::shared_ptr<const models::User> as_user(const Dictionary& d) {
        return std::dynamic_pointer_cast<const models::User>(d.asReference());
    }
}  // namespace

TEST_CASE("Load returns converted fields") {
    Schema schema(models::user_schema());
    auto result = schema.load(Dictionary{{"name", "Monty"}, {"age", "42.3"}, {"registered", "yes"}});
    REQUIRE(result.errors.empty());
    REQUIRE(result.data.at("name") == "Monty");
    REQUIRE(result.data.at("age").asDouble() == Approx(42.3));
    REQUIRE(result.data.at("registered") == true);
    REQUIRE(result.data.size() == 3);
}

TEST_CASE("Load materializes objects through the factory") {
    Schema schema(user_factory_schema());

    SECTION("From a mapping") {
        auto result = schema.load(Dictionary{{"name", "Monty"}});
        REQUIRE(result.errors.empty());
        REQUIRE(result.data.isReference());
        REQUIRE(as_user(result.data)->name == "Monty");
    }
    SECTION("From json text") {
        auto result = schema.loads(R"({"name": "Monty", "age": "42.3"})");
        REQUIRE(result.errors.empty());
        auto user = as_user(result.data);
        REQUIRE(user->name == "Monty");
        REQUIRE(user->age.asDouble() == Approx(42.3));
    }
    SECTION("Not when there are errors") {
        auto result = schema.load(Dictionary{{"name", "Monty"}, {"email", "foo"}});
        REQUIRE(result.data.isMappedObject());
        REQUIRE(result.data.at("name") == "Monty");
        REQUIRE(result.errors.has("email"));
    }
}

TEST_CASE("Dumped values load back") {
    auto cls = SchemaBuilder("RoundTripSchema")
                           .field("name", fields::String())
                           .field("age", fields::Integer())
                           .field("score", fields::Float())
                           .field("tags", fields::List(fields::String()))
                           .field("active", fields::Boolean())
                           .field("homepage", fields::Url())
                           .field("created", fields::DateTime())
                           .build();
    Schema schema(cls);
    Dictionary original = {{"name", "Monty"},
                           {"age", 42},
                           {"score", 9.5},
                           {"tags", Dictionary::array({"a", "b"})},
                           {"active", true},
                           {"homepage", "http://example.org/"},
                           {"created", Timestamp{2013, 11, 10, 14, 20, 58, 0, 0}}};
    auto dumped = schema.dump(original);
    REQUIRE(dumped.errors.empty());
    auto loaded = schema.load(dumped.data);
    REQUIRE(loaded.errors.empty());
    REQUIRE(loaded.data == original);
}

TEST_CASE("Missing versus null on required fields") {
    auto cls = SchemaBuilder("RequiredUserSchema").field("name", fields::Raw().required()).build();
    Schema schema(cls);

    auto missing = schema.load(Dictionary::object());
    REQUIRE(missing.errors == Dictionary{{"name", Dictionary::array({"Missing data for required field."})}});

    auto null = schema.load(Dictionary{{"name", Dictionary::null()}});
    REQUIRE(null.errors.empty());
    REQUIRE(null.data.at("name").isNull());

    SECTION("Required is not checked on dump") {
        REQUIRE(schema.dump(Dictionary::object()).errors.empty());
    }
}

TEST_CASE("Required field with a custom validator") {
    auto cls = SchemaBuilder("ValidatingSchema")
                           .field("color", fields::String().required().validate([](const Dictionary& v) {
                               return v == "red" or v == "blue";
                           }).error("Color must be red or blue"))
                           .build();
    Schema schema(cls);
    REQUIRE(schema.load(Dictionary::object()).errors.at("color").at(0) == "Missing data for required field.");
    REQUIRE(schema.load(Dictionary{{"color", "green"}}).errors.at("color").at(0) == "Color must be red or blue");
    REQUIRE(schema.load(Dictionary{{"color", "red"}}).errors.empty());
}

TEST_CASE("Invalid email on a required field") {
    auto cls = SchemaBuilder("EmailSchema").field("email", fields::Email().required()).build();
    Schema schema(cls);
    auto result = schema.load(Dictionary{{"email", "not-an-email"}});
    REQUIRE(result.errors ==
            Dictionary{{"email", Dictionary::array({"\"not-an-email\" is not a valid email address."})}});
    REQUIRE_FALSE(result.data.has("email"));
}

TEST_CASE("Load rejects input that is not a mapping") {
    Schema schema(models::user_schema());
    auto result = schema.load(Dictionary("Monty"));
    REQUIRE(result.errors.at(SCHEMA_ERRORS_KEY).at(0) == "Invalid input type: expected a mapping.");
}

TEST_CASE("Loading many") {
    auto cls = SchemaBuilder("ManyAgeSchema")
                           .field("name", fields::String())
                           .field("age", fields::Integer().validate([](const Dictionary& v) { return v.asInt() >= 0; }))
                           .build();
    SchemaArgs args;
    args.many = true;
    Schema schema(cls, args);

    SECTION("Errors are keyed by the failing indices") {
        auto result = schema.load(Dictionary::array({Dictionary{{"name", "Mick"}, {"age", -1}},
                                                     Dictionary{{"name", "Keith"}, {"age", 12}},
                                                     Dictionary{{"name", "Ron"}, {"age", "abc"}}}));
        REQUIRE(result.errors.keys() == std::vector<std::string>{"0", "2"});
        REQUIRE(result.errors.at("0") == Dictionary{{"age", Dictionary::array({"Invalid value."})}});
        REQUIRE(result.errors.at("2").at("age").at(0) == "'abc' cannot be formatted as an integer.");
        REQUIRE(result.data.size() == 3);
        REQUIRE(result.data.at(1).at("age") == 12);
        REQUIRE_FALSE(result.data.at(0).has("age"));
    }
    SECTION("A mapping is not a list") {
        auto result = schema.load(Dictionary{{"name", "Mick"}});
        REQUIRE(result.errors.at(SCHEMA_ERRORS_KEY).at(0) == "Invalid input type: expected a list.");
        REQUIRE(result.data == Dictionary::array());
    }
}

TEST_CASE("A throwing field validator is a field error") {
    auto cls = SchemaBuilder("ThrowingValidator")
                           .field("email", fields::Email())
                           .field("age", fields::Integer().validate([](const Dictionary& v) { return v.asInt() >= 0; }))
                           .field("name", fields::String())
                           .build();
    Schema schema(cls);
    UnmarshalResult result;
    REQUIRE_NOTHROW(result = schema.load(Dictionary{{"email", "foo"}, {"age", Dictionary::null()}, {"name", "Monty"}}));
    REQUIRE(result.errors.keys() == std::vector<std::string>{"email", "age"});
    REQUIRE(result.errors.at("age").at(0) == "not an int");
    REQUIRE(result.data == Dictionary{{"name", "Monty"}});

    SECTION("The error override replaces the message") {
        auto custom = SchemaBuilder("ThrowingValidatorMessage")
                                  .field("age", fields::Integer()
                                                        .validate([](const Dictionary& v) { return v.asInt() >= 0; })
                                                        .error("Age must be a positive number"))
                                  .build();
        Schema other(custom);
        REQUIRE(other.load(Dictionary{{"age", Dictionary::null()}}).errors.at("age").at(0) ==
                "Age must be a positive number");
    }
}

TEST_CASE("Pass-through fields load values unchanged") {
    auto cls = SchemaBuilder("PassThrough").field("anything", fields::Raw()).build();
    Schema schema(cls);
    Dictionary nested = {{"a", Dictionary::array({1, 2})}};
    REQUIRE(schema.load(Dictionary{{"anything", nested}}).data.at("anything") == nested);
}
