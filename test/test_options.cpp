#include <catch2/catch_all.hpp>
#include <ms/marshal.h>

#include "test_models.h"

using namespace ms;
using namespace ms::fields;
using Catch::Matchers::ContainsSubstring;

namespace {
    std::vector<std::string> names_of(const FieldList& fields) {
        std::vector<std::string> names;
        for (auto const& entry : fields) names.push_back(entry.first);
        return names;
    }
}  // namespace

TEST_CASE("Schema inheritance") {
    auto a = SchemaBuilder("InheritA").field("field_a", Integer()).build();

    SECTION("Fields of the base come first") {
        auto b = SchemaBuilder("InheritB").inherit(a).field("field_b", String()).build();
        REQUIRE(names_of(b->declaredFields()) == std::vector<std::string>{"field_a", "field_b"});
        REQUIRE(names_of(b->ownFields()) == std::vector<std::string>{"field_b"});
    }
    SECTION("Redeclared fields keep their slot") {
        auto b = SchemaBuilder("RedeclareB").inherit(a).field("field_b", String()).field("field_a", String()).build();
        REQUIRE(names_of(b->declaredFields()) == std::vector<std::string>{"field_a", "field_b"});
        REQUIRE(b->declaredFields().front().second->kind() == "String");
    }
    SECTION("Diamond") {
        auto b = SchemaBuilder("DiamondB").inherit(a).field("field_b", Integer()).build();
        auto c = SchemaBuilder("DiamondC").inherit(a).field("field_c", Integer()).build();
        auto d = SchemaBuilder("DiamondD").inherit(b).inherit(c).field("field_d", Integer()).build();
        REQUIRE(names_of(d->declaredFields()) == std::vector<std::string>{"field_a", "field_c", "field_b", "field_d"});

        std::vector<std::string> order;
        for (auto const& cls : d->mro()) order.push_back(cls->name());
        REQUIRE(order == std::vector<std::string>{"DiamondD", "DiamondB", "DiamondC", "InheritA"});
    }
    SECTION("Inconsistent hierarchies are rejected") {
        auto b = SchemaBuilder("OrderB").inherit(a).build();
        REQUIRE_THROWS_AS(SchemaBuilder("OrderX").inherit(a).inherit(b).build(), SchemaDefinitionError);
    }
    SECTION("Methods are inherited") {
        auto derived = SchemaBuilder("DerivedUserSchema").inherit(models::user_schema()).build();
        Schema schema(derived);
        auto data = schema.dump(models::ref(models::make_user("Monty", 81))).data;
        REQUIRE(data.at("is_old") == true);
    }
    SECTION("Null bases are rejected") {
        REQUIRE_THROWS_AS(SchemaBuilder("NullBase").inherit(nullptr), SchemaDefinitionError);
    }
}

TEST_CASE("Schema class registry") {
    REQUIRE(SchemaClass::lookup("UserSchema") == models::user_schema());
    REQUIRE(SchemaClass::lookup("NoSuchSchemaClass") == nullptr);
    {
        auto temporary = SchemaBuilder("TemporarySchema").field("name", String()).build();
        REQUIRE(SchemaClass::lookup("TemporarySchema") == temporary);
    }
    REQUIRE(SchemaClass::lookup("TemporarySchema") == nullptr);
}

TEST_CASE("The fields option") {
    auto user = models::make_user("Monty", 42);

    SECTION("Undeclared names are passed through") {
        auto cls = SchemaBuilder("FieldsOptionSchema")
                               .meta(Dictionary{{"fields", Dictionary::array({"name", "email", "age", "created"})}})
                               .build();
        Schema schema(cls);
        auto result = schema.dump(models::ref(user));
        REQUIRE(result.errors.empty());
        REQUIRE(result.data.keys() == std::vector<std::string>{"name", "email", "age", "created"});
        REQUIRE(result.data.at("email") == "monty@python.org");
        REQUIRE(result.data.at("age") == 42);
        REQUIRE(result.data.at("created") == "2013-11-10T14:20:58+00:00");
        REQUIRE(schema.field("name").kind() == "Inferred");
    }
    SECTION("Declared fields are used when listed") {
        auto cls = SchemaBuilder("FieldsWithDeclared")
                               .field("uppername", models::Uppercased().attribute("name"))
                               .field("ignored", String().attribute("name"))
                               .meta(Dictionary{{"fields", Dictionary::array({"name", "uppername"})}})
                               .build();
        Schema schema(cls);
        auto data = schema.dump(models::ref(user)).data;
        REQUIRE(data == Dictionary{{"name", "Monty"}, {"uppername", "MONTY"}});
    }
    SECTION("Missing attributes are not data errors") {
        auto cls = SchemaBuilder("MissingAttrSchema")
                               .meta(Dictionary{{"fields", Dictionary::array({"name", "nope"})}})
                               .build();
        Schema schema(cls);
        try {
            schema.dump(models::ref(user));
            FAIL("expected an AttributeLookupError");
        } catch (const AttributeLookupError& e) {
            REQUIRE(e.attribute == "nope");
        }
    }
    SECTION("Inherited by subclasses") {
        auto base = SchemaBuilder("FieldsBase").meta(Dictionary{{"fields", Dictionary::array({"name", "email"})}}).build();
        auto derived = SchemaBuilder("FieldsDerived").inherit(base).build();
        Schema schema(derived);
        REQUIRE(schema.fieldNames() == std::vector<std::string>{"name", "email"});
    }
    SECTION("Subclass options win") {
        auto base = SchemaBuilder("OptionsBase").meta(Dictionary{{"fields", Dictionary::array({"name", "email"})}}).build();
        auto derived = SchemaBuilder("OptionsDerived")
                                   .inherit(base)
                                   .meta(Dictionary{{"additional", Dictionary::array({"age"})}})
                                   .build();
        REQUIRE(derived->options().additional);
        REQUIRE_FALSE(derived->options().fields);
        Schema schema(derived);
        REQUIRE(schema.fieldNames() == std::vector<std::string>{"age"});
    }
}

TEST_CASE("The additional option") {
    auto cls = SchemaBuilder("AdditionalSchema")
                           .field("lowername", Function(FunctionFn([](const Dictionary& obj) {
                                      return Dictionary(resolve(obj, "email")->asString());
                                  })))
                           .meta(Dictionary{{"additional", Dictionary::array({"name", "age", "lowername"})}})
                           .build();
    Schema schema(cls);
    REQUIRE(schema.fieldNames() == std::vector<std::string>{"lowername", "name", "age"});
    auto data = schema.dump(models::ref(models::make_user("Monty", 42))).data;
    REQUIRE(data.at("lowername") == "monty@python.org");
    REQUIRE(data.at("age") == 42);
}

TEST_CASE("The exclude option") {
    SECTION("On the class") {
        auto cls = SchemaBuilder("ExcludeOptionSchema")
                               .inherit(models::user_schema())
                               .meta(Dictionary{{"exclude", Dictionary::array({"created", "updated"})}})
                               .build();
        Schema schema(cls);
        auto names = schema.fieldNames();
        REQUIRE(std::find(names.begin(), names.end(), "created") == names.end());
        REQUIRE(std::find(names.begin(), names.end(), "updated") == names.end());
        REQUIRE(std::find(names.begin(), names.end(), "created_iso") != names.end());
    }
    SECTION("Applies after fields and additional") {
        auto cls = SchemaBuilder("ExcludeAfterFields")
                               .meta(Dictionary{{"fields", Dictionary::array({"name", "email"})},
                                                {"exclude", Dictionary::array({"email"})}})
                               .build();
        REQUIRE(Schema(cls).fieldNames() == std::vector<std::string>{"name"});
    }
    SECTION("On the instance") {
        SchemaArgs args;
        args.exclude = {"email", "name"};
        Schema schema(models::user_schema(), args);
        auto data = schema.dump(models::ref(models::make_user("Monty"))).data;
        REQUIRE_FALSE(data.has("email"));
        REQUIRE_FALSE(data.has("name"));
        REQUIRE(data.has("uppername"));
    }
}

TEST_CASE("Option values are checked") {
    SECTION("Lists of names") {
        REQUIRE_THROWS_AS(SchemaBuilder("BadFields").meta(Dictionary{{"fields", "name"}}), SchemaDefinitionError);
        REQUIRE_THROWS_AS(SchemaBuilder("BadAdditional").meta(Dictionary{{"additional", "email"}}),
                          SchemaDefinitionError);
        REQUIRE_THROWS_AS(SchemaBuilder("BadExclude").meta(Dictionary{{"exclude", Dictionary::array({1})}}),
                          SchemaDefinitionError);
    }
    SECTION("Fields and additional together") {
        REQUIRE_THROWS_WITH(SchemaBuilder("BothOptions")
                                        .meta(Dictionary{{"fields", Dictionary::array({"name"})},
                                                         {"additional", Dictionary::array({"email"})}})
                                        .build(),
                            ContainsSubstring("Cannot set both"));
    }
    SECTION("Flags and formats") {
        REQUIRE_THROWS_AS(SchemaBuilder("BadStrict").meta(Dictionary{{"strict", "yes"}}), SchemaDefinitionError);
        REQUIRE_THROWS_AS(SchemaBuilder("BadDateformat").meta(Dictionary{{"dateformat", 3}}), SchemaDefinitionError);
    }
    SECTION("Unknown options") {
        REQUIRE_THROWS_WITH(SchemaBuilder("Unknown").meta(Dictionary{{"ordered", true}}),
                            ContainsSubstring("unknown schema option 'ordered'"));
    }
}

TEST_CASE("The dateformat option") {
    auto user = models::make_user("Monty");
    auto cls = SchemaBuilder("DateFormatSchema")
                           .field("created", DateTime())
                           .field("updated", DateTime("%m-%d"))
                           .meta(Dictionary{{"dateformat", "%Y-%m"}, {"additional", Dictionary::array({"birthdate"})}})
                           .build();
    Schema schema(cls);
    auto data = schema.dump(models::ref(user)).data;
    REQUIRE(data.at("created") == "2013-11");
    REQUIRE(data.at("updated") == "11-10");
    REQUIRE(data.at("birthdate") == "2013-01");

    SECTION("Inherited") {
        auto derived = SchemaBuilder("DateFormatDerived").inherit(cls).build();
        Schema child(derived);
        REQUIRE(child.dump(models::ref(user)).data.at("created") == "2013-11");
    }
}

TEST_CASE("The skip_missing option") {
    auto cls = SchemaBuilder("SkipMissingSchema")
                           .field("name", String())
                           .field("email", Email())
                           .field("age", Integer().defaultValue(Dictionary::null()))
                           .field("count", Integer().defaultValue(5))
                           .field("nick", String())
                           .meta(Dictionary{{"skip_missing", true}})
                           .build();
    Schema schema(cls);
    auto data = schema.dump(Dictionary{{"name", "Monty"}, {"email", Dictionary::null()}, {"nick", ""}}).data;
    REQUIRE(data == Dictionary{{"name", "Monty"}, {"count", 5}, {"nick", ""}});

    SECTION("Without the option missing values are emitted") {
        auto plain = SchemaBuilder("NoSkipSchema").inherit(cls).meta(Dictionary{{"skip_missing", false}}).build();
        Schema other(plain);
        auto all = other.dump(Dictionary{{"name", "Monty"}}).data;
        REQUIRE(all.keys() == std::vector<std::string>{"name", "email", "age", "count", "nick"});
        REQUIRE(all.at("age").isNull());
    }
}

TEST_CASE("Schema instance arguments") {
    SECTION("Unknown only names") {
        SchemaArgs args;
        args.only = std::vector<std::string>{"name", "nope"};
        REQUIRE_THROWS_WITH(Schema(models::user_schema(), args), ContainsSubstring("'nope'"));
    }
    SECTION("Unknown field lookups") {
        Schema schema(models::user_schema());
        REQUIRE_THROWS_AS(schema.field("nope"), std::out_of_range);
        REQUIRE(schema.field("email").kind() == "Email");
    }
    SECTION("Null schema classes") {
        REQUIRE_THROWS_AS(Schema(nullptr), SchemaDefinitionError);
    }
}
