// test_array_ops.cpp - Tests for Array matching and CRUD operations
// Module 5: Array matcher

#include <catch2/catch_all.hpp>
#include <jsonb_delta/array_ops.h>
#include <jsonb_delta/builders.h>
#include <jsonb_delta/path_core.h>
#include <jsonb_delta/value.h>

#include <string>
#include <vector>

using namespace jsonb_delta;

// ============================================================
// Helper Functions
// ============================================================

namespace {

Value orders_doc() {
    return Value::object({{"orders", Value::array({
        Value::object({{"id", 1}, {"status", "new"}}),
        Value::object({{"id", 2}, {"status", "new"}}),
    })}});
}

/// [{"id": 0}, {"id": 1}, ...] wrapped as {"items": [...]}
Value numbered_items(int count) {
    ArrayBuilder items;
    for (int i = 0; i < count; ++i) {
        items.push_back(Value::object({{"id", i}, {"label", "item-" + std::to_string(i)}}));
    }
    return Value::object({{"items", items.finish()}});
}

/// {"k": {"k": ... {"k": leaf}}} with @p levels objects
Value nested_objects(std::size_t levels, int leaf) {
    Value v{leaf};
    for (std::size_t i = 0; i < levels; ++i) {
        v = Value::object({{"k", v}});
    }
    return v;
}

const ValueArray& array_at(const Value& doc, const char* key) {
    return *doc.find(key)->get_if<ValueArray>();
}

} // namespace

// ============================================================
// Find Tests
// ============================================================

TEST_CASE("find_where", "[array][find]") {
    auto doc = orders_doc();

    SECTION("first match") {
        REQUIRE(find_where(doc, "orders", "id", Value{2}).value() == std::size_t{1});
    }

    SECTION("numeric equality across representations") {
        REQUIRE(find_where(doc, "orders", "id", Value{2.0}).value() == std::size_t{1});
    }

    SECTION("no match") {
        REQUIRE_FALSE(find_where(doc, "orders", "id", Value{3}).value().has_value());
        REQUIRE_FALSE(find_where(doc, "orders", "id", Value{"1"}).value().has_value());
    }

    SECTION("non-object elements are skipped") {
        auto mixed = Value::array({1, "x", Value::array({}), Value::object({{"id", 7}})});
        REQUIRE(find_where(*mixed.get_if<ValueArray>(), "id", Value{7}) == std::size_t{3});
    }

    SECTION("missing or non-array path") {
        REQUIRE_FALSE(find_where(doc, "missing", "id", Value{1}).value().has_value());
        REQUIRE_FALSE(find_where(doc, "orders[0]", "id", Value{1}).value().has_value());
    }

    SECTION("root array through an empty Path") {
        auto root = Value::array({Value::object({{"k", "a"}}), Value::object({{"k", "b"}})});
        REQUIRE(find_where(root, Path{}, "k", Value{"b"}).value() == std::size_t{1});
    }

    SECTION("string paths must not be empty") {
        REQUIRE(find_where(doc, "", "id", Value{1}).error_code() == ErrorCode::ParseError);
    }
}

TEST_CASE("find_where integer fast path matches the generic scan", "[array][find]") {
    auto doc = numbered_items(100);
    const auto& items = array_at(doc, "items");

    SECTION("every position, including the unrolled remainder") {
        for (int id = 0; id < 100; ++id) {
            REQUIRE(find_where(items, "id", Value{id}) == static_cast<std::size_t>(id));
        }
    }

    SECTION("absent id") {
        REQUIRE_FALSE(find_where(items, "id", Value{100}).has_value());
        REQUIRE_FALSE(find_where(items, "id", Value{-1}).has_value());
    }

    SECTION("integral double takes the same path") {
        REQUIRE(find_where(items, "id", Value{42.0}) == std::size_t{42});
    }

    SECTION("string ids never match integer fields") {
        REQUIRE_FALSE(find_where(items, "id", Value{"42"}).has_value());
    }

    SECTION("first of several duplicates") {
        auto dup = set_at_path(doc, "items[90].id", Value{5}).value();
        REQUIRE(find_where(array_at(dup, "items"), "id", Value{5}) == std::size_t{5});
    }
}

TEST_CASE("contains_id", "[array][find]") {
    auto doc = Value::object({{"posts", Value::array({
        Value::object({{"id", 1}}),
        Value::object({{"id", "550e8400"}}),
    })}});

    REQUIRE(contains_id(doc, "posts", "id", Value{1}).value());
    REQUIRE(contains_id(doc, "posts", "id", Value{"550e8400"}).value());
    REQUIRE_FALSE(contains_id(doc, "posts", "id", Value{999}).value());
    REQUIRE_FALSE(contains_id(doc, "other", "id", Value{1}).value());
}

TEST_CASE("extract_id", "[array][find]") {
    REQUIRE(extract_id(Value::object({{"id", "abc"}})) == std::string{"abc"});
    REQUIRE(extract_id(Value::object({{"id", 42}})) == std::string{"42"});
    REQUIRE(extract_id(Value::object({{"company_id", 7}}), "company_id") == std::string{"7"});
    REQUIRE_FALSE(extract_id(Value::object({{"id", true}})).has_value());
    REQUIRE_FALSE(extract_id(Value::object({{"id", nullptr}})).has_value());
    REQUIRE_FALSE(extract_id(Value::object({{"other", 1}})).has_value());
    REQUIRE_FALSE(extract_id(Value::array({1})).has_value());
}

// ============================================================
// Update Tests
// ============================================================

TEST_CASE("update_where", "[array][update]") {
    auto doc = orders_doc();
    auto updates = Value::object({{"status", "shipped"}});

    SECTION("patches exactly one element and keeps order") {
        auto result = update_where(doc, "orders", "id", Value{1}, updates).value();
        REQUIRE(result == Value::object({{"orders", Value::array({
            Value::object({{"id", 1}, {"status", "shipped"}}),
            Value::object({{"id", 2}, {"status", "new"}}),
        })}}));
    }

    SECTION("only the first of duplicate matches") {
        auto dup = Value::object({{"orders", Value::array({
            Value::object({{"id", 1}, {"n", 0}}),
            Value::object({{"id", 1}, {"n", 0}}),
        })}});
        auto result = update_where(dup, "orders", "id", Value{1}, Value::object({{"n", 1}})).value();
        REQUIRE(*get_at_path(result, "orders[0].n").value() == Value{1});
        REQUIRE(*get_at_path(result, "orders[1].n").value() == Value{0});
    }

    SECTION("untouched elements are shared") {
        auto result = update_where(doc, "orders", "id", Value{1}, updates).value();
        REQUIRE(&array_at(result, "orders")[1].get() == &array_at(doc, "orders")[1].get());
    }

    SECTION("absent path is a no-op") {
        auto result = update_where(doc, "missing", "id", Value{1}, updates);
        REQUIRE(result.ok());
        REQUIRE(result.value() == doc);
    }

    SECTION("path to a non-array is a no-op") {
        auto scalar = Value::object({{"orders", 5}});
        REQUIRE(update_where(scalar, "orders", "id", Value{1}, updates).value() == scalar);
    }

    SECTION("no match is a no-op") {
        REQUIRE(update_where(doc, "orders", "id", Value{9}, updates).value() == doc);
    }

    SECTION("updates must be an object") {
        REQUIRE(update_where(doc, "orders", "id", Value{1}, Value{"x"}).error_code() == ErrorCode::TypeMismatch);
    }

    SECTION("absent path ignores the kind of updates") {
        auto result = update_where(doc, "missing", "id", Value{1}, Value{1});
        REQUIRE(result.ok());
        REQUIRE(result.value() == doc);
    }

    SECTION("nested array path") {
        auto nested = Value::object({{"shop", orders_doc()}});
        auto result = update_where(nested, "shop.orders", "id", Value{2}, updates).value();
        REQUIRE(*get_at_path(result, "shop.orders[1].status").value() == Value{"shipped"});
    }
}

TEST_CASE("update_where_path", "[array][update]") {
    auto doc = orders_doc();

    SECTION("writes a nested field, creating objects") {
        auto result = update_where_path(doc, "orders", "id", Value{2}, "shipping.carrier", Value{"ups"}).value();
        REQUIRE(*get_at_path(result, "orders[1].shipping.carrier").value() == Value{"ups"});
        REQUIRE(*get_at_path(result, "orders[1].status").value() == Value{"new"});
    }

    SECTION("empty update path replaces the element") {
        auto result = update_where_path(doc, "orders", "id", Value{1}, "", Value{0}).value();
        REQUIRE(*get_at_path(result, "orders[0]").value() == Value{0});
    }

    SECTION("no match is a no-op") {
        REQUIRE(update_where_path(doc, "orders", "id", Value{5}, "a", Value{1}).value() == doc);
    }

    SECTION("navigator errors inside the element propagate") {
        auto result = update_where_path(doc, "orders", "id", Value{1}, "status.code", Value{1});
        REQUIRE(result.error_code() == ErrorCode::TypeMismatch);
    }

    SECTION("depth counts from the document root") {
        // orders(1) + element(2) + a(3) + b(4)
        REQUIRE(update_where_path(doc, "orders", "id", Value{1}, "a.b", Value{1}, Options{4}).ok());
        REQUIRE(update_where_path(doc, "orders", "id", Value{1}, "a.b", Value{1}, Options{3}).error_code() ==
                ErrorCode::DepthExceeded);
    }
}

TEST_CASE("update_where_batch", "[array][update]") {
    auto doc = numbered_items(10);

    SECTION("applies every entry") {
        auto batch = Value::array({
            Value::object({{"id", 1}, {"label", "one"}}),
            Value::object({{"id", 8}, {"label", "eight"}, {"hot", true}}),
        });
        auto result = update_where_batch(doc, "items", "id", batch).value();
        REQUIRE(*get_at_path(result, "items[1].label").value() == Value{"one"});
        REQUIRE(*get_at_path(result, "items[8].hot").value() == Value{true});
        REQUIRE(*get_at_path(result, "items[2].label").value() == Value{"item-2"});
    }

    SECTION("equivalent to repeated single updates on unique ids") {
        auto batch = Value::array({
            Value::object({{"id", 3}, {"label", "x"}}),
            Value::object({{"id", 0}, {"label", "y"}}),
            Value::object({{"id", 9}, {"label", "z"}}),
        });
        auto expected = doc;
        for (const auto& entry : *batch.get_if<ValueArray>()) {
            expected = update_where(expected, "items", "id", *entry->find("id"), *entry).value();
        }
        REQUIRE(update_where_batch(doc, "items", "id", batch).value() == expected);
    }

    SECTION("later entries override earlier ones for the same id") {
        auto batch = Value::array({
            Value::object({{"id", 4}, {"label", "first"}, {"a", 1}}),
            Value::object({{"id", 4}, {"label", "second"}}),
        });
        auto result = update_where_batch(doc, "items", "id", batch).value();
        REQUIRE(*get_at_path(result, "items[4]").value() ==
                Value::object({{"id", 4}, {"label", "second"}, {"a", 1}}));
    }

    SECTION("entries without the key and non-objects are ignored") {
        auto batch = Value::array({Value::object({{"label", "nobody"}}), 17, "x"});
        REQUIRE(update_where_batch(doc, "items", "id", batch).value() == doc);
    }

    SECTION("updates must be an array") {
        REQUIRE(update_where_batch(doc, "items", "id", Value::object({})).error_code() ==
                ErrorCode::TypeMismatch);
    }

    SECTION("absent path is a no-op") {
        auto batch = Value::array({Value::object({{"id", 1}})});
        REQUIRE(update_where_batch(doc, "nothing", "id", batch).value() == doc);
    }

    SECTION("absent path ignores the kind of updates") {
        auto result = update_where_batch(doc, "nothing", "id", Value{"not an array"});
        REQUIRE(result.ok());
        REQUIRE(result.value() == doc);
    }
}

TEST_CASE("update_multi_row", "[array][update]") {
    std::vector<Value> docs{
        orders_doc(),
        Value::object({{"orders", Value::array({Value::object({{"id", 3}})})}}),
        Value::object({{"other", 1}}),
    };
    auto updates = Value::object({{"status", "done"}});

    SECTION("each document is updated independently") {
        auto results = update_multi_row(docs, "orders", "id", Value{1}, updates).value();
        REQUIRE(results.size() == 3);
        REQUIRE(*get_at_path(results[0], "orders[0].status").value() == Value{"done"});
        REQUIRE(results[1] == docs[1]);
        REQUIRE(results[2] == docs[2]);
    }

    SECTION("an error fails the whole call") {
        REQUIRE(update_multi_row(docs, "orders", "id", Value{1}, Value{1}).error_code() ==
                ErrorCode::TypeMismatch);
    }

    SECTION("empty input") {
        REQUIRE(update_multi_row({}, "orders", "id", Value{1}, updates).value().empty());
    }
}

// ============================================================
// Insert Tests
// ============================================================

TEST_CASE("insert_where", "[array][insert]") {
    auto ranked = Value::object({{"list", Value::array({
        Value::object({{"rank", 1}}),
        Value::object({{"rank", 5}}),
    })}});
    auto element = Value::object({{"id", 5}, {"rank", 3}});

    SECTION("ascending order is maintained") {
        auto result = insert_where(ranked, "list", element, "rank").value();
        REQUIRE(*get_at_path(result, "list").value() == Value::array({
            Value::object({{"rank", 1}}),
            Value::object({{"id", 5}, {"rank", 3}}),
            Value::object({{"rank", 5}}),
        }));
    }

    SECTION("descending order") {
        auto desc = Value::object({{"list", Value::array({
            Value::object({{"rank", 5}}),
            Value::object({{"rank", 1}}),
        })}});
        auto result = insert_where(desc, "list", element, "rank", SortOrder::Descending).value();
        REQUIRE(*get_at_path(result, "list[1]").value() == element);
    }

    SECTION("ties go after existing equal values") {
        auto result = insert_where(ranked, "list", Value::object({{"rank", 1}, {"new", true}}), "rank").value();
        REQUIRE(*get_at_path(result, "list[1].new").value() == Value{true});
    }

    SECTION("largest value is appended") {
        auto result = insert_where(ranked, "list", Value::object({{"rank", 10}}), "rank").value();
        REQUIRE(*get_at_path(result, "list[2].rank").value() == Value{10});
    }

    SECTION("string sort keys") {
        auto names = Value::object({{"list", Value::array({
            Value::object({{"name", "alice"}}),
            Value::object({{"name", "carol"}}),
        })}});
        auto result = insert_where(names, "list", Value::object({{"name", "bob"}}), "name").value();
        REQUIRE(*get_at_path(result, "list[1].name").value() == Value{"bob"});
    }

    SECTION("elements without the sort key are passed over") {
        auto gaps = Value::object({{"list", Value::array({
            Value::object({{"rank", 1}}),
            "note",
            Value::object({{"other", 0}}),
            Value::object({{"rank", 5}}),
        })}});
        auto result = insert_where(gaps, "list", element, "rank").value();
        REQUIRE(*get_at_path(result, "list[3]").value() == element);
    }

    SECTION("element without the sort key is appended") {
        auto result = insert_where(ranked, "list", Value::object({{"id", 1}}), "rank").value();
        REQUIRE(*get_at_path(result, "list[2]").value() == Value::object({{"id", 1}}));
    }

    SECTION("missing array is created") {
        auto result = insert_where(Value::object({}), "list", element, "rank").value();
        REQUIRE(result == Value::object({{"list", Value::array({element})}}));
    }

    SECTION("non-array target is replaced by a new array") {
        auto result = insert_where(Value::object({{"list", 3}}), "list", element, "rank").value();
        REQUIRE(*get_at_path(result, "list").value() == Value::array({element}));
    }

    SECTION("heterogeneous sort values are rejected") {
        auto result = insert_where(ranked, "list", Value::object({{"rank", "3"}}), "rank");
        REQUIRE(result.error_code() == ErrorCode::InvalidSortKey);
    }

    SECTION("unorderable kinds are rejected") {
        auto flags = Value::object({{"list", Value::array({Value::object({{"rank", true}})})}});
        auto result = insert_where(flags, "list", Value::object({{"rank", false}}), "rank");
        REQUIRE(result.error_code() == ErrorCode::InvalidSortKey);
    }
}

// ============================================================
// Delete Tests
// ============================================================

TEST_CASE("delete_where", "[array][delete]") {
    auto doc = Value::object({{"items", Value::array({
        Value::object({{"id", "dup"}, {"n", 1}}),
        Value::object({{"id", "keep"}, {"n", 2}}),
        Value::object({{"id", "dup"}, {"n", 3}}),
    })}});

    SECTION("removes every match and keeps survivor order") {
        auto result = delete_where(doc, "items", "id", Value{"dup"}).value();
        REQUIRE(*get_at_path(result, "items").value() ==
                Value::array({Value::object({{"id", "keep"}, {"n", 2}})}));
    }

    SECTION("no match is a no-op") {
        auto result = delete_where(doc, "items", "id", Value{"none"}).value();
        REQUIRE(result == doc);
    }

    SECTION("absent path is a no-op") {
        REQUIRE(delete_where(doc, "nope", "id", Value{"dup"}).value() == doc);
    }

    SECTION("non-object elements survive") {
        auto mixed = Value::object({{"items", Value::array({1, Value::object({{"id", 1}}), "x"})}});
        auto result = delete_where(mixed, "items", "id", Value{1}).value();
        REQUIRE(*get_at_path(result, "items").value() == Value::array({1, "x"}));
    }
}

// ============================================================
// Depth Guard Tests
// ============================================================

TEST_CASE("array operations depth guard", "[array][depth]") {
    auto doc = Value::object({{"a", Value::object({{"b", Value::array({Value::object({{"id", 1}})})}})}});
    auto updates = Value::object({{"x", 1}});

    REQUIRE(update_where(doc, "a.b", "id", Value{1}, updates, Options{3}).ok());
    REQUIRE(update_where(doc, "a.b", "id", Value{1}, updates, Options{2}).error_code() == ErrorCode::DepthExceeded);
    REQUIRE(find_where(doc, "a.b", "id", Value{1}, Options{2}).error_code() == ErrorCode::DepthExceeded);
    REQUIRE(delete_where(doc, "a.b", "id", Value{1}, Options{1}).error_code() == ErrorCode::DepthExceeded);
}

TEST_CASE("array operations on ids nesting past the limit", "[array][depth]") {
    const Options opts{8};
    auto deep_id = nested_objects(50, 1);
    auto doc = Value::object({{"items", Value::array({
        Value::object({{"id", deep_id}, {"name", "deep"}}),
        Value::object({{"id", 1}, {"name", "flat"}}),
    })}});

    SECTION("find_where with a scalar match value skips the deep element") {
        REQUIRE(find_where(doc, "items", "id", Value{1}, opts).value() == std::size_t{1});
    }

    SECTION("find_where with a deep match value") {
        auto result = find_where(doc, "items", "id", deep_id, opts);
        REQUIRE(result.error_code() == ErrorCode::DepthExceeded);
        REQUIRE_FALSE(find_where(array_at(doc, "items"), "id", deep_id, opts).has_value());
    }

    SECTION("find_where with a shallow container match value") {
        auto shallow = nested_objects(3, 1);
        REQUIRE_FALSE(find_where(doc, "items", "id", shallow, opts).value().has_value());
    }

    SECTION("delete_where") {
        REQUIRE(delete_where(doc, "items", "id", deep_id, opts).error_code() == ErrorCode::DepthExceeded);
        auto result = delete_where(doc, "items", "id", Value{1}, opts).value();
        REQUIRE(array_at(result, "items").size() == 1);
        REQUIRE(*array_at(result, "items")[0].get().find("name") == Value{"deep"});
    }

    SECTION("update_where") {
        auto updates = Value::object({{"seen", true}});
        REQUIRE(update_where(doc, "items", "id", deep_id, updates, opts).error_code() ==
                ErrorCode::DepthExceeded);
    }

    SECTION("update_where_batch skips deep element ids") {
        auto batch = Value::array({Value::object({{"id", 1}, {"name", "patched"}})});
        auto result = update_where_batch(doc, "items", "id", batch, opts).value();
        REQUIRE(*array_at(result, "items")[1].get().find("name") == Value{"patched"});
        REQUIRE(&array_at(result, "items")[0].get() == &array_at(doc, "items")[0].get());
    }

    SECTION("update_where_batch with no flat match leaves the document unchanged") {
        auto batch = Value::array({Value::object({{"id", 7}})});
        REQUIRE(update_where_batch(doc, "items", "id", batch, opts).value() == doc);
    }

    SECTION("update_where_batch rejects deep entry ids") {
        auto batch = Value::array({Value::object({{"id", deep_id}, {"name", "x"}})});
        REQUIRE(update_where_batch(doc, "items", "id", batch, opts).error_code() == ErrorCode::DepthExceeded);
    }
}
