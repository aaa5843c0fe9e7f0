// main.cpp
// jsonb_delta Example - surgical edits on a JSON-like order document
//
// Demo 1: Path navigation (read / write / erase)
// Demo 2: Merges (shallow, deep, at path, smart patch)
// Demo 3: Array matching (update, batch update, insert, delete)
// Demo 4: Delta computation and application
//
// Run without arguments for every demo, or pass its number (1-4).

#include <jsonb_delta/jsonb_delta.h>

#include <cstdlib>
#include <iostream>

using namespace jsonb_delta;

// ============================================================
// Sample Document
// ============================================================

namespace {

Value make_store()
{
    return Value::object({
        {"store", "north"},
        {"settings", Value::object({{"currency", "EUR"}, {"ui", Value::object({{"theme", "light"}})}})},
        {"orders", Value::array({
            Value::object({{"id", 101}, {"status", "new"}, {"total", Value{*Number::parse("19.99")}}}),
            Value::object({{"id", 102}, {"status", "paid"}, {"total", Value{*Number::parse("5.00")}}}),
            Value::object({{"id", 103}, {"status", "new"}, {"total", 42}}),
        })},
    });
}

template <typename T>
void show(const char* label, const Result<T>& result)
{
    if (result) {
        std::cout << "  " << label << ": " << result.value() << "\n";
    } else {
        std::cout << "  " << label << ": error " << error_code_name(result.error_code())
                  << " (" << result.error().message << ")\n";
    }
}

void demo_navigation()
{
    std::cout << "\n=== Demo 1: Path navigation ===\n";
    auto doc = make_store();

    auto status = get_at_path(doc, "orders[1].status");
    if (status && status.value()) {
        std::cout << "  orders[1].status = " << *status.value() << "\n";
    }

    show("set settings.ui.font.size", set_at_path(doc, "settings.ui.font.size", Value{14}));
    show("set orders[7].status", set_at_path(doc, "orders[7].status", Value{"x"}));
    show("erase settings.currency", erase_at_path(doc, "settings.currency"));

    auto parsed = parse_path("orders[x]");
    if (!parsed) {
        std::cout << "  parse orders[x]: " << error_code_name(parsed.error_code())
                  << " at offset " << parsed.error().offset << "\n";
    }
}

void demo_merge()
{
    std::cout << "\n=== Demo 2: Merges ===\n";
    auto doc = make_store();
    auto patch = Value::object({{"settings", Value::object({{"ui", Value::object({{"dense", true}})}})}});

    show("shallow_merge", shallow_merge(doc, patch));
    show("deep_merge", deep_merge(doc, patch));
    show("merge_at_path settings.ui", merge_at_path(doc, Value::object({{"theme", "dark"}}), "settings.ui"));
    show("smart_patch_nested store", smart_patch_nested(doc, Value::object({{"name", "North"}}), "store"));
}

void demo_arrays()
{
    std::cout << "\n=== Demo 3: Array matching ===\n";
    auto doc = make_store();

    show("update_where id=102",
         update_where(doc, "orders", "id", Value{102}, Value::object({{"status", "shipped"}})));

    auto batch = Value::array({
        Value::object({{"id", 101}, {"status", "cancelled"}}),
        Value::object({{"id", 103}, {"status", "paid"}}),
    });
    show("update_where_batch", update_where_batch(doc, "orders", "id", batch));

    show("insert_where by total",
         insert_where(doc, "orders", Value::object({{"id", 104}, {"total", 10}}), "total"));
    show("delete_where status=new", delete_where(doc, "orders", "status", Value{"new"}));
    show("contains_id 103", contains_id(doc, "orders", "id", Value{103}));

    if (auto id = extract_id(Value::object({{"id", 7}}))) {
        std::cout << "  extract_id: " << *id << "\n";
    }
}

void demo_delta()
{
    std::cout << "\n=== Demo 4: Delta ===\n";
    auto before = make_store();
    auto after = update_where(before, "orders", "id", Value{101}, Value::object({{"status", "paid"}})).value();
    after = set_at_path(after, "settings.region", Value{"eu-north"}).value();

    auto delta = compute_delta(before, after);
    if (!delta) {
        std::cout << "  compute_delta failed\n";
        return;
    }
    std::cout << "  delta: " << delta.value().to_value() << "\n";

    auto restored = apply_delta(before, delta.value());
    std::cout << "  round-trip equal: " << std::boolalpha << (restored && restored.value() == after) << "\n";
    show("has_any_difference", has_any_difference(before, after));
}

} // namespace

int main(int argc, char* argv[])
{
    const int choice = argc > 1 ? std::atoi(argv[1]) : 0;

    try {
        if (choice == 0 || choice == 1) demo_navigation();
        if (choice == 0 || choice == 2) demo_merge();
        if (choice == 0 || choice == 3) demo_arrays();
        if (choice == 0 || choice == 4) demo_delta();
    } catch (const ResultError& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
