// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Example usage of the jnav library
//
// This example demonstrates:
// - Decoding a document once and navigating it with dotted paths
// - Inspecting shapes and iterating objects and arrays
// - Coercing scalars into typed values
// - Building a tree in code and wrapping it
// - Error handling

#include "../jnav.h"
#include <iostream>
#include <string>

using jn::Node;
using jn::Value;

static const char kMenu[] = R"json({"menu": {
    "id": "file",
    "value": "File",
    "popup": {
        "menuitem": [
            {"value": "New", "onclick": "CreateNewDoc()"},
            {"value": "Open", "onclick": "OpenDoc()"},
            {"value": "Close", "onclick": "CloseDoc()"}
        ]
    }
}})json";

// Example 1: Walk a path
void example_navigate()
{
    std::cout << "\n=== Example 1: Navigating a Document ===" << std::endl;

    Node root = Node::parse(kMenu);
    Node open = root.get("menu.popup.menuitem.[1].value");
    std::cout << "menu.popup.menuitem.[1].value = "
              << *open.getStringValue() << std::endl;

    // A parsed Path can be reused without tokenizing again.
    jn::Path onclick = jn::Path::parse("onclick");
    for (const Node& item : root.get("menu.popup.menuitem").asList())
        std::cout << "  " << *item.get("value").getStringValue() << " -> "
                  << *jn::resolve(item, onclick).getStringValue() << std::endl;
}

// Example 2: Shapes and iteration
void example_shapes()
{
    std::cout << "\n=== Example 2: Shapes ===" << std::endl;

    Node root = Node::parse(R"({"name": "gadget", "sizes": [1, 2, 3],
                                "stock": {"north": 4, "south": 0},
                                "discontinued": null})");
    for (const auto& member : root.asMap())
        std::cout << "  " << member.first << ": "
                  << jn::ShapeToString(member.second.shape()) << std::endl;
    std::cout << "sizes has " << root.get("sizes").size() << " elements"
              << std::endl;
}

// Example 3: Typed extraction
void example_coerce()
{
    std::cout << "\n=== Example 3: Coercion ===" << std::endl;

    Node record = Node::parse(R"({
        "Id": "001D000000IqhSLIAZ",
        "Amount": "1234.50",
        "Quantity": 3.0,
        "Active": "TRUE",
        "CloseDate": "2024-02-29",
        "CreatedAt": 1709207130250,
        "Reminder": "09:30:00",
        "Attachment": "aGVsbG8=",
        "Notes": null
    })");

    std::cout << "  Id         " << record.get("Id").getIdValue()->str()
              << std::endl;
    std::cout << "  Amount     "
              << record.get("Amount").getDecimalValue()->toString()
              << std::endl;
    std::cout << "  Quantity   " << *record.get("Quantity").getIntegerValue()
              << std::endl;
    std::cout << "  Active     "
              << (*record.get("Active").getBooleanValue() ? "yes" : "no")
              << std::endl;
    std::cout << "  CloseDate  "
              << record.get("CloseDate").getDateValue()->toString()
              << std::endl;
    std::cout << "  CreatedAt  "
              << record.get("CreatedAt").getDateTimeValue()->toString()
              << std::endl;
    std::cout << "  Reminder   "
              << record.get("Reminder").getTimeValue()->toString()
              << std::endl;
    std::cout << "  Attachment " << *record.get("Attachment").getBlobValue()
              << std::endl;

    // null is absent for every target type
    if (!record.get("Notes").getStringValue())
        std::cout << "  Notes      (absent)" << std::endl;
}

// Example 4: Wrap a tree built in code
void example_build()
{
    std::cout << "\n=== Example 4: Wrapping a Value ===" << std::endl;

    Value config(Value::ObjectType{
      { "server",
        Value(Value::ObjectType{ { "host", Value("0.0.0.0") },
                                 { "port", Value(8080) } }) },
      { "features",
        Value(Value::ArrayType{ Value("logging"), Value("caching") }) },
    });
    Node root(std::move(config));
    std::cout << "port = " << *root.get("server.port").getLongValue()
              << std::endl;
    std::cout << "features.[1] = " << *root.get("features.[1]").getStringValue()
              << std::endl;
}

// Example 5: Error handling
void example_errors()
{
    std::cout << "\n=== Example 5: Error Handling ===" << std::endl;

    Node root = Node::parse(kMenu);
    static const char* const kPaths[] = {
        "menu.popup.menuitem[0]", // index glued onto a key
        "menu.popup.missing",
        "menu.popup.menuitem.[7]",
        "menu.id.[0]",
    };
    for (const char* path : kPaths) {
        try {
            root.get(path);
        } catch (const jn::Error& e) {
            std::cout << "  " << path << ": " << e.what() << std::endl;
        }
    }

    try {
        root.get("menu.id").getLongValue();
    } catch (const jn::CoercionError& e) {
        std::cout << "  coercion to " << e.target() << ": " << e.what()
                  << std::endl;
    }

    try {
        Node::parse(R"({"a": 1, "b": 2,})");
    } catch (const jn::DecodeError& e) {
        std::cout << "  decode: " << Value::StatusToString(e.status())
                  << std::endl;
    }
}

int main()
{
    std::cout << "jnav Example Program" << std::endl;
    std::cout << "====================" << std::endl;

    example_navigate();
    example_shapes();
    example_coerce();
    example_build();
    example_errors();

    std::cout << "\nAll examples completed!" << std::endl;
    return 0;
}
