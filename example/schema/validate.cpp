#include "exschema/schema/compiler.hpp"
#include "exschema/validator/errors.hpp"

#include <iostream>

using namespace exschema::schema;
using namespace exschema::validator;

int main() {
    // A shared document that other schemas refer to
    SchemaCompiler compiler;
    compiler.registerDocument(
        "urn:common",
        {{"definitions",
          {{"email",
            {{"type", "string"}, {"format", "email"}, {"maxLength", 254}}},
           {"tag", {{"type", "string"}, {"minLength", 1}}}}}});

    // Define a JSON schema
    json schema = {
        {"type", "object"},
        {"properties",
         {
             {"name", {{"type", "string"}}},
             {"age", {{"type", "integer"}, {"minimum", 0}}},
             {"email", {{"$ref", "urn:common#/definitions/email"}}},
             {"tags",
              {{"type", "array"},
               {"items", {{"$ref", "urn:common#/definitions/tag"}}},
               {"uniqueItems", true}}},
         }},
        {"required", {"name", "age"}},
        {"additionalProperties", false}};

    CompiledSchema compiled = compiler.compile(schema, "urn:person");
    std::cout << compiled.toString() << std::endl;

    // Define a JSON instance that conforms to the schema
    json validInstance = {{"name", "John Doe"},
                          {"age", 30},
                          {"email", "john.doe@example.com"},
                          {"tags", {"developer", "blogger"}}};
    std::cout << "Valid instance is valid: " << std::boolalpha
              << compiled.isValid(validInstance) << std::endl;

    // Define a JSON instance that does not conform to the schema
    json invalidInstance = {{"name", "John Doe"},
                            {"age", -5},
                            {"nickname", "JD"},
                            {"tags", {"developer", 123, "developer"}}};

    auto errors = compiled.validate(invalidInstance);
    std::cout << "Invalid instance is valid: " << std::boolalpha
              << errors.empty() << std::endl;

    // Print the validation errors
    std::cout << "Validation errors:" << std::endl;
    for (const auto& error : errors) {
        std::cout << "Error: " << error.message
                  << ", Path: " << formatPath(error.path) << std::endl;
    }
    std::cout << groupByPath(errors).dump(4) << std::endl;

    return 0;
}
