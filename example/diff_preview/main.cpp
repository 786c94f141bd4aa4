// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// main.cpp
// diff_preview - print the detailed diff of one resource
//
// Usage:
//   diff_preview <schema.json> <old_state.json> <new_inputs.json> [type] [name]
//
// Pass "-" for a missing old state (create) or new inputs (delete).
// Prints the preview, then the wire-format diff as JSON.

#include <provbridge/json.h>
#include <provbridge/resource_diff.h>
#include <provbridge/schema.h>
#include <provbridge/secrets.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace provbridge;

namespace {

std::string read_file(const std::string& file)
{
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw Error("cannot open '" + file + "'");
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

Value read_tree(const std::string& file)
{
    if (file == "-") {
        return Value{};
    }
    return from_json(read_file(file));
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 4) {
        std::cerr << "usage: " << argv[0]
                  << " <schema.json> <old_state.json> <new_inputs.json> [type] [name]\n";
        return 2;
    }

    try {
        ResourceDiffRequest request;
        request.type = argc > 4 ? argv[4] : "provbridge:index:Resource";
        request.name = argc > 5 ? argv[5] : "resource";
        request.schema = schema_from_json(read_file(argv[1]));
        request.old_state = decode_state(read_tree(argv[2]));
        request.new_inputs = read_tree(argv[3]);

        const ResourceDiff diff = diff_resource(request);
        std::cout << diff.preview << "\n";
        std::cout << wire_to_json(diff.wire) << "\n";
    } catch (const Error& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
