//=============================================================================
// Tree Parser Unit Tests
//=============================================================================

#include <boost/ut.hpp>
#include "tmappa/tree.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using namespace boost::ut;
using namespace tmappa;

namespace {

const char* WORLD_YAML = R"(
tree:
  label: World
  bounds: [0, 0, 800, 600]
  children:
    - label: Europe
      bounds: [0, 0, 400, 600]
      centre: [120.5, 80]
      colour: "#336699"
      children:
        - label: France
          bounds: [0, 0, 400, 300]
        - label: spacer
          bounds: [0, 300, 400, 300]
          dummy: true
    - label: Asia
      bounds: [400, 0, 400, 600]
      hue: 0.6
)";

} // namespace

suite tree_parser_tests = [] {
    "parses labels, bounds and hierarchy"_test = [] {
        auto res = parseTree(WORLD_YAML);
        expect(res.has_value()) << error_msg(res);
        const TreeNode& world = *res;

        expect(world.label == std::string("World"));
        expect(world.footprint == Rect{0, 0, 800, 600});
        expect(world.children.size() == 2_ul);
        expect(!world.isLeaf());
        expect(countNodes(world) == 5_ul);

        const TreeNode& europe = world.children[0];
        expect(europe.label == std::string("Europe"));
        expect(europe.children.size() == 2_ul);
        expect(europe.children[0].isLeaf());
        expect(europe.children[1].dummy);
    };

    "optional attributes"_test = [] {
        auto res = parseTree(WORLD_YAML);
        expect(res.has_value());
        const TreeNode& europe = res->children[0];
        const TreeNode& asia = res->children[1];

        expect(europe.geoCentre == Point{120.5f, 80.0f});
        expect(europe.colour == std::optional<Colour>(Colour(0x33, 0x66, 0x99)));
        expect(!europe.hue.has_value());

        expect(!asia.colour.has_value());
        expect(asia.hue.has_value() && *asia.hue == 0.6_f);
        expect(!asia.dummy);
    };

    "centre defaults to the middle of the bounds"_test = [] {
        auto res = parseTree(WORLD_YAML);
        expect(res.has_value());
        expect(res->geoCentre == Point{400, 300});
        expect(res->children[1].geoCentre == Point{600, 300});
    };

    "missing tree key is an error"_test = [] {
        auto res = parseTree("nodes: []\n");
        expect(!res.has_value());
        expect(error_msg(res).find("tree") != std::string::npos);
    };

    "missing bounds names the node path"_test = [] {
        auto res = parseTree(R"(
tree:
  label: World
  bounds: [0, 0, 10, 10]
  children:
    - label: Europe
)");
        expect(!res.has_value());
        expect(error_msg(res).find("World/Europe") != std::string::npos) << error_msg(res);
        expect(error_msg(res).find("missing bounds") != std::string::npos);
    };

    "bounds must be four numbers"_test = [] {
        expect(!parseTree("tree: {label: a, bounds: [1, 2, 3]}").has_value());
        expect(!parseTree("tree: {label: a, bounds: [1, 2, x, 4]}").has_value());
        expect(!parseTree("tree: {label: a, bounds: 5}").has_value());
    };

    "non-finite numbers are rejected"_test = [] {
        auto res = parseTree(R"(
tree:
  label: World
  bounds: [0, 0, 10, 10]
  children:
    - label: Europe
      bounds: [0, 0, 1, .nan]
)");
        expect(!res.has_value());
        expect(error_msg(res).find("World/Europe") != std::string::npos) << error_msg(res);
        expect(error_msg(res).find("finite") != std::string::npos);

        expect(!parseTree("tree: {label: a, bounds: [0, 0, .inf, 1]}").has_value());
        expect(!parseTree("tree: {label: a, bounds: [0, 0, 1, 1], centre: [-.inf, 0]}").has_value());
    };

    "non-finite hue is rejected"_test = [] {
        auto res = parseTree("tree: {label: a, bounds: [0, 0, 1, 1], hue: .inf}");
        expect(!res.has_value());
        expect(error_msg(res).find("hue") != std::string::npos) << error_msg(res);
        expect(!parseTree("tree: {label: a, bounds: [0, 0, 1, 1], hue: .nan}").has_value());
    };

    "bounds beyond the pixel range are rejected"_test = [] {
        auto res = parseTree("tree: {label: big, bounds: [0, 0, 1e12, 10]}");
        expect(!res.has_value());
        expect(error_msg(res).find("big") != std::string::npos) << error_msg(res);

        // Each edge fits, the width between them does not
        expect(!parseTree("tree: {label: wide, bounds: [-2e9, 0, 4e9, 10]}").has_value());
        expect(parseTree("tree: {label: ok, bounds: [-1e6, -1e6, 2e6, 2e6]}").has_value());
    };

    "bad centre and bad colour are errors"_test = [] {
        expect(!parseTree("tree: {label: a, bounds: [0, 0, 1, 1], centre: [1]}").has_value());

        auto res = parseTree("tree: {label: a, bounds: [0, 0, 1, 1], colour: '#zz0000'}");
        expect(!res.has_value());
        expect(error_msg(res).find("#zz0000") != std::string::npos);
    };

    "YAML syntax errors are reported"_test = [] {
        auto res = parseTree("tree: [unclosed");
        expect(!res.has_value());
        expect(error_msg(res).find("YAML") != std::string::npos);
    };

    "loadTree reads from a file"_test = [] {
        auto path = std::filesystem::temp_directory_path() / "tmappa-tree-test.yaml";
        {
            std::ofstream out(path);
            out << WORLD_YAML;
        }
        auto res = loadTree(path.string());
        expect(res.has_value()) << error_msg(res);
        expect(countNodes(*res) == 5_ul);
        std::filesystem::remove(path);
    };

    "loadTree reports a missing file"_test = [] {
        auto res = loadTree("/nonexistent/tmappa/tree.yaml");
        expect(!res.has_value());
        expect(error_msg(res).find("Cannot open") != std::string::npos);
    };
};
