//=============================================================================
// Tree Builder Unit Tests
//
// Pre-order construction, levels, colour threading through the hierarchy,
// dummy and hue handling.
//=============================================================================

#include <boost/ut.hpp>
#include "tmappa/tree-builder.h"
#include "tmappa/canvas.h"
#include "harness/scripted_context.h"

#include <string>
#include <utility>
#include <vector>

using namespace boost::ut;
using namespace tmappa;
using tmappa::test::ScriptedContext;

namespace {

TreeNode node(const std::string& label, Rect footprint, std::vector<TreeNode> children = {}) {
    TreeNode tn;
    tn.label = label;
    tn.footprint = footprint;
    tn.geoCentre = footprint.centre();
    tn.children = std::move(children);
    return tn;
}

//   root
//   ├── a
//   │   ├── a1
//   │   └── a2
//   └── b
//       └── b1
TreeNode sampleTree() {
    return node("root", {0, 0, 100, 100}, {
        node("a", {0, 0, 50, 100}, {
            node("a1", {0, 0, 50, 50}),
            node("a2", {0, 50, 50, 50}),
        }),
        node("b", {50, 0, 50, 100}, {
            node("b1", {50, 0, 50, 100}),
        }),
    });
}

const NodeAttributes& find(const std::vector<NodeAttributes>& nodes, const std::string& label) {
    for (const auto& n : nodes) {
        if (n.getLabel() == label) return n;
    }
    expect(false) << "no node labelled" << label;
    return nodes.front();
}

} // namespace

suite tree_builder_tests = [] {
    "nodes come out in pre-order"_test = [] {
        ScriptedContext ctx;
        auto nodes = buildNodes(sampleTree(), ctx, BuildOptions{});

        std::vector<std::string> labels;
        for (const auto& n : nodes) labels.push_back(n.getLabel());
        expect(labels == std::vector<std::string>{"root", "a", "a1", "a2", "b", "b1"});
    };

    "levels and leaf flags follow the tree"_test = [] {
        ScriptedContext ctx;
        auto nodes = buildNodes(sampleTree(), ctx, BuildOptions{});

        expect(find(nodes, "root").getLevel() == 0_u);
        expect(find(nodes, "a").getLevel() == 1_u);
        expect(find(nodes, "a2").getLevel() == 2_u);
        expect(find(nodes, "b1").getLevel() == 2_u);

        expect(!find(nodes, "root").isLeaf());
        expect(!find(nodes, "b").isLeaf());
        expect(find(nodes, "a1").isLeaf());
        expect(find(nodes, "b1").isLeaf());
    };

    "every node registers its bounds"_test = [] {
        ScriptedContext ctx;
        auto nodes = buildNodes(sampleTree(), ctx, BuildOptions{});
        expect(ctx.registered().size() == 6_ul);
        expect(ctx.registered()[0] == IntRect{0, 0, 100, 100});
        expect(ctx.registered()[5] == IntRect{50, 0, 50, 100});
    };

    "root takes the configured hue and descendants inherit it"_test = [] {
        ScriptedContext ctx(0.0f);
        BuildOptions options;
        options.rootHue = 0.33f;
        auto nodes = buildNodes(sampleTree(), ctx, options);

        const Colour rootColour(124, 204, 122);
        for (const auto& n : nodes) {
            expect(n.getColour() == std::optional<Colour>(rootColour)) << n.getLabel();
        }
        // Five non-root nodes, three draws each
        expect(ctx.randomCalls() == 15_i);
    };

    "children perturb the colour of their own parent"_test = [] {
        // Each draw of 0.6 with mutation 0.5 adds 6.35 -> +6 per generation
        ScriptedContext ctx(0.5f, {0.6f});
        auto nodes = buildNodes(sampleTree(), ctx, BuildOptions{});

        expect(find(nodes, "root").getColour() == std::optional<Colour>(Colour(204, 122, 122)));
        expect(find(nodes, "a").getColour() == std::optional<Colour>(Colour(210, 128, 128)));
        expect(find(nodes, "a1").getColour() == std::optional<Colour>(Colour(216, 134, 134)));
        expect(find(nodes, "b1").getColour() == std::optional<Colour>(Colour(216, 134, 134)));
    };

    "explicit colours are used and passed down"_test = [] {
        auto tree = sampleTree();
        tree.children[0].colour = Colour(10, 20, 30);
        ScriptedContext ctx(0.0f);
        auto nodes = buildNodes(tree, ctx, BuildOptions{});

        expect(find(nodes, "a").getColour() == std::optional<Colour>(Colour(10, 20, 30)));
        expect(find(nodes, "a1").getColour() == std::optional<Colour>(Colour(10, 20, 30)));
        expect(find(nodes, "b").getColour() == std::optional<Colour>(Colour(204, 122, 122)));
    };

    "a node with its own hue starts a new family"_test = [] {
        auto tree = sampleTree();
        tree.children[1].hue = 0.33f;
        ScriptedContext ctx(0.0f);
        auto nodes = buildNodes(tree, ctx, BuildOptions{});

        expect(find(nodes, "a").getColour() == std::optional<Colour>(Colour(204, 122, 122)));
        expect(find(nodes, "b").getColour() == std::optional<Colour>(Colour(124, 204, 122)));
        expect(find(nodes, "b1").getColour() == std::optional<Colour>(Colour(124, 204, 122)));
    };

    "dummy nodes have no colour and pass on what they inherited"_test = [] {
        auto tree = sampleTree();
        tree.children[1].dummy = true;
        tree.children[0].colour = Colour(1, 2, 3);
        tree.children[1].colour.reset();
        ScriptedContext ctx(0.0f);
        auto nodes = buildNodes(tree, ctx, BuildOptions{});

        const auto& b = find(nodes, "b");
        expect(b.isDummy());
        expect(!b.getColour().has_value());
        expect(!b.getHexColour().has_value());
        expect(find(nodes, "b1").getColour() == std::optional<Colour>(Colour(204, 122, 122)));
    };

    "dummy with an explicit colour keeps it"_test = [] {
        auto tree = sampleTree();
        tree.children[1].dummy = true;
        tree.children[1].colour = Colour(9, 9, 9);
        ScriptedContext ctx(0.0f);
        auto nodes = buildNodes(tree, ctx, BuildOptions{});
        expect(find(nodes, "b").getColour() == std::optional<Colour>(Colour(9, 9, 9)));
        expect(find(nodes, "b1").getColour() == std::optional<Colour>(Colour(9, 9, 9)));
    };

    "same seed gives the same colours"_test = [] {
        Canvas::Options options;
        options.mutation = 0.8f;
        options.seed = 1234;
        auto a = Canvas::create(options);
        auto b = Canvas::create(options);
        expect(a.has_value() && b.has_value());

        auto first = buildNodes(sampleTree(), **a, BuildOptions{});
        auto second = buildNodes(sampleTree(), **b, BuildOptions{});
        expect(first.size() == second.size());
        for (size_t i = 0; i < first.size(); i++) {
            expect(first[i].getColour() == second[i].getColour());
        }
        expect((*a)->extent() == std::optional<IntRect>(IntRect{0, 0, 100, 100}));
        expect((*a)->registeredCount() == 6_u);
    };
};
