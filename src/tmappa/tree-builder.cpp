#include <tmappa/tree-builder.h>
#include <spdlog/spdlog.h>
#include <optional>

namespace tmappa {

namespace {

struct Frame {
    const TreeNode* node;
    uint32_t level;
    std::optional<Colour> inherited;  // nearest resolved ancestor colour
};

} // namespace

std::vector<NodeAttributes> buildNodes(const TreeNode& root, RenderContext& ctx,
                                       const BuildOptions& options) {
    std::vector<NodeAttributes> nodes;
    nodes.reserve(countNodes(root));

    std::vector<Frame> stack;
    stack.push_back({&root, 0, std::nullopt});

    while (!stack.empty()) {
        Frame frame = stack.back();
        stack.pop_back();
        const TreeNode& tn = *frame.node;

        std::optional<float> hue = tn.hue.value_or(options.rootHue);
        std::optional<Colour> parentColour = frame.inherited;
        if (tn.dummy) {
            hue.reset();
            parentColour.reset();
        } else if (tn.hue) {
            parentColour.reset();
        }

        nodes.emplace_back(ctx, tn.label, tn.footprint, tn.geoCentre, tn.isLeaf(), tn.dummy,
                           hue, tn.colour, parentColour, frame.level);

        // Spacers pass on what they inherited
        std::optional<Colour> childColour = nodes.back().getColour();
        if (!childColour) childColour = frame.inherited;

        for (auto it = tn.children.rbegin(); it != tn.children.rend(); ++it) {
            stack.push_back({&*it, frame.level + 1, childColour});
        }
    }

    spdlog::debug("buildNodes: built {} nodes", nodes.size());
    return nodes;
}

} // namespace tmappa
