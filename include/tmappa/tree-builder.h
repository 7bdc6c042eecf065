#pragma once

#include <tmappa/node-attributes.h>
#include <tmappa/render-context.h>
#include <tmappa/tree.h>
#include <vector>

namespace tmappa {

struct BuildOptions {
    float rootHue = 0.0f;  // hue of nodes without their own hue or a coloured ancestor
};

/// Create the attributes of every node of `root` in pre-order (a node before
/// its children, children left to right). Each node receives the resolved
/// colour of its nearest coloured ancestor as parent colour, except nodes that
/// declare their own hue. Dummy nodes get no colour unless the data names one.
std::vector<NodeAttributes> buildNodes(const TreeNode& root, RenderContext& ctx,
                                       const BuildOptions& options);

} // namespace tmappa
