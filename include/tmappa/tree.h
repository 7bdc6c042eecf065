#pragma once

#include <tmappa/colour.h>
#include <tmappa/geometry.h>
#include <tmappa/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tmappa {

//=============================================================================
// TreeNode - one node of an already laid-out tree
//=============================================================================
struct TreeNode {
    std::string label;
    Rect footprint;
    Point geoCentre;
    std::optional<Colour> colour;   // explicit colour from the data
    std::optional<float> hue;       // starts a new colour family here
    bool dummy = false;
    std::vector<TreeNode> children;

    bool isLeaf() const { return children.empty(); }
};

/// Number of nodes in the subtree rooted at `node`, including itself.
size_t countNodes(const TreeNode& node);

/// Parse a YAML tree description:
///
///   tree:
///     label: World
///     bounds: [0, 0, 800, 600]    # x, y, width, height
///     centre: [400, 300]          # optional, defaults to the bounds centre
///     colour: "#336699"           # optional
///     hue: 0.6                    # optional
///     dummy: false                # optional
///     children: [...]             # optional
Result<TreeNode> parseTree(const std::string& yaml);

/// Read and parse a YAML tree description from a file.
Result<TreeNode> loadTree(const std::string& path);

} // namespace tmappa
