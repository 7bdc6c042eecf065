#pragma once

#include <tmappa/node-attributes.h>
#include <optional>
#include <string>
#include <vector>

namespace tmappa {

/// Dump resolved node attributes as YAML: an optional `extent` rectangle and a
/// `nodes` list. Nodes without colour carry no `colour` key.
std::string writeNodes(const std::vector<NodeAttributes>& nodes,
                       const std::optional<IntRect>& extent);

} // namespace tmappa
