#include <tmappa/tree.h>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

namespace tmappa {

namespace {

Result<std::vector<float>> parseNumbers(const YAML::Node& node, size_t count) {
    if (!node.IsSequence() || node.size() != count) {
        return Err<std::vector<float>>("expected a list of " + std::to_string(count) + " numbers");
    }
    std::vector<float> values;
    values.reserve(count);
    for (const auto& item : node) {
        float value;
        try {
            value = item.as<float>();
        } catch (const YAML::Exception&) {
            return Err<std::vector<float>>("'" + item.as<std::string>("?") + "' is not a number");
        }
        if (!std::isfinite(value)) {
            return Err<std::vector<float>>("'" + item.as<std::string>("?") + "' is not a finite number");
        }
        values.push_back(value);
    }
    return Ok(std::move(values));
}

// Outer bounds are integer pixels: edges and rounded extents must fit in int32_t
bool fitsPixelRange(const Rect& r) {
    constexpr double lo = std::numeric_limits<int32_t>::min();
    constexpr double hi = std::numeric_limits<int32_t>::max();
    double x0 = std::floor(double(r.x));
    double y0 = std::floor(double(r.y));
    double x1 = std::ceil(double(r.x) + r.w);
    double y1 = std::ceil(double(r.y) + r.h);
    for (double v : {x0, y0, x1, y1, x1 - x0, y1 - y0}) {
        if (v < lo || v > hi) return false;
    }
    return true;
}

Result<TreeNode> parseNode(const YAML::Node& node, const std::string& parentPath) {
    if (!node.IsMap()) {
        return Err<TreeNode>("node under '" + parentPath + "' is not a map");
    }

    TreeNode tn;
    if (node["label"])
        tn.label = node["label"].as<std::string>();

    std::string path = parentPath.empty() ? tn.label : parentPath + "/" + tn.label;

    if (!node["bounds"]) {
        return Err<TreeNode>("node '" + path + "': missing bounds");
    }
    auto bounds = parseNumbers(node["bounds"], 4);
    if (!bounds) {
        return Err<TreeNode>("node '" + path + "': bad bounds", bounds);
    }
    tn.footprint = {(*bounds)[0], (*bounds)[1], (*bounds)[2], (*bounds)[3]};
    if (!fitsPixelRange(tn.footprint)) {
        return Err<TreeNode>("node '" + path + "': bounds outside the pixel coordinate range");
    }

    if (node["centre"]) {
        auto centre = parseNumbers(node["centre"], 2);
        if (!centre) {
            return Err<TreeNode>("node '" + path + "': bad centre", centre);
        }
        tn.geoCentre = {(*centre)[0], (*centre)[1]};
    } else {
        tn.geoCentre = tn.footprint.centre();
    }

    if (node["colour"]) {
        auto colour = parseHexColour(node["colour"].as<std::string>());
        if (!colour) {
            return Err<TreeNode>("node '" + path + "'", colour);
        }
        tn.colour = *colour;
    }

    if (node["hue"]) {
        float hue = node["hue"].as<float>();
        if (!std::isfinite(hue)) {
            return Err<TreeNode>("node '" + path + "': hue must be a finite number");
        }
        tn.hue = hue;
    }
    if (node["dummy"])
        tn.dummy = node["dummy"].as<bool>();

    if (node["children"]) {
        if (!node["children"].IsSequence()) {
            return Err<TreeNode>("node '" + path + "': children must be a list");
        }
        for (const auto& childNode : node["children"]) {
            auto child = parseNode(childNode, path);
            if (!child) {
                return child;
            }
            tn.children.push_back(std::move(*child));
        }
    }

    return Ok(std::move(tn));
}

} // namespace

size_t countNodes(const TreeNode& node) {
    size_t count = 1;
    for (const auto& child : node.children)
        count += countNodes(child);
    return count;
}

Result<TreeNode> parseTree(const std::string& yaml) {
    try {
        YAML::Node root = YAML::Load(yaml);
        if (!root["tree"]) {
            return Err<TreeNode>("missing 'tree' key");
        }
        auto tree = parseNode(root["tree"], "");
        if (tree) {
            spdlog::debug("parseTree: {} nodes", countNodes(*tree));
        }
        return tree;
    } catch (const YAML::Exception& e) {
        return Err<TreeNode>("YAML parse error: " + std::string(e.what()));
    }
}

Result<TreeNode> loadTree(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<TreeNode>("Cannot open tree file: " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    auto res = parseTree(ss.str());
    if (!res) {
        return Err<TreeNode>("Failed to parse " + path, res);
    }
    return res;
}

} // namespace tmappa
