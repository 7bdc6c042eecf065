#include <tmappa/node-writer.h>
#include <yaml-cpp/yaml.h>

namespace tmappa {

namespace {

template<typename T>
void emitRect(YAML::Emitter& out, T x, T y, T w, T h) {
    out << YAML::Flow << YAML::BeginSeq << x << y << w << h << YAML::EndSeq;
}

} // namespace

std::string writeNodes(const std::vector<NodeAttributes>& nodes,
                       const std::optional<IntRect>& extent) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    if (extent) {
        out << YAML::Key << "extent" << YAML::Value;
        emitRect(out, extent->x, extent->y, extent->w, extent->h);
    }

    out << YAML::Key << "nodes" << YAML::Value << YAML::BeginSeq;
    for (const auto& node : nodes) {
        const Rect& r = node.getBounds();
        const Point& c = node.getGeoBounds();

        out << YAML::BeginMap;
        out << YAML::Key << "label" << YAML::Value << node.getLabel();
        out << YAML::Key << "level" << YAML::Value << node.getLevel();
        out << YAML::Key << "leaf" << YAML::Value << node.isLeaf();
        out << YAML::Key << "dummy" << YAML::Value << node.isDummy();
        out << YAML::Key << "bounds" << YAML::Value;
        emitRect(out, r.x, r.y, r.w, r.h);
        out << YAML::Key << "centre" << YAML::Value
            << YAML::Flow << YAML::BeginSeq << c.x << c.y << YAML::EndSeq;
        if (auto hex = node.getHexColour()) {
            out << YAML::Key << "colour" << YAML::Value << YAML::DoubleQuoted << *hex;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
    return out.c_str();
}

} // namespace tmappa
