// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
#include "escn-writer.hh"

#include <sstream>

#include "str-util.hh"

namespace tinyescn {
namespace escn {

namespace {

// "times": PoolRealArray( 0, 1 )
std::string to_real_array(const std::vector<double> &v) {
  std::vector<std::string> items;
  for (const auto &x : v) {
    items.push_back(value::to_string(value::Value(x)));
  }

  std::stringstream ss;
  ss << "PoolRealArray( " << join(", ", items) << " )";
  return ss.str();
}

void WriteAttributes(const AttributeList &attribs, std::stringstream &ss) {
  for (const auto &attr : attribs) {
    ss << attr.first << " = " << value::to_string(attr.second) << "\n";
  }
}

void WriteAnimation(const Document::AnimationEntry &entry,
                    std::stringstream &ss) {
  const Animation &anim = entry.animation;

  ss << "[sub_resource id=" << entry.id << " type=\"" << kResourceAnimation
     << "\"]\n\n";
  ss << "resource_name = " << quote(escapeString(anim.name)) << "\n";
  ss << "length = " << value::to_string(value::Value(anim.length)) << "\n";
  ss << "loop = " << (anim.loop ? "true" : "false") << "\n";

  for (size_t i = 0; i < anim.tracks.size(); i++) {
    const AnimationTrack &track = anim.tracks[i];
    const std::string prefix = "tracks/" + std::to_string(i) + "/";

    std::vector<double> transitions(track.times.size(), 1.0);
    std::vector<std::string> values;
    for (const auto &v : track.values) {
      values.push_back(value::to_string(v));
    }

    ss << prefix << "type = \"value\"\n";
    ss << prefix << "path = NodePath(" << quote(escapeString(track.path))
       << ")\n";
    ss << prefix << "interp = 1\n";
    ss << prefix << "loop_wrap = true\n";
    ss << prefix << "imported = false\n";
    ss << prefix << "enabled = true\n";
    ss << prefix << "keys = {\n";
    ss << "\"times\": " << to_real_array(track.times) << ",\n";
    ss << "\"transitions\": " << to_real_array(transitions) << ",\n";
    ss << "\"update\": 0,\n";
    ss << "\"values\": [ " << join(", ", values) << " ]\n";
    ss << "}\n";
  }

  ss << "\n";
}

void WriteNode(const Node &node, std::stringstream &ss) {
  ss << "[node name=" << quote(escapeString(node.name()));
  if (!node.is_instance()) {
    ss << " type=" << quote(node.type());
  }
  if (node.parent()) {
    ss << " parent=" << quote(escapeString(node.parent()->path()));
  }
  if (node.is_instance()) {
    ss << " instance=" << value::to_string(node.instance().value());
  }
  ss << "]\n\n";

  WriteAttributes(node.attributes(), ss);

  ss << "\n";
}

}  // namespace

std::string ExportToString(const Document &doc) {
  std::stringstream ss;

  size_t load_steps =
      doc.external_resources().size() + doc.animations().size() + 1;

  ss << "[gd_scene load_steps=" << load_steps << " format=2]\n\n";

  for (const auto &entry : doc.external_resources()) {
    ss << "[ext_resource id=" << entry.id
       << " path=" << quote(escapeString(entry.resource.path))
       << " type=" << quote(entry.resource.type) << "]\n\n";
  }

  for (const auto &entry : doc.animations()) {
    WriteAnimation(entry, ss);
  }

  for (const auto &node : doc.nodes()) {
    WriteNode(*node, ss);
  }

  return ss.str();
}

}  // namespace escn
}  // namespace tinyescn
