// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
#include "escn-types.hh"

#include "common-macros.inc"

namespace tinyescn {

void Node::set_attribute(const std::string &name, const value::Value &v) {
  for (auto &attr : attribs_) {
    if (attr.first == name) {
      attr.second = v;
      return;
    }
  }
  attribs_.emplace_back(name, v);
}

nonstd::optional<value::Value> Node::get_attribute(
    const std::string &name) const {
  for (const auto &attr : attribs_) {
    if (attr.first == name) {
      return attr.second;
    }
  }
  return nonstd::nullopt;
}

bool Node::has_attribute(const std::string &name) const {
  return get_attribute(name).has_value();
}

std::string Node::path() const {
  if (!parent_) {
    return ".";
  }

  std::string parent_path = parent_->path();
  if (parent_path == ".") {
    return name_;
  }
  return parent_path + "/" + name_;
}

Node *Document::add_node(std::unique_ptr<Node> node) {
  if (!node) {
    return nullptr;
  }

  DCOUT("add node " << node->name() << ", parent = "
                    << (node->parent() ? node->parent()->name() : "(root)"));
  nodes_.emplace_back(std::move(node));
  return nodes_.back().get();
}

Node *Document::find_node(const std::string &path) const {
  for (const auto &node : nodes_) {
    if (node->path() == path) {
      return node.get();
    }
  }
  return nullptr;
}

nonstd::optional<uint32_t> Document::get_external_resource(
    const std::string &name) const {
  for (const auto &entry : ext_resources_) {
    if (entry.name == name) {
      return entry.id;
    }
  }
  return nonstd::nullopt;
}

nonstd::expected<uint32_t, std::string> Document::add_external_resource(
    const ExternalResource &resource, const std::string &name) {
  if (get_external_resource(name)) {
    return nonstd::make_unexpected("External resource `" + name +
                                   "` is already registered.");
  }

  uint32_t id{0};
  if (!ext_resource_ids_.Allocate(&id)) {
    return nonstd::make_unexpected(
        std::string("Failed to allocate external resource id."));
  }

  ExternalResourceEntry entry;
  entry.id = id;
  entry.name = name;
  entry.resource = resource;
  ext_resources_.emplace_back(std::move(entry));

  return id;
}

nonstd::expected<uint32_t, std::string> Document::add_animation(
    const Animation &animation) {
  uint32_t id{0};
  if (!sub_resource_ids_.Allocate(&id)) {
    return nonstd::make_unexpected(
        std::string("Failed to allocate sub resource id."));
  }

  AnimationEntry entry;
  entry.id = id;
  entry.animation = animation;
  animations_.emplace_back(std::move(entry));

  return id;
}

}  // namespace tinyescn
