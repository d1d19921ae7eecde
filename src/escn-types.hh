// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
//
// In-memory escn(Godot text scene) document.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "handle-allocator.hh"
#include "nonstd/expected.hpp"
#include "nonstd/optional.hpp"
#include "value-types.hh"

namespace tinyescn {

constexpr auto kNodeSpatial = "Spatial";
constexpr auto kNodeCamera = "Camera";
constexpr auto kNodeOmniLight = "OmniLight";
constexpr auto kNodeSpotLight = "SpotLight";
constexpr auto kNodeDirectionalLight = "DirectionalLight";
constexpr auto kNodeAnimationPlayer = "AnimationPlayer";

constexpr auto kResourceAnimation = "Animation";

using AttributeList = std::vector<std::pair<std::string, value::Value>>;

///
/// Node record.
/// Attribute keys are unique. Setting an existing key overwrites the value
/// and keeps its position.
///
class Node {
 public:
  Node(const std::string &name, const std::string &type, Node *parent)
      : name_(name), type_(type), parent_(parent) {}

  // Instance of an external resource(e.g. linked PackedScene).
  Node(const std::string &name, const value::ResourceRef &instance,
       Node *parent)
      : name_(name), parent_(parent), instance_(instance) {}

  const std::string &name() const { return name_; }

  // Empty for an instance node.
  const std::string &type() const { return type_; }

  // nullptr for the scene root.
  Node *parent() const { return parent_; }

  bool is_instance() const { return instance_.has_value(); }
  const nonstd::optional<value::ResourceRef> &instance() const {
    return instance_;
  }

  void set_attribute(const std::string &name, const value::Value &v);

  nonstd::optional<value::Value> get_attribute(const std::string &name) const;

  bool has_attribute(const std::string &name) const;

  const AttributeList &attributes() const { return attribs_; }

  ///
  /// NodePath from the scene root.
  /// "." for the root, "A" for a child of the root, "A/B" for a grandchild.
  ///
  std::string path() const;

 private:
  std::string name_;
  std::string type_;
  Node *parent_{nullptr};
  nonstd::optional<value::ResourceRef> instance_;
  AttributeList attribs_;
};

struct ExternalResource {
  std::string path;
  std::string type;
};

struct AnimationTrack {
  std::string path;  // "<node path>:<attribute>"
  std::vector<double> times;  // seconds
  std::vector<value::Value> values;
};

struct Animation {
  std::string name;
  double length{0.0};  // seconds
  bool loop{false};
  std::vector<AnimationTrack> tracks;
};

///
/// Container of nodes and resources for one exported scene.
/// Resource ids are document scoped, start from 1, and are stable for the
/// lifetime of the document.
///
class Document {
 public:
  struct ExternalResourceEntry {
    uint32_t id{0};
    std::string name;  // logical name
    ExternalResource resource;
  };

  struct AnimationEntry {
    uint32_t id{0};
    Animation animation;
  };

  Document() = default;
  Document(const Document &) = delete;
  Document &operator=(const Document &) = delete;

  ///
  /// Add node to the document. The document takes the ownership.
  /// Returns nullptr when `node` is nullptr.
  ///
  Node *add_node(std::unique_ptr<Node> node);

  const std::vector<std::unique_ptr<Node>> &nodes() const { return nodes_; }

  // Lookup node by `Node::path()`
  Node *find_node(const std::string &path) const;

  ///
  /// Lookup external resource id by logical name.
  ///
  nonstd::optional<uint32_t> get_external_resource(
      const std::string &name) const;

  ///
  /// Register an external resource under the logical name `name`.
  /// Returns error when `name` is already registered.
  ///
  nonstd::expected<uint32_t, std::string> add_external_resource(
      const ExternalResource &resource, const std::string &name);

  const std::vector<ExternalResourceEntry> &external_resources() const {
    return ext_resources_;
  }

  nonstd::expected<uint32_t, std::string> add_animation(
      const Animation &animation);

  const std::vector<AnimationEntry> &animations() const {
    return animations_;
  }

 private:
  std::vector<std::unique_ptr<Node>> nodes_;

  std::vector<ExternalResourceEntry> ext_resources_;
  HandleAllocator<uint32_t> ext_resource_ids_;

  std::vector<AnimationEntry> animations_;
  HandleAllocator<uint32_t> sub_resource_ids_;
};

}  // namespace tinyescn
