// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
//
// Converters for nodes which can be written in a single function:
// empty(placeholder), camera and light.
//
#pragma once

#include <string>

#include "escn-types.hh"
#include "export-settings.hh"
#include "nonstd/optional.hpp"
#include "source-scene.hh"

namespace tinyescn {

///
/// Result of a node conversion.
///
/// - Node: a new node was added to the document.
/// - UnchangedParent: the object was filtered out. `node()` is the parent,
///   so that children can still be attached.
/// - None: no node was created(e.g. unsupported light type).
///
class NodeResult {
 public:
  enum class Kind { Node, UnchangedParent, None };

  static NodeResult MakeNode(Node *node) {
    return NodeResult(Kind::Node, node);
  }
  static NodeResult MakeUnchangedParent(Node *parent) {
    return NodeResult(Kind::UnchangedParent, parent);
  }
  static NodeResult MakeNone() { return NodeResult(Kind::None, nullptr); }

  Kind kind() const { return kind_; }

  bool has_node() const { return kind_ == Kind::Node; }

  // nullptr for `None`, or for `UnchangedParent` of the scene root.
  Node *node() const { return node_; }

 private:
  NodeResult(Kind kind, Node *node) : kind_(kind), node_(node) {}

  Kind kind_;
  Node *node_;
};

///
/// Target node kind of a source light type.
/// POINT -> OmniLight, SPOT -> SpotLight, SUN -> DirectionalLight.
///
nonstd::optional<std::string> GetLightNodeKind(const std::string &light_type);

///
/// Find an existing scene named `scene_name` in the project and register it
/// to the document as an external resource(at most once per name).
///
/// @return Reference to the external resource. nullopt when not found.
///
nonstd::optional<value::ResourceRef> UseExternalScene(
    Document *doc, const ExportSettings &settings,
    const std::string &scene_name, std::string *warn, std::string *err);

///
/// Converts an empty(or any unknown object) into a Spatial.
/// An empty named like a scene file(e.g. "house.tscn", "house.escn.001")
/// becomes an instance of the existing scene when it is found in the project.
///
NodeResult ExportEmptyNode(Document *doc, const ExportSettings &settings,
                           const source::Object &obj, Node *parent,
                           std::string *warn, std::string *err);

NodeResult ExportCameraNode(Document *doc, const ExportSettings &settings,
                            const source::Object &obj, Node *parent,
                            std::string *warn, std::string *err);

///
/// Exports lights - well, the ones it knows about. Other light types
/// report a warning and no node is created.
///
NodeResult ExportLightNode(Document *doc, const ExportSettings &settings,
                           const source::Object &obj, Node *parent,
                           std::string *warn, std::string *err);

///
/// Dispatch by `obj.type`. CAMERA and LIGHT objects are skipped(parent is
/// returned) when their type is not in `settings.object_types`. Other types
/// are exported as empty.
///
NodeResult ExportObject(Document *doc, const ExportSettings &settings,
                        const source::Object &obj, Node *parent,
                        std::string *warn, std::string *err);

}  // namespace tinyescn
