// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
#include "simple-nodes.hh"

#include <map>
#include <memory>

#include "animation-export.hh"
#include "attribute-conversion.hh"
#include "common-macros.inc"
#include "external-scene.hh"
#include "str-util.hh"
#include "xform.hh"

namespace tinyescn {

nonstd::optional<std::string> GetLightNodeKind(const std::string &light_type) {
  static const std::map<std::string, std::string> kLightToNodeKind = {
      {source::kLightPoint, kNodeOmniLight},
      {source::kLightSpot, kNodeSpotLight},
      {source::kLightSun, kNodeDirectionalLight},
  };

  auto it = kLightToNodeKind.find(light_type);
  if (it == kLightToNodeKind.end()) {
    return nonstd::nullopt;
  }
  return it->second;
}

nonstd::optional<value::ResourceRef> UseExternalScene(
    Document *doc, const ExportSettings &settings,
    const std::string &scene_name, std::string *warn, std::string *err) {
  if (!doc) {
    PUSH_ERROR("`doc` arg is nullptr.");
    return nonstd::nullopt;
  }

  nonstd::optional<ExternalSceneInfo> scene =
      FindScene(settings, scene_name, warn);
  if (!scene) {
    PUSH_WARN("Unable to find '" << scene_name << "' in project");
    return nonstd::nullopt;
  }

  value::ResourceRef ref;
  ref.kind = value::ResourceRef::Kind::External;

  if (auto id = doc->get_external_resource(scene_name)) {
    ref.id = id.value();
    return ref;
  }

  ExternalResource resource;
  resource.path = scene.value().path;
  resource.type = scene.value().type;

  auto id = doc->add_external_resource(resource, scene_name);
  if (!id) {
    PUSH_ERROR(id.error());
    return nonstd::nullopt;
  }

  ref.id = id.value();
  return ref;
}

NodeResult ExportEmptyNode(Document *doc, const ExportSettings &settings,
                           const source::Object &obj, Node *parent,
                           std::string *warn, std::string *err) {
  if (!settings.object_types.count(source::kObjectEmpty)) {
    return NodeResult::MakeUnchangedParent(parent);
  }

  if (!doc) {
    PUSH_ERROR("`doc` arg is nullptr.");
    return NodeResult::MakeNone();
  }

  std::string scene_name = findSceneFilenamePrefix(obj.name);
  if (!scene_name.empty()) {
    auto instance = UseExternalScene(doc, settings, scene_name, warn, err);
    if (instance) {
      std::unique_ptr<Node> instance_node(
          new Node(obj.name, instance.value(), parent));
      instance_node->set_attribute("transform", obj.matrix_local);
      return NodeResult::MakeNode(doc->add_node(std::move(instance_node)));
    }
    DCOUT("Fallback to Spatial: " << obj.name);
  }

  std::unique_ptr<Node> empty_node(new Node(obj.name, kNodeSpatial, parent));
  empty_node->set_attribute("transform", obj.matrix_local);
  return NodeResult::MakeNode(doc->add_node(std::move(empty_node)));
}

NodeResult ExportCameraNode(Document *doc, const ExportSettings &settings,
                            const source::Object &obj, Node *parent,
                            std::string *warn, std::string *err) {
  if (!doc) {
    PUSH_ERROR("`doc` arg is nullptr.");
    return NodeResult::MakeNone();
  }

  if (!obj.camera) {
    PUSH_ERROR("Object `" << obj.name << "` has no camera data.");
    return NodeResult::MakeNone();
  }

  const source::CameraData &camera = obj.camera.value();

  std::unique_ptr<Node> cam_node(new Node(obj.name, kNodeCamera, parent));

  for (const auto &item : GetCameraAttributeConversion()) {
    cam_node->set_attribute(item.target_attr, item.Apply(camera));
  }

  if (camera.type == source::kCameraPerspective) {
    cam_node->set_attribute("projection", 0);
  } else {
    cam_node->set_attribute("projection", 1);
  }

  // `fov` is not in the attribute conversion table because it is not
  // animated.
  cam_node->set_attribute("fov", to_degrees(double(camera.angle)));

  cam_node->set_attribute(
      "transform", NormalizeTransform(obj.matrix_local, kNodeCamera));

  Node *node = doc->add_node(std::move(cam_node));

  if (!ExportAnimationData(doc, settings, node, camera, warn, err)) {
    PUSH_WARN("Failed to export animation of camera " << obj.name);
  }

  return NodeResult::MakeNode(node);
}

NodeResult ExportLightNode(Document *doc, const ExportSettings &settings,
                           const source::Object &obj, Node *parent,
                           std::string *warn, std::string *err) {
  if (!doc) {
    PUSH_ERROR("`doc` arg is nullptr.");
    return NodeResult::MakeNone();
  }

  if (!obj.light) {
    PUSH_ERROR("Object `" << obj.name << "` has no light data.");
    return NodeResult::MakeNone();
  }

  const source::LightData &light = obj.light.value();

  Node *node = nullptr;

  nonstd::optional<std::string> kind = GetLightNodeKind(light.type);
  if (kind) {
    std::unique_ptr<Node> light_node(
        new Node(obj.name, kind.value(), parent));

    for (const auto &item : GetLightAttributeConversion(kind.value())) {
      light_node->set_attribute(item.target_attr, item.Apply(light));
    }

    // Properties common to all lights.
    // These are not in the conversion table since they are not animated.
    light_node->set_attribute("transform",
                              FixDirectionalTransform(obj.matrix_local));
    light_node->set_attribute("light_negative", light.energy < 0.0f);
    light_node->set_attribute("shadow_enabled",
                              light.use_shadow && light.cycles.cast_shadow);

    node = doc->add_node(std::move(light_node));
  } else {
    PUSH_WARN("Unknown light type. Use Point, Spot or Sun: " << obj.name);
  }

  // No-op when `node` is nullptr.
  if (!ExportAnimationData(doc, settings, node, light, warn, err)) {
    PUSH_WARN("Failed to export animation of light " << obj.name);
  }

  if (!node) {
    return NodeResult::MakeNone();
  }
  return NodeResult::MakeNode(node);
}

NodeResult ExportObject(Document *doc, const ExportSettings &settings,
                        const source::Object &obj, Node *parent,
                        std::string *warn, std::string *err) {
  if (obj.type == source::kObjectCamera) {
    if (!settings.object_types.count(source::kObjectCamera)) {
      return NodeResult::MakeUnchangedParent(parent);
    }
    return ExportCameraNode(doc, settings, obj, parent, warn, err);
  } else if (obj.type == source::kObjectLight) {
    if (!settings.object_types.count(source::kObjectLight)) {
      return NodeResult::MakeUnchangedParent(parent);
    }
    return ExportLightNode(doc, settings, obj, parent, warn, err);
  }

  DCOUT("Export " << obj.type << " as empty: " << obj.name);
  return ExportEmptyNode(doc, settings, obj, parent, warn, err);
}

}  // namespace tinyescn
