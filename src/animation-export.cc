// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
#include "animation-export.hh"

#include <algorithm>
#include <memory>
#include <vector>

#include "attribute-conversion.hh"
#include "common-macros.inc"

namespace tinyescn {

namespace {

Node *GetOrCreateAnimationPlayer(Document *doc, Node *parent) {
  for (const auto &node : doc->nodes()) {
    if ((node->type() == kNodeAnimationPlayer) &&
        (node->parent() == parent)) {
      return node.get();
    }
  }

  // root_node of AnimationPlayer defaults to "..".
  std::unique_ptr<Node> player(
      new Node(kAnimationPlayerName, kNodeAnimationPlayer, parent));
  return doc->add_node(std::move(player));
}

template <typename T>
bool ExportAnimationTracks(Document *doc, const ExportSettings &settings,
                           Node *node, const T &data,
                           const std::vector<AttributeConvertInfo<T>> &table,
                           std::string *warn, std::string *err) {
  if (!node) {
    DCOUT("No target node. Skip animation export.");
    return true;
  }

  if (!doc) {
    PUSH_ERROR_AND_RETURN("`doc` arg is nullptr.");
  }

  if (!data.animation_data.action) {
    return true;
  }

  if (settings.fps <= 0.0) {
    PUSH_ERROR_AND_RETURN("Invalid fps: " << settings.fps);
  }

  const source::Action &action = data.animation_data.action.value();

  // The player is placed as a sibling and its root_node is "..", so the
  // track path is the node name(or "." when the node is the scene root).
  std::string track_prefix = node->parent() ? node->name() : ".";

  Animation anim;
  anim.name = action.name;

  for (const auto &item : table) {
    std::vector<const source::FCurve *> curves =
        action.FindFCurves(item.source_attr);
    if (curves.empty()) {
      continue;
    }

    std::vector<double> frames;
    for (const auto *curve : curves) {
      for (const auto &key : curve->keyframes) {
        frames.push_back(key.frame);
      }
    }
    std::sort(frames.begin(), frames.end());
    frames.erase(std::unique(frames.begin(), frames.end()), frames.end());

    if (frames.empty()) {
      continue;
    }

    // Static value is the baseline. Animated channels are overwritten.
    const value::Value baseline = item.get(data);

    AnimationTrack track;
    track.path = track_prefix + ":" + item.target_attr;

    for (const double frame : frames) {
      value::Value sampled = baseline;
      for (const auto *curve : curves) {
        auto v = curve->Evaluate(frame);
        if (!v) {
          continue;
        }
        if ((curve->array_index < 0) ||
            !sampled.set_channel(size_t(curve->array_index),
                                 double(v.value()))) {
          PUSH_WARN("Invalid channel index " << curve->array_index << " for `"
                                             << item.source_attr << "` of "
                                             << node->name());
        }
      }

      double t = frame / settings.fps;
      track.times.push_back(t);
      track.values.push_back(item.convert(sampled));
      anim.length = std::max(anim.length, t);
    }

    anim.tracks.push_back(track);
  }

  if (anim.tracks.empty()) {
    return true;
  }

  auto anim_id = doc->add_animation(anim);
  if (!anim_id) {
    PUSH_ERROR_AND_RETURN(anim_id.error());
  }

  Node *player_parent = node->parent() ? node->parent() : node;
  Node *player = GetOrCreateAnimationPlayer(doc, player_parent);

  std::string anim_key = "anims/" + action.name;
  if (player->has_attribute(anim_key)) {
    anim_key += "_" + node->name();
  }

  value::ResourceRef ref;
  ref.kind = value::ResourceRef::Kind::Sub;
  ref.id = anim_id.value();
  player->set_attribute(anim_key, ref);

  return true;
}

}  // namespace

bool ExportAnimationData(Document *doc, const ExportSettings &settings,
                         Node *node, const source::CameraData &camera,
                         std::string *warn, std::string *err) {
  return ExportAnimationTracks(doc, settings, node, camera,
                               GetCameraAttributeConversion(), warn, err);
}

bool ExportAnimationData(Document *doc, const ExportSettings &settings,
                         Node *node, const source::LightData &light,
                         std::string *warn, std::string *err) {
  if (!node) {
    DCOUT("No target node. Skip animation export.");
    return true;
  }

  return ExportAnimationTracks(doc, settings, node, light,
                               GetLightAttributeConversion(node->type()),
                               warn, err);
}

}  // namespace tinyescn
