// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
//
// Export animated properties of camera/light data blocks.
//
#pragma once

#include <string>

#include "escn-types.hh"
#include "export-settings.hh"
#include "source-scene.hh"

namespace tinyescn {

constexpr auto kAnimationPlayerName = "AnimationPlayer";

///
/// Export animation curves of a camera data block as tracks of the `node`.
/// Curves are sampled at their key frames and converted with the camera
/// attribute conversion table.
///
/// No-op when `node` is nullptr or the data block has no action.
///
/// @param[inout] doc Document.
/// @param[in] settings Export settings.
/// @param[in] node Target node(nullable).
/// @param[in] camera Source camera data.
/// @param[out] warn Warning message.
/// @param[out] err Error message.
///
/// @return true upon success.
///
bool ExportAnimationData(Document *doc, const ExportSettings &settings,
                         Node *node, const source::CameraData &camera,
                         std::string *warn, std::string *err);

///
/// Light version. The conversion table is selected from `node->type()`.
///
bool ExportAnimationData(Document *doc, const ExportSettings &settings,
                         Node *node, const source::LightData &light,
                         std::string *warn, std::string *err);

}  // namespace tinyescn
