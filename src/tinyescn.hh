// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
//
// TinyEscn: convert DCC scene objects(empty, camera, light) into an escn
// (Godot text scene) document.
//
#ifndef TINYESCN_HH_
#define TINYESCN_HH_

#include <string>
#include <vector>

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Weverything"
#endif

#include "nonstd/expected.hpp"
#include "nonstd/optional.hpp"

#ifdef __clang__
#pragma clang diagnostic pop
#endif

#include "animation-export.hh"
#include "attribute-conversion.hh"
#include "escn-types.hh"
#include "escn-writer.hh"
#include "export-settings.hh"
#include "external-scene.hh"
#include "simple-nodes.hh"
#include "source-scene.hh"
#include "value-types.hh"
#include "xform.hh"

namespace tinyescn {

constexpr int version_major = 0;
constexpr int version_minor = 1;
constexpr int version_micro = 0;

///
/// Export objects into the document, in order. `parents[i]` is the index of
/// the parent object of `objects[i]` in `objects`(-1 = scene root node
/// `root`). Parent must come before its children.
///
/// Objects which are filtered out pass their parent node to their children.
///
/// @param[inout] doc Document.
/// @param[in] settings Export settings.
/// @param[in] objects Source objects.
/// @param[in] parents Parent index of each object.
/// @param[in] root Scene root node(nullable).
/// @param[out] warn Warning message.
/// @param[out] err Error message.
///
/// @return false when `parents` is inconsistent with `objects`.
///
bool ExportObjects(Document *doc, const ExportSettings &settings,
                   const std::vector<source::Object> &objects,
                   const std::vector<int> &parents, Node *root,
                   std::string *warn, std::string *err);

}  // namespace tinyescn

#endif  // TINYESCN_HH_
