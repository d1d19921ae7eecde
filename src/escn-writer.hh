// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
//
// escn(Godot text scene) serializer
//
#pragma once

#include <string>

#include "escn-types.hh"

namespace tinyescn {
namespace escn {

///
/// Serialize the document as escn text.
/// Sections are ordered: header, ext_resource, sub_resource, node.
///
std::string ExportToString(const Document &doc);

}  // namespace escn
}  // namespace tinyescn
