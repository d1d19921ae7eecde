// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
#include "tinyescn.hh"

#include "common-macros.inc"

namespace tinyescn {

bool ExportObjects(Document *doc, const ExportSettings &settings,
                   const std::vector<source::Object> &objects,
                   const std::vector<int> &parents, Node *root,
                   std::string *warn, std::string *err) {
  if (!doc) {
    PUSH_ERROR_AND_RETURN("`doc` arg is nullptr.");
  }

  if (objects.size() != parents.size()) {
    PUSH_ERROR_AND_RETURN("objects.size() " << objects.size()
                          << " and parents.size() " << parents.size()
                          << " must be same.");
  }

  // Node which children of objects[i] are attached to.
  std::vector<Node *> attach_nodes(objects.size(), nullptr);

  for (size_t i = 0; i < objects.size(); i++) {
    Node *parent = root;
    if (parents[i] >= 0) {
      if (size_t(parents[i]) >= i) {
        PUSH_ERROR_AND_RETURN("Parent of `" << objects[i].name
                              << "` must be exported before it.");
      }
      parent = attach_nodes[size_t(parents[i])];
    }

    NodeResult ret =
        ExportObject(doc, settings, objects[i], parent, warn, err);
    if (ret.kind() == NodeResult::Kind::None) {
      // Children of an unconverted object go to its parent.
      attach_nodes[i] = parent;
    } else {
      attach_nodes[i] = ret.node();
    }
  }

  return true;
}

}  // namespace tinyescn
