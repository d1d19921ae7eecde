#ifdef _MSC_VER
#define NOMINMAX
#endif

#include <string>
#include <vector>

#define TEST_NO_MAIN
#include "acutest.h"

#include "export-settings.hh"
#include "external-scene.hh"
#include "io-util.hh"
#include "unit-common.hh"
#include "unit-external-scene.h"

using namespace tinyescn;
using namespace tinyescn_test;

void external_scene_test(void) {
  {
    TEST_CHECK(ParseSearchPathMode("PROJECT_DIR") == SearchPathMode::ProjectDir);
    TEST_CHECK(ParseSearchPathMode("EXPORT_DIR") == SearchPathMode::ExportDir);
    TEST_CHECK(ParseSearchPathMode("NONE") == SearchPathMode::Disabled);
    TEST_CHECK(ParseSearchPathMode("") == SearchPathMode::Disabled);
  }

  // Disabled search never touches the file system.
  {
    ExportSettings settings;
    settings.material_search_paths = SearchPathMode::Disabled;
    bool called = false;
    settings.project_path_func = [&called]() {
      called = true;
      return std::string("/");
    };

    std::string warn;
    TEST_CHECK(GetSceneSearchDir(settings).empty());
    TEST_CHECK(!FindScene(settings, "house.tscn", &warn));
    TEST_CHECK(!called);
    TEST_CHECK(warn.empty());
  }

  // Project dir is evaluated lazily.
  {
    ExportSettings settings;
    settings.material_search_paths = SearchPathMode::ProjectDir;
    int count = 0;
    settings.project_path_func = [&count]() {
      count++;
      return std::string("/project");
    };
    TEST_CHECK(count == 0);
    TEST_CHECK(GetSceneSearchDir(settings) == "/project");
    TEST_CHECK(count == 1);
  }

  {
    ExportSettings settings;
    settings.material_search_paths = SearchPathMode::ExportDir;
    settings.path = "/project/scenes/level.escn";
    TEST_CHECK(GetSceneSearchDir(settings) == "/project/scenes");
  }

#ifndef _WIN32
  {
    std::string root = make_temp_dir();
    TEST_CHECK(!root.empty());
    if (root.empty()) {
      return;
    }

    TEST_CHECK(make_dir(root + "/props"));
    TEST_CHECK(make_dir(root + "/props/old"));
    TEST_CHECK(make_dir(root + "/levels"));

    TEST_CHECK(write_file(root + "/props/house.tscn",
                          "[gd_scene load_steps=2 format=2]\n\n[node name=\"house\" type=\"Spatial\"]\n"));
    TEST_CHECK(write_file(root + "/props/old/house.tscn",
                          "[gd_scene format=2]\n"));
    TEST_CHECK(write_file(root + "/levels/tree.tscn",
                          "[gd_resource type=\"Material\" format=2]\n"));
    TEST_CHECK(write_file(root + "/levels/rock.escn",
                          "[gd_scene load_steps=1 format=2]\n"));

    // Zero matches
    {
      std::string warn;
      TEST_CHECK(!FindSceneInSubtree(root, "car.tscn", &warn));
      TEST_CHECK(warn.empty());
    }

    // Not a scene file
    {
      std::string warn;
      TEST_CHECK(!FindSceneInSubtree(root, "tree.tscn", &warn));
    }

    // One match
    {
      std::string warn;
      auto ret = FindSceneInSubtree(root, "rock.escn", &warn);
      TEST_CHECK(ret.has_value());
      if (ret) {
        TEST_CHECK(ret->path == root + "/levels/rock.escn");
        TEST_CHECK(ret->type == "PackedScene");
      }
      TEST_CHECK(warn.empty());
    }

    // Two matches: warn, smallest path wins.
    {
      std::string warn;
      auto ret = FindSceneInSubtree(root, "house.tscn", &warn);
      TEST_CHECK(ret.has_value());
      if (ret) {
        TEST_CHECK(ret->path == root + "/props/house.tscn");
        TEST_CHECK(ret->type == "PackedScene");
      }
      TEST_CHECK(!warn.empty());
      TEST_CHECK(warn.find("Multiple scenes found for house.tscn") !=
                 std::string::npos);
      TEST_MSG("warn: %s", warn.c_str());
    }

    // Non-existent search root
    {
      std::string warn;
      TEST_CHECK(!FindSceneInSubtree(root + "/nowhere", "house.tscn", &warn));
    }

    // Through settings
    {
      ExportSettings settings;
      settings.material_search_paths = SearchPathMode::ExportDir;
      settings.path = root + "/levels/level.escn";

      std::string warn;
      TEST_CHECK(FindScene(settings, "rock.escn", &warn).has_value());
      // Outside of the export dir.
      TEST_CHECK(!FindScene(settings, "house.tscn", &warn).has_value());

      settings.material_search_paths = SearchPathMode::ProjectDir;
      settings.project_path_func = [root]() { return root; };
      TEST_CHECK(FindScene(settings, "house.tscn", &warn).has_value());
    }

    TEST_CHECK(remove_dir(root));
  }

  // Symlinked directories are not followed.
  {
    std::string root = make_temp_dir();
    TEST_CHECK(!root.empty());
    if (root.empty()) {
      return;
    }

    TEST_CHECK(write_file(root + "/house.tscn", "[gd_scene format=2]\n"));
    TEST_CHECK(make_symlink(".", root + "/a"));
    TEST_CHECK(make_symlink(".", root + "/b"));
    TEST_CHECK(make_dir(root + "/sub"));
    TEST_CHECK(make_symlink("..", root + "/sub/up"));

    std::vector<std::string> paths;
    std::string err;
    TEST_CHECK(io::FindFilesRecursive(root, "house.tscn", &paths, &err));
    TEST_CHECK(paths.size() == 1);
    TEST_MSG("%d candidates", int(paths.size()));
    if (paths.size() == 1) {
      TEST_CHECK(paths[0] == root + "/house.tscn");
    }

    std::string warn;
    auto ret = FindSceneInSubtree(root, "house.tscn", &warn);
    TEST_CHECK(ret.has_value());
    TEST_CHECK(warn.empty());
    TEST_MSG("warn: %s", warn.c_str());

    // Symlink to a file is a regular candidate.
    TEST_CHECK(make_symlink(root + "/house.tscn", root + "/sub/house.tscn"));
    paths.clear();
    TEST_CHECK(io::FindFilesRecursive(root, "house.tscn", &paths, &err));
    TEST_CHECK(paths.size() == 2);

    TEST_CHECK(remove_dir(root));
  }
#endif
}
