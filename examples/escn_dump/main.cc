#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "tinyescn.hh"
#include "io-util.hh"

using namespace tinyescn;

void print_help() {
  std::cout << "Usage escn_dump [--search-path=PROJECT_DIR|EXPORT_DIR|NONE] [--project=DIR] [--no-empty] [--no-camera] [--no-light] [output.escn]\n";
  std::cout << "\n Export a built-in demo scene(empties, a camera and lights) as escn.";
  std::cout << "\n Print to stdout when output is not specified.\n";
  std::cout << "\n --search-path Where to look for existing scenes(`house.tscn` etc). Default PROJECT_DIR";
  std::cout << "\n --project Project directory. Default current directory\n";
}

static source::Action MakeBlinkAction() {
  source::Action action;
  action.name = "Blink";

  source::FCurve energy;
  energy.data_path = "energy";
  energy.keyframes.push_back({1.0, 1000.0f});
  energy.keyframes.push_back({12.0, 0.0f});
  energy.keyframes.push_back({24.0, 1000.0f});
  action.fcurves.push_back(energy);

  return action;
}

static void BuildDemoScene(std::vector<source::Object> *objects,
                           std::vector<int> *parents) {
  source::Object rig;
  rig.name = "Rig";
  rig.type = source::kObjectEmpty;
  rig.matrix_local.m[3][2] = 2.0;
  objects->push_back(rig);
  parents->push_back(-1);

  source::Object cam;
  cam.name = "Camera";
  cam.type = source::kObjectCamera;
  cam.matrix_local.m[3][1] = -10.0;
  cam.camera = source::CameraData();
  objects->push_back(cam);
  parents->push_back(0);

  source::Object lamp;
  lamp.name = "Lamp";
  lamp.type = source::kObjectLight;
  source::LightData point;
  point.type = source::kLightPoint;
  point.energy = 1000.0f;
  point.color = {1.0f, 0.8f, 0.6f};
  point.animation_data.action = MakeBlinkAction();
  lamp.light = point;
  objects->push_back(lamp);
  parents->push_back(0);

  source::Object sun;
  sun.name = "Sun";
  sun.type = source::kObjectLight;
  source::LightData sun_data;
  sun_data.type = source::kLightSun;
  sun_data.energy = 3.0f;
  sun.light = sun_data;
  objects->push_back(sun);
  parents->push_back(-1);

  source::Object area;
  area.name = "Area";
  area.type = source::kObjectLight;
  source::LightData area_data;
  area_data.type = source::kLightArea;
  area.light = area_data;
  objects->push_back(area);
  parents->push_back(-1);

  source::Object house;
  house.name = "house.tscn.001";
  house.type = source::kObjectEmpty;
  house.matrix_local.m[3][0] = 5.0;
  objects->push_back(house);
  parents->push_back(-1);
}

int main(int argc, char **argv) {
  ExportSettings settings;
  std::string project_dir = ".";
  std::string output;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if ((arg.compare("-h") == 0) || (arg.compare("--help") == 0)) {
      print_help();
      return EXIT_FAILURE;
    } else if (arg.compare(0, 14, "--search-path=") == 0) {
      settings.material_search_paths = ParseSearchPathMode(arg.substr(14));
    } else if (arg.compare(0, 10, "--project=") == 0) {
      project_dir = arg.substr(10);
    } else if (arg.compare("--no-empty") == 0) {
      settings.object_types.erase(source::kObjectEmpty);
    } else if (arg.compare("--no-camera") == 0) {
      settings.object_types.erase(source::kObjectCamera);
    } else if (arg.compare("--no-light") == 0) {
      settings.object_types.erase(source::kObjectLight);
    } else {
      output = arg;
    }
  }

  settings.path = output;
  settings.project_path_func = [project_dir]() { return project_dir; };

  if (!io::IsDirectory(project_dir)) {
    std::cerr << "Project directory not found: " << project_dir << "\n";
    return EXIT_FAILURE;
  }

  std::vector<source::Object> objects;
  std::vector<int> parents;
  BuildDemoScene(&objects, &parents);

  Document doc;
  Node *root = doc.add_node(std::unique_ptr<Node>(new Node("Scene", kNodeSpatial, nullptr)));

  std::string warn, err;
  bool ret = ExportObjects(&doc, settings, objects, parents, root, &warn, &err);

  if (!warn.empty()) {
    std::cerr << "WARN : " << warn << "\n";
  }

  if (!ret) {
    std::cerr << "Failed to export scene.\n";
    if (!err.empty()) {
      std::cerr << "ERR : " << err << "\n";
    }
    return EXIT_FAILURE;
  }

  std::string s = escn::ExportToString(doc);

  if (output.empty()) {
    std::cout << s;
  } else {
    std::ofstream ofs(output, std::ofstream::binary);
    if (!ofs) {
      std::cerr << "Failed to open file to write: " << output << "\n";
      return EXIT_FAILURE;
    }
    ofs << s;
    std::cout << "Wrote " << output << "\n";
  }

  return EXIT_SUCCESS;
}
