#pragma once

void external_scene_test(void);
