#include <iostream>

int test_interpolation();
int test_color();
int test_palette();
int test_terrain();
int test_scene_composer();
int test_scene_parameters();
int test_svg_surface();
int test_args();
int test_log();
int test_random();
int test_output_path();

int main() {
  int fails = 0;

  fails += test_interpolation();
  fails += test_color();
  fails += test_palette();
  fails += test_terrain();
  fails += test_scene_composer();
  fails += test_scene_parameters();
  fails += test_svg_surface();
  fails += test_args();
  fails += test_log();
  fails += test_random();
  fails += test_output_path();

  if (fails == 0) {
    std::cout << "[ridgeline_tests] ALL PASS\n";
    return 0;
  }

  std::cerr << "[ridgeline_tests] FAILS=" << fails << "\n";
  return 1;
}
