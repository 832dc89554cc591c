#pragma once

#include <string>

namespace speckle_track::runner {

struct RunOptions {
  std::string config_path;
  std::string data_path;          // 3-D FITS cube, one plane per frame
  std::string translations_path;  // N x 2 or N x 3 FITS table [m]
  std::string mask_path;          // optional
  std::string whitefield_path;    // optional
  std::string out_dir;
  int n_iter_override = 0;        // 0 = use the config value
};

int run_pipeline_command(const RunOptions &opts);

} // namespace speckle_track::runner
