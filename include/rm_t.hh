#pragma once

namespace dupsweep {

enum class rm_t {
  log,    // dry run, log entry only
  remove  // log entry and remove file
};

}  // namespace dupsweep
