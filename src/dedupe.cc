#include "dedupe.hh"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "dedupe_same_sz.hh"
#include "hasher.hh"
#include "partial_hash.hh"
#include "size_str.hh"

namespace dupsweep {

inline namespace detail_v1 {

namespace {

class timer_t {
  std::chrono::steady_clock::time_point _prev_time;

 public:
  timer_t() noexcept : _prev_time(std::chrono::steady_clock::now()) {}
  std::chrono::milliseconds time() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }
};

void log_stage(const stats_t &stats, timer_t &timer) {
  std::cerr << "[log] elapsed: " << timer.time().count() << "ms" << std::endl;
  std::cerr << "[log] file candidates: " << stats.file_cnt
            << " total size: " << utils::format_size(stats.total_sz)
            << std::endl;
}

}  // namespace

std::vector<std::filesystem::path> canonical_dirs(
    const std::vector<std::filesystem::path> &search_dir) {
  std::vector<std::filesystem::path> dirs;
  for (const auto &dir : search_dir) {
    auto path = std::filesystem::canonical(dir);
    if (!std::filesystem::is_directory(path)) {
      throw std::invalid_argument("not a directory: " + path.string());
    }
    if (std::find(dirs.begin(), dirs.end(), path) == dirs.end()) {
      dirs.emplace_back(std::move(path));
    }
  }
  return dirs;
}

void validate(const options_t &opts) {
  if (opts.search_dir.empty()) {
    throw std::invalid_argument("no search directory");
  }
  if (opts.min_sz == 0) {
    throw std::invalid_argument("minimum size must be at least 1");
  }
  if (opts.max_sz != 0 && opts.min_sz > opts.max_sz) {
    throw std::invalid_argument("minimum size is larger than maximum size");
  }
  if (opts.min_cnt < 2) {
    throw std::invalid_argument("duplicate count must be at least 2");
  }
  if (opts.scan_sz == 0) {
    throw std::invalid_argument("scan size must be greater than 0");
  }
  get_hash_type(opts.hash_algo);
}

report_t dedupe(const options_t &opts, std::ostream &log_stream) {
  validate(opts);
  const auto hash_type = get_hash_type(opts.hash_algo);
  const auto search_dir = canonical_dirs(opts.search_dir);
  for (const auto &dir : search_dir) {
    std::cerr << "[log] search: " << dir << '\n';
  }

  timer_t timer;
  report_t report;

  std::cerr << "[log] list files..." << std::endl;
  auto size_map = find_candidates(search_dir, opts.min_sz, opts.max_sz,
                                  opts.min_cnt, opts.order);
  report.by_size = generate_stats(size_map);
  log_stage(report.by_size, timer);
  if (size_map.empty()) {
    std::cerr << "[log] no candidates" << std::endl;
    return report;
  }

  std::cerr << "[log] compare last " << opts.scan_sz << " bytes..."
            << std::endl;
  size_map = eliminate_partial(std::move(size_map), scan_t::last, opts.scan_sz,
                               opts.min_cnt, hash_type);
  report.by_last = generate_stats(size_map);
  log_stage(report.by_last, timer);
  if (size_map.empty()) {
    std::cerr << "[log] no candidates" << std::endl;
    return report;
  }

  std::cerr << "[log] compare first " << opts.scan_sz << " bytes..."
            << std::endl;
  size_map = eliminate_partial(std::move(size_map), scan_t::first,
                               opts.scan_sz, opts.min_cnt, hash_type);
  report.by_first = generate_stats(size_map);
  log_stage(report.by_first, timer);
  if (size_map.empty()) {
    std::cerr << "[log] no candidates" << std::endl;
    return report;
  }

  // one size at a time, removal included
  auto remain = report.by_first;
  for (auto &[file_sz, files] : size_map) {
    remain.file_cnt -= files.size();
    remain.total_sz -= file_sz * files.size();

    std::cerr << "[log] hash " << files.size() << " files of size "
              << utils::format_size(file_sz) << "..." << std::endl;
    for (auto &[digest, group] : dedupe_same_sz(files, hash_type)) {
      if (group.size() < opts.min_cnt) {
        std::cerr << "[log] too few files with same digest (" << group.size()
                  << "): " << digest << '\n';
        continue;
      }
      std::cerr << "[log] duplicate group: " << digest << '\n';
      report.dupe_list.emplace_back(resolve_group(digest, std::move(group),
                                                  file_sz, opts.rm_meth,
                                                  report.freed, log_stream));
    }
    std::cerr << "[log] removed " << report.freed.file_cnt
              << " files totaling " << utils::format_size(report.freed.total_sz)
              << ", remaining " << remain.file_cnt << " files totaling "
              << utils::format_size(remain.total_sz) << std::endl;
  }
  std::cerr << "[log] elapsed: " << timer.time().count() << "ms" << std::endl;
  std::cerr << "[log] duplicate group count: " << report.dupe_list.size()
            << std::endl;

  return report;
}

}  // namespace detail_v1

}  // namespace dupsweep
