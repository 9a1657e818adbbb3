#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "dedupe.hh"
#include "size_str.hh"

using namespace std::literals;

namespace {

constexpr auto usage =
    "usage: dupsweep [-m minsize] [-M maxsize] [-c count] [-s scansize] "
    "[-o inode|name|depth] [-a hash_algo] [-l log_path] [--delete-files] "
    "[-h/--help] path...";

}  // namespace

int main(int argc, char* argv[]) {
  dupsweep::options_t opts;
  std::string log_path;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string_view arg = argv[i];
      const bool takes_value = arg == "-m"sv || arg == "-M"sv ||
                               arg == "-c"sv || arg == "-s"sv ||
                               arg == "-o"sv || arg == "-a"sv || arg == "-l"sv;
      if (takes_value && i + 1 >= argc) {
        std::cerr << "missing value for " << arg << std::endl;
        return 1;
      }
      if (arg == "-m"sv) {
        opts.min_sz = dupsweep::utils::parse_size(argv[++i]);
      } else if (arg == "-M"sv) {
        opts.max_sz = dupsweep::utils::parse_size(argv[++i]);
      } else if (arg == "-c"sv) {
        opts.min_cnt = dupsweep::utils::parse_count(argv[++i]);
      } else if (arg == "-s"sv) {
        opts.scan_sz = dupsweep::utils::parse_size(argv[++i]);
      } else if (arg == "-o"sv) {
        const std::string_view order = argv[++i];
        if (order == "inode"sv) {
          opts.order = dupsweep::walk_order_t::inode;
        } else if (order == "name"sv) {
          opts.order = dupsweep::walk_order_t::name;
        } else if (order == "depth"sv) {
          opts.order = dupsweep::walk_order_t::depth;
        } else {
          std::cerr << "unknown order: " << order << std::endl;
          return 1;
        }
      } else if (arg == "-a"sv) {
        opts.hash_algo = argv[++i];
      } else if (arg == "-l"sv) {
        log_path = argv[++i];
      } else if (arg == "--delete-files"sv) {
        opts.rm_meth = dupsweep::rm_t::remove;
      } else if (arg == "-h"sv || arg == "--help"sv) {
        std::cerr << usage << std::endl;
        return 0;
      } else if (arg.starts_with('-')) {
        std::cerr << "unknown option: " << arg << std::endl;
        return 1;
      } else {
        opts.search_dir.emplace_back(arg);
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "[err] " << e.what() << std::endl;
    return 1;
  }

  if (opts.search_dir.empty()) {
    std::cerr << usage << std::endl;
    return 1;
  }

  std::ostream* log_stream = &std::cout;
  std::ofstream log_file;
  if (!log_path.empty()) {
    log_file.open(log_path, std::ios::out | std::ios::trunc);
    if (!log_file.is_open() || !log_file.good()) {
      std::cerr << "[err] error opening logfile: " << log_path << std::endl;
      return 1;
    }
    log_stream = &log_file;
  }

  if (opts.rm_meth == dupsweep::rm_t::log) {
    std::cerr << "[log] dry run, add --delete-files to actually delete files"
              << std::endl;
  } else {
    std::cerr << "[warn] deleting files!" << std::endl;
  }
  std::cerr << "[log] file sizes: "
            << dupsweep::utils::format_size(opts.min_sz) << " - "
            << (opts.max_sz == 0 ? "no limit"s
                                 : dupsweep::utils::format_size(opts.max_sz))
            << std::endl;
  std::cerr << "[log] scan size: " << dupsweep::utils::format_size(opts.scan_sz)
            << std::endl;

  try {
    const auto report = dupsweep::dedupe(opts, *log_stream);
    log_stream->flush();
    std::cerr << "[log] removed " << report.freed.file_cnt
              << " files totaling "
              << dupsweep::utils::format_size(report.freed.total_sz)
              << std::endl;
  } catch (const std::exception& e) {
    log_stream->flush();
    std::cerr << "[err] " << e.what() << std::endl;
    return 1;
  }
}
