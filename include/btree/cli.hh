#ifndef __BTREE_CLI_HH__
#define __BTREE_CLI_HH__
#include "CLI/App.hpp"
#include "spdlog/common.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace btree {

struct CommonOptions {
  size_t order{4};
  bool verbose{false};
  std::string log_file;
  spdlog::level::level_enum log_level{spdlog::level::info};
};

struct RandomOptions : CommonOptions {
  uint64_t seed{0};
  size_t insertions{1000};
  size_t queries{100};
  int64_t key_range{0}; // 0 selects 3 * insertions
};

struct InsertOptions : CommonOptions {
  std::vector<int64_t> keys;
  bool dump{false};
};

struct CliSubcommands {
  CLI::App *random;
  CLI::App *insert;
};

void AddCommonOptions(CLI::App *app, CommonOptions &options);
CliSubcommands CreateCli(CLI::App &app, RandomOptions &random_opts,
                         InsertOptions &insert_opts);
void SetupLogging(const CommonOptions &options);

} // namespace btree
#endif
