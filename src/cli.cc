#include "cli.hh"
#include "btree.hh"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <iostream>
#include <map>

namespace btree {
void SetupLogging(const CommonOptions &options) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    // File sink is always enabled
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.log_file, true);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    sinks.push_back(file_sink);

    // Console sink only if verbose mode is enabled
    if (options.verbose) {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_pattern("[%^%l%$] %v");
      sinks.push_back(console_sink);
    }

    auto logger =
        std::make_shared<spdlog::logger>("btree", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(options.log_level);

    spdlog::info("Starting btree driver with order {}", options.order);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    exit(1);
  }
}

void AddCommonOptions(CLI::App *app, CommonOptions &options) {
  app->add_option("-o,--order", options.order,
                  "Maximum number of children per node")
      ->default_val(4)
      ->check(CLI::Range(kMinimumOrder, static_cast<size_t>(4096)));
  app->add_flag("-v,--verbose", options.verbose,
                "Enable verbose console output");
  app->add_option("-l,--log-file", options.log_file, "Log file path")
      ->default_val("btree.log");

  app->add_option("--log-level", options.log_level,
                  "Log level (trace, debug, info, warn, error, critical)")
      ->default_val(spdlog::level::info)
      ->transform(CLI::CheckedTransformer(
          std::map<std::string, spdlog::level::level_enum>{
              {"trace", spdlog::level::trace},
              {"debug", spdlog::level::debug},
              {"info", spdlog::level::info},
              {"warn", spdlog::level::warn},
              {"error", spdlog::level::err},
              {"critical", spdlog::level::critical}},
          CLI::ignore_case));
}

CliSubcommands CreateCli(CLI::App &app, RandomOptions &random_opts,
                         InsertOptions &insert_opts) {
  app.require_subcommand(1, 1);

  auto random = app.add_subcommand(
      "random", "Insert random keys, run membership queries and validate");
  auto insert =
      app.add_subcommand("insert", "Insert the given keys and print the tree");

  AddCommonOptions(random, random_opts);
  random->add_option("--seed", random_opts.seed, "RNG seed (0 for random)")
      ->default_val(0);
  random
      ->add_option("-n,--insertions", random_opts.insertions,
                   "Number of keys to insert")
      ->default_val(1000)
      ->check(CLI::NonNegativeNumber);
  random
      ->add_option("-q,--queries", random_opts.queries,
                   "Number of membership queries")
      ->default_val(100)
      ->check(CLI::NonNegativeNumber);
  random
      ->add_option("--key-range", random_opts.key_range,
                   "Keys are drawn from [0, key-range] (0 for 3x insertions)")
      ->default_val(0)
      ->check(CLI::NonNegativeNumber);

  AddCommonOptions(insert, insert_opts);
  insert->add_flag("--dump", insert_opts.dump, "Print the node structure");
  insert->add_option("keys", insert_opts.keys, "Keys to insert, in order")
      ->required();

  return CliSubcommands{random, insert};
}

} // namespace btree
