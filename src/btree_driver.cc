#include "btree.hh"
#include "cli.hh"
#include "invariant_checker.hh"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <random>
#include <set>
#include <sstream>
#include <spdlog/spdlog.h>

namespace {
using namespace btree;

void ReportStats(const BTree<int64_t> &tree) {
  std::stringstream ss;
  ss << tree.Stats();
  spdlog::info(ss.str());
  std::cout << ss.str() << "\n";
}

bool Validate(const BTree<int64_t> &tree) {
  if (auto violation = CheckInvariants(tree)) {
    std::stringstream ss;
    ss << *violation;
    spdlog::error("Invariant violation: {}", ss.str());
    return false;
  }
  spdlog::info("All structural invariants hold");
  return true;
}

int RunRandom(const RandomOptions &opts) {
  const uint64_t seed = opts.seed != 0 ? opts.seed : std::random_device{}();
  const int64_t key_range =
      opts.key_range > 0 ? opts.key_range
                         : std::max<int64_t>(
                               1, static_cast<int64_t>(opts.insertions * 3));
  spdlog::info("Random workload: seed {}, {} insertions, {} queries, keys in "
               "[0, {}]",
               seed, opts.insertions, opts.queries, key_range);

  std::mt19937_64 rng(seed);
  std::uniform_int_distribution<int64_t> key_dist(0, key_range);

  BTree<int64_t> tree(opts.order);
  std::set<int64_t> inserted;

  for (size_t i = 0; i < opts.insertions; ++i) {
    const int64_t key = key_dist(rng);
    tree.Insert(key);
    inserted.insert(key);
  }
  spdlog::info("Inserted {} distinct keys, height {}", tree.Size(),
               tree.Height());

  size_t hits = 0;
  size_t mismatches = 0;
  for (size_t i = 0; i < opts.queries; ++i) {
    const int64_t key = key_dist(rng);
    const bool found = tree.Get(key).has_value();
    if (found != (inserted.count(key) > 0)) {
      spdlog::error("Query {}: tree reports {}, expected {}", key,
                    found ? "found" : "absent",
                    found ? "absent" : "found");
      mismatches++;
    }
    if (found) {
      hits++;
    }
    std::cout << "Query " << key << ": " << (found ? "Found" : "Not Found")
              << "\n";
  }
  spdlog::info("{} of {} queries found", hits, opts.queries);

  const auto traversal = tree.Traverse();
  if (!std::equal(traversal.begin(), traversal.end(), inserted.begin(),
                  inserted.end())) {
    spdlog::error("In-order traversal does not match the inserted key set");
    mismatches++;
  }

  ReportStats(tree);
  if (!Validate(tree) || mismatches > 0) {
    return 1;
  }
  return 0;
}

int RunInsert(const InsertOptions &opts) {
  BTree<int64_t> tree(opts.order);
  for (const auto key : opts.keys) {
    if (!tree.Insert(key)) {
      spdlog::debug("Key {} already present", key);
    }
  }

  std::cout << "Keys:";
  for (const auto key : tree.Traverse()) {
    std::cout << " " << key;
  }
  std::cout << "\n";

  if (opts.dump) {
    tree.Dump(std::cout);
  }
  ReportStats(tree);
  return Validate(tree) ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"B-Tree driver - builds in-memory B-Trees and checks them"};
  RandomOptions random_opts;
  InsertOptions insert_opts;

  auto subcmds = CreateCli(app, random_opts, insert_opts);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  const bool is_random = subcmds.random->parsed();
  const CommonOptions &active_opts =
      is_random ? static_cast<const CommonOptions &>(random_opts)
                : static_cast<const CommonOptions &>(insert_opts);
  SetupLogging(active_opts);

  try {
    const int status = is_random ? RunRandom(random_opts)
                                 : RunInsert(insert_opts);
    spdlog::info("Driver finished with status {}", status);
    return status;
  } catch (const std::exception &e) {
    spdlog::error("Error: {}", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
