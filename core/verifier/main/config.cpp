/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/main/config.hpp"

#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>

#include "common/enum.hpp"

namespace scv::config {
  inline auto &class_conversion_table(RequestKind &&) {
    using E = RequestKind;
    static common::ConversionTable<E, 2> table{
        {{E::kMultiPart, "multi-part"}, {E::kStandardJson, "standard-json"}}};
    return table;
  }

  inline void validate(boost::any &out,
                       const std::vector<std::string> &values,
                       RequestKind *,
                       long) {
    using namespace boost::program_options;
    check_first_occurrence(out);
    auto &value{get_single_string(values)};
    if (auto kind{common::from_string<RequestKind>(value)}) {
      out = *kind;
      return;
    }
    boost::throw_exception(invalid_option_value{value});
  }

  spdlog::level::level_enum getLogLevel(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
    }
    return spdlog::level::info;
  }

  Config Config::read(int argc, char **argv) {
    Config config;
    struct {
      char log_level;
      int64_t rpc_timeout;
      boost::optional<boost::filesystem::path> config_file;
    } raw;
    namespace po = boost::program_options;
    po::options_description desc("Smart contract verifier options");
    auto option{desc.add_options()};
    option("help,h", "print usage message");
    option("config", po::value(&raw.config_file), "read options from file");
    option("log,l",
           po::value(&raw.log_level)->default_value('i'),
           "log level, [e,w,i,d,t]");
    option("log-file", po::value(&config.log_file), "mirror log to file");
    option("threads",
           po::value(&config.threads)->default_value(4),
           "verification worker threads");

    po::options_description rpc_desc("Node options");
    auto rpc_option{rpc_desc.add_options()};
    rpc_option(
        "rpc-url",
        po::value(&config.rpc_url)->default_value(
            "https://evmos-evm.publicnode.com"),
        "ethereum json-rpc endpoint");
    rpc_option("rpc-timeout",
               po::value(&raw.rpc_timeout)->default_value(30),
               "json-rpc call timeout (seconds)");
    desc.add(rpc_desc);

    po::options_description catalog_desc("Compiler options");
    auto catalog_option{catalog_desc.add_options()};
    catalog_option("compilers-dir",
                   po::value(&config.compilers_dir),
                   "directory of compilers named after their versions");
    catalog_option("compiler-version",
                   po::value(&config.compiler_versions)->composing(),
                   "available compiler version");
    desc.add(catalog_desc);

    po::options_description command_desc("Commands");
    auto command_option{command_desc.add_options()};
    command_option("list-versions",
                   po::bool_switch(&config.list_versions),
                   "print available compiler versions");
    command_option("code",
                   po::value(&config.code_address),
                   "print code deployed at address");
    command_option("plan",
                   po::value(&config.plan),
                   "print compiler inputs verification of request tries");
    command_option("kind",
                   po::value(&config.kind)->default_value(
                       RequestKind::kMultiPart, "multi-part"),
                   "request kind, [multi-part,standard-json]");
    desc.add(command_desc);

    po::variables_map vm;
    po::store(parse_command_line(argc, argv, desc), vm);
    if (vm.count("help") != 0) {
      std::cerr << desc << std::endl;
      exit(EXIT_SUCCESS);
    }
    po::notify(vm);
    if (raw.config_file) {
      std::ifstream config_file{raw.config_file->string()};
      if (!config_file.good()) {
        std::cerr << "Config file " << *raw.config_file << " does not exist."
                  << std::endl;
        exit(EXIT_FAILURE);
      }
      po::store(po::parse_config_file(config_file, desc), vm);
      po::notify(vm);
    }

    if (raw.rpc_timeout <= 0) {
      boost::throw_exception(po::invalid_option_value{
          std::to_string(raw.rpc_timeout)});
    }
    config.rpc_timeout = std::chrono::seconds{raw.rpc_timeout};

    config.log_level = getLogLevel(raw.log_level);
    spdlog::set_level(config.log_level);

    return config;
  }
}  // namespace scv::config
