/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>

#include "common/file.hpp"
#include "common/hexutil.hpp"
#include "common/http_requests/impl/request_factory_impl.hpp"
#include "common/logger.hpp"
#include "common/outcome_fmt.hpp"
#include "eth/impl/json_rpc_address_code.hpp"
#include "verifier/compiler_input_json.hpp"
#include "verifier/impl/dry_run_verifier.hpp"
#include "verifier/impl/list_compiler_catalog.hpp"
#include "verifier/impl/logging_middleware.hpp"
#include "verifier/main/config.hpp"
#include "verifier/request_json.hpp"
#include "verifier/response_json.hpp"
#include "verifier/verifier_service.hpp"

namespace scv {
  using config::Config;
  using config::RequestKind;
  using primitives::CompilerVersion;
  using verifier::CompilerCatalog;
  using verifier::ListCompilerCatalog;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("main");
      return logger.get();
    }
  }  // namespace

  outcome::result<std::shared_ptr<CompilerCatalog>> makeCatalog(
      const Config &config) {
    std::vector<CompilerVersion> versions;
    if (config.compilers_dir) {
      OUTCOME_TRY(dir, ListCompilerCatalog::fromDirectory(*config.compilers_dir));
      versions = dir->versions();
    }
    for (const auto &str : config.compiler_versions) {
      OUTCOME_TRY(version, CompilerVersion::fromString(str));
      versions.push_back(std::move(version));
    }
    return std::make_shared<ListCompilerCatalog>(std::move(versions));
  }

  outcome::result<void> printCode(
      const std::shared_ptr<eth::AddressCode> &address_code,
      const std::string &address) {
    verifier::DeployedBytecodeResolver resolver{address_code};
    OUTCOME_TRY(code, resolver.resolve(address));
    std::cout << common::hex0x(code) << std::endl;
    return outcome::success();
  }

  /**
   * Runs whole search of request with dry run verifier and prints compiler
   * inputs in order they were attempted, then response
   */
  outcome::result<void> printPlan(
      const Config &config,
      const std::shared_ptr<CompilerCatalog> &catalog,
      const std::shared_ptr<eth::AddressCode> &address_code) {
    OUTCOME_TRY(json, common::readFile(*config.plan));
    OUTCOME_TRY(request,
                config.kind == RequestKind::kStandardJson
                    ? verifier::decodeStandardJsonRequest(json)
                    : verifier::decodeMultiPartRequest(json));

    auto dry_run{std::make_shared<verifier::DryRunVerifier>()};
    auto client{std::make_shared<verifier::SolidityClient>(
        catalog,
        dry_run,
        address_code,
        std::make_shared<verifier::LoggingMiddleware>())};
    verifier::VerifierService service{client, config.threads};

    auto result{service.verifySync(std::move(request))};
    for (const auto &input : dry_run->attempts()) {
      std::cout << verifier::encodeCompilerInput(input) << std::endl;
    }
    std::cout << (result ? verifier::encodeSuccess(result.value())
                         : verifier::encodeFailure(result.error()))
              << std::endl;
    if (!result) {
      log()->info("plan of {} attempts ended with {}",
                  dry_run->attempts().size(),
                  result.error());
    }
    return outcome::success();
  }

  outcome::result<void> main(const Config &config) {
    OUTCOME_TRY(catalog, makeCatalog(config));
    if (config.list_versions) {
      std::cout << verifier::encodeVersions(catalog->versions()) << std::endl;
      return outcome::success();
    }

    auto address_code{std::make_shared<eth::JsonRpcAddressCode>(
        std::make_shared<common::RequestFactoryImpl>(),
        config.rpc_url,
        std::chrono::duration_cast<std::chrono::milliseconds>(
            config.rpc_timeout))};
    if (config.code_address) {
      return printCode(address_code, *config.code_address);
    }
    if (config.plan) {
      return printPlan(config, catalog, address_code);
    }
    log()->warn("nothing to do, see --help");
    return outcome::success();
  }
}  // namespace scv

int main(int argc, char *argv[]) {
  scv::config::Config config;
  try {
    config = scv::config::Config::read(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  if (config.log_file) {
    using scv::common::file_sink;
    file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        config.log_file->string());
    spdlog::default_logger()->sinks().push_back(file_sink);
  }

  if (auto result{scv::main(config)}; !result) {
    spdlog::error("{}", result.error());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
