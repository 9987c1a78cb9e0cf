/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <exception>
#include <iostream>
#include <stdexcept>

#include <boost/program_options.hpp>

#include <droidflow/Cancellation.h>
#include <droidflow/DroidFlow.h>
#include <droidflow/Errors.h>
#include <droidflow/ExitCode.h>

int main(int argc, char* argv[]) {
  namespace program_options = boost::program_options;
  program_options::options_description options;
  options.add_options()("help,h", "Show help dialog.")(
      "config,c",
      program_options::value<std::string>(),
      "Path to the JSON configuration file.");

  auto tool = droidflow::DroidFlow();
  tool.add_options(options);

  try {
    program_options::variables_map variables;
    program_options::store(
        program_options::parse_command_line(argc, argv, options), variables);
    if (variables.count("help")) {
      std::cerr << options;
      return ExitCode::success();
    }
    if (!variables.count("config")) {
      std::cerr << "error: missing parameter `--config`.\n";
      std::cerr << "Usage: " << argv[0] << " --config <json_config_file>\n";
      return ExitCode::invalid_argument_error(
          "No JSON configuration file provided.");
    }

    tool.run(variables);
  } catch (const program_options::error& exception) {
    return ExitCode::invalid_argument_error(exception.what());
  } catch (const droidflow::ArchiveError& exception) {
    return ExitCode::archive_error(exception.what());
  } catch (const droidflow::ManifestError& exception) {
    return ExitCode::manifest_error(exception.what());
  } catch (const droidflow::MalformedDexError& exception) {
    return ExitCode::dex_error(exception.what());
  } catch (const droidflow::AnalysisCancelled& exception) {
    return ExitCode::cancelled(exception.what());
  } catch (const std::invalid_argument& exception) {
    return ExitCode::invalid_argument_error(exception.what());
  } catch (const droidflow::NotFoundError& exception) {
    return ExitCode::analysis_error(exception.what());
  } catch (const std::runtime_error& exception) {
    return ExitCode::analysis_error(exception.what());
  } catch (const std::logic_error& exception) {
    return ExitCode::analysis_error(exception.what());
  } catch (const std::exception& exception) {
    return ExitCode::error(exception.what());
  }

  return ExitCode::success();
}
