/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/program_options.hpp>

#include <droidflow/ApkAnalyzer.h>
#include <droidflow/Options.h>
#include <droidflow/Statistics.h>

namespace droidflow {

/* The `droidflow` command line tool. */
class DroidFlow final {
 public:
  DroidFlow() = default;

  void add_options(boost::program_options::options_description& options) const;
  void run(const boost::program_options::variables_map& variables);

  /* Run the analysis and write every result in the output directory. */
  void run(const Options& options);

 private:
  void analyze(
      ApkAnalyzer& analyzer,
      const Options& options,
      Statistics& statistics);
};

} // namespace droidflow
