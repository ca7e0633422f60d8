// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_COMMON_PARAMS_GUARD
#define OMEGAFAN_COMMON_PARAMS_GUARD

#include "omegafan/Ideal.hpp"
#include <mathic.h>
#include <tbb/global_control.h>
#include <memory>
#include <string>
#include <vector>

OMEGAFAN_NAMESPACE_BEGIN

class CommonParams {
public:
  CommonParams(size_t minDirectParams, size_t maxDirectParams);

  void directOptions
    (std::vector<std::string> tokens, mathic::CliParser& parser);

  void pushBackParameters(std::vector<mathic::CliParameter*>& parameters);

  /// Takes appropriate action depending on the parameters. For example this
  /// will set the number of threads in tbb.
  void perform();

  /// The value of -threadCount. 0 means as many as tbb likes.
  unsigned int threadCount() const {return mThreadCount.value();}

  /// Returns the number of direct parameters/input files.
  size_t inputFileCount() const;

  /// Returns the file name at offset i, if any.
  const std::string& inputFileName(size_t i) const;

  /// Reads the ideal in the input file at offset i. Reports an error if
  /// the file cannot be opened.
  Ideal readInputIdeal(size_t i) const;

private:
  mathic::IntegerParameter mTracingLevel;
  mathic::IntegerParameter mThreadCount;
  mathic::StringParameter mLogs;

  /// to set thread count
  std::unique_ptr<tbb::global_control> mThreadControl;
  std::size_t mMinDirectParams;
  std::size_t mMaxDirectParams;
  std::vector<std::string> mDirectParameters;
};

OMEGAFAN_NAMESPACE_END

#endif
