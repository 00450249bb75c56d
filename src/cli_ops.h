#ifndef CLI_OPS_H
#define CLI_OPS_H

#include "image.h"
#include "noise.h"
#include "pipeline.h"

#include <memory>
#include <string>
#include <vector>

// Nearest odd kernel size at or above requested.
int oddKernelSize(int requested);

Pipeline applyOption(const Pipeline& pipeline,
                     const std::string& option,
                     const RgbaImage& source,
                     const std::shared_ptr<RandomSource>& random);

Pipeline buildPipeline(const std::vector<std::string>& options,
                       const RgbaImage& source,
                       const std::shared_ptr<RandomSource>& random);

#endif
