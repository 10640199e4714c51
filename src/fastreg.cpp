// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "fastreg/fastreg.hpp"

#include <spdlog/spdlog.h>

namespace fastreg {

FastReg::FastReg() : FastReg(Config{}) {}

FastReg::FastReg(const Config& cfg)
    : cfg_(cfg),
      prototype_(createModel(cfg.model)),
      estimator_(cfg.ransac) {
  spdlog::debug("[FastReg] {} model, epsilon={}, confidence={}",
                prototype_->name(), cfg_.ransac.max_epsilon,
                cfg_.ransac.confidence);
}

FastReg FastReg::fromFile(const std::string& path) {
  return FastReg(loadConfig(path));
}

FitResult FastReg::fit(const Correspondences& matches,
                       const Budget& budget) const {
  return estimator_.run(matches, *prototype_, budget);
}

}  // namespace fastreg
