// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef FASTREG_CONFIG_FASTREG_HPP
#define FASTREG_CONFIG_FASTREG_HPP

#include <string>

namespace YAML {
class Node;
}

#include "fastreg/config/model.hpp"
#include "fastreg/config/ransac.hpp"

namespace fastreg {

/// Registration configuration for FastReg.
struct Config {
  config::Model model;
  config::Ransac ransac;
};

Config parseConfig(const YAML::Node& root);
Config loadConfig(const std::string& path);

}  // namespace fastreg

#endif  // FASTREG_CONFIG_FASTREG_HPP
