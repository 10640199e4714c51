// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * fitmatches: fit a transform to point matches with RANSAC.
 *
 * Input: one match per line, "sx sy tx ty [weight]". '#' starts a comment.
 *
 * Usage:
 *   ./fitmatches matches.txt [config.yaml]
 *
 * Example:
 *   ./fitmatches tile_matches.txt config/default.yaml
 */

#include <fastreg/fastreg.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace fastreg;

namespace {

Correspondences readMatches(const std::string& path) {
  std::ifstream fs(path);
  if (!fs) {
    throw std::runtime_error("Cannot open matches file: " + path);
  }

  Correspondences matches;
  std::string line;
  size_t line_no = 0;
  while (std::getline(fs, line)) {
    ++line_no;
    const auto hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);

    std::istringstream ss(line);
    double sx, sy, tx, ty;
    if (!(ss >> sx)) continue;  // blank or comment-only
    if (!(ss >> sy >> tx >> ty)) {
      throw std::runtime_error(path + ":" + std::to_string(line_no) +
                               ": expected 'sx sy tx ty [weight]'");
    }
    double weight = 1.0;
    if (!(ss >> weight)) weight = 1.0;
    matches.emplace_back(Point(sx, sy), Point(tx, ty), weight);
  }
  return matches;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: fitmatches <matches.txt> [config.yaml]\n"
              << "  matches.txt: one 'sx sy tx ty [weight]' per line\n"
              << "  config.yaml: model and ransac settings (default: affine)\n";
    return 1;
  }

  try {
    const std::string matches_path = argv[1];
    const FastReg reg =
        (argc >= 3) ? FastReg::fromFile(argv[2]) : FastReg();

    // Load
    std::cout << "Loading " << matches_path << " ..." << std::endl;
    const auto matches = readMatches(matches_path);
    std::cout << "  " << matches.size() << " matches" << std::endl;

    // Estimate
    std::cout << "Fitting " << reg.prototype().name()
              << " (epsilon=" << reg.config().ransac.max_epsilon << ") ..."
              << std::endl;
    const auto result = reg.fit(matches);

    std::cout << "  Model: " << result.model->name() << std::endl;
    std::cout << "  Parameters: " << result.parameters.transpose() << std::endl;
    std::cout << "  Inliers: " << result.inliers.size() << " / "
              << matches.size() << std::endl;
    std::cout << "  Cost: " << result.cost << std::endl;
    std::cout << "  Trials: " << result.iterations
              << (result.stopped_early ? " (stopped early)" : "") << std::endl;
  } catch (const Error& e) {
    std::cerr << "Estimation failed: " << e.what() << std::endl;
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
