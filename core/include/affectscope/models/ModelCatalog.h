#pragma once

#include "affectscope/EmotionTypes.h"

#include <istream>
#include <string>

namespace affectscope {
namespace models {

constexpr const char* kManifestFileName = "ensemble.manifest";

/**
 * Parse an ensemble manifest.
 *
 * One model per line, whitespace separated, '#' starts a comment:
 *
 *   <name> <artifact> <weight> <height> <width> <channels> [rank]
 *
 * Relative artifact paths resolve against baseDir. Throws std::runtime_error
 * with the offending line number on malformed input.
 */
EnsembleConfig parse_manifest(std::istream& in, const std::string& baseDir);

/**
 * Read <modelsDir>/ensemble.manifest. Entries whose artifact is missing are
 * skipped with a warning; a missing manifest yields an empty config.
 */
EnsembleConfig load_catalog(const std::string& modelsDir);

}  // namespace models
}  // namespace affectscope
