/**
 * @file input_classifier.h
 * @brief Groups uploaded files into a ::modelsmith::model_bundle.
 *
 * Classification only looks at file names. Label files, readmes and other
 * inert companions are ignored; anything else that is not part of exactly one
 * complete model is rejected.
 */
#pragma once

#include <expected>
#include <string>
#include <vector>

#include "modelsmith/error.h"
#include "modelsmith/model_bundle.h"

namespace modelsmith
{

struct input_file
{
    std::string name; // original file name, may contain a relative directory
    std::string ref;  // content store reference
};

/**
 * @brief Classifies @p files into a single model bundle.
 *
 * Errors use ::modelsmith::error_code::ambiguous_input when more than one
 * model could be formed (or extra model files are present),
 * ::modelsmith::error_code::unsupported_format for unknown file types and
 * ::modelsmith::error_code::missing_role when a model is incomplete.
 */
std::expected<model_bundle, error> classify(const std::vector<input_file>& files);

// True for files that classification ignores (labels, readmes, ...).
bool is_inert_file(const std::string& name);

} // namespace modelsmith
