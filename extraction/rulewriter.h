#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "ruleextractor.hpp"

namespace kbann {

/* -------------------------------------------------------------- *
 * Rule output: one quoted rule per line                          *
 * -------------------------------------------------------------- */

/** 'text' with backslashes and single quotes escaped. */
std::string quoteRule(const std::string& text);

/** Write every rule as a quoted line. */
void writeRules(const std::vector<ExtractedRule>& rules, std::ostream& out);

/**
 * @brief Save rules to path, replacing any existing file.
 * @throws std::runtime_error if the file cannot be written.
 */
void saveRules(const std::vector<ExtractedRule>& rules, const std::string& path);

} // namespace kbann
