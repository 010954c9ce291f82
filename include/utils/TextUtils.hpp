/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TEXT_UTILS_HPP
#define TEXT_UTILS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace SoloAdventure {
namespace TextUtils {

std::string toLower(std::string_view text);
std::string trim(std::string_view text);

// Splits on runs of whitespace, dropping empty tokens
std::vector<std::string> splitWords(std::string_view text);
std::string join(const std::vector<std::string> &parts, std::string_view separator);

bool isDigits(std::string_view text);
bool startsWith(std::string_view text, std::string_view prefix);

// Substitutes every "{key}" with value
std::string replaceAll(std::string text, std::string_view key, std::string_view value);

// Content message templates carry {roll} and {total}
std::string formatRollTemplate(const std::string &templ, int roll, int total);

// "+2", "-1", "+0"
std::string signedNumber(int value);

} // namespace TextUtils
} // namespace SoloAdventure

#endif // TEXT_UTILS_HPP
