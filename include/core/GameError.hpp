/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_ERROR_HPP
#define GAME_ERROR_HPP

#include <stdexcept>
#include <string>

namespace SoloAdventure {

/**
 * @brief Raised when trusted campaign/profile data is missing or malformed
 *
 * Unknown campaign, room, mob, companion, class or race ids and broken dice
 * expressions in content are programming/data errors, not gameplay results.
 */
class ContentError : public std::runtime_error {
public:
  explicit ContentError(const std::string &message)
      : std::runtime_error(message) {}
};

} // namespace SoloAdventure

#endif // GAME_ERROR_HPP
