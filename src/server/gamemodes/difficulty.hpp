#pragma once

#include <string_view>

namespace modevote::server::gamemodes {

// Numeric difficulty levels understood by the host engine.
inline constexpr float kDifficultyBeginner = 1.0f;
inline constexpr float kDifficultyNormal = 2.0f;
inline constexpr float kDifficultyHard = 4.0f;
inline constexpr float kDifficultySuicidal = 5.0f;
inline constexpr float kDifficultyHellOnEarth = 7.0f;

/*
=============
ResolveDifficulty

Maps a free-text difficulty label onto the host's numeric difficulty.
Labels are compared case-insensitively against ordered synonym sets and the
first set containing a prefix of the label wins. Unrecognized labels are
read as a literal number and non-numeric text resolves to 0.
=============
*/
float ResolveDifficulty(std::string_view label);

} // namespace modevote::server::gamemodes
