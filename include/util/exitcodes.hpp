#pragma once

namespace exitc
{
inline constexpr int ok        = 0;
inline constexpr int bad_args  = 2;
inline constexpr int no_server = 3;
inline constexpr int rejected  = 4;  // daemon replied ERR
}  // namespace exitc
