#ifndef RICHTEXT_ANSI_HPP
#define RICHTEXT_ANSI_HPP

#include <string_view>

namespace richtext::ansi {

// Regular colors

inline constexpr std::u8string_view black = u8"\x1B[30m";
inline constexpr std::u8string_view red = u8"\x1B[31m";
inline constexpr std::u8string_view green = u8"\x1B[32m";
inline constexpr std::u8string_view yellow = u8"\x1B[33m";
inline constexpr std::u8string_view blue = u8"\x1B[34m";
inline constexpr std::u8string_view magenta = u8"\x1B[35m";

// High-intensity colors

inline constexpr std::u8string_view h_black = u8"\x1B[0;90m";
inline constexpr std::u8string_view h_red = u8"\x1B[0;91m";
inline constexpr std::u8string_view h_green = u8"\x1B[0;92m";
inline constexpr std::u8string_view h_yellow = u8"\x1B[0;93m";
inline constexpr std::u8string_view h_blue = u8"\x1B[0;94m";
inline constexpr std::u8string_view h_magenta = u8"\x1B[0;95m";
inline constexpr std::u8string_view h_white = u8"\x1B[0;97m";

// Select Graphic Rendition building blocks

/// @brief Control Sequence Introducer.
inline constexpr std::u8string_view csi = u8"\x1B[";
/// @brief Terminates an SGR sequence started with `csi`.
inline constexpr char8_t sgr_end = u8'm';

inline constexpr std::u8string_view sgr_bold = u8"1";
inline constexpr std::u8string_view sgr_italic = u8"3";
inline constexpr std::u8string_view sgr_underline = u8"4";
inline constexpr std::u8string_view sgr_strikethrough = u8"9";
/// @brief Followed by `;r;g;b`, sets a 24-bit foreground color.
inline constexpr std::u8string_view sgr_foreground_rgb = u8"38;2";
/// @brief Followed by `;r;g;b`, sets a 24-bit background color.
inline constexpr std::u8string_view sgr_background_rgb = u8"48;2";

// Other sequences

inline constexpr std::u8string_view reset = u8"\033[0m";

} // namespace richtext::ansi

#endif
