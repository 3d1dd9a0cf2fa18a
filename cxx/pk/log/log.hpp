#pragma once

#include <exception>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace pk {
namespace Log {

enum struct Display
{
  None = 0,
  Ephemeral = 1,
  Low = 2,
  High = 3
};

/* Only the most recent entries are retained */
inline constexpr std::size_t SavedLimit = 1024;

void SetDisplayLevel(Display const l);
auto CurrentLevel() -> Display;
auto IsHigh() -> bool;
auto FormatEntry(std::string const &category, fmt::string_view fmt, fmt::format_args args) -> std::string;
void SaveEntry(std::string const &entry, fmt::text_style const style, Display const level);
auto Saved() -> std::vector<std::string>;
void ClearSaved();

template <typename... Args> inline void Print(std::string const &category, fmt::format_string<Args...> fstr, Args &&...args)
{
  SaveEntry(FormatEntry(category, fstr, fmt::make_format_args(args...)), fmt::text_style(), Display::Ephemeral);
}

template <typename... Args> inline void Debug(std::string const &category, fmt::format_string<Args...> fstr, Args &&...args)
{
  if (IsHigh()) { SaveEntry(FormatEntry(category, fstr, fmt::make_format_args(args...)), fmt::text_style(), Display::High); }
}

template <typename... Args>
inline void Warn(std::string const &category, fmt::format_string<Args...> const &fstr, Args &&...args)
{
  SaveEntry(FormatEntry(category, fstr, fmt::make_format_args(args...)), fmt::fg(fmt::terminal_color::bright_yellow), Display::None);
}

struct Failure : std::runtime_error
{
  template <typename... Args>
  Failure(std::string const &cat, fmt::format_string<Args...> fs, Args &&...args)
    : std::runtime_error(FormatEntry(cat, fs, fmt::make_format_args(args...)))
  {
  }
};

/* Bad operator name, missing argument, bad weight or a shape that does not match the stored parameters */
struct ConfigFailure : Failure
{
  using Failure::Failure;
};

/* A factorization or decomposition did not succeed, or something came back non-finite */
struct NumericFailure : Failure
{
  using Failure::Failure;
};

/* An optional backend an operator relies on is not present */
struct MissingBackend : Failure
{
  using Failure::Failure;
};

} // namespace Log
} // namespace pk
