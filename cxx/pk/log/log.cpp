#include "log.hpp"

#include <fmt/chrono.h>

#include <atomic>
#include <ctime>
#include <deque>
#include <mutex>
#include <stdio.h>

namespace pk {
namespace Log {

namespace {
std::atomic<Display>     displayLevel = Display::None;
std::mutex               logMutex;
std::deque<std::string>  savedEntries;

auto TheTime() -> std::string
{
  auto const t = std::time(nullptr);
  return fmt::format("{:%H:%M:%S}", fmt::localtime(t));
}
} // namespace

void SetDisplayLevel(Display const l)
{
  std::scoped_lock lock(logMutex);
  displayLevel = l;
  // Move the cursor one more line down so we don't erase the caller's output
  if (displayLevel == Display::Ephemeral) { fmt::print(stderr, "\n"); }
}

auto CurrentLevel() -> Display { return displayLevel; }

auto IsHigh() -> bool { return displayLevel == Display::High; }

auto FormatEntry(std::string const &category, fmt::string_view fmt, fmt::format_args args) -> std::string
{
  return fmt::format("[{}] [{:<6}] {}", TheTime(), category, fmt::vformat(fmt, args));
}

void SaveEntry(std::string const &s, fmt::text_style const style, Display const level)
{
  std::scoped_lock lock(logMutex);
  savedEntries.push_back(s);
  if (savedEntries.size() > SavedLimit) { savedEntries.pop_front(); }
  if (displayLevel >= level) {
    if (displayLevel == Display::Ephemeral) { fmt::print(stderr, "\033[A\33[2K\r"); }
    fmt::print(stderr, style, "{}\n", s);
  }
}

auto Saved() -> std::vector<std::string>
{
  std::scoped_lock lock(logMutex);
  return std::vector<std::string>(savedEntries.cbegin(), savedEntries.cend());
}

void ClearSaved()
{
  std::scoped_lock lock(logMutex);
  savedEntries.clear();
}

} // namespace Log
} // namespace pk
