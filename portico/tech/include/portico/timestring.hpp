#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

#include "portico/timedef.hpp"

namespace portico {

// Length of an IMF-fixdate, as in "Sun, 06 Nov 1994 08:49:37 GMT".
inline constexpr std::size_t kRFC7231DateStrLen = 29;

// Writes the IMF-fixdate of 'tp' (second precision, always GMT) to 'out', which needs kRFC7231DateStrLen chars.
// No null terminator. Returns the iterator past the last written char.
constexpr auto TimeToStringRFC7231(SysTimePoint tp, auto out) {
  using namespace std::chrono;
  constexpr std::string_view kWeekDays = "SunMonTueWedThuFriSat";
  constexpr std::string_view kMonths = "JanFebMarAprMayJunJulAugSepOctNovDec";

  const auto put = [&out](std::string_view chars) {
    for (char ch : chars) {
      *out++ = ch;
    }
  };
  const auto putDigits = [&out](unsigned value, int nbDigits) {
    for (unsigned divisor = nbDigits == 4 ? 1000U : 10U; divisor != 0; divisor /= 10U) {
      *out++ = static_cast<char>('0' + ((value / divisor) % 10U));
    }
  };

  const auto secs = time_point_cast<seconds>(tp);
  const auto day = floor<days>(secs);
  const year_month_day ymd{day};
  const hh_mm_ss hms{secs - day};

  put(kWeekDays.substr(3U * weekday{day}.c_encoding(), 3U));
  put(", ");
  putDigits(static_cast<unsigned>(ymd.day()), 2);
  put(" ");
  put(kMonths.substr(3U * (static_cast<unsigned>(ymd.month()) - 1U), 3U));
  put(" ");
  putDigits(static_cast<unsigned>(static_cast<int>(ymd.year())), 4);
  put(" ");
  putDigits(static_cast<unsigned>(hms.hours().count()), 2);
  put(":");
  putDigits(static_cast<unsigned>(hms.minutes().count()), 2);
  put(":");
  putDigits(static_cast<unsigned>(hms.seconds().count()), 2);
  put(" GMT");
  return out;
}

}  // namespace portico
