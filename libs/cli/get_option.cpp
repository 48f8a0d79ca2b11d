#include <algorithm>
#include <cctype>
#include <iterator>

#include <libs/cli/get_option.hpp>

bool get_flag(std::span<char*>& args, std::string_view flag) noexcept {
  if (args.empty())
    return false;
  auto first = std::next(args.begin());
  auto last = args.end();
  auto fres = std::remove(first, last, flag);
  args = args.subspan(0, args.size() - std::distance(fres, last));
  return fres != last;
}

const char* get_option(std::span<char*>& args, std::string_view option) noexcept {
  if (args.empty() || option.empty())
    return nullptr;
  auto first = std::next(args.begin());
  auto last = args.end();
  // values may be negative numbers, only a lone dash or another option name is rejected
  auto fres = std::adjacent_find(first, last, [&](const char* opt, const char* val) {
    const bool is_option =
        val[0] == '-' && (val[1] == '\0' || val[1] == '-' || std::isalpha(static_cast<unsigned char>(val[1])));
    return opt == option && !is_option;
  });
  if (fres == last)
    return nullptr;
  fres = std::rotate(fres, std::next(fres, 2), last);
  args = args.subspan(0, args.size() - 2);
  return *std::next(fres);
}
