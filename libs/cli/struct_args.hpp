#pragma once

#include <optional>
#include <ostream>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <libs/cli/get_option.hpp>

namespace args {

namespace detail {

struct option_info {
  std::string_view long_name;
  std::string_view short_name;
  std::string_view description;
};

struct parser_iface {
  virtual const char* get_option(const option_info& opt) = 0;
  virtual const char* get_required_option(const option_info& opt) = 0;
};

inline parser_iface* current_parser = nullptr;

class arguments_parser : public parser_iface {
public:
  arguments_parser(std::span<char*> args) : args_{args} {}

  const char* get_option(const option_info& opt) override {
    const char* val = ::get_option(args_, opt.long_name);
    if (!val)
      val = ::get_option(args_, opt.short_name);
    return val;
  }

  const char* get_required_option(const option_info& opt) override {
    const char* val = get_option(opt);
    if (!val)
      missing_opts_.push_back(opt.long_name);
    return val;
  }

  [[nodiscard]] std::span<const std::string_view> missing_options() const noexcept { return missing_opts_; }

private:
  std::span<char*> args_;
  std::vector<std::string_view> missing_opts_;
};

class args_help_parser : public parser_iface {
public:
  args_help_parser(std::ostream& out) noexcept : out_{out} {}

  const char* get_option(const option_info& opt) override {
    out_ << '\t' << opt.long_name << (opt.short_name.empty() ? "" : ", ") << opt.short_name << " VAL\t"
         << opt.description << '\n';
    return nullptr;
  }

  const char* get_required_option(const option_info& opt) override { return get_option(opt); }

private:
  std::ostream& out_;
};

class usage_parser : public parser_iface {
public:
  usage_parser(std::ostream& out) noexcept : out_{out} {}

  const char* get_option(const option_info& opt) override {
    out_ << " [" << (opt.short_name.empty() ? opt.long_name : opt.short_name) << " VAL]";
    return nullptr;
  }
  const char* get_required_option(const option_info& opt) override {
    out_ << ' ' << (opt.short_name.empty() ? opt.long_name : opt.short_name) << " VAL";
    return nullptr;
  }

private:
  std::ostream& out_;
};

} // namespace detail

template <typename T>
class option : private detail::option_info {
public:
  option(const char* long_name, const char* description)
      : detail::option_info{.long_name = long_name, .short_name = {}, .description = description} {}

  option(const char* short_name, const char* long_name, const char* description)
      : detail::option_info{.long_name = long_name, .short_name = short_name, .description = description} {}

  option& default_value(const T& val) {
    default_ = val;
    return *this;
  }

  operator T() const {
    const char* val =
        default_ ? detail::current_parser->get_option(*this) : detail::current_parser->get_required_option(*this);
    return val ? T{val} : default_.value_or(T{});
  }

private:
  std::optional<T> default_;
};

/// Repeatable option. Occurrences of the long name are collected before the short ones. Never required.
template <typename T>
class option<std::vector<T>> : private detail::option_info {
public:
  option(const char* long_name, const char* description)
      : detail::option_info{.long_name = long_name, .short_name = {}, .description = description} {}

  option(const char* short_name, const char* long_name, const char* description)
      : detail::option_info{.long_name = long_name, .short_name = short_name, .description = description} {}

  operator std::vector<T>() const {
    std::vector<T> res;
    while (const char* val = detail::current_parser->get_option(*this))
      res.push_back(T{val});
    return res;
  }
};

/// Throws std::system_error with std::errc::invalid_argument if any required option is missing.
template <typename T>
T parse(std::span<char*> args) {
  detail::arguments_parser p{args};
  detail::current_parser = &p;
  T res{};
  detail::current_parser = nullptr;
  if (!p.missing_options().empty()) {
    throw std::system_error{
        std::make_error_code(std::errc::invalid_argument),
        fmt::format("missing required options: {}", fmt::join(p.missing_options(), ", "))
    };
  }
  return res;
}

template <typename T>
void args_help(std::ostream& out) {
  detail::args_help_parser p{out};
  detail::current_parser = &p;
  T{};
  detail::current_parser = nullptr;
}

template <typename T>
void usage(std::string_view progname, std::ostream& out) {
  out << "Usage: " << progname;
  detail::usage_parser p{out};
  detail::current_parser = &p;
  T{};
  detail::current_parser = nullptr;
  out << '\n';
}

} // namespace args
