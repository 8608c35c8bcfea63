#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>

#include <baton_config.hpp>
#include <baton_errors.hpp>

namespace
{
  // throws if the value is not a number or does not fit into uint64_t
  uint64_t ensure_value_numeric(std::string_view name, std::string_view value)
  {
    uint64_t ret = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ret);

    if(ec == std::errc::invalid_argument || value.empty() || ptr != value.data() + value.size()) {
      throw baton::configure::not_a_number_option_value(std::source_location::current(), name);
    }
    if(ec == std::errc::result_out_of_range) {
      throw baton::configure::impossible_option_value(std::source_location::current(), name);
    }
    return ret;
  }

  void set_option(baton::options_t& ret, std::string_view name, std::string_view value)
  {
    if(name == baton::configure::opt_timeout) {
      const auto ms = ensure_value_numeric(name, value);
      if(ms > uint64_t(std::numeric_limits<std::chrono::milliseconds::rep>::max())) {
        throw baton::configure::impossible_option_value(std::source_location::current(), name);
      }
      ret.m_timeout = std::chrono::milliseconds(ms);
    } else
    if(name == baton::configure::opt_size) {
      const auto bytes = ensure_value_numeric(name, value);
      if(bytes > uint64_t(std::numeric_limits<int32_t>::max())) {
        throw baton::configure::impossible_option_value(std::source_location::current(), name);
      }
      ret.m_region_bytes = static_cast<std::size_t>(bytes);
    } else {
      throw baton::configure::unsupported_option(std::source_location::current(), std::string(name));
    }
  }
}

namespace baton
{

options_t options_from_comma_separated(std::string_view cv)
{
  options_t ret;

  // parser state: two lexs, two states
  enum class state {
    reading_name, // from begin of string or the most recent , until =
    reading_value // from most recent = to , or end of string
  } state_v = state::reading_name;

  std::string_view name;
  std::size_t b = 0; // begin of a current lex
  for(std::size_t e = 0; e <= cv.size(); e++) {
    const bool at_end = e == cv.size();

    if(state_v == state::reading_name) {
      if(at_end || cv[e] == ',') {
        // "a,,b" or a trailing comma: nothing to set, a bare name is not allowed
        if(e != b) {
          throw configure::unsupported_option(std::source_location::current(), std::string(cv.substr(b, e - b)));
        }
        b = e + 1;
      } else
      if(cv[e] == '=') {
        name = cv.substr(b, e - b);
        state_v = state::reading_value;
        b = e + 1;
      }
    } else {
      if(at_end || cv[e] == ',') {
        set_option(ret, name, cv.substr(b, e - b));
        state_v = state::reading_name;
        b = e + 1;
      }
    }
  }
  return ret;
}

options_t options_from_env()
{
  if(const char* env_p = std::getenv(configure::env_BATON_OPTIONS)) {
    return options_from_comma_separated(env_p);
  }
  return options_t{};
}

}
