#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace baton
{
    namespace configure
    {
        constexpr const char* env_BATON_OPTIONS = "BATON_OPTIONS";

        constexpr std::string_view opt_timeout = "timeout";
        constexpr std::string_view opt_size = "size";
    }

    struct options_t
    {
        /// applied to every single wait of a transfer, not to the transfer as a whole
        std::chrono::milliseconds m_timeout{5000};
        /// byte length of a region provisioned by baton tools
        std::size_t m_region_bytes = 65536;
    };

    /// parses "name=value,name=value...,name=value", missing names keep their defaults;
    /// names: timeout (milliseconds), size (bytes)
    /// @throws configure::unsupported_option, configure::not_a_number_option_value, configure::impossible_option_value
    options_t options_from_comma_separated(std::string_view cv);

    /// same syntax, read from the env variable BATON_OPTIONS; defaults when the variable is not set
    options_t options_from_env();
}
