#pragma once

#include <fmt/format.h>

#include <concepts>
#include <exception>
#include <string>
#include <string_view>
#include <system_error>

namespace framed {

// An error value that can be rendered on a single log line.
template <class E>
concept DisplayableError = std::convertible_to<const E&, std::string_view> || std::derived_from<E, std::exception> ||
                           std::same_as<E, std::error_code> || fmt::is_formattable<E>::value;

// Renders a displayable error into a string.
// Exceptions render as what(), error codes as their message, everything else through fmt.
template <DisplayableError E>
std::string DisplayError(const E& error) {
  if constexpr (std::convertible_to<const E&, std::string_view>) {
    return std::string(static_cast<std::string_view>(error));
  } else if constexpr (std::derived_from<E, std::exception>) {
    return error.what();
  } else if constexpr (std::same_as<E, std::error_code>) {
    return error.message();
  } else {
    return fmt::format("{}", error);
  }
}

}  // namespace framed
