#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace qrbackup::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);
// Positive integer value of `name`, or `default_value` when unset or unparsable.
std::size_t GetSize(std::string_view name, std::size_t default_value);

}  // namespace qrbackup::env
