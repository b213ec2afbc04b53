#pragma once

#include "qrbackup/frame.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace qrbackup::splitter {

using Bytes = std::vector<std::uint8_t>;

struct SplitPlan {
    std::string file_name;
    std::uint32_t checksum = 0;
    std::size_t file_size = 0;
    std::size_t budget = 0;
    std::size_t overhead = 0;
    std::size_t body_capacity = 0;
    std::uint32_t count = 0;
    std::size_t last_body_len = 0;
    std::size_t last_padding = 0;

    // Encoded length shared by every frame of the plan.
    std::size_t FrameSize() const noexcept { return budget; }
};

// Throws CapacityError when the name overhead leaves no room for a body under
// `budget`, and FormatError for an empty or NUL-containing name.
SplitPlan Plan(const std::string& file_name, std::size_t file_size, std::uint32_t checksum, std::size_t budget);

frame::Frame MakeFrame(const SplitPlan& plan, const Bytes& data, std::uint32_t index);

// Calls `sink` once per encoded frame, in index order.
void ForEachFrame(const SplitPlan& plan,
                  const Bytes& data,
                  const std::function<void(std::uint32_t index, const Bytes& encoded)>& sink);

std::vector<Bytes> Split(const Bytes& data, const std::string& file_name, std::size_t budget);

}  // namespace qrbackup::splitter
