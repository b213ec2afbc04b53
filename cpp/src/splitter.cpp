#include "qrbackup/splitter.hpp"

#include "qrbackup/checksum.hpp"
#include "qrbackup/errors.hpp"

#include <limits>
#include <stdexcept>

namespace qrbackup::splitter {

SplitPlan Plan(const std::string& file_name, std::size_t file_size, std::uint32_t checksum, std::size_t budget) {
    SplitPlan plan;
    plan.file_name = file_name;
    plan.checksum = checksum;
    plan.file_size = file_size;
    plan.budget = budget;
    plan.overhead = frame::Encode(file_name, checksum, 0, 0, 0, {}).size();
    if (plan.overhead >= budget) {
        throw CapacityError("File name \"" + file_name + "\" needs " + std::to_string(plan.overhead)
                            + " header bytes, which does not fit the " + std::to_string(budget)
                            + "-byte symbol budget");
    }
    plan.body_capacity = budget - plan.overhead;

    std::size_t full_parts = file_size / plan.body_capacity;
    std::size_t remainder = file_size - full_parts * plan.body_capacity;
    std::size_t count = full_parts;
    if (remainder != 0 || file_size == 0) {
        count += 1;
        plan.last_body_len = remainder;
        plan.last_padding = plan.body_capacity - remainder;
    } else {
        plan.last_body_len = plan.body_capacity;
        plan.last_padding = 0;
    }
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        throw CapacityError("File \"" + file_name + "\" would need more than 2^32-1 parts");
    }
    plan.count = static_cast<std::uint32_t>(count);
    return plan;
}

frame::Frame MakeFrame(const SplitPlan& plan, const Bytes& data, std::uint32_t index) {
    if (index >= plan.count) {
        throw std::out_of_range("Frame index " + std::to_string(index) + " beyond part count "
                                + std::to_string(plan.count));
    }
    if (data.size() != plan.file_size) {
        throw std::invalid_argument("Split data does not match planned file size");
    }
    const bool last = index + 1 == plan.count;
    const std::size_t offset = static_cast<std::size_t>(index) * plan.body_capacity;
    const std::size_t body_len = last ? plan.last_body_len : plan.body_capacity;

    frame::Frame out;
    out.checksum = plan.checksum;
    out.count = plan.count;
    out.index = index;
    out.file_name = plan.file_name;
    out.padding = last ? plan.last_padding : 0;
    out.body.assign(data.begin() + static_cast<std::ptrdiff_t>(offset),
                    data.begin() + static_cast<std::ptrdiff_t>(offset + body_len));
    return out;
}

void ForEachFrame(const SplitPlan& plan,
                  const Bytes& data,
                  const std::function<void(std::uint32_t index, const Bytes& encoded)>& sink) {
    for (std::uint32_t index = 0; index < plan.count; ++index) {
        Bytes encoded = frame::Encode(MakeFrame(plan, data, index));
        sink(index, encoded);
    }
}

std::vector<Bytes> Split(const Bytes& data, const std::string& file_name, std::size_t budget) {
    SplitPlan plan = Plan(file_name, data.size(), checksum::Crc32(data), budget);
    std::vector<Bytes> frames;
    frames.reserve(plan.count);
    ForEachFrame(plan, data, [&frames](std::uint32_t, const Bytes& encoded) { frames.push_back(encoded); });
    return frames;
}

}  // namespace qrbackup::splitter
