#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace qrbackup {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UsageError : public Error {
public:
    using Error::Error;
};

class IoError : public Error {
public:
    using Error::Error;
};

class FormatError : public Error {
public:
    using Error::Error;
};

class CapacityError : public Error {
public:
    using Error::Error;
};

class ConflictingMetadataError : public Error {
public:
    using Error::Error;
};

class MissingPartsError : public Error {
public:
    // `missing` may hold only the lowest indices; `missing_total` is the full count.
    MissingPartsError(const std::string& identifier,
                      std::vector<std::uint32_t> missing,
                      std::uint64_t missing_total,
                      std::vector<std::uint32_t> found);

    const std::vector<std::uint32_t>& Missing() const noexcept { return missing_; }
    std::uint64_t MissingTotal() const noexcept { return missing_total_; }
    const std::vector<std::uint32_t>& Found() const noexcept { return found_; }

private:
    std::vector<std::uint32_t> missing_;
    std::uint64_t missing_total_;
    std::vector<std::uint32_t> found_;
};

class CorruptionError : public Error {
public:
    CorruptionError(const std::string& identifier, std::uint32_t expected, std::uint32_t actual);

    std::uint32_t Expected() const noexcept { return expected_; }
    std::uint32_t Actual() const noexcept { return actual_; }

private:
    std::uint32_t expected_;
    std::uint32_t actual_;
};

// "[0, 2, 5]". At most kMaxListedParts entries are shown; when `total` exceeds the
// number shown the rest is summarised as "... N more".
std::string FormatIndexList(const std::vector<std::uint32_t>& indices, std::uint64_t total);
std::string FormatIndexList(const std::vector<std::uint32_t>& indices);
std::string FormatCrc(std::uint32_t crc);

}  // namespace qrbackup
