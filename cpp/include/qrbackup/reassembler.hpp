#pragma once

#include "qrbackup/capabilities.hpp"
#include "qrbackup/frame.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace qrbackup::reassembler {

using Bytes = std::vector<std::uint8_t>;

// All frames seen so far for one (file name, checksum) identity.
struct ReassemblyGroup {
    std::string identifier;
    std::string file_name;
    std::uint32_t checksum = 0;
    std::vector<frame::Frame> frames;
};

enum class GroupStatus {
    Verified,
    Corrupted,
    MissingParts,
    ConflictingMetadata,
};

const char* StatusName(GroupStatus status);

struct GroupResult {
    std::string identifier;
    std::string file_name;
    std::uint32_t checksum = 0;
    std::size_t frames = 0;
    GroupStatus status = GroupStatus::Verified;
    // Filled for Verified and Corrupted.
    Bytes data;
    std::string error;
    // Lowest missing indices, at most kMaxListedParts of them.
    std::vector<std::uint32_t> missing;
    std::uint64_t missing_total = 0;
    std::vector<std::uint32_t> found;

    bool Verified() const noexcept { return status == GroupStatus::Verified; }
};

// Orders and concatenates the group's bodies. Throws ConflictingMetadataError when
// frames disagree on the part count, carry an index outside it, or carry different
// bodies for one index, and MissingPartsError when indices are absent.
// Byte-identical duplicates are accepted.
Bytes Assemble(const ReassemblyGroup& group);

// Throws CorruptionError when `data` does not match the group checksum.
void Verify(const ReassemblyGroup& group, const Bytes& data);

// Assemble + Verify with the failure captured in the result.
GroupResult Resolve(const ReassemblyGroup& group);

class Reassembler {
public:
    explicit Reassembler(const TextTranscoder& transcoder);

    // Transcodes and decodes one transport string. Malformed input is recorded in
    // Rejected() and false is returned.
    bool AddCode(const std::string& code);
    void AddFrame(frame::Frame frame);

    const std::map<std::string, ReassemblyGroup>& Groups() const noexcept { return groups_; }
    const std::vector<std::string>& Rejected() const noexcept { return rejected_; }

    // Resolves every group in identifier order and discards them.
    std::vector<GroupResult> ResolveAll();

private:
    const TextTranscoder& transcoder_;
    std::map<std::string, ReassemblyGroup> groups_;
    std::vector<std::string> rejected_;
};

}  // namespace qrbackup::reassembler
