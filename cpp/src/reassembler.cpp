#include "qrbackup/reassembler.hpp"

#include "qrbackup/checksum.hpp"
#include "qrbackup/constants.hpp"
#include "qrbackup/errors.hpp"

#include <algorithm>

namespace qrbackup::reassembler {

namespace {

std::vector<const frame::Frame*> SortedByIndex(const ReassemblyGroup& group) {
    std::vector<const frame::Frame*> sorted;
    sorted.reserve(group.frames.size());
    for (const auto& part : group.frames) {
        sorted.push_back(&part);
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const frame::Frame* a, const frame::Frame* b) {
        return a->index < b->index;
    });
    return sorted;
}

}  // namespace

const char* StatusName(GroupStatus status) {
    switch (status) {
        case GroupStatus::Verified:
            return "verified";
        case GroupStatus::Corrupted:
            return "corrupted";
        case GroupStatus::MissingParts:
            return "missing parts";
        case GroupStatus::ConflictingMetadata:
            return "conflicting metadata";
    }
    return "unknown";
}

Bytes Assemble(const ReassemblyGroup& group) {
    if (group.frames.empty()) {
        throw MissingPartsError(group.identifier, {}, 0, {});
    }
    const std::uint32_t count = group.frames.front().count;
    for (const auto& part : group.frames) {
        if (part.count != count) {
            throw ConflictingMetadataError("Detected conflicted data for file " + group.identifier
                                           + ": parts report counts " + std::to_string(count) + " and "
                                           + std::to_string(part.count));
        }
    }
    if (count == 0) {
        throw ConflictingMetadataError("Detected conflicted data for file " + group.identifier
                                       + ": part count is zero");
    }

    auto sorted = SortedByIndex(group);
    std::vector<std::uint32_t> found;
    std::vector<const frame::Frame*> unique;
    for (const frame::Frame* part : sorted) {
        if (part->index >= count) {
            throw ConflictingMetadataError("Detected conflicted data for file " + group.identifier + ": part index "
                                           + std::to_string(part->index) + " outside part count "
                                           + std::to_string(count));
        }
        if (!unique.empty() && unique.back()->index == part->index) {
            if (unique.back()->body != part->body) {
                throw ConflictingMetadataError("Detected conflicted data for file " + group.identifier
                                               + ": part " + std::to_string(part->index)
                                               + " was read with different contents");
            }
            continue;
        }
        unique.push_back(part);
        found.push_back(part->index);
    }

    if (found.size() != count) {
        // Walk the gaps between found indices so a garbled count never sizes a
        // per-index allocation.
        const std::uint64_t missing_total = static_cast<std::uint64_t>(count) - found.size();
        std::vector<std::uint32_t> missing;
        std::uint64_t next = 0;
        for (std::size_t i = 0; i <= found.size() && missing.size() < constants::kMaxListedParts; ++i) {
            const std::uint64_t gap_end = i < found.size() ? found[i] : count;
            for (; next < gap_end && missing.size() < constants::kMaxListedParts; ++next) {
                missing.push_back(static_cast<std::uint32_t>(next));
            }
            next = gap_end + 1;
        }
        throw MissingPartsError(group.identifier, std::move(missing), missing_total, std::move(found));
    }

    std::size_t total = 0;
    for (const frame::Frame* part : unique) {
        total += part->body.size();
    }
    Bytes out;
    out.reserve(total);
    for (const frame::Frame* part : unique) {
        out.insert(out.end(), part->body.begin(), part->body.end());
    }
    return out;
}

void Verify(const ReassemblyGroup& group, const Bytes& data) {
    std::uint32_t actual = checksum::Crc32(data);
    if (actual != group.checksum) {
        throw CorruptionError(group.identifier, group.checksum, actual);
    }
}

GroupResult Resolve(const ReassemblyGroup& group) {
    GroupResult result;
    result.identifier = group.identifier;
    result.file_name = group.file_name;
    result.checksum = group.checksum;
    result.frames = group.frames.size();
    try {
        result.data = Assemble(group);
        Verify(group, result.data);
        result.status = GroupStatus::Verified;
    } catch (const MissingPartsError& exc) {
        result.status = GroupStatus::MissingParts;
        result.error = exc.what();
        result.missing = exc.Missing();
        result.missing_total = exc.MissingTotal();
        result.found = exc.Found();
    } catch (const ConflictingMetadataError& exc) {
        result.status = GroupStatus::ConflictingMetadata;
        result.error = exc.what();
    } catch (const CorruptionError& exc) {
        result.status = GroupStatus::Corrupted;
        result.error = exc.what();
    }
    return result;
}

Reassembler::Reassembler(const TextTranscoder& transcoder) : transcoder_(transcoder) {}

bool Reassembler::AddCode(const std::string& code) {
    auto decoded = transcoder_.Decode(code);
    if (!decoded) {
        rejected_.push_back("Invalid transport string: " + code);
        return false;
    }
    try {
        AddFrame(frame::Decode(*decoded));
    } catch (const FormatError& exc) {
        rejected_.push_back(std::string("Invalid code data: ") + exc.what());
        return false;
    }
    return true;
}

void Reassembler::AddFrame(frame::Frame frame) {
    std::string identifier = frame::Identifier(frame);
    auto it = groups_.find(identifier);
    if (it == groups_.end()) {
        ReassemblyGroup group;
        group.identifier = identifier;
        group.file_name = frame.file_name;
        group.checksum = frame.checksum;
        it = groups_.emplace(identifier, std::move(group)).first;
    }
    it->second.frames.push_back(std::move(frame));
}

std::vector<GroupResult> Reassembler::ResolveAll() {
    std::vector<GroupResult> results;
    results.reserve(groups_.size());
    for (const auto& entry : groups_) {
        results.push_back(Resolve(entry.second));
    }
    groups_.clear();
    return results;
}

}  // namespace qrbackup::reassembler
