#pragma once

#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace qrbackup::collector {

bool IsCandidate(std::string_view code);

// Thread-safe set of transport strings gathered from scanned images and codes
// files. Exact duplicates collapse to one entry.
class CodeCollector {
public:
    // Returns true when `code` is a candidate not seen before.
    bool Add(std::string code);

    // Adds every candidate line of a codes file; returns the number of candidate
    // lines (duplicates included).
    std::size_t AddCodesText(const std::string& text);

    std::size_t Size() const;
    std::vector<std::string> Codes() const;

private:
    mutable std::mutex mutex_;
    std::set<std::string> codes_;
};

std::string Trim(std::string_view value);

}  // namespace qrbackup::collector
