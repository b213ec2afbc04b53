#include "qrbackup/collector.hpp"

#include "qrbackup/constants.hpp"

#include <cctype>
#include <sstream>

namespace qrbackup::collector {

std::string Trim(std::string_view value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return std::string(value.substr(begin, end - begin));
}

bool IsCandidate(std::string_view code) {
    return code.substr(0, constants::kTransportPrefix.size()) == constants::kTransportPrefix;
}

bool CodeCollector::Add(std::string code) {
    code = Trim(code);
    if (!IsCandidate(code)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return codes_.insert(std::move(code)).second;
}

std::size_t CodeCollector::AddCodesText(const std::string& text) {
    std::istringstream iss(text);
    std::string line;
    std::size_t candidates = 0;
    while (std::getline(iss, line)) {
        std::string trimmed = Trim(line);
        if (!IsCandidate(trimmed)) {
            continue;
        }
        ++candidates;
        Add(std::move(trimmed));
    }
    return candidates;
}

std::size_t CodeCollector::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return codes_.size();
}

std::vector<std::string> CodeCollector::Codes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(codes_.begin(), codes_.end());
}

}  // namespace qrbackup::collector
