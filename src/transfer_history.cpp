#include "transfer_history.hpp"
#include "errors.hpp"
#include "event_log.hpp"
#include <fstream>
#include <string>

namespace history {

TransferHistory::TransferHistory(std::filesystem::path journal) : journal_(std::move(journal)) {}

void TransferHistory::append(const protocol::TransferRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);

    if (journal_.empty()) return;

    std::error_code ec;
    if (journal_.has_parent_path()) {
        std::filesystem::create_directories(journal_.parent_path(), ec);
    }
    std::ofstream out(journal_, std::ios::app);
    if (!out.is_open()) {
        throw errors::StorageError("Could not open transfer journal: " + journal_.string());
    }
    nlohmann::json j = record;
    out << j.dump() << "\n";
    if (!out) {
        throw errors::StorageError("Could not append to transfer journal: " + journal_.string());
    }
}

std::vector<protocol::TransferRecord> TransferHistory::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::size_t TransferHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::vector<protocol::TransferRecord> TransferHistory::load_journal(const std::filesystem::path& journal) {
    std::vector<protocol::TransferRecord> records;
    std::ifstream in(journal);
    if (!in.is_open()) return records;

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        try {
            records.push_back(nlohmann::json::parse(line).get<protocol::TransferRecord>());
        } catch (const nlohmann::json::exception& e) {
            event_log::warn("Skipping journal line " + std::to_string(line_no) + " of " +
                            journal.string() + ": " + e.what());
        }
    }
    return records;
}

} // namespace history
