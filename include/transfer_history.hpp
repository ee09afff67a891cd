#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <vector>
#include "protocol/transfer_record.hpp"

namespace history {

// Completed transfers in completion order. Optionally mirrored to a
// JSON-lines file, one record per line.
class TransferHistory {
public:
    TransferHistory() = default;
    explicit TransferHistory(std::filesystem::path journal);

    // Throws errors::StorageError if the journal cannot be written; the
    // in-memory entry is kept either way.
    void append(const protocol::TransferRecord& record);

    std::vector<protocol::TransferRecord> snapshot() const;
    std::size_t size() const;

    // Reads a journal written by append(). Malformed lines are skipped.
    static std::vector<protocol::TransferRecord> load_journal(const std::filesystem::path& journal);

private:
    std::filesystem::path journal_;
    mutable std::mutex mutex_;
    std::vector<protocol::TransferRecord> records_;
};

} // namespace history
