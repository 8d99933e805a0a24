/*
 * In-memory and JSON-file recovery stores
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef RECOVERY_STORES_HPP
#define RECOVERY_STORES_HPP

#include "IResponseRecoveryStore.hpp"

#include <map>
#include <mutex>
#include <string>

class InMemoryRecoveryStore : public IResponseRecoveryStore {
public:
    bool put(const std::string& id, const std::string& text) override;
    std::optional<std::string> get(const std::string& id) const override;
    bool remove(const std::string& id) override;
    std::vector<std::string> list_pending_ids() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> entries_;
};

/**
 * Store backed by a single JSON object file: { "<id>": "<partial text>" }
 *
 * Every mutation rewrites the whole file through a temporary file and a
 * rename, so a reader never sees a half-written file and the last
 * successful put survives the process being killed.
 */
class JsonFileRecoveryStore : public IResponseRecoveryStore {
public:
    /**
     * Loads existing entries. An unreadable or corrupt file is logged and
     * treated as empty; it is replaced on the next mutation.
     */
    explicit JsonFileRecoveryStore(std::string path);

    bool put(const std::string& id, const std::string& text) override;
    std::optional<std::string> get(const std::string& id) const override;
    bool remove(const std::string& id) override;
    std::vector<std::string> list_pending_ids() const override;

    const std::string& path() const { return path_; }

private:
    void load();
    bool persist() const;

    std::string path_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> entries_;
};

#endif // RECOVERY_STORES_HPP
