/*
 * Recovery store implementations
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "RecoveryStores.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

// ============================================================================
// InMemoryRecoveryStore
// ============================================================================

bool InMemoryRecoveryStore::put(const std::string& id, const std::string& text)
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[id] = text;
    return true;
}

std::optional<std::string> InMemoryRecoveryStore::get(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryRecoveryStore::remove(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(id);
    return true;
}

std::vector<std::string> InMemoryRecoveryStore::list_pending_ids() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& entry : entries_) {
        ids.push_back(entry.first);
    }
    return ids;
}

// ============================================================================
// JsonFileRecoveryStore
// ============================================================================

JsonFileRecoveryStore::JsonFileRecoveryStore(std::string path)
    : path_(std::move(path))
{
    load();
}

bool JsonFileRecoveryStore::put(const std::string& id, const std::string& text)
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[id] = text;
    return persist();
}

std::optional<std::string> JsonFileRecoveryStore::get(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool JsonFileRecoveryStore::remove(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(id) == 0) {
        return true;
    }
    return persist();
}

std::vector<std::string> JsonFileRecoveryStore::list_pending_ids() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& entry : entries_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void JsonFileRecoveryStore::load()
{
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return;
    }

    std::ifstream input(path_);
    if (!input) {
        if (auto logger = Logger::get_logger(Logger::kStream)) {
            logger->warn("Cannot open recovery store {}", path_);
        }
        return;
    }

    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::string errors;
    bool parsed = false;
    try {
        parsed = Json::parseFromStream(reader_builder, input, &root, &errors);
    } catch (const Json::Exception& ex) {
        errors = ex.what();
    }

    if (!parsed || !root.isObject()) {
        if (auto logger = Logger::get_logger(Logger::kStream)) {
            logger->warn("Ignoring corrupt recovery store {}: {}", path_,
                         errors.empty() ? "not a JSON object" : errors);
        }
        return;
    }

    for (const auto& id : root.getMemberNames()) {
        if (root[id].isString()) {
            entries_[id] = root[id].asString();
        }
    }

    if (auto logger = Logger::get_logger(Logger::kStream)) {
        logger->debug("Loaded {} pending response(s) from {}", entries_.size(), path_);
    }
}

bool JsonFileRecoveryStore::persist() const
{
    namespace fs = std::filesystem;

    Json::Value root(Json::objectValue);
    for (const auto& [id, text] : entries_) {
        root[id] = text;
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";

    const fs::path target(path_);
    const fs::path temp = target.string() + ".tmp";
    std::error_code ec;

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            if (auto logger = Logger::get_logger(Logger::kStream)) {
                logger->error("Cannot create {}: {}", target.parent_path().string(), ec.message());
            }
            return false;
        }
    }

    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output) {
            if (auto logger = Logger::get_logger(Logger::kStream)) {
                logger->error("Cannot write recovery store {}", temp.string());
            }
            return false;
        }
        output << Json::writeString(writer, root) << '\n';
        output.flush();
        if (!output) {
            if (auto logger = Logger::get_logger(Logger::kStream)) {
                logger->error("Short write to recovery store {}", temp.string());
            }
            return false;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        if (auto logger = Logger::get_logger(Logger::kStream)) {
            logger->error("Cannot replace recovery store {}: {}", path_, ec.message());
        }
        fs::remove(temp, ec);
        return false;
    }
    return true;
}
