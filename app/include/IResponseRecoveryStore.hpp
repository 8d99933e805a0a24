/*
 * Persistence surface for partial streamed responses
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef I_RESPONSE_RECOVERY_STORE_HPP
#define I_RESPONSE_RECOVERY_STORE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * Flat key/value store keyed by stream session id
 *
 * An id stays "pending" until remove() is called for it. Implementations
 * must be safe to call from several session threads at once.
 */
class IResponseRecoveryStore {
public:
    virtual ~IResponseRecoveryStore() = default;

    /**
     * Insert or overwrite. Returns false if the write could not be persisted.
     */
    virtual bool put(const std::string& id, const std::string& text) = 0;

    virtual std::optional<std::string> get(const std::string& id) const = 0;

    virtual bool remove(const std::string& id) = 0;

    virtual std::vector<std::string> list_pending_ids() const = 0;
};

using RecoveryStorePtr = std::shared_ptr<IResponseRecoveryStore>;

#endif // I_RESPONSE_RECOVERY_STORE_HPP
