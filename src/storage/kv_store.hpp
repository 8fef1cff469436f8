#pragma once

#include "tinyboard/common.hpp"
#include "tinyboard/error.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace tinyboard::storage {

/**
 * Options for opening the store
 */
struct KvStoreOptions {
    bool create_if_missing{true};
    bool sync_writes{false};     // fsync every put
    size_t cache_size_mb{8};     // LRU block cache
};

/**
 * Ordered, durable key-value store backed by LevelDB.
 *
 * Keys and values are arbitrary byte strings. Iteration is in lexicographic
 * key order. All operations are safe to call concurrently from multiple
 * threads; LevelDB serializes writes internally. There is no cross-key
 * atomicity: every put is an independent single-key write.
 */
class KvStore {
public:
    struct Entry {
        std::string key;
        std::string value;
    };

    /**
     * Lazy cursor over all entries whose key starts with a prefix.
     * Must not outlive the store that created it.
     */
    class Scan {
    public:
        ~Scan();
        Scan(Scan&&) noexcept;
        Scan& operator=(Scan&&) noexcept;
        Scan(const Scan&) = delete;
        Scan& operator=(const Scan&) = delete;

        /**
         * Advance to the next matching entry
         * @param entry Filled with the entry on success
         * @return False once the prefix range is exhausted or on error
         */
        bool next(Entry& entry);

        /**
         * Error state of the underlying iterator; check after next() returns false
         */
        Result<void> status() const;

    private:
        friend class KvStore;
        struct State;
        explicit Scan(std::unique_ptr<State> state);
        std::unique_ptr<State> state_;
    };

    /**
     * Open (or create) a store in a directory
     * @param db_path Database directory, parents created if missing
     * @param options Open options
     * @throws StorageException if the database cannot be opened
     */
    explicit KvStore(const std::filesystem::path& db_path, const KvStoreOptions& options = {});
    ~KvStore();

    // Disable copy, allow move
    KvStore(const KvStore&) = delete;
    KvStore& operator=(const KvStore&) = delete;
    KvStore(KvStore&&) noexcept;
    KvStore& operator=(KvStore&&) noexcept;

    /**
     * Look up a key
     * @return Value, nullopt if absent, or a store error
     */
    Result<std::optional<std::string>> get(const std::string& key) const;

    /**
     * Write a key (overwrites)
     */
    Result<void> put(const std::string& key, const std::string& value);

    /**
     * Start a lazy prefix scan in key order
     */
    Scan scan_prefix(const std::string& prefix) const;

    /**
     * Count entries under a prefix without copying values
     */
    Result<size_t> count_prefix(const std::string& prefix) const;

    /**
     * Make all previous writes durable
     */
    Result<void> flush();

    const std::filesystem::path& path() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tinyboard::storage
