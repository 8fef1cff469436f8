#include "kv_store.hpp"
#include "utils/logger.hpp"
#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/iterator.h>
#include <leveldb/options.h>
#include <leveldb/status.h>
#include <leveldb/write_batch.h>
#include <system_error>

namespace tinyboard::storage {

namespace {

Error to_error(const leveldb::Status& status, ErrorCode io_code, const std::string& context) {
    if (status.IsCorruption()) {
        return Error(ErrorCode::StoreCorrupted, context, status.ToString());
    }
    return Error(io_code, context, status.ToString());
}

bool has_prefix(const leveldb::Slice& key, const std::string& prefix) {
    return key.starts_with(leveldb::Slice(prefix));
}

} // anonymous namespace

// Scan state
struct KvStore::Scan::State {
    std::unique_ptr<leveldb::Iterator> iterator;
    std::string prefix;
    bool started{false};
    bool finished{false};
};

KvStore::Scan::Scan(std::unique_ptr<State> state)
    : state_(std::move(state))
{}

KvStore::Scan::~Scan() = default;
KvStore::Scan::Scan(Scan&&) noexcept = default;
KvStore::Scan& KvStore::Scan::operator=(Scan&&) noexcept = default;

bool KvStore::Scan::next(Entry& entry) {
    if (!state_ || state_->finished) {
        return false;
    }

    auto& it = *state_->iterator;
    if (!state_->started) {
        it.Seek(state_->prefix);
        state_->started = true;
    } else {
        it.Next();
    }

    if (!it.Valid() || !has_prefix(it.key(), state_->prefix)) {
        state_->finished = true;
        return false;
    }

    entry.key = it.key().ToString();
    entry.value = it.value().ToString();
    return true;
}

Result<void> KvStore::Scan::status() const {
    if (!state_) {
        return Result<void>::Ok();
    }
    auto status = state_->iterator->status();
    if (!status.ok()) {
        return to_error(status, ErrorCode::StoreReadFailed,
                        "Prefix scan failed for '" + state_->prefix + "'");
    }
    return Result<void>::Ok();
}

class KvStore::Impl {
public:
    Impl(const std::filesystem::path& db_path, const KvStoreOptions& options)
        : path_(db_path)
        , sync_writes_(options.sync_writes)
    {
        std::error_code ec;
        if (db_path.has_parent_path()) {
            std::filesystem::create_directories(db_path.parent_path(), ec);
            if (ec) {
                throw StorageException(ErrorCode::StoreWriteFailed,
                    "cannot create " + db_path.parent_path().string() + ": " + ec.message());
            }
        }

        // Cache and filter must outlive the DB, so they are members declared before it
        cache_.reset(leveldb::NewLRUCache(options.cache_size_mb * 1024 * 1024));
        filter_.reset(leveldb::NewBloomFilterPolicy(10));

        leveldb::Options db_options;
        db_options.create_if_missing = options.create_if_missing;
        db_options.block_cache = cache_.get();
        db_options.filter_policy = filter_.get();

        leveldb::DB* raw_db = nullptr;
        auto status = leveldb::DB::Open(db_options, db_path.string(), &raw_db);
        if (!status.ok()) {
            throw StorageException(
                status.IsCorruption() ? ErrorCode::StoreCorrupted : ErrorCode::StoreReadFailed,
                "cannot open " + db_path.string() + ": " + status.ToString());
        }
        db_.reset(raw_db);

        TINYBOARD_LOG_INFO("Store opened at: {}", path_.string());
    }

    Result<std::optional<std::string>> get(const std::string& key) const {
        std::string value;
        auto status = db_->Get(leveldb::ReadOptions(), key, &value);
        if (status.IsNotFound()) {
            return Result<std::optional<std::string>>::Ok(std::nullopt);
        }
        if (!status.ok()) {
            TINYBOARD_LOG_ERROR("Store get failed for {}: {}", key, status.ToString());
            return to_error(status, ErrorCode::StoreReadFailed, "Failed to read '" + key + "'");
        }
        return Result<std::optional<std::string>>::Ok(std::move(value));
    }

    Result<void> put(const std::string& key, const std::string& value) {
        leveldb::WriteOptions write_options;
        write_options.sync = sync_writes_;

        auto status = db_->Put(write_options, key, value);
        if (!status.ok()) {
            TINYBOARD_LOG_ERROR("Store put failed for {}: {}", key, status.ToString());
            return to_error(status, ErrorCode::StoreWriteFailed, "Failed to write '" + key + "'");
        }

        TINYBOARD_LOG_TRACE("Stored {} ({} bytes)", key, value.size());
        return Result<void>::Ok();
    }

    leveldb::Iterator* new_iterator() const {
        return db_->NewIterator(leveldb::ReadOptions());
    }

    Result<size_t> count_prefix(const std::string& prefix) const {
        leveldb::ReadOptions read_options;
        read_options.fill_cache = false;
        std::unique_ptr<leveldb::Iterator> it(db_->NewIterator(read_options));

        size_t count = 0;
        for (it->Seek(prefix); it->Valid() && has_prefix(it->key(), prefix); it->Next()) {
            ++count;
        }

        if (!it->status().ok()) {
            TINYBOARD_LOG_ERROR("Store count failed for prefix {}: {}", prefix, it->status().ToString());
            return to_error(it->status(), ErrorCode::StoreReadFailed,
                            "Failed to count '" + prefix + "'");
        }
        return Result<size_t>::Ok(count);
    }

    Result<void> flush() {
        // An empty synced batch forces the log to disk
        leveldb::WriteOptions write_options;
        write_options.sync = true;
        leveldb::WriteBatch batch;

        auto status = db_->Write(write_options, &batch);
        if (!status.ok()) {
            TINYBOARD_LOG_ERROR("Store flush failed: {}", status.ToString());
            return to_error(status, ErrorCode::StoreWriteFailed, "Failed to flush store");
        }
        return Result<void>::Ok();
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    bool sync_writes_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_;
    std::unique_ptr<leveldb::DB> db_;
};

// KvStore implementation
KvStore::KvStore(const std::filesystem::path& db_path, const KvStoreOptions& options)
    : impl_(std::make_unique<Impl>(db_path, options))
{}

KvStore::~KvStore() = default;
KvStore::KvStore(KvStore&&) noexcept = default;
KvStore& KvStore::operator=(KvStore&&) noexcept = default;

Result<std::optional<std::string>> KvStore::get(const std::string& key) const {
    return impl_->get(key);
}

Result<void> KvStore::put(const std::string& key, const std::string& value) {
    return impl_->put(key, value);
}

KvStore::Scan KvStore::scan_prefix(const std::string& prefix) const {
    auto state = std::make_unique<Scan::State>();
    state->iterator.reset(impl_->new_iterator());
    state->prefix = prefix;
    return Scan(std::move(state));
}

Result<size_t> KvStore::count_prefix(const std::string& prefix) const {
    return impl_->count_prefix(prefix);
}

Result<void> KvStore::flush() {
    return impl_->flush();
}

const std::filesystem::path& KvStore::path() const {
    return impl_->path();
}

} // namespace tinyboard::storage
