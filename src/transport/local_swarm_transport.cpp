#include "ginseng/transport/local_swarm_transport.hpp"
#include "ginseng/transport/ticket.hpp"
#include "ginseng/core/logger.hpp"
#include "ginseng/core/utils.hpp"
#include "ginseng/crypto/hash.hpp"
#include "ginseng/crypto/random.hpp"
#include <fstream>
#include <vector>

namespace ginseng::transport {

namespace fs = std::filesystem;
using core::TransferError;
using core::TransferResult;

namespace {

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LOG_DEBUG("Could not remove {}: {}", path.string(), ec.message());
    }
}

// Moves a finished file into the blob store and records it
TransferResult commit_blob(NodeStore& store, const fs::path& staged,
                           const std::string& blob_hash, uint64_t size) {
    auto target = store.config.get_blob_path(blob_hash);
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        remove_quietly(staged);
        return TransferResult(TransferError::IO_ERROR,
                              "Cannot create blob directory: " + ec.message());
    }
    
    fs::rename(staged, target, ec);
    if (ec) {
        remove_quietly(staged);
        return TransferResult(TransferError::IO_ERROR,
                              "Cannot store blob " + blob_hash + ": " + ec.message());
    }
    
    if (!store.index->add_blob(blob_hash, size)) {
        return TransferResult(TransferError::IO_ERROR, "Cannot index blob " + blob_hash);
    }
    return TransferResult();
}

// Copies the source into incomplete/, hashes the copy, then commits it
class LocalUploadStream : public UploadStream {
public:
    LocalUploadStream(std::shared_ptr<NodeStore> store, fs::path source, uint64_t size,
                      uint32_t chunk_size)
        : store_(std::move(store)), source_(std::move(source)), size_(size),
          buffer_(chunk_size), state_(State::SIZE), offset_(0) {
        staged_ = store_->config.get_incomplete_path("upload-" + crypto::SecureRandom::generate_uuid());
    }
    
    ~LocalUploadStream() override {
        if (state_ != State::DONE && state_ != State::FINISHED) {
            input_.close();
            output_.close();
            remove_quietly(staged_);
        }
    }
    
    TransferResult next(std::optional<UploadPrimitive>& item) override {
        item.reset();
        switch (state_) {
            case State::SIZE:
                return start(item);
            case State::COPY:
                return copy_chunk(item);
            case State::HASH:
                return hash_chunk(item);
            case State::DONE:
                state_ = State::FINISHED;
                return TransferResult();
            case State::FINISHED:
                return TransferResult();
        }
        return TransferResult();
    }
    
private:
    enum class State { SIZE, COPY, HASH, DONE, FINISHED };
    
    std::shared_ptr<NodeStore> store_;
    fs::path source_;
    fs::path staged_;
    uint64_t size_;
    std::vector<std::uint8_t> buffer_;
    State state_;
    uint64_t offset_;
    std::ifstream input_;
    std::ofstream output_;
    crypto::BlobHasher hasher_;
    
    TransferResult fail(TransferResult result) {
        state_ = State::FINISHED;
        input_.close();
        output_.close();
        remove_quietly(staged_);
        return result;
    }
    
    TransferResult start(std::optional<UploadPrimitive>& item) {
        input_.open(source_, std::ios::binary);
        if (!input_) {
            return fail(TransferResult(TransferError::IO_ERROR, "Cannot open " + source_.string()));
        }
        output_.open(staged_, std::ios::binary | std::ios::trunc);
        if (!output_) {
            return fail(TransferResult(TransferError::IO_ERROR, "Cannot stage " + staged_.string()));
        }
        
        state_ = State::COPY;
        item = UploadSize{size_};
        return TransferResult();
    }
    
    TransferResult copy_chunk(std::optional<UploadPrimitive>& item) {
        input_.read(reinterpret_cast<char*>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
        auto read = static_cast<size_t>(input_.gcount());
        if (input_.bad()) {
            return fail(TransferResult(TransferError::IO_ERROR, "Read error on " + source_.string()));
        }
        
        if (read > 0) {
            output_.write(reinterpret_cast<const char*>(buffer_.data()), static_cast<std::streamsize>(read));
            if (!output_) {
                return fail(TransferResult(TransferError::IO_ERROR, "Write error on " + staged_.string()));
            }
            offset_ += read;
        }
        
        if (input_.eof()) {
            input_.close();
            output_.close();
            if (!output_) {
                return fail(TransferResult(TransferError::IO_ERROR, "Write error on " + staged_.string()));
            }
            // The file size was taken up front; a file that changed underneath is not shared
            if (offset_ != size_) {
                return fail(TransferResult(TransferError::IO_ERROR,
                                           "File changed while sharing: " + source_.string()));
            }
            
            input_.clear();
            input_.open(staged_, std::ios::binary);
            auto init = hasher_.initialize();
            if (!input_ || !init) {
                return fail(TransferResult(TransferError::IO_ERROR, "Cannot hash " + staged_.string()));
            }
            state_ = State::HASH;
            item = CopyProgress{offset_};
            offset_ = 0;
            return TransferResult();
        }
        
        item = CopyProgress{offset_};
        return TransferResult();
    }
    
    TransferResult hash_chunk(std::optional<UploadPrimitive>& item) {
        input_.read(reinterpret_cast<char*>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
        auto read = static_cast<size_t>(input_.gcount());
        if (input_.bad()) {
            return fail(TransferResult(TransferError::IO_ERROR, "Read error on " + staged_.string()));
        }
        
        if (read > 0) {
            auto updated = hasher_.update(std::span<const std::uint8_t>(buffer_.data(), read));
            if (!updated) {
                return fail(updated);
            }
            offset_ += read;
        }
        
        if (!input_.eof()) {
            item = HashProgress{offset_};
            return TransferResult();
        }
        
        input_.close();
        crypto::BlobHash hash;
        auto finalized = hasher_.finalize(hash);
        if (!finalized) {
            return fail(finalized);
        }
        
        auto hex = crypto::hash_utils::to_hex(hash);
        auto committed = commit_blob(*store_, staged_, hex, size_);
        if (!committed) {
            state_ = State::FINISHED;
            return committed;
        }
        
        state_ = State::DONE;
        item = UploadDone{hex};
        return TransferResult();
    }
};

// Reads a blob out of the provider's store into this node's store, verifying its hash
class LocalDownloadStream : public DownloadStream {
public:
    LocalDownloadStream(std::shared_ptr<NodeStore> provider, std::shared_ptr<NodeStore> local,
                        storage::SharedFile file, uint32_t chunk_size)
        : provider_(std::move(provider)), local_(std::move(local)), file_(std::move(file)),
          buffer_(chunk_size), state_(State::TRY), offset_(0) {
        staged_ = local_->config.get_incomplete_path("download-" + crypto::SecureRandom::generate_uuid());
    }
    
    ~LocalDownloadStream() override {
        if (state_ == State::COPY) {
            input_.close();
            output_.close();
            remove_quietly(staged_);
        }
    }
    
    TransferResult next(std::optional<DownloadPrimitive>& item) override {
        item.reset();
        switch (state_) {
            case State::TRY:
                state_ = State::OPEN;
                item = TryProvider{provider_->node_id};
                return TransferResult();
            case State::OPEN:
                return open(item);
            case State::COPY:
                return copy_chunk(item);
            case State::FINISHED:
                return TransferResult();
        }
        return TransferResult();
    }
    
private:
    enum class State { TRY, OPEN, COPY, FINISHED };
    
    std::shared_ptr<NodeStore> provider_;
    std::shared_ptr<NodeStore> local_;
    storage::SharedFile file_;
    fs::path staged_;
    std::vector<std::uint8_t> buffer_;
    State state_;
    uint64_t offset_;
    std::ifstream input_;
    std::ofstream output_;
    crypto::BlobHasher hasher_;
    
    void abort_copy() {
        state_ = State::FINISHED;
        input_.close();
        output_.close();
        remove_quietly(staged_);
    }
    
    TransferResult open(std::optional<DownloadPrimitive>& item) {
        auto source = provider_->config.get_blob_path(file_.hash);
        if (!provider_->index->has_blob(file_.hash) || !core::utils::FileUtils::is_file(source)) {
            state_ = State::FINISHED;
            item = DownloadError{"Provider does not have blob " + file_.hash};
            return TransferResult();
        }
        
        if (!local_->config.has_sufficient_space(file_.size)) {
            state_ = State::FINISHED;
            item = DownloadError{"Not enough free space for " + file_.name};
            return TransferResult();
        }
        
        input_.open(source, std::ios::binary);
        if (!input_) {
            state_ = State::FINISHED;
            item = DownloadError{"Provider blob unreadable: " + file_.hash};
            return TransferResult();
        }
        
        output_.open(staged_, std::ios::binary | std::ios::trunc);
        auto init = hasher_.initialize();
        if (!output_ || !init) {
            abort_copy();
            return TransferResult(TransferError::IO_ERROR, "Cannot stage " + staged_.string());
        }
        
        state_ = State::COPY;
        item = DownloadProgress{0};
        return TransferResult();
    }
    
    TransferResult copy_chunk(std::optional<DownloadPrimitive>& item) {
        input_.read(reinterpret_cast<char*>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
        auto read = static_cast<size_t>(input_.gcount());
        if (input_.bad()) {
            abort_copy();
            item = DownloadError{"Connection to provider lost"};
            return TransferResult();
        }
        
        if (read > 0) {
            output_.write(reinterpret_cast<const char*>(buffer_.data()), static_cast<std::streamsize>(read));
            auto updated = hasher_.update(std::span<const std::uint8_t>(buffer_.data(), read));
            if (!output_ || !updated) {
                abort_copy();
                return TransferResult(TransferError::IO_ERROR, "Write error on " + staged_.string());
            }
            offset_ += read;
        }
        
        if (!input_.eof()) {
            item = DownloadProgress{offset_};
            return TransferResult();
        }
        
        input_.close();
        output_.close();
        
        crypto::BlobHash hash;
        auto finalized = hasher_.finalize(hash);
        if (!output_ || !finalized) {
            abort_copy();
            return TransferResult(TransferError::IO_ERROR, "Cannot finish " + staged_.string());
        }
        
        if (offset_ != file_.size || crypto::hash_utils::to_hex(hash) != file_.hash) {
            abort_copy();
            item = DownloadError{"Blob " + file_.hash + " failed verification"};
            return TransferResult();
        }
        
        state_ = State::FINISHED;
        auto committed = commit_blob(*local_, staged_, file_.hash, file_.size);
        if (!committed) {
            return committed;
        }
        
        item = PartComplete{};
        return TransferResult();
    }
};

}

LocalSwarmTransport::LocalSwarmTransport(fs::path swarm_directory, fs::path node_home,
                                         uint32_t chunk_size)
    : swarm_directory_(std::move(swarm_directory)), node_home_(std::move(node_home)),
      chunk_size_(chunk_size == 0 ? 65536 : chunk_size) {
}

TransferResult LocalSwarmTransport::load_or_create_node_id(const fs::path& node_home,
                                                           crypto::NodeId& node_id) {
    auto id_path = node_home / "node_id";
    
    if (core::utils::FileUtils::exists(id_path)) {
        std::ifstream file(id_path);
        std::string hex;
        std::getline(file, hex);
        auto parsed = crypto::hash_utils::node_id_from_hex(core::utils::StringUtils::trim(hex));
        if (!parsed) {
            return TransferResult(TransferError::IO_ERROR, "Corrupt node id file: " + id_path.string());
        }
        node_id = *parsed;
        return TransferResult();
    }
    
    if (!core::utils::FileUtils::create_directories(node_home)) {
        return TransferResult(TransferError::IO_ERROR, "Cannot create " + node_home.string());
    }
    
    auto generated = crypto::SecureRandom::generate_node_id();
    std::ofstream file(id_path, std::ios::trunc);
    file << crypto::hash_utils::to_hex(generated) << '\n';
    if (!file) {
        return TransferResult(TransferError::IO_ERROR, "Cannot write " + id_path.string());
    }
    
    LOG_INFO("Created node identity at {}", id_path.string());
    node_id = generated;
    return TransferResult();
}

TransferResult LocalSwarmTransport::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (local_) {
        return TransferResult();
    }
    
    if (!crypto::SecureRandom::initialize()) {
        return TransferResult(TransferError::TRANSPORT_ERROR, "Failed to initialize libsodium");
    }
    
    crypto::NodeId id;
    auto loaded = load_or_create_node_id(node_home_, id);
    if (!loaded) {
        return TransferResult(TransferError::TRANSPORT_ERROR, "Cannot load node identity: " + loaded.message);
    }
    
    auto store = std::make_shared<NodeStore>();
    store->node_id = crypto::hash_utils::to_hex(id);
    store->config = storage::StorageConfig(swarm_directory_ / store->node_id);
    store->config.chunk_size = chunk_size_;
    
    if (!store->config.validate() || !store->config.create_directories()) {
        return TransferResult(TransferError::TRANSPORT_ERROR,
                              "Cannot prepare node store under " + swarm_directory_.string());
    }
    
    store->index = std::make_unique<storage::BlobIndex>(store->config.database_path);
    if (!store->index->initialize()) {
        return TransferResult(TransferError::TRANSPORT_ERROR,
                              "Cannot open node index " + store->config.database_path.string());
    }
    
    LOG_INFO("Node {} joined swarm {}", store->node_id, swarm_directory_.string());
    local_ = std::move(store);
    return TransferResult();
}

std::string LocalSwarmTransport::node_id() const {
    auto store = local_store();
    return store ? store->node_id : std::string();
}

std::shared_ptr<NodeStore> LocalSwarmTransport::local_store() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_;
}

TransferResult LocalSwarmTransport::add_path(const fs::path& path, std::unique_ptr<UploadStream>& stream) {
    auto store = local_store();
    if (!store) {
        return TransferResult(TransferError::INVALID_STATE, "Transport not connected");
    }
    
    auto size = core::utils::FileUtils::file_size(path);
    if (!size) {
        return TransferResult(TransferError::PATH_ERROR, "Cannot read " + path.string());
    }
    
    stream = std::make_unique<LocalUploadStream>(store, path, *size, chunk_size_);
    return TransferResult();
}

TransferResult LocalSwarmTransport::publish_share(const storage::ShareMetadata& metadata, std::string& ticket) {
    auto store = local_store();
    if (!store) {
        return TransferResult(TransferError::INVALID_STATE, "Transport not connected");
    }
    
    auto valid = metadata.validate();
    if (!valid) {
        return valid;
    }
    
    auto manifest = metadata.serialize();
    
    Ticket result;
    result.share_hash = crypto::hash_utils::hash_string(manifest);
    auto node_id = crypto::hash_utils::node_id_from_hex(store->node_id);
    if (!node_id) {
        return TransferResult(TransferError::INVALID_STATE, "Invalid local node id");
    }
    result.node_id = *node_id;
    
    if (!store->index->add_share(result.share_hash_hex(), manifest, metadata)) {
        return TransferResult(TransferError::IO_ERROR, "Cannot record share manifest");
    }
    
    ticket = result.to_string();
    LOG_INFO("Published share '{}' ({} files) as {}", metadata.name, metadata.files.size(),
             result.share_hash_hex());
    return TransferResult();
}

TransferResult LocalSwarmTransport::open_provider(const std::string& node_id_hex,
                                                  std::shared_ptr<NodeStore>& store) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (local_ && local_->node_id == node_id_hex) {
        store = local_;
        return TransferResult();
    }
    
    auto it = providers_.find(node_id_hex);
    if (it != providers_.end()) {
        store = it->second;
        return TransferResult();
    }
    
    auto provider = std::make_shared<NodeStore>();
    provider->node_id = node_id_hex;
    provider->config = storage::StorageConfig(swarm_directory_ / node_id_hex);
    
    // Opening would create an empty index for a node that never existed
    if (!core::utils::FileUtils::is_file(provider->config.database_path)) {
        return TransferResult(TransferError::TRANSPORT_ERROR, "peer unreachable");
    }
    
    provider->index = std::make_unique<storage::BlobIndex>(provider->config.database_path);
    if (!provider->index->initialize()) {
        return TransferResult(TransferError::TRANSPORT_ERROR, "peer unreachable");
    }
    
    providers_.emplace(node_id_hex, provider);
    store = std::move(provider);
    return TransferResult();
}

TransferResult LocalSwarmTransport::resolve_ticket(const std::string& ticket_text,
                                                   storage::ShareMetadata& metadata) {
    Ticket ticket;
    auto parsed = Ticket::parse(ticket_text, ticket);
    if (!parsed) {
        return parsed;
    }
    
    std::shared_ptr<NodeStore> provider;
    auto opened = open_provider(ticket.node_id_hex(), provider);
    if (!opened) {
        return opened;
    }
    
    std::string manifest;
    auto found = provider->index->get_manifest(ticket.share_hash_hex(), manifest);
    if (!found) {
        return found;
    }
    
    if (crypto::hash_utils::hash_string(manifest) != ticket.share_hash) {
        return TransferResult(TransferError::METADATA_ERROR, "Share manifest does not match ticket");
    }
    
    return storage::ShareMetadata::deserialize(manifest, metadata);
}

bool LocalSwarmTransport::has_blob(const std::string& blob_hash) {
    auto store = local_store();
    if (!store) {
        return false;
    }
    return store->index->has_blob(blob_hash) &&
           core::utils::FileUtils::is_file(store->config.get_blob_path(blob_hash));
}

TransferResult LocalSwarmTransport::fetch(const std::string& ticket_text, const storage::SharedFile& file,
                                          std::unique_ptr<DownloadStream>& stream) {
    auto local = local_store();
    if (!local) {
        return TransferResult(TransferError::INVALID_STATE, "Transport not connected");
    }
    
    Ticket ticket;
    auto parsed = Ticket::parse(ticket_text, ticket);
    if (!parsed) {
        return parsed;
    }
    
    std::shared_ptr<NodeStore> provider;
    auto opened = open_provider(ticket.node_id_hex(), provider);
    if (!opened) {
        return opened;
    }
    
    stream = std::make_unique<LocalDownloadStream>(provider, local, file, chunk_size_);
    return TransferResult();
}

TransferResult LocalSwarmTransport::export_blob(const std::string& blob_hash, const fs::path& destination) {
    auto store = local_store();
    if (!store) {
        return TransferResult(TransferError::INVALID_STATE, "Transport not connected");
    }
    
    auto source = store->config.get_blob_path(blob_hash);
    if (!store->index->has_blob(blob_hash) || !core::utils::FileUtils::is_file(source)) {
        return TransferResult(TransferError::IO_ERROR, "Blob not in local store: " + blob_hash);
    }
    
    if (destination.has_parent_path() &&
        !core::utils::FileUtils::create_directories(destination.parent_path())) {
        return TransferResult(TransferError::IO_ERROR,
                              "Cannot create directory " + destination.parent_path().string());
    }
    
    std::error_code ec;
    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return TransferResult(TransferError::IO_ERROR,
                              "Cannot export to " + destination.string() + ": " + ec.message());
    }
    return TransferResult();
}

size_t LocalSwarmTransport::blob_count() const {
    auto store = local_store();
    return store ? store->index->get_blob_count() : 0;
}

uint64_t LocalSwarmTransport::stored_bytes() const {
    auto store = local_store();
    return store ? store->index->get_total_size() : 0;
}

std::vector<storage::ShareRecord> LocalSwarmTransport::shares() const {
    auto store = local_store();
    return store ? store->index->list_shares() : std::vector<storage::ShareRecord>{};
}

}
