#pragma once

#include "transport.hpp"
#include "../crypto/crypto_types.hpp"
#include "../storage/blob_index.hpp"
#include "../storage/storage_config.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ginseng::transport {

// Blob store and index of one node in the swarm directory
struct NodeStore {
    std::string node_id;
    storage::StorageConfig config;
    std::unique_ptr<storage::BlobIndex> index;
};

// Transport over a directory shared by every node: each node keeps its blobs
// under <swarm>/<node id>/ and downloads read straight from the provider's store.
class LocalSwarmTransport : public TransportLibrary {
public:
    LocalSwarmTransport(std::filesystem::path swarm_directory,
                        std::filesystem::path node_home,
                        uint32_t chunk_size = 65536);
    
    core::TransferResult connect() override;
    std::string node_id() const override;
    
    core::TransferResult add_path(const std::filesystem::path& path,
                                  std::unique_ptr<UploadStream>& stream) override;
    core::TransferResult publish_share(const storage::ShareMetadata& metadata,
                                       std::string& ticket) override;
    
    core::TransferResult resolve_ticket(const std::string& ticket,
                                        storage::ShareMetadata& metadata) override;
    bool has_blob(const std::string& blob_hash) override;
    core::TransferResult fetch(const std::string& ticket,
                               const storage::SharedFile& file,
                               std::unique_ptr<DownloadStream>& stream) override;
    core::TransferResult export_blob(const std::string& blob_hash,
                                     const std::filesystem::path& destination) override;
    
    // Store statistics for the info command; zero before connect()
    size_t blob_count() const;
    uint64_t stored_bytes() const;
    std::vector<storage::ShareRecord> shares() const;
    
    const std::filesystem::path& swarm_directory() const { return swarm_directory_; }
    
    // Loads <node_home>/node_id, creating it on first use
    static core::TransferResult load_or_create_node_id(const std::filesystem::path& node_home,
                                                       crypto::NodeId& node_id);
    
private:
    std::filesystem::path swarm_directory_;
    std::filesystem::path node_home_;
    uint32_t chunk_size_;
    
    mutable std::mutex mutex_;
    std::shared_ptr<NodeStore> local_;
    std::unordered_map<std::string, std::shared_ptr<NodeStore>> providers_;
    
    std::shared_ptr<NodeStore> local_store() const;
    core::TransferResult open_provider(const std::string& node_id_hex,
                                       std::shared_ptr<NodeStore>& store);
};

}
