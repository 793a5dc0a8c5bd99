#include "ginseng/core/command_handler.hpp"
#include "ginseng/core/config.hpp"
#include "ginseng/core/logger.hpp"
#include "ginseng/core/progress_display.hpp"
#include "ginseng/core/utils.hpp"
#include "ginseng/storage/path_resolver.hpp"
#include "ginseng/transfer/transfer_orchestrator.hpp"
#include "ginseng/transport/local_swarm_transport.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace ginseng::core {

namespace {

std::unique_ptr<transport::LocalSwarmTransport> make_transport() {
    auto& config = Config::instance();
    
    auto node_home = utils::FileUtils::expand_home(config.get_string("node.home", "~/.ginseng"));
    auto swarm = config.get_string("store.swarm_directory", "");
    auto swarm_dir = swarm.empty() ? node_home / "swarm" : utils::FileUtils::expand_home(swarm);
    auto chunk_size = config.get_int("transfer.chunk_size", 65536);
    
    return std::make_unique<transport::LocalSwarmTransport>(
        swarm_dir, node_home, static_cast<uint32_t>(chunk_size > 0 ? chunk_size : 65536));
}

bool json_output() {
    return Config::instance().get_string("output.format", "text") == "json";
}

}

CommandResult ShareCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::vector<std::string> paths(args.begin() + 1, args.end());
    LOG_INFO("Sharing {} path(s)", paths.size());
    
    auto swarm = make_transport();
    storage::FilesystemPathResolver resolver;
    transfer::TransferOrchestrator orchestrator(
        *swarm, resolver, transfer::OrchestratorOptions::from_config(Config::instance()));
    
    bool json = json_output();
    transfer::EventChannel channel;
    ProgressDisplay display(channel, json, std::cout);
    display.start();
    
    transfer::ShareOutcome outcome;
    auto result = orchestrator.share_files(paths, channel, outcome);
    display.finish();
    
    if (!result) {
        return CommandResult::error(result.describe());
    }
    
    if (json) {
        std::cout << nlohmann::json{{"ticket", outcome.ticket}}.dump() << "\n";
    } else {
        std::cout << "\nTicket:\n" << outcome.ticket << "\n";
    }
    
    return CommandResult::ok("Share published");
}

CommandResult DownloadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    auto swarm = make_transport();
    storage::FilesystemPathResolver resolver;
    transfer::TransferOrchestrator orchestrator(
        *swarm, resolver, transfer::OrchestratorOptions::from_config(Config::instance()));
    
    bool json = json_output();
    transfer::EventChannel channel;
    ProgressDisplay display(channel, json, std::cout);
    display.start();
    
    transfer::DownloadOutcome outcome;
    auto result = orchestrator.download_files(args[1], channel, outcome);
    display.finish();
    
    if (!result) {
        return CommandResult::error(result.describe());
    }
    
    if (json) {
        nlohmann::json summary{
            {"downloadPath", outcome.download_path.string()},
            {"metadata", nlohmann::json::parse(outcome.metadata.serialize())},
        };
        std::cout << summary.dump() << "\n";
    } else {
        std::cout << "\nSaved '" << outcome.metadata.name << "' to " << outcome.download_path.string() << "\n";
    }
    
    if (outcome.session.failed_files > 0) {
        return CommandResult::error(std::to_string(outcome.session.failed_files) + " file(s) could not be downloaded", 2);
    }
    return CommandResult::ok("Download finished");
}

CommandResult InfoCommandHandler::execute(const std::vector<std::string>& args) {
    (void)args;
    
    auto swarm = make_transport();
    auto result = swarm->connect();
    if (!result) {
        return CommandResult::error(result.describe());
    }
    
    using utils::StringUtils;
    
    std::cout << "Node ID:   " << swarm->node_id() << "\n";
    std::cout << "Swarm:     " << swarm->swarm_directory().string() << "\n";
    std::cout << "Blobs:     " << swarm->blob_count() << " ("
              << StringUtils::format_bytes(swarm->stored_bytes()) << ")\n";
    
    auto shares = swarm->shares();
    std::cout << "Shares:    " << shares.size() << "\n";
    for (const auto& share : shares) {
        std::cout << "  " << share.name << "  [" << storage::to_string(share.share_type) << ", "
                  << share.file_count << " files, " << StringUtils::format_bytes(share.total_size)
                  << "]  " << utils::TimeUtils::format_timestamp(
                         std::chrono::system_clock::time_point(std::chrono::seconds(share.created_at)))
                  << "\n";
    }
    
    return CommandResult::ok();
}

}
