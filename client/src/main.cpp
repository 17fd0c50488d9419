#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <variant>

#include "chunkvault/client/config.hpp"
#include "chunkvault/client/logger.hpp"
#include "chunkvault/client/resume_state_store.hpp"
#include "chunkvault/client/upload_client.hpp"
#include "chunkvault/client/uploader.hpp"
#include "chunkvault/version.hpp"

namespace
{

    using chunkvault::client::ClientConfig;
    using chunkvault::client::Logger;

    bool is_failure(const chunkvault::protocol::Response &response)
    {
        return std::holds_alternative<chunkvault::protocol::ErrorResponse>(response) ||
               std::holds_alternative<chunkvault::protocol::AuthFailedResponse>(response);
    }

    int run(const ClientConfig &config, Logger &logger)
    {
        chunkvault::client::UploadClient client(config.token, logger);
        client.connect(config.host, config.port);

        const auto server = config.host + ":" + std::to_string(config.port);
        chunkvault::client::ResumeStateStore state;

        if (config.command == "upload" || config.command == "resume")
        {
            chunkvault::client::Uploader uploader(client, state, logger, server);
            uploader.on_progress([](std::uint32_t received, std::uint32_t total)
                                 { std::cout << "\rUploaded " << received << " / " << total << " chunks" << std::flush; });

            const auto report = config.command == "upload"
                                    ? uploader.upload(config.arguments[0], config.chunk_size)
                                    : uploader.resume(config.arguments[0], config.arguments[1], config.chunk_size);
            std::cout << std::endl;
            std::cout << "OK" << std::endl;
            std::cout << "Session: " << report.session_id << (report.resumed ? " (resumed)" : "") << std::endl;
            std::cout << "Stored as: " << report.storage_key << " (" << report.final_size << " bytes)" << std::endl;
            return EXIT_SUCCESS;
        }

        const auto &session_id = config.arguments[0];
        chunkvault::protocol::Response response;
        if (config.command == "status")
        {
            response = client.status(session_id);
        }
        else if (config.command == "pause")
        {
            response = client.pause(session_id);
        }
        else
        {
            response = client.cancel(session_id);
            if (std::holds_alternative<chunkvault::protocol::CancelledResponse>(response))
            {
                state.remove_session(session_id);
            }
        }

        std::cout << chunkvault::client::describe(response) << std::endl;
        return is_failure(response) ? EXIT_FAILURE : EXIT_SUCCESS;
    }

} // namespace

int main(int argc, char *argv[])
{
    ClientConfig config;
    try
    {
        config = chunkvault::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ChunkVault client " << chunkvault::version() << "\n"
                  << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    Logger logger(config.log_path);
    try
    {
        return run(config, logger);
    }
    catch (const std::exception &ex)
    {
        std::cout << std::endl;
        std::cerr << "ERROR: " << ex.what() << std::endl;
        logger.warn("error", "fatal: ", ex.what());
        return EXIT_FAILURE;
    }
}
