#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace scramble
{
    enum class HttpRoute
    {
        Index,
        Snapshot,
        Command,
        ConfigApi,
        Textures,
        Unknown
    };

    // Request path (query string allowed) to route.
    HttpRoute routeForPath(const std::string &path);

    // Value of `name` in the query string of `path`, or "" when absent.
    std::string extractQueryParam(const std::string &path, const std::string &name);

    class SimpleHttpUiServer
    {
    public:
        struct HandlerResult
        {
            int status_code = 200;
            std::string body;
        };

        using SnapshotProvider = std::function<std::string()>;
        using CommandHandler = std::function<HandlerResult(const std::string &)>;
        using ConfigProvider = std::function<std::string()>;
        using ConfigMutationHandler = std::function<HandlerResult(const std::string &)>;
        using TextureListProvider = std::function<std::string()>;

        SimpleHttpUiServer(int port,
                           SnapshotProvider snapshot_provider,
                           CommandHandler command_handler,
                           ConfigProvider config_provider,
                           ConfigMutationHandler config_mutation_handler,
                           TextureListProvider texture_list_provider);
        ~SimpleHttpUiServer();

        bool start();
        void stop();

        static std::string buildHttpResponse(const std::string &status,
                                             const std::string &content_type,
                                             const std::string &body);

    private:
        void acceptLoop();
        void handleClient(int client_fd);
        void sendResponse(int client_fd, const std::string &response) const;

        int port;
        int server_fd;
        std::atomic<bool> running;
        std::thread accept_thread;
        SnapshotProvider snapshot_provider;
        CommandHandler command_handler;
        ConfigProvider config_provider;
        ConfigMutationHandler config_mutation_handler;
        TextureListProvider texture_list_provider;
    };
} // namespace scramble
