#include "SimpleHttpUiServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>

namespace scramble
{
    namespace
    {
        constexpr std::size_t MAX_REQUEST_BYTES = 1 << 20;

        std::string statusTextFromCode(int status_code)
        {
            switch (status_code)
            {
            case 200:
                return "200 OK";
            case 400:
                return "400 Bad Request";
            case 404:
                return "404 Not Found";
            case 405:
                return "405 Method Not Allowed";
            case 500:
                return "500 Internal Server Error";
            default:
                return std::to_string(status_code) + " Unknown";
            }
        }

        // Content-Length of the request head, or 0 when the header is missing.
        std::size_t contentLength(const std::string &head)
        {
            std::string lower;
            lower.reserve(head.size());
            for (char c : head)
            {
                lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }

            std::size_t pos = lower.find("content-length:");
            if (pos == std::string::npos)
            {
                return 0;
            }
            return static_cast<std::size_t>(std::strtoul(head.c_str() + pos + 15, nullptr, 10));
        }

        const char *kIndexHtml = R"HTML(
<!doctype html>
<html lang="en"><head><meta charset="UTF-8" /><title>Scramble Crossing</title></head>
<body>
<p>Scramble crossing simulation. Endpoints:</p>
<ul>
<li>GET /snapshot</li>
<li>GET /command?cmd=start|stop|reset|step</li>
<li>GET, POST /config/api</li>
<li>GET /textures</li>
</ul>
</body></html>
)HTML";
    } // namespace

    HttpRoute routeForPath(const std::string &path)
    {
        std::size_t qmark = path.find('?');
        std::string clean_path = qmark == std::string::npos ? path : path.substr(0, qmark);

        if (clean_path == "/" || clean_path == "/index.html")
        {
            return HttpRoute::Index;
        }
        if (clean_path == "/snapshot")
        {
            return HttpRoute::Snapshot;
        }
        if (clean_path == "/command")
        {
            return HttpRoute::Command;
        }
        if (clean_path == "/config/api" || clean_path == "/config.json")
        {
            return HttpRoute::ConfigApi;
        }
        if (clean_path == "/textures")
        {
            return HttpRoute::Textures;
        }
        return HttpRoute::Unknown;
    }

    std::string extractQueryParam(const std::string &path, const std::string &name)
    {
        std::size_t qmark = path.find('?');
        if (qmark == std::string::npos)
        {
            return "";
        }

        std::string query = path.substr(qmark + 1);
        std::istringstream pairs(query);
        std::string pair;
        while (std::getline(pairs, pair, '&'))
        {
            std::size_t eq = pair.find('=');
            if (eq != std::string::npos && pair.substr(0, eq) == name)
            {
                return pair.substr(eq + 1);
            }
        }
        return "";
    }

    SimpleHttpUiServer::SimpleHttpUiServer(int port,
                                           SnapshotProvider snapshot_provider,
                                           CommandHandler command_handler,
                                           ConfigProvider config_provider,
                                           ConfigMutationHandler config_mutation_handler,
                                           TextureListProvider texture_list_provider)
        : port(port),
          server_fd(-1),
          running(false),
          snapshot_provider(std::move(snapshot_provider)),
          command_handler(std::move(command_handler)),
          config_provider(std::move(config_provider)),
          config_mutation_handler(std::move(config_mutation_handler)),
          texture_list_provider(std::move(texture_list_provider))
    {
    }

    SimpleHttpUiServer::~SimpleHttpUiServer()
    {
        stop();
    }

    bool SimpleHttpUiServer::start()
    {
        server_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (server_fd < 0)
        {
            std::cerr << "UI server: failed to create socket\n";
            return false;
        }

        int opt = 1;
        setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(static_cast<uint16_t>(port));

        if (bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
        {
            std::cerr << "UI server: bind failed on port " << port << "\n";
            close(server_fd);
            server_fd = -1;
            return false;
        }

        if (listen(server_fd, 16) < 0)
        {
            std::cerr << "UI server: listen failed\n";
            close(server_fd);
            server_fd = -1;
            return false;
        }

        running = true;
        accept_thread = std::thread(&SimpleHttpUiServer::acceptLoop, this);
        return true;
    }

    void SimpleHttpUiServer::stop()
    {
        if (!running)
        {
            return;
        }

        running = false;
        if (server_fd >= 0)
        {
            shutdown(server_fd, SHUT_RDWR);
            close(server_fd);
            server_fd = -1;
        }

        if (accept_thread.joinable())
        {
            accept_thread.join();
        }
    }

    void SimpleHttpUiServer::acceptLoop()
    {
        while (running)
        {
            sockaddr_in client_addr{};
            socklen_t len = sizeof(client_addr);
            int client_fd = accept(server_fd, reinterpret_cast<sockaddr *>(&client_addr), &len);
            if (client_fd < 0)
            {
                if (running)
                {
                    continue;
                }
                break;
            }

            handleClient(client_fd);
            close(client_fd);
        }
    }

    void SimpleHttpUiServer::sendResponse(int client_fd, const std::string &response) const
    {
        std::size_t sent = 0;
        while (sent < response.size())
        {
            ssize_t n = send(client_fd, response.data() + sent, response.size() - sent, 0);
            if (n <= 0)
            {
                std::cerr << "UI server: send failed\n";
                return;
            }
            sent += static_cast<std::size_t>(n);
        }
    }

    void SimpleHttpUiServer::handleClient(int client_fd)
    {
        char buffer[8192];
        std::string req;
        std::size_t header_end = std::string::npos;

        // Read until the full head and any declared body have arrived
        while (req.size() < MAX_REQUEST_BYTES)
        {
            ssize_t n = recv(client_fd, buffer, sizeof(buffer), 0);
            if (n <= 0)
            {
                break;
            }
            req.append(buffer, static_cast<std::size_t>(n));

            if (header_end == std::string::npos)
            {
                header_end = req.find("\r\n\r\n");
            }
            if (header_end != std::string::npos &&
                req.size() >= header_end + 4 + contentLength(req.substr(0, header_end)))
            {
                break;
            }
        }

        if (req.empty())
        {
            return;
        }

        std::istringstream input(req);
        std::string method, path, version;
        input >> method >> path >> version;
        std::string body;
        if (header_end != std::string::npos)
        {
            body = req.substr(header_end + 4);
        }

        switch (routeForPath(path))
        {
        case HttpRoute::Index:
            sendResponse(client_fd, buildHttpResponse("200 OK", "text/html; charset=utf-8", kIndexHtml));
            return;

        case HttpRoute::Snapshot:
            sendResponse(client_fd, buildHttpResponse("200 OK", "application/json", snapshot_provider()));
            return;

        case HttpRoute::Command:
        {
            HandlerResult result = command_handler(extractQueryParam(path, "cmd"));
            sendResponse(client_fd, buildHttpResponse(statusTextFromCode(result.status_code), "text/plain", result.body));
            return;
        }

        case HttpRoute::ConfigApi:
            if (method == "GET")
            {
                sendResponse(client_fd, buildHttpResponse("200 OK", "application/json", config_provider()));
                return;
            }
            if (method == "POST")
            {
                HandlerResult result = config_mutation_handler(body);
                sendResponse(client_fd, buildHttpResponse(statusTextFromCode(result.status_code), "application/json", result.body));
                return;
            }
            sendResponse(client_fd, buildHttpResponse("405 Method Not Allowed", "application/json", "{\"ok\":false,\"error\":\"method not allowed\"}"));
            return;

        case HttpRoute::Textures:
            sendResponse(client_fd, buildHttpResponse("200 OK", "application/json", texture_list_provider()));
            return;

        case HttpRoute::Unknown:
            break;
        }

        sendResponse(client_fd, buildHttpResponse("404 Not Found", "text/plain", "not found"));
    }

    std::string SimpleHttpUiServer::buildHttpResponse(const std::string &status,
                                                      const std::string &content_type,
                                                      const std::string &body)
    {
        std::ostringstream out;
        out << "HTTP/1.1 " << status << "\r\n";
        out << "Content-Type: " << content_type << "\r\n";
        out << "Cache-Control: no-store, no-cache, must-revalidate, max-age=0\r\n";
        out << "Access-Control-Allow-Origin: *\r\n";
        out << "Content-Length: " << body.size() << "\r\n";
        out << "Connection: close\r\n\r\n";
        out << body;
        return out.str();
    }
} // namespace scramble
