#include <iostream>
#include <cerrno>
#include <cstring>
#include <utility>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>
#include <pthread.h>

#include "BaseServer.hpp"


BaseServer::BaseServer(int port)
    : socket_fd{-1}, server_port{port} {}

BaseServer::~BaseServer() {
    stop();
    waitForHandlers();
    if (socket_fd != -1) {
        close(socket_fd);
    }
}

bool BaseServer::start() {
    if (!listen()) {
        return false;
    }
    serve();
    return true;
}

bool BaseServer::listen() {
    // Create a TCP Socket
    socket_fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (socket_fd < 0) {
        std::cerr << "Error: Failed to create socket\n";
        return false;
    }

    // Set Socket Options to Allow Reuse of Address
    int opt = 1;
    if (setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "Error: Failed to set socket options\n";
        close(socket_fd);
        socket_fd = -1;
        return false;
    }

    // Prepare the sockaddr_in Structure
    sockaddr_in server_addr{};
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = INADDR_ANY;
    server_addr.sin_port = htons(server_port);

    // Bind the Socket to the Port
    if (bind(socket_fd, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        std::cerr << "Error: Failed to bind to port " << server_port << "\n";
        close(socket_fd);
        socket_fd = -1;
        return false;
    }

    // Start Listening for Incoming Connections
    if (::listen(socket_fd, SOMAXCONN) < 0) {
        std::cerr << "Error: Failed to listen on port " << server_port << "\n";
        close(socket_fd);
        socket_fd = -1;
        return false;
    }

    // Find out which port we got if 0 was requested
    socklen_t len = sizeof(server_addr);
    if (getsockname(socket_fd, (struct sockaddr*)&server_addr, &len) == 0) {
        server_port = ntohs(server_addr.sin_port);
    }

    std::cout << "Server listening on port " << server_port << ".\n";
    return true;
}

void BaseServer::serve() {
    // Accept Incoming Connections
    while (!stopping) {
        int client_fd = acceptConnection();
        if (client_fd < 0) {
            continue; // Accept failed, try again
        }

        {
            std::lock_guard<std::mutex> lock(handlers_mutex);
            ++active_handlers;
        }

        // Create a New Thread for Each Client
        auto* args = new std::pair<BaseServer*, int>(this, client_fd);
        pthread_t thread_id;
        if (pthread_create(&thread_id, nullptr, BaseServer::threadEntry, args) != 0) {
            std::cerr << "Error: Failed to create thread\n";
            close(client_fd);
            delete args;
            std::lock_guard<std::mutex> lock(handlers_mutex);
            --active_handlers;
            continue;
        }

        pthread_detach(thread_id); // Auto-clean threads
    }
}

void BaseServer::stop() {
    if (stopping.exchange(true)) {
        return;
    }
    if (socket_fd != -1) {
        // Wakes a blocked accept()
        shutdown(socket_fd, SHUT_RDWR);
    }
}

int BaseServer::acceptConnection() {
    // Prepare to Accept a Connection
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);

    // Accept the Incoming Connection
    int client_fd = accept4(socket_fd, (struct sockaddr*)&client_addr, &client_len, SOCK_CLOEXEC);
    if (client_fd < 0) {
        if (!stopping && errno != EINTR) {
            std::cerr << "Error: Failed to accept connection: " << std::strerror(errno) << "\n";
        }
        return -1;
    }
    return client_fd;
}

void BaseServer::waitForHandlers() {
    std::unique_lock<std::mutex> lock(handlers_mutex);
    handlers_done.wait(lock, [this] { return active_handlers == 0; });
}

void* BaseServer::threadEntry(void* arg) {
    auto* args = reinterpret_cast<std::pair<BaseServer*, int>*>(arg);
    BaseServer* server = args->first;
    int client_fd = args->second;
    delete args;

    server->threadHandler(client_fd);

    pthread_exit(nullptr);
    return nullptr;
}

void BaseServer::threadHandler(int client_fd) {
    handleRequest(client_fd);   // takes ownership of client_fd

    std::lock_guard<std::mutex> lock(handlers_mutex);
    if (--active_handlers == 0) {
        handlers_done.notify_all();
    }
}
