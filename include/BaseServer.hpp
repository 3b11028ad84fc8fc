#ifndef BASE_SERVER_HPP
#define BASE_SERVER_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>

/**
 * BaseServer - Thread-per-connection TCP listener
 *
 * Each accepted socket is handed to handleRequest() on its own detached
 * thread; handleRequest() owns the descriptor and must close it (or hand it
 * to something that will). The destructor stops accepting and waits for
 * running handlers to return.
 */
class BaseServer{
public:
    explicit BaseServer(int port);
    virtual ~BaseServer();

    BaseServer(const BaseServer&) = delete;
    BaseServer& operator=(const BaseServer&) = delete;

    // Bind and listen, then serve until stop()
    bool start();

    // Bind and listen only. Port 0 picks a free port, see boundPort().
    bool listen();

    // Accept loop. Returns after stop().
    void serve();

    void stop();

    int boundPort() const { return server_port; }

    int acceptConnection();

protected:
    int socket_fd;
    int server_port;

    virtual void handleRequest(int client_fd) = 0;

    // Derived destructors call this before their members go away
    void waitForHandlers();

private:
    std::atomic<bool> stopping{false};
    std::mutex handlers_mutex;
    std::condition_variable handlers_done;
    int active_handlers = 0;

    static void* threadEntry(void* arg);
    void threadHandler(int client_fd);
};

#endif // BASE_SERVER_HPP
