// streamer.hpp - MJPEG streamer (Linux) for the annotated skill bar
// ------------------------------------------------------------------
// * Streams the most recent frame at up to `fps` (default 10).
// * Disables Nagle (TCP_NODELAY) for low latency.
// * Frame counters are exposed for the status log instead of printed.
//
#pragma once

#include <opencv2/opencv.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include "logging.hpp"

class FrameStreamer
{
public:
    explicit FrameStreamer(uint16_t port = 8081, int fps = 10)
        : port_(port), periodUs_(1'000'000 / std::max(1, fps))
    {
        log_info("MJPEG stream on port " + std::to_string(port_) + ", fps " + std::to_string(fps));
        srvThread_ = std::thread([this]
                                 { serve(); });
    }

    ~FrameStreamer()
    {
        stop_ = true;
        if (srvThread_.joinable())
            srvThread_.join();

        // Client loops poll stop_ every millisecond
        while (clients_ > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        log_info("MJPEG stream stopped");
    }

    // Push a raw BGR frame (thread-safe)
    void push(const cv::Mat &bgr)
    {
        if (bgr.empty())
            return;

        std::vector<uchar> jpg;
        if (!cv::imencode(".jpg", bgr, jpg, {cv::IMWRITE_JPEG_QUALITY, 80}))
        {
            log_warning("Could not encode stream frame");
            return;
        }
        {
            std::lock_guard<std::mutex> lk(mut_);
            lastJPEG_.swap(jpg);
        }
        pushCount_++;
    }

    uint64_t pushed() const { return pushCount_; }
    uint64_t sent() const { return sendCount_; }

private:
    static bool sendAll(int fd, const void *buf, size_t len)
    {
        const char *p = static_cast<const char *>(buf);
        while (len)
        {
            ssize_t n = send(fd, p, len, MSG_NOSIGNAL);
            if (n <= 0)
                return false;
            p += n;
            len -= n;
        }
        return true;
    }

    void serve()
    {
        int srv = socket(AF_INET, SOCK_STREAM, 0);
        if (srv < 0)
        {
            log_error("Stream socket could not be created");
            return;
        }

        int one = 1;
        setsockopt(srv, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port_);
        addr.sin_addr.s_addr = INADDR_ANY;
        if (bind(srv, reinterpret_cast<sockaddr *>(&addr), sizeof addr) < 0 || listen(srv, 10) < 0)
        {
            log_error("Stream could not listen on port " + std::to_string(port_));
            close(srv);
            return;
        }

        while (!stop_)
        {
            fd_set rfds;
            FD_ZERO(&rfds);
            FD_SET(srv, &rfds);
            timeval tv{0, 100'000};
            if (select(srv + 1, &rfds, nullptr, nullptr, &tv) > 0)
            {
                int cli = accept(srv, nullptr, nullptr);
                if (cli >= 0)
                {
                    clients_++;
                    std::thread(&FrameStreamer::client, this, cli).detach();
                }
            }
        }
        close(srv);
    }

    // ------------------------------------------------------------------ per-client loop
    void client(int sock)
    {
        int one = 1;
        setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        char req[1024];
        if (read(sock, req, sizeof req) < 0) // discard HTTP request
        {
            close(sock);
            clients_--;
            return;
        }

        static constexpr char hdr[] =
            "HTTP/1.0 200 OK\r\n"
            "Cache-Control: no-cache\r\n"
            "Pragma: no-cache\r\n"
            "Content-Type: multipart/x-mixed-replace; boundary=frame\r\n\r\n";
        if (!sendAll(sock, hdr, sizeof(hdr) - 1))
        {
            close(sock);
            clients_--;
            return;
        }

        std::vector<uchar> cached;
        auto lastSent = std::chrono::steady_clock::now() - std::chrono::microseconds(periodUs_);

        while (!stop_)
        {
            auto now = std::chrono::steady_clock::now();
            if (now - lastSent >= std::chrono::microseconds(periodUs_))
            {
                {
                    std::lock_guard<std::mutex> lk(mut_);
                    if (!lastJPEG_.empty())
                        cached = lastJPEG_;
                }
                if (!cached.empty())
                {
                    std::ostringstream head;
                    head << "--frame\r\nContent-Type: image/jpeg\r\nContent-Length: "
                         << cached.size() << "\r\n\r\n";
                    if (!sendAll(sock, head.str().c_str(), head.str().size()))
                        break;
                    if (!sendAll(sock, cached.data(), cached.size()))
                        break;
                    if (!sendAll(sock, "\r\n", 2))
                        break;

                    sendCount_++;
                    lastSent = now;
                }
            }
            std::this_thread::sleep_for(std::chrono::microseconds(1000));
        }
        close(sock);
        clients_--;
    }

    // ------------------------------------------------------------------ data members
    uint16_t port_;
    int periodUs_;

    std::atomic<bool> stop_{false};
    std::thread srvThread_;
    std::atomic<int> clients_{0};

    std::mutex mut_;
    std::vector<uchar> lastJPEG_;

    std::atomic<uint64_t> pushCount_{0};
    std::atomic<uint64_t> sendCount_{0};
};
