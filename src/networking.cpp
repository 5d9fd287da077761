#include "networking.hpp"
#include "transfer.hpp"
#include "security.hpp"
#include "protocol/messages.hpp"
#include <iostream>
#include <boost/asio.hpp>
#include <filesystem>
#include <iomanip>
#include <cstdio>
#include <stdexcept>

using boost::asio::ip::tcp;

namespace networking {

namespace {

std::string format_size(uint64_t bytes) {
    double size = bytes;
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%s", size, units[i]);
    return std::string(buf);
}

tcp::socket connect_to(boost::asio::io_context& io_context, const std::string& ip, unsigned short port) {
    tcp::socket socket(io_context);
    tcp::resolver resolver(io_context);
    boost::asio::connect(socket, resolver.resolve(ip, std::to_string(port)));
    return socket;
}

} // namespace

Server::Server(int32_t max_frame_length)
    : max_frame_length_(max_frame_length) {
    if (max_frame_length < protocol::kHeaderLength) {
        throw std::invalid_argument("max frame length must be at least " +
                                    std::to_string(protocol::kHeaderLength));
    }
}

bool Server::listen(unsigned short port, std::function<void(unsigned short)> on_ready) {
    try {
        boost::asio::io_context io_context;
        tcp::acceptor acceptor(io_context, tcp::endpoint(tcp::v4(), port));
        unsigned short bound_port = acceptor.local_endpoint().port();
        std::cout << "Listening on port " << bound_port << std::endl;
        if (on_ready) {
            on_ready(bound_port);
        }

        tcp::socket socket(io_context);
        acceptor.accept(socket);
        std::cout << "Peer connected from " << socket.remote_endpoint().address().to_string() << "\n";

        summary_ = serve(socket, std::cout);
        if (!summary_.clean_close) {
            return false;
        }

        std::cout << "Peer disconnected.\n";
        for (const auto& entry : summary_.received) {
            std::cout << "Transfer " << entry.first << ": " << format_size(entry.second) << " received\n";
        }
        if (summary_.untracked_bytes > 0) {
            std::cout << "Untracked transfers: " << format_size(summary_.untracked_bytes) << " received\n";
        }
        return true;
    } catch (std::exception& e) {
        std::cerr << "Server Exception: " << e.what() << "\n";
        return false;
    }
}

SessionSummary Server::serve(tcp::socket& socket, std::ostream& out) {
    SessionSummary summary;
    while (true) {
        std::optional<protocol::Frame> frame;
        try {
            frame = transfer::MessageReceiver::receive_frame(socket, max_frame_length_);
        } catch (const protocol::CodecError& e) {
            std::cerr << "Protocol error (" << protocol::to_string(e.kind()) << "): " << e.what()
                      << ". Closing connection.\n";
            socket.close();
            return summary;
        }
        if (!frame) {
            summary.clean_close = true;
            return summary;
        }

        ++summary.frames;
        out << protocol::frame_to_json(*frame).dump() << "\n";

        if (frame->type == protocol::MessageType::PING) {
            if (!transfer::MessageSender::send_frame(socket, protocol::encode_ping())) {
                return summary;
            }
            ++summary.pings_answered;
        } else if (frame->type == protocol::MessageType::FILE_CHUNK) {
            protocol::FileChunk chunk;
            try {
                chunk = protocol::decode_file_chunk(frame->payload);
            } catch (const protocol::CodecError& e) {
                std::cerr << "Malformed FILE_CHUNK: " << e.what() << ". Closing connection.\n";
                socket.close();
                return summary;
            }
            auto it = summary.received.find(chunk.transfer_id);
            if (it != summary.received.end()) {
                it->second += chunk.chunk.size();
            } else if (summary.received.size() < kMaxTrackedTransfers) {
                summary.received.emplace(chunk.transfer_id, chunk.chunk.size());
            } else {
                summary.untracked_bytes += chunk.chunk.size();
            }
        }
    }
}

bool Client::send_file(const std::string& ip, unsigned short port,
                       const std::string& username, const std::string& filepath,
                       uint64_t start_offset) {
    try {
        std::error_code ec;
        auto fsize = std::filesystem::file_size(filepath, ec);
        if (ec) {
            std::cerr << "File not found: " << filepath << "\n";
            return false;
        }
        std::string filename = std::filesystem::path(filepath).filename().string();

        boost::asio::io_context io_context;
        tcp::socket socket = connect_to(io_context, ip, port);
        std::cout << "Connected to peer!\n";

        if (!transfer::MessageSender::send_frame(socket, protocol::encode_hello(username))) {
            return false;
        }
        if (!transfer::MessageSender::send_frame(
                socket, protocol::encode_file_advert(filename, filename, static_cast<int64_t>(fsize)))) {
            return false;
        }

        std::string transfer_id = security::generate_transfer_id();
        std::cout << "Sending " << filename << " (" << format_size(fsize) << ") as transfer " << transfer_id << "\n";

        bool ok = transfer::MessageSender::send_file(
            socket, filepath, transfer_id, start_offset,
            [](const std::string& name, uint64_t sent, uint64_t total, double speed_mbps) {
                int percent = (total > 0) ? static_cast<int>((sent * 100.0) / total) : 100;
                std::cout << "\r" << name << " " << percent << "% | "
                          << std::fixed << std::setprecision(1) << speed_mbps << " MB/s    " << std::flush;
            });
        std::cout << "\n";
        if (ok) {
            std::cout << "File transfer completed successfully.\n";
        }
        return ok;
    } catch (std::exception& e) {
        std::cerr << "Client Exception: " << e.what() << "\n";
        return false;
    }
}

bool Client::ping(const std::string& ip, unsigned short port, const std::string& username) {
    try {
        boost::asio::io_context io_context;
        tcp::socket socket = connect_to(io_context, ip, port);

        if (!transfer::MessageSender::send_frame(socket, protocol::encode_hello(username)) ||
            !transfer::MessageSender::send_frame(socket, protocol::encode_ping())) {
            return false;
        }

        auto reply = transfer::MessageReceiver::receive_frame(socket, protocol::kDefaultMaxFrameLength);
        if (!reply) {
            std::cerr << "Peer closed the connection without replying.\n";
            return false;
        }
        std::cout << protocol::frame_to_json(*reply).dump() << "\n";
        return true;
    } catch (std::exception& e) {
        std::cerr << "Client Exception: " << e.what() << "\n";
        return false;
    }
}

} // namespace networking
