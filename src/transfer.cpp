#include "transfer.hpp"
#include "protocol/limits.hpp"
#include "protocol/messages.hpp"
#include <iostream>
#include <vector>
#include <fstream>
#include <filesystem>
#include <chrono>

namespace transfer {

bool MessageSender::send_frame(boost::asio::ip::tcp::socket& socket, const protocol::Bytes& frame) {
    try {
        boost::asio::write(socket, boost::asio::buffer(frame));
        return true;
    } catch (std::exception& e) {
        std::cerr << "MessageSender Exception: " << e.what() << "\n";
        return false;
    }
}

std::optional<protocol::Frame> MessageReceiver::receive_frame(boost::asio::ip::tcp::socket& socket,
                                                              int32_t max_frame_length) {
    return protocol::read_next_message(socket, max_frame_length);
}

bool MessageSender::send_file(boost::asio::ip::tcp::socket& socket, const std::string& filepath,
                              const std::string& transfer_id, uint64_t start_offset,
                              TransferProgressCallback progress_cb) {
    try {
        std::ifstream file(filepath, std::ios::binary);
        if (!file.is_open()) {
            std::cerr << "Could not open file for reading: " << filepath << "\n";
            return false;
        }

        // Get file size
        file.seekg(0, std::ios::end);
        uint64_t file_size = file.tellg();
        if (start_offset > file_size) {
            std::cerr << "Start offset " << start_offset << " is past the end of " << filepath
                      << " (" << file_size << " bytes)\n";
            return false;
        }
        file.seekg(start_offset);

        uint64_t total_sent = start_offset;
        auto start_time = std::chrono::steady_clock::now();
        auto last_cb_time = start_time;

        protocol::Bytes buffer(protocol::kTransferChunkSize);
        while (file.read(reinterpret_cast<char*>(buffer.data()), buffer.size()) || file.gcount() > 0) {
            std::streamsize bytes_read = file.gcount();
            protocol::Bytes chunk(buffer.begin(), buffer.begin() + bytes_read);
            auto frame = protocol::encode_file_chunk(transfer_id, static_cast<int64_t>(total_sent), chunk);
            boost::asio::write(socket, boost::asio::buffer(frame));
            total_sent += bytes_read;

            if (progress_cb) {
                auto now = std::chrono::steady_clock::now();
                auto elapsed_since_cb = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_cb_time).count();
                if (elapsed_since_cb >= 300 || total_sent == file_size) {
                    double elapsed = std::chrono::duration<double>(now - start_time).count();
                    uint64_t session_sent = total_sent - start_offset;
                    double speed = (elapsed > 0) ? (session_sent / elapsed / (1024.0 * 1024.0)) : 0;
                    std::filesystem::path p(filepath);
                    progress_cb(p.filename().string(), total_sent, file_size, speed);
                    last_cb_time = now;
                }
            }
        }
        return true;
    } catch (std::exception& e) {
        std::cerr << "MessageSender Exception (send_file): " << e.what() << "\n";
        return false;
    }
}

} // namespace transfer
