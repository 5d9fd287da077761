#pragma once

#include <string>
#include <functional>
#include <cstdint>
#include <optional>
#include <boost/asio.hpp>
#include "protocol/frame.hpp"

namespace transfer {

// Progress callback: filename, bytes_transferred, bytes_total, speed_mbps
using TransferProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t, double)>;

class MessageSender {
public:
    // Writes one packed frame. Returns false (and logs) if the socket fails.
    static bool send_frame(boost::asio::ip::tcp::socket& socket, const protocol::Bytes& frame);

    // Streams the file as FILE_CHUNK frames of kTransferChunkSize, starting
    // at start_offset, all tagged with transfer_id. Each chunk carries its
    // absolute file offset. A start_offset past the end of the file fails.
    static bool send_file(boost::asio::ip::tcp::socket& socket, const std::string& filepath,
                          const std::string& transfer_id, uint64_t start_offset = 0,
                          TransferProgressCallback progress_cb = nullptr);
};

class MessageReceiver {
public:
    // Next frame from the peer, or std::nullopt once the peer closed cleanly
    // between frames. Codec violations throw protocol::CodecError; the
    // connection must be dropped after one.
    static std::optional<protocol::Frame> receive_frame(boost::asio::ip::tcp::socket& socket,
                                                        int32_t max_frame_length);
};

} // namespace transfer
