#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <ostream>
#include <functional>
#include <map>
#include <boost/asio.hpp>
#include "protocol/frame.hpp"
#include "protocol/json.hpp"

namespace networking {

// Prints one JSON line per frame until the stream ends on a frame boundary
// and returns how many were printed. Codec violations propagate; the stream
// is unusable after one.
template <typename SyncReadStream>
std::size_t dump_frames(SyncReadStream& stream, std::ostream& out,
                        int32_t max_frame_length = protocol::kDefaultMaxFrameLength) {
    std::size_t count = 0;
    while (auto frame = protocol::read_next_message(stream, max_frame_length)) {
        out << protocol::frame_to_json(*frame).dump() << "\n";
        ++count;
    }
    return count;
}

// Frames received from one peer. Totals are kept for at most
// kMaxTrackedTransfers distinct transfer ids; chunks for ids past that
// land in untracked_bytes.
struct SessionSummary {
    std::size_t frames = 0;
    std::size_t pings_answered = 0;
    std::map<std::string, uint64_t> received;  // transfer_id -> bytes
    uint64_t untracked_bytes = 0;
    bool clean_close = false;  // false if the peer broke the protocol
};

constexpr std::size_t kMaxTrackedTransfers = 64;

class Server {
public:
    explicit Server(int32_t max_frame_length = protocol::kDefaultMaxFrameLength);

    // Accepts a single peer on port (0 picks one) and serves it. on_ready
    // gets the bound port once the acceptor is listening.
    bool listen(unsigned short port, std::function<void(unsigned short)> on_ready = nullptr);

    // Dumps the peer's frames to out, answers PING with PING and totals
    // FILE_CHUNK bytes per transfer. Returns at the peer's clean close or at
    // the first codec violation, which ends the session.
    SessionSummary serve(boost::asio::ip::tcp::socket& socket, std::ostream& out);

    const SessionSummary& summary() const { return summary_; }

private:
    int32_t max_frame_length_;
    SessionSummary summary_;
};

class Client {
public:
    // HELLO, FILE_ADVERT, then the file from start_offset as FILE_CHUNKs
    // under a fresh transfer id.
    bool send_file(const std::string& ip, unsigned short port,
                   const std::string& username, const std::string& filepath,
                   uint64_t start_offset = 0);

    // HELLO + PING, then prints the first frame the peer sends back.
    bool ping(const std::string& ip, unsigned short port, const std::string& username);
};

} // namespace networking
