#include <iostream>
#include <fstream>
#include <iterator>
#include <string>
#include <stdexcept>
#include <vector>
#include <cstdint>
#include "cli.hpp"
#include "networking.hpp"
#include "security.hpp"
#include "protocol/messages.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage:\n"
              << "  seekwire encode hello <username> -o <file>\n"
              << "  seekwire encode ping -o <file>\n"
              << "  seekwire encode advert <file_id> <name> <size> -o <file>\n"
              << "  seekwire encode get <transfer_id|-> <file_id> <offset> -o <file>\n"
              << "  seekwire encode chunk <transfer_id> <offset> <data_file> -o <file>\n"
              << "  seekwire dump <file> [--max-frame <bytes>]\n"
              << "  seekwire listen <port> [--max-frame <bytes>]\n"
              << "  seekwire send <ip> <port> <username> <path> [--offset <bytes>]\n"
              << "  seekwire ping <ip> <port> [username]\n";
}

protocol::Bytes read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for reading: " + path);
    }
    return protocol::Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

protocol::Bytes build_frame(const std::vector<std::string>& args) {
    const std::string& kind = args.at(0);
    if (kind == "hello" && args.size() == 2) {
        return protocol::encode_hello(args[1]);
    }
    if (kind == "ping" && args.size() == 1) {
        return protocol::encode_ping();
    }
    if (kind == "advert" && args.size() == 4) {
        return protocol::encode_file_advert(args[1], args[2], std::stoll(args[3]));
    }
    if (kind == "get" && args.size() == 4) {
        std::string transfer_id = args[1] == "-" ? security::generate_transfer_id() : args[1];
        std::cout << "transfer_id: " << transfer_id << "\n";
        return protocol::encode_get_file(transfer_id, args[2], std::stoll(args[3]));
    }
    if (kind == "chunk" && args.size() == 4) {
        return protocol::encode_file_chunk(args[1], std::stoll(args[2]), read_file(args[3]));
    }
    throw std::invalid_argument("bad encode arguments");
}

int run_encode(const cli::Options& opts) {
    if (opts.args.empty() || opts.output.empty()) {
        print_usage();
        return 1;
    }
    protocol::Bytes frame;
    try {
        frame = build_frame(opts.args);
    } catch (const std::invalid_argument&) {
        print_usage();
        return 1;
    }

    // Append so several frames can be stacked into one capture file.
    std::ofstream out(opts.output, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        std::cerr << "Could not open file for writing: " << opts.output << "\n";
        return 1;
    }
    out.write(reinterpret_cast<const char*>(frame.data()), frame.size());
    std::cout << "Wrote " << frame.size() << " bytes to " << opts.output << "\n";
    return 0;
}

int run_dump(const cli::Options& opts) {
    if (opts.args.size() != 1) {
        print_usage();
        return 1;
    }
    protocol::Bytes capture = read_file(opts.args[0]);
    protocol::ByteReader reader(capture);
    try {
        std::size_t count = networking::dump_frames(reader, std::cout, opts.max_frame_length);
        std::cerr << count << " frame(s)\n";
    } catch (const protocol::CodecError& e) {
        std::cerr << "Protocol error at offset " << reader.position() << " ("
                  << protocol::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    try {
        std::string command = argv[1];
        cli::Options opts = cli::parse_options(argc, argv);

        if (command == "encode") {
            return run_encode(opts);
        } else if (command == "dump") {
            return run_dump(opts);
        } else if (command == "listen" && opts.args.size() == 1) {
            networking::Server server(opts.max_frame_length);
            return server.listen(static_cast<unsigned short>(std::stoi(opts.args[0]))) ? 0 : 1;
        } else if (command == "send" && opts.args.size() == 4) {
            networking::Client client;
            unsigned short port = static_cast<unsigned short>(std::stoi(opts.args[1]));
            return client.send_file(opts.args[0], port, opts.args[2], opts.args[3], opts.offset) ? 0 : 1;
        } else if (command == "ping" && (opts.args.size() == 2 || opts.args.size() == 3)) {
            networking::Client client;
            unsigned short port = static_cast<unsigned short>(std::stoi(opts.args[1]));
            std::string username = opts.args.size() == 3 ? opts.args[2] : "seekwire";
            return client.ping(opts.args[0], port, username) ? 0 : 1;
        }
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    print_usage();
    return 1;
}
