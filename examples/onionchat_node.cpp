#include <boost/asio.hpp>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "onionchat/config.hpp"
#include "onionchat/connection_manager.hpp"
#include "onionchat/contacts.hpp"
#include "onionchat/crypto.hpp"
#include "onionchat/errors.hpp"
#include "onionchat/identity.hpp"
#include "onionchat/log.hpp"
#include "onionchat/socks_transport.hpp"
#include "onionchat/version.hpp"

namespace {

bool read_file(const std::string& path, OnionChat::byte_vector& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

void write_file(const std::string& path, const OnionChat::byte_vector& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw OnionChat::RuntimeError("Cannot write " + path);
    }
}

std::string display_name(const OnionChat::ContactBook& contacts, const std::string& address) {
    auto contact = contacts.find(address);
    return contact ? contact->nickname + " (" + address + ")" : address;
}

void print_event(const OnionChat::ContactBook& contacts, const OnionChat::Event& event) {
    using namespace OnionChat;
    const std::string who = display_name(contacts, event_address(event));
    if (std::holds_alternative<HandshakeCompleted>(event)) {
        std::cout << "[+] Connected to " << who << std::endl;
    } else if (auto* failed = std::get_if<HandshakeFailed>(&event)) {
        std::cout << "[!] Handshake with " << who << " failed: " << to_string(failed->reason) << std::endl;
    } else if (auto* msg = std::get_if<MessageReceived>(&event)) {
        if (msg->metadata.file) {
            std::cout << "[" << who << "] offers file " << msg->metadata.file->name << " ("
                      << msg->metadata.file->size << " bytes, " << msg->metadata.file->mime_type << ")"
                      << std::endl;
        } else {
            std::cout << "[" << who << "] " << std::string(msg->plaintext.begin(), msg->plaintext.end())
                      << std::endl;
        }
    } else {
        std::cout << "[-] Connection to " << who << " lost" << std::endl;
    }
}

void print_help() {
    std::cout << "Commands:\n"
                 "  /connect <address>\n"
                 "  /disconnect <address>\n"
                 "  /send <address> <text>\n"
                 "  /file <address> <name> <size> <mime-type>\n"
                 "  /add <address> <nickname>\n"
                 "  /contacts\n"
                 "  /peers\n"
                 "  /quit"
              << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.ini> <identity-file> [contacts-file]" << std::endl;
        return 1;
    }
    const std::string identity_path = argv[2];
    const std::string contacts_path = argc > 3 ? argv[3] : "";

    // 1. Initialize the crypto library
    if (OnionChat::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    // 2. Load the configuration
    OnionChat::Config config;
    try {
        config = OnionChat::Config::load_file(argv[1]);
    } catch (const OnionChat::ConfigError& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }
    OnionChat::Log::set_level(OnionChat::Log::parse_level(config.log.level));
    const OnionChat::PasswordCost cost = OnionChat::PasswordCost::from_name(config.security.password_cost);

    const char* env_password = std::getenv("ONIONCHAT_PASSWORD");
    std::string password = env_password ? env_password : "";
    if (password.empty()) {
        std::cout << "Password: " << std::flush;
        std::getline(std::cin, password);
    }

    // 3. Load or create the identity
    OnionChat::IdentityStore identity(cost);
    OnionChat::ContactBook contacts(cost);
    try {
        OnionChat::byte_vector blob;
        if (read_file(identity_path, blob)) {
            identity.load(blob, password);
        } else {
            identity.create_identity();
            write_file(identity_path, identity.save(password));
            std::cout << "Created a new identity in " << identity_path << std::endl;
        }
        if (!contacts_path.empty() && read_file(contacts_path, blob)) {
            contacts.load(blob, password);
        }
    } catch (const OnionChat::Exception& e) {
        std::cerr << "Cannot open local storage: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "OnionChat protocol 0x" << std::hex << OnionChat::SUPPORTED_VERSIONS.front() << std::dec
              << std::endl;
    std::cout << "Address:     " << identity.address() << std::endl;
    std::cout << "Fingerprint: " << identity.fingerprint() << std::endl;

    // 4. Start the transport and the connection manager
    boost::asio::io_context io;
    auto work = boost::asio::make_work_guard(io);
    OnionChat::net::SocksTransport transport(io, config.tor, config.protocol.max_message_size);
    OnionChat::ConnectionManager manager(io, identity, transport, config.protocol);

    try {
        transport.listen();
    } catch (const OnionChat::TransportError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    manager.start();

    std::vector<std::thread> workers;
    const unsigned thread_count = std::max(2u, std::thread::hardware_concurrency());
    for (unsigned i = 0; i < thread_count; ++i) {
        workers.emplace_back([&io]() { io.run(); });
    }

    // 5. Print events as they arrive
    std::atomic<bool> running{true};
    std::thread printer([&]() {
        while (running) {
            if (auto event = manager.events().wait_for(std::chrono::milliseconds(200))) {
                contacts.apply(*event);
                print_event(contacts, *event);
            }
        }
    });

    // 6. Read commands from stdin
    print_help();
    std::string line;
    while (std::getline(std::cin, line)) {
        std::istringstream in(line);
        std::string cmd, address;
        in >> cmd >> address;
        if (auto contact = contacts.find(address); !contact) {
            // Allow nicknames in place of addresses.
            for (const auto& c : contacts.list()) {
                if (c.nickname == address) {
                    address = c.address;
                    break;
                }
            }
        }

        try {
            if (cmd == "/quit") {
                break;
            } else if (cmd == "/connect") {
                manager.execute(OnionChat::Connect{address});
            } else if (cmd == "/disconnect") {
                manager.execute(OnionChat::Disconnect{address});
            } else if (cmd == "/send") {
                std::string text;
                std::getline(in >> std::ws, text);
                manager.execute(OnionChat::SendText{address, text});
            } else if (cmd == "/file") {
                OnionChat::SendFileMetadata file;
                file.address = address;
                in >> file.name >> file.size >> file.mime_type;
                manager.execute(file);
            } else if (cmd == "/add") {
                std::string nickname;
                std::getline(in >> std::ws, nickname);
                if (!contacts.add(address, nickname)) {
                    std::cout << "Already a contact." << std::endl;
                }
            } else if (cmd == "/contacts") {
                for (const auto& c : contacts.list()) {
                    std::cout << (c.online ? " * " : "   ") << c.nickname << "  " << c.address << std::endl;
                }
            } else if (cmd == "/peers") {
                for (const auto& peer : manager.peers()) {
                    auto state = manager.peer_state(peer);
                    std::cout << "   " << peer << "  " << (state ? OnionChat::to_string(*state) : "gone") << std::endl;
                }
            } else if (!cmd.empty()) {
                print_help();
            }
        } catch (const OnionChat::Exception& e) {
            std::cout << "Error: " << e.what() << std::endl;
        }
    }

    // 7. Shut down and persist the contact list
    manager.shutdown();
    running = false;
    printer.join();
    work.reset();
    io.stop();
    for (auto& t : workers) {
        t.join();
    }
    transport.stop();

    if (!contacts_path.empty()) {
        try {
            write_file(contacts_path, contacts.save(password));
        } catch (const OnionChat::Exception& e) {
            std::cerr << "Cannot save contacts: " << e.what() << std::endl;
            return 1;
        }
    }
    return 0;
}
