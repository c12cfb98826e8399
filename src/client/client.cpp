/*
 * ChatRelay - command line client implementation
 */

#include "client.hpp"

#include "event_codec.hpp"
#include "file_transfer.hpp"
#include "protocol.hpp"
#include "utils.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <type_traits>

namespace chatrelay {

namespace {
constexpr const char* kChannelInfo = "chatrelay-channel";

std::string guess_mime(const std::string& extension) {
    static const std::map<std::string, std::string> kMimeTypes{
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".json", "application/json"}};
    std::string lower = extension;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    auto it = kMimeTypes.find(lower);
    return it != kMimeTypes.end() ? it->second : kDefaultMime;
}

std::string format_size(uint64_t bytes) {
    std::ostringstream out;
    if (bytes >= 1024 * 1024) {
        out << (bytes / (1024 * 1024)) << " MiB";
    } else if (bytes >= 1024) {
        out << (bytes / 1024) << " KiB";
    } else {
        out << bytes << " B";
    }
    return out.str();
}

// Text following the first `words` space separated words.
std::string remainder_after(const std::string& line, std::size_t words) {
    std::size_t pos = 0;
    for (std::size_t i = 0; i < words; ++i) {
        pos = line.find(' ', pos);
        if (pos == std::string::npos) {
            return "";
        }
        pos = line.find_first_not_of(' ', pos);
        if (pos == std::string::npos) {
            return "";
        }
    }
    return line.substr(pos);
}
} // namespace

ChatClient::ChatClient(ClientConfig config)
    : config_(std::move(config)),
      key_pair_(generate_rsa_keypair()),
      public_pem_(public_key_to_pem(key_pair_)),
      queue_(*this),
      assembler_(key_pair_, [this](const Event& event) { queue_.emit(event); }) {
    queue_.set_desired_username(config_.username);
    queue_.set_error_callback([this](const RelayError& error) { print_line("[error] " + error.message); });
    queue_.set_connect_request([this] { request_connect(); });

    assembler_.set_progress_callback([this](const std::string& id, uint64_t received, uint64_t expected) {
        if (expected == 0) {
            print_line("[file] transfer " + id.substr(0, 8) + ": " + std::to_string(received) + " chunk(s)");
        } else {
            print_line("[file] transfer " + id.substr(0, 8) + ": " + std::to_string(received) + "/" +
                       std::to_string(expected));
        }
    });
    assembler_.set_complete_callback([this](const ReceivedFile& file) {
        std::string error;
        auto path = save_received_file(file.filename, file.data, error);
        if (path.has_value()) {
            print_line("[file] encrypted file " + file.filename + " saved to " + path.value());
        } else {
            print_line("[error] could not save " + file.filename + ": " + error);
        }
    });
    assembler_.set_error_callback([this](const std::string& id, const std::string& message) {
        print_line("[error] transfer " + id.substr(0, 8) + " failed: " + message);
    });
}

ChatClient::~ChatClient() {
    stop();
}

bool ChatClient::start(std::chrono::milliseconds timeout) {
    if (running_.exchange(true)) {
        return connected_;
    }
    connection_thread_ = std::thread(&ChatClient::connection_loop, this);

    uint64_t attempts_before = 0;
    {
        std::lock_guard<std::mutex> lock(connect_mutex_);
        attempts_before = connect_attempts_;
    }
    queue_.emit(RegisterRequest{config_.username});

    std::unique_lock<std::mutex> lock(connect_mutex_);
    connect_cv_.wait_for(lock, timeout, [&] { return connected_ || connect_attempts_ > attempts_before; });
    return connected_;
}

void ChatClient::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(connect_mutex_);
        connect_requested_ = false;
    }
    connect_cv_.notify_all();
    {
        std::lock_guard<std::mutex> lock(socket_mutex_);
        if (socket_fd_ >= 0) {
            ::shutdown(socket_fd_, SHUT_RDWR);
        }
    }
    if (connection_thread_.joinable()) {
        connection_thread_.join();
    }
}

void ChatClient::request_connect() {
    {
        std::lock_guard<std::mutex> lock(connect_mutex_);
        connect_requested_ = true;
    }
    connect_cv_.notify_all();
}

void ChatClient::connection_loop() {
    std::unique_lock<std::mutex> lock(connect_mutex_);
    while (running_) {
        connect_cv_.wait(lock, [this] { return !running_ || connect_requested_; });
        if (!running_) {
            break;
        }
        connect_requested_ = false;
        lock.unlock();

        queue_.on_connecting();
        if (open_connection()) {
            {
                std::lock_guard<std::mutex> notify_lock(connect_mutex_);
                connected_ = true;
            }
            connect_cv_.notify_all();
            queue_.on_connected();
            reader_loop();
            connected_ = false;
            close_socket();
            print_line("[info] disconnected from server");
        } else {
            print_line("[error] could not connect to " + config_.host + ":" + std::to_string(config_.port));
        }

        queue_.on_disconnected();
        assembler_.clear();
        peer_keys_.clear();
        {
            std::lock_guard<std::mutex> users_lock(users_mutex_);
            users_.clear();
        }

        lock.lock();
        ++connect_attempts_;
        connect_cv_.notify_all();
    }
}

bool ChatClient::open_connection() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        log_error("socket() failed: " + std::string(std::strerror(errno)));
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);

    if (inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) <= 0) {
        addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* result = nullptr;
        if (::getaddrinfo(config_.host.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
            log_error("Unable to resolve host " + config_.host);
            ::close(fd);
            return false;
        }
        addr.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
        ::freeaddrinfo(result);
    }

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        log_error("connect() failed: " + std::string(std::strerror(errno)));
        ::close(fd);
        return false;
    }

    bool ok = false;
    try {
        ok = perform_handshake(fd);
    } catch (const std::exception& ex) {
        log_error(std::string("Handshake exception: ") + ex.what());
    }
    if (!ok) {
        log_error("Handshake with server failed");
        ::close(fd);
        return false;
    }

    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (!running_) {
        ::close(fd);
        return false;
    }
    socket_fd_ = fd;
    return true;
}

bool ChatClient::perform_handshake(int fd) {
    auto frame_opt = receive_frame(fd);
    if (!frame_opt.has_value() || frame_opt->kind != MessageKind::Handshake) {
        return false;
    }

    std::string server_msg(frame_opt->payload.begin(), frame_opt->payload.end());
    auto server_kv = parse_kv_string(server_msg);
    if (server_kv["type"] != "server_hello") {
        return false;
    }

    auto server_public = base64_decode(server_kv["pub"]);
    if (!server_public.has_value()) {
        return false;
    }

    KeyPair client_keys = generate_x25519_keypair();
    auto shared = compute_x25519_shared(client_keys.private_key, server_public.value());
    auto channel_key = hkdf_sha256(shared, kChannelInfo, kAes256KeySize);

    std::map<std::string, std::string> response{
        {"type", "client_hello"},
        {"pub", base64_encode(client_keys.public_key)}
    };

    Frame reply;
    reply.kind = MessageKind::Handshake;
    std::string reply_payload = kv_string(response);
    reply.payload.assign(reply_payload.begin(), reply_payload.end());
    if (!send_frame(fd, reply)) {
        return false;
    }

    auto ack_opt = receive_frame(fd);
    if (!ack_opt.has_value() || ack_opt->kind != MessageKind::Handshake) {
        return false;
    }
    std::string ack_msg(ack_opt->payload.begin(), ack_opt->payload.end());
    auto ack_kv = parse_kv_string(ack_msg);
    if (ack_kv["type"] != "handshake_ack") {
        return false;
    }
    uint64_t id = std::stoull(ack_kv["id"]);

    std::lock_guard<std::mutex> lock(socket_mutex_);
    connection_id_ = id;
    channel_key_ = std::move(channel_key);
    log_info("Connected as #" + std::to_string(id));
    return true;
}

bool ChatClient::send_event(const Event& event, std::string& error) {
    std::string encoded = encode_event(event);
    std::vector<uint8_t> plaintext(encoded.begin(), encoded.end());

    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (socket_fd_ < 0) {
        error = "not connected";
        return false;
    }
    Ciphertext sealed;
    try {
        sealed = aes256_gcm_encrypt(channel_key_, plaintext, channel_aad(true, connection_id_));
    } catch (const std::exception& ex) {
        error = ex.what();
        return false;
    }
    Frame frame{MessageKind::Event, pack_sealed_payload(sealed.nonce, sealed.data, sealed.tag)};
    if (!send_frame(socket_fd_, frame)) {
        error = "connection lost";
        return false;
    }
    return true;
}

void ChatClient::reader_loop() {
    int fd = -1;
    std::vector<uint8_t> key;
    std::vector<uint8_t> aad;
    {
        std::lock_guard<std::mutex> lock(socket_mutex_);
        fd = socket_fd_;
        key = channel_key_;
        aad = channel_aad(false, connection_id_);
    }

    while (running_) {
        auto frame_opt = receive_frame(fd);
        if (!frame_opt.has_value()) {
            log_warn("Server disconnected.");
            break;
        }
        const Frame& frame = frame_opt.value();
        if (frame.kind != MessageKind::Event) {
            std::string text(frame.payload.begin(), frame.payload.end());
            log_warn("Unexpected handshake payload: " + text);
            continue;
        }

        std::vector<uint8_t> nonce;
        std::vector<uint8_t> ciphertext;
        std::vector<uint8_t> tag;
        if (!unpack_sealed_payload(frame.payload, nonce, ciphertext, tag)) {
            log_warn("Invalid event payload from server");
            continue;
        }

        std::string text;
        try {
            auto plaintext = aes256_gcm_decrypt(key, Ciphertext{nonce, ciphertext, tag}, aad);
            text.assign(plaintext.begin(), plaintext.end());
        } catch (const std::exception& ex) {
            log_error(std::string("Event decrypt failed: ") + ex.what());
            continue;
        }

        std::string error;
        auto event = decode_event(text, EventDirection::ToClient, error);
        if (!event.has_value()) {
            log_warn("Dropping malformed event: " + error);
            continue;
        }
        handle_event(event.value());
    }
}

void ChatClient::close_socket() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (socket_fd_ >= 0) {
        ::shutdown(socket_fd_, SHUT_RDWR);
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
    channel_key_.clear();
    connection_id_ = 0;
}

void ChatClient::set_event_observer(EventObserver observer) {
    observer_ = std::move(observer);
}

// Records the latency of a timestamped message and returns it as a display suffix.
std::string ChatClient::measure(LatencyStats& stats, const std::optional<double>& timestamp) {
    if (!timestamp.has_value()) {
        return "";
    }
    const double latency = latency_seconds(timestamp.value(), unix_time_seconds());
    stats.record(latency);
    std::ostringstream out;
    out << " (" << std::fixed << std::setprecision(2) << latency * 1000.0 << " ms)";
    return out.str();
}

void ChatClient::handle_event(const Event& event) {
    if (observer_) {
        observer_(event);
    }
    std::visit(
        [&](const auto& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, UserListUpdate>) {
                on_user_list(payload);
            } else if constexpr (std::is_same_v<T, PublicMessage>) {
                const std::string latency = measure(public_latency_, payload.timestamp);
                // Only the round trip of our own messages is shown.
                const bool own = payload.username == queue_.desired_username();
                print_line("[public] " + payload.username + ": " + payload.message + (own ? latency : ""));
                if (payload.file.has_value()) {
                    show_file("public file from " + payload.username, payload.file.value());
                }
            } else if constexpr (std::is_same_v<T, PrivateMessageReceived>) {
                print_line("[pm from " + payload.sender + " #" + std::to_string(payload.message_id) + "] " +
                           payload.message + measure(private_latency_, payload.timestamp));
                if (payload.file.has_value()) {
                    show_file("private file from " + payload.sender, payload.file.value());
                }
                queue_.emit(ReadAckRequest{{payload.message_id}});
            } else if constexpr (std::is_same_v<T, PrivateMessageSent>) {
                print_line("[pm to " + payload.recipient + " #" + std::to_string(payload.message_id) + "] " +
                           payload.message + " (" + payload.status + ")");
            } else if constexpr (std::is_same_v<T, ReadReceipt>) {
                print_line("[seen] message #" + std::to_string(payload.message_id));
            } else if constexpr (std::is_same_v<T, PublicTyping>) {
                print_line("[typing] " + payload.username + (payload.is_typing ? " is typing..." : " stopped typing"));
            } else if constexpr (std::is_same_v<T, PrivateTyping>) {
                print_line("[typing] " + payload.username +
                           (payload.is_typing ? " is typing to you..." : " stopped typing to you"));
            } else if constexpr (std::is_same_v<T, ChatHistory>) {
                print_line("[history] " + std::to_string(payload.messages.size()) + " message(s)");
                for (const auto& entry : payload.messages) {
                    print_line("  " + entry.username + ": " + entry.message +
                               (entry.file.has_value() ? " [file " + entry.file->name + "]" : std::string()));
                }
            } else if constexpr (std::is_same_v<T, PeerPublicKey>) {
                on_peer_key(payload);
            } else if constexpr (std::is_same_v<T, FileChunkRelay>) {
                assembler_.on_chunk(payload.chunk);
            } else if constexpr (std::is_same_v<T, FileTransferAck>) {
                if (payload.success) {
                    print_line("[file] transfer " + payload.transfer_id.substr(0, 8) + " delivered");
                } else {
                    print_line("[file] transfer " + payload.transfer_id.substr(0, 8) + " failed: " + payload.error);
                }
            } else if constexpr (std::is_same_v<T, ErrorNotice>) {
                print_line("[error] " + payload.message);
                if (queue_.on_error_notice(payload.message)) {
                    print_line("[info] choose another name with /register <name>");
                }
            } else {
                log_debug(std::string("Ignoring client-bound '") + event_name(event) + "'");
            }
        },
        event);
}

void ChatClient::on_user_list(const UserListUpdate& update) {
    std::vector<std::string> departed;
    {
        std::lock_guard<std::mutex> lock(users_mutex_);
        for (const auto& name : users_) {
            if (std::find(update.users.begin(), update.users.end(), name) == update.users.end()) {
                departed.push_back(name);
            }
        }
        users_ = update.users;
    }
    for (const auto& name : departed) {
        peer_keys_.remove(name);
    }

    std::string joined;
    for (const auto& name : update.users) {
        joined += (joined.empty() ? "" : ", ") + name;
    }
    print_line("[users] " + joined);

    const std::string own_name = queue_.desired_username();
    for (const auto& name : update.users) {
        if (name != own_name && peer_keys_.mark_offered(name)) {
            offer_key(name);
        }
    }
}

void ChatClient::on_peer_key(const PeerPublicKey& offer) {
    std::string error;
    if (!peer_keys_.store(offer.username, offer.public_key, error)) {
        print_line("[error] rejected public key from " + offer.username + ": " + error);
        return;
    }
    print_line("[security] received public key from " + offer.username);
    if (peer_keys_.mark_offered(offer.username)) {
        offer_key(offer.username);
    }
}

void ChatClient::show_file(const std::string& label, const FilePayload& file) {
    auto data = base64_decode(file.data);
    if (!data.has_value()) {
        print_line("[error] " + label + " could not be decoded");
        return;
    }
    std::string error;
    auto path = save_received_file(file.name, data.value(), error);
    if (!path.has_value()) {
        print_line("[error] could not save " + file.name + ": " + error);
        return;
    }
    print_line("[file] " + label + ": " + file.name + " (" + format_size(data->size()) + ") saved to " +
               path.value());
}

std::optional<std::string> ChatClient::save_received_file(const std::string& filename,
                                                          const std::vector<uint8_t>& data,
                                                          std::string& error) {
    std::error_code ec;
    std::filesystem::create_directories(config_.download_dir, ec);
    if (ec) {
        error = ec.message();
        return std::nullopt;
    }
    std::string extension = std::filesystem::path(filename).extension().string();
    auto target = std::filesystem::path(config_.download_dir) / ("chatrelay_" + hex_encode(random_bytes(8)) + extension);

    std::ofstream out(target, std::ios::binary);
    if (!out) {
        error = "cannot open " + target.string();
        return std::nullopt;
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        error = "write failed";
        return std::nullopt;
    }
    return target.string();
}

void ChatClient::send_public_message(const std::string& text) {
    queue_.emit(PublicMessageRequest{text, std::nullopt, unix_time_seconds()});
}

void ChatClient::send_private_message(const std::string& recipient, const std::string& text) {
    queue_.emit(PrivateMessageRequest{recipient, text, std::nullopt, unix_time_seconds()});
}

bool ChatClient::send_file(const std::string& path,
                           const std::optional<std::string>& recipient,
                           std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Cannot read file " + path;
        return false;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (data.empty()) {
        error = "File is empty";
        return false;
    }
    if (data.size() > kMaxFileBytes) {
        error = "File exceeds the 5 MiB limit";
        return false;
    }
    const std::filesystem::path file_path(path);
    const std::string filename = file_path.filename().string();

    if (recipient.has_value()) {
        auto key = peer_keys_.find(recipient.value());
        if (key.has_value()) {
            PreparedTransfer transfer;
            try {
                transfer = prepare_transfer(filename, data, key.value(), config_.chunk_size);
            } catch (const std::exception& ex) {
                error = std::string("Encryption failed: ") + ex.what();
                return false;
            }
            for (auto& upload : private_chunk_uploads(transfer, recipient.value())) {
                queue_.emit(upload);
            }
            print_line("[file] sending " + filename + " encrypted to " + recipient.value() + " in " +
                       std::to_string(transfer.chunks.size()) + " chunk(s)");
            return true;
        }
        log_debug("No public key cached for " + recipient.value() + ", sending plain attachment");
    }

    FilePayload file;
    file.name = filename;
    file.mime = guess_mime(file_path.extension().string());
    file.size = data.size();
    file.data = base64_encode(data);

    if (recipient.has_value()) {
        queue_.emit(PrivateMessageRequest{recipient.value(), "", file, unix_time_seconds()});
    } else {
        queue_.emit(PublicMessageRequest{"", file, unix_time_seconds()});
    }
    return true;
}

void ChatClient::offer_key(const std::string& username) {
    queue_.emit(KeyExchangeRequest{username, public_pem_});
}

void ChatClient::request_history() {
    queue_.emit(HistoryRequest{});
}

void ChatClient::indicate_typing(bool is_typing, const std::optional<std::string>& recipient) {
    TypingRequest request;
    request.is_typing = is_typing;
    if (recipient.has_value()) {
        request.context = "private";
        request.recipient = recipient;
    } else {
        request.context = "public";
    }
    queue_.emit_typing(request);
}

void ChatClient::register_username(const std::string& username) {
    queue_.emit(RegisterRequest{trim(username)});
}

void ChatClient::run() {
    show_prompt();
    std::string line;
    while (running_ && std::getline(std::cin, line)) {
        process_user_input(line);
        if (!running_) {
            break;
        }
        show_prompt();
    }
    stop();
}

void ChatClient::process_user_input(const std::string& line) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return;
    }
    if (trimmed == "/quit") {
        stop();
        return;
    }
    if (trimmed == "/help") {
        std::lock_guard<std::mutex> lock(io_mutex_);
        std::cout << "\nCommands:\n"
                  << "  /users                  - list online users\n"
                  << "  /history                - show recent public messages\n"
                  << "  /msg <user> <text>      - send a private message\n"
                  << "  /file <path>            - share a file with everyone\n"
                  << "  /pfile <user> <path>    - send a file privately\n"
                  << "  /key <user>             - offer your public key\n"
                  << "  /typing on|off [user]   - send a typing indicator\n"
                  << "  /register <name>        - register or change your username\n"
                  << "  /stats                  - show message latency statistics\n"
                  << "  /quit                   - exit client\n"
                  << "  <text>                  - send a public message\n";
        return;
    }
    if (trimmed == "/users") {
        std::lock_guard<std::mutex> lock(users_mutex_);
        std::string joined;
        for (const auto& name : users_) {
            joined += (joined.empty() ? "" : ", ") + name;
        }
        print_line("[users] " + (joined.empty() ? std::string("(none)") : joined));
        return;
    }
    if (trimmed == "/history") {
        request_history();
        return;
    }
    if (trimmed == "/stats") {
        print_line("[stats] public " + std::to_string(public_latency_.count()) + " message(s): " +
                   public_latency_.summary());
        print_line("[stats] private " + std::to_string(private_latency_.count()) + " message(s): " +
                   private_latency_.summary());
        return;
    }

    auto parts = split(trimmed, ' ');
    const std::string& command = parts[0];
    if (command == "/msg") {
        std::string text = remainder_after(trimmed, 2);
        if (parts.size() < 3 || text.empty()) {
            print_line("Usage: /msg <user> <text>");
            return;
        }
        send_private_message(parts[1], text);
        return;
    }
    if (command == "/file" || command == "/pfile") {
        const bool is_private = command == "/pfile";
        std::string path = remainder_after(trimmed, is_private ? 2 : 1);
        if (path.empty()) {
            print_line(is_private ? "Usage: /pfile <user> <path>" : "Usage: /file <path>");
            return;
        }
        std::string error;
        std::optional<std::string> recipient;
        if (is_private) {
            recipient = parts[1];
        }
        if (!send_file(path, recipient, error)) {
            print_line("[error] " + error);
        }
        return;
    }
    if (command == "/register") {
        if (parts.size() < 2) {
            print_line("Usage: /register <name>");
            return;
        }
        register_username(parts[1]);
        return;
    }
    if (command == "/key") {
        if (parts.size() < 2) {
            print_line("Usage: /key <user>");
            return;
        }
        offer_key(parts[1]);
        return;
    }
    if (command == "/typing") {
        if (parts.size() < 2 || (parts[1] != "on" && parts[1] != "off")) {
            print_line("Usage: /typing on|off [user]");
            return;
        }
        std::optional<std::string> recipient;
        if (parts.size() >= 3) {
            recipient = parts[2];
        }
        indicate_typing(parts[1] == "on", recipient);
        return;
    }
    if (command[0] == '/') {
        print_line("Unknown command " + command + ", try /help");
        return;
    }

    send_public_message(trimmed);
}

void ChatClient::print_line(const std::string& line) {
    if (config_.quiet) {
        return;
    }
    std::lock_guard<std::mutex> lock(io_mutex_);
    std::cout << "\n" << line << std::endl;
}

void ChatClient::show_prompt() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    const std::string name = queue_.desired_username();
    std::cout << "[" << (name.empty() ? std::string("unregistered") : name) << "]> " << std::flush;
}

} // namespace chatrelay
