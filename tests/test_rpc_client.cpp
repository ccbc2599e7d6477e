/**
 * @file test_rpc_client.cpp
 * @brief Тесты разбора ответов kaspad и сериализации транзакции
 */

#include <gtest/gtest.h>

#include "core/hex.hpp"
#include "core/json.hpp"
#include "kaspa/address.hpp"
#include "kaspa/rpc_client.hpp"
#include "test_helpers.hpp"

#include <openssl/evp.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace kasfaucet::tests {

namespace rpc = kaspa::rpc;

// =============================================================================
// Конверт ответа
// =============================================================================

TEST(RpcEnvelopeTest, ExtractsResult) {
    auto result = rpc::extract_result(R"({"id":1,"result":{"entries":[]},"error":null})");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, R"({"entries":[]})");
}

/**
 * @brief Тест: ошибка ноды передаётся с её сообщением
 */
TEST(RpcEnvelopeTest, NodeError) {
    auto result = rpc::extract_result(
        R"({"id":1,"error":{"message":"transaction already in mempool"}})");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RpcRejected);
    EXPECT_EQ(result.error().message, "transaction already in mempool");
}

TEST(RpcEnvelopeTest, MissingResult) {
    auto absent = rpc::extract_result(R"({"id":1})");
    ASSERT_FALSE(absent.has_value());
    EXPECT_EQ(absent.error().code, ErrorCode::RpcParseError);

    auto null_result = rpc::extract_result(R"({"id":1,"result":null})");
    EXPECT_FALSE(null_result.has_value());

    EXPECT_FALSE(rpc::extract_result("<html>502</html>").has_value());
}

/**
 * @brief Тест: wRPC ответ несёт результат в "params"
 */
TEST(RpcEnvelopeTest, WrpcParams) {
    auto result = rpc::extract_result(
        R"({"id":7,"method":"getCurrentNetwork","params":{"network":"testnet"}})");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, R"({"network":"testnet"})");
}

// =============================================================================
// UTXO
// =============================================================================

/**
 * @brief Тест: scriptPublicKey в виде объекта
 */
TEST(UtxoParseTest, ObjectScriptForm) {
    auto txid = std::string(62, '0') + "ab";
    auto utxos = rpc::parse_utxo_entries(
        R"({"entries":[{"address":"kaspatest:q","outpoint":{"transactionId":")" + txid +
        R"(","index":2},"utxoEntry":{"amount":"500000000","scriptPublicKey":)"
        R"({"version":0,"scriptPublicKey":"20aaac"},"blockDaaScore":"123","isCoinbase":true}}]})");

    ASSERT_TRUE(utxos.has_value()) << utxos.error().message;
    ASSERT_EQ(utxos->size(), 1u);

    const auto& utxo = (*utxos)[0];
    EXPECT_EQ(utxo.outpoint.transaction_id[31], 0xab);
    EXPECT_EQ(utxo.outpoint.index, 2u);
    EXPECT_EQ(utxo.amount, 500'000'000u);
    EXPECT_EQ(utxo.script_public_key.version, 0);
    EXPECT_EQ(utxo.script_public_key.script, (Bytes{0x20, 0xaa, 0xac}));
    EXPECT_EQ(utxo.block_daa_score, 123u);
    EXPECT_TRUE(utxo.is_coinbase);
}

/**
 * @brief Тест: компактная форма "<версия BE><скрипт>"
 */
TEST(UtxoParseTest, CompactScriptForm) {
    auto txid = std::string(64, '1');
    auto utxos = rpc::parse_utxo_entries(
        R"({"entries":[{"outpoint":{"transactionId":")" + txid +
        R"(","index":0},"utxoEntry":{"amount":1000,"scriptPublicKey":"000120ac"}}]})");

    ASSERT_TRUE(utxos.has_value()) << utxos.error().message;
    ASSERT_EQ(utxos->size(), 1u);
    EXPECT_EQ((*utxos)[0].script_public_key.version, 1);
    EXPECT_EQ((*utxos)[0].script_public_key.script, (Bytes{0x20, 0xac}));
    EXPECT_EQ((*utxos)[0].block_daa_score, 0u);
    EXPECT_FALSE((*utxos)[0].is_coinbase);
}

/**
 * @brief Тест: нода опускает пустой массив entries
 */
TEST(UtxoParseTest, MissingEntriesMeansEmpty) {
    auto utxos = rpc::parse_utxo_entries(R"({})");

    ASSERT_TRUE(utxos.has_value());
    EXPECT_TRUE(utxos->empty());
}

TEST(UtxoParseTest, RejectsMalformedEntries) {
    EXPECT_FALSE(rpc::parse_utxo_entries(R"({"entries":{}})").has_value());
    EXPECT_FALSE(rpc::parse_utxo_entries(R"({"entries":[{"outpoint":{}}]})").has_value());

    auto short_txid = rpc::parse_utxo_entries(
        R"({"entries":[{"outpoint":{"transactionId":"abcd","index":0},)"
        R"("utxoEntry":{"amount":1,"scriptPublicKey":"000020"}}]})");
    ASSERT_FALSE(short_txid.has_value());
    EXPECT_EQ(short_txid.error().code, ErrorCode::RpcParseError);

    auto txid = std::string(64, '2');
    auto no_amount = rpc::parse_utxo_entries(
        R"({"entries":[{"outpoint":{"transactionId":")" + txid +
        R"(","index":0},"utxoEntry":{"scriptPublicKey":"000020"}}]})");
    EXPECT_FALSE(no_amount.has_value());
}

// =============================================================================
// Сериализация транзакции
// =============================================================================

TEST(TransactionJsonTest, RpcShape) {
    kaspa::Transaction tx;
    kaspa::TransactionInput input;
    input.previous_outpoint = make_utxo(0xab, 5, 1).outpoint;
    input.signature_script = {0x41, 0x01};
    input.sequence = 3;
    tx.inputs.push_back(input);
    tx.outputs.push_back({1000, kaspa::ScriptPublicKey{0, {0x20, 0xac}}});

    auto json = kaspa::to_rpc_json(tx);

    EXPECT_EQ(core::json::get_u64(json, "version"), 0u);
    EXPECT_EQ(core::json::get_u64(json, "lockTime"), 0u);
    EXPECT_EQ(core::json::get_string(json, "subnetworkId"), std::string(40, '0'));
    EXPECT_EQ(core::json::get_string(json, "payload"), "");

    auto inputs = core::json::split_array(*core::json::find_member(json, "inputs"));
    ASSERT_TRUE(inputs.has_value());
    ASSERT_EQ(inputs->size(), 1u);
    auto outpoint = core::json::find_member((*inputs)[0], "previousOutpoint");
    ASSERT_TRUE(outpoint.has_value());
    std::string txid_hex;
    for (int i = 0; i < 32; ++i) {
        txid_hex += "ab";
    }
    EXPECT_EQ(core::json::get_string(*outpoint, "transactionId"), txid_hex);
    EXPECT_EQ(core::json::get_u64(*outpoint, "index"), 5u);
    EXPECT_EQ(core::json::get_string((*inputs)[0], "signatureScript"), "4101");
    EXPECT_EQ(core::json::get_u64((*inputs)[0], "sequence"), 3u);
    EXPECT_EQ(core::json::get_u64((*inputs)[0], "sigOpCount"), 1u);

    auto outputs = core::json::split_array(*core::json::find_member(json, "outputs"));
    ASSERT_TRUE(outputs.has_value());
    ASSERT_EQ(outputs->size(), 1u);
    EXPECT_EQ(core::json::get_u64((*outputs)[0], "value"), 1000u);
    EXPECT_EQ(core::json::get_string((*outputs)[0], "scriptPublicKey"), "000020ac");
    EXPECT_EQ(core::json::get_u64(json, "mass"), 0u);
}

// =============================================================================
// WebSocket транспорт
// =============================================================================

namespace {

/// @brief Слушающий сокет на 127.0.0.1 с портом от ядра
int listen_loopback(uint16_t& port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (fd < 0 ||
        ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd, 16) != 0) {
        return -1;
    }
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    port = ntohs(addr.sin_port);
    return fd;
}

/**
 * @brief kaspad в миниатюре: WebSocket рукопожатие и один запрос
 *        на соединение
 */
class FakeWrpcNode {
public:
    enum class Mode { Reply, Silent, Close };

    using Responder = std::function<std::string(const std::string& request)>;

    explicit FakeWrpcNode(Mode mode, Responder responder = {})
        : mode_(mode), responder_(std::move(responder)) {
        listen_fd_ = listen_loopback(port_);
        thread_ = std::thread([this] { serve(); });
    }

    ~FakeWrpcNode() {
        stop_ = true;
        thread_.join();
        ::close(listen_fd_);
    }

    kaspa::RpcConfig config(uint32_t timeout = 5) const {
        kaspa::RpcConfig cfg;
        cfg.url = std::format("ws://127.0.0.1:{}", port_);
        cfg.timeout = timeout;
        cfg.connect_timeout = 1;
        return cfg;
    }

    std::vector<std::string> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

private:
    void serve() {
        while (!stop_) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) {
                continue;
            }
            int client = ::accept(listen_fd_, nullptr, nullptr);
            if (client < 0) {
                continue;
            }
            timeval tv{3, 0};
            ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            handle(client);
            ::close(client);
        }
    }

    void handle(int client) {
        std::string buffer;
        if (!read_until(client, buffer, "\r\n\r\n")) {
            return;
        }
        auto head_end = buffer.find("\r\n\r\n") + 4;
        std::string head = buffer.substr(0, head_end);
        buffer.erase(0, head_end);

        std::string lower = head;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto key_pos = lower.find("sec-websocket-key:");
        if (key_pos == std::string::npos) {
            return;
        }
        key_pos += 18;
        auto key_end = head.find("\r\n", key_pos);
        std::string key = head.substr(key_pos, key_end - key_pos);
        key.erase(0, key.find_first_not_of(' '));
        key.erase(key.find_last_not_of(' ') + 1);

        send_all(client, std::format(
            "HTTP/1.1 101 Switching Protocols\r\n"
            "Upgrade: websocket\r\n"
            "Connection: Upgrade\r\n"
            "Sec-WebSocket-Accept: {}\r\n\r\n",
            accept_key(key)
        ));

        auto request = read_frame(client, buffer);
        if (!request) {
            return;
        }
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(*request);
        }

        if (mode_ == Mode::Close) {
            return;
        }
        if (mode_ == Mode::Reply) {
            // Уведомление без id клиент должен пропустить
            send_all(client, frame(R"({"method":"blockAddedNotification","params":{}})"));
            send_all(client, frame(responder_(*request)));
        }

        // Ждём, пока клиент сам закроет соединение
        char sink[256];
        while (::recv(client, sink, sizeof(sink), 0) > 0) {}
    }

    static std::string accept_key(const std::string& key) {
        std::string source = key + "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digest_len = 0;
        EVP_Digest(source.data(), source.size(), digest, &digest_len, EVP_sha1(), nullptr);
        unsigned char encoded[64] = {};
        int n = EVP_EncodeBlock(encoded, digest, static_cast<int>(digest_len));
        return std::string(reinterpret_cast<char*>(encoded), static_cast<std::size_t>(n));
    }

    static std::string frame(const std::string& payload) {
        std::string out;
        out += static_cast<char>(0x81);
        if (payload.size() < 126) {
            out += static_cast<char>(payload.size());
        } else {
            out += static_cast<char>(126);
            out += static_cast<char>((payload.size() >> 8) & 0xff);
            out += static_cast<char>(payload.size() & 0xff);
        }
        return out + payload;
    }

    static bool read_until(int fd, std::string& buffer, std::string_view marker) {
        char chunk[1024];
        while (buffer.find(marker) == std::string::npos) {
            auto n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                return false;
            }
            buffer.append(chunk, static_cast<std::size_t>(n));
        }
        return true;
    }

    static bool read_exact(int fd, std::string& buffer, std::size_t count, std::string& out) {
        char chunk[1024];
        while (buffer.size() < count) {
            auto n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                return false;
            }
            buffer.append(chunk, static_cast<std::size_t>(n));
        }
        out = buffer.substr(0, count);
        buffer.erase(0, count);
        return true;
    }

    /// @brief Прочитать один текстовый кадр клиента (с маской)
    static std::optional<std::string> read_frame(int fd, std::string& buffer) {
        std::string header;
        if (!read_exact(fd, buffer, 2, header)) {
            return std::nullopt;
        }
        auto b1 = static_cast<unsigned char>(header[1]);
        uint64_t len = b1 & 0x7f;
        std::string ext;
        if (len == 126) {
            if (!read_exact(fd, buffer, 2, ext)) return std::nullopt;
            len = (static_cast<unsigned char>(ext[0]) << 8) | static_cast<unsigned char>(ext[1]);
        } else if (len == 127) {
            if (!read_exact(fd, buffer, 8, ext)) return std::nullopt;
            len = 0;
            for (char c : ext) {
                len = (len << 8) | static_cast<unsigned char>(c);
            }
        }
        std::string mask;
        if ((b1 & 0x80) && !read_exact(fd, buffer, 4, mask)) {
            return std::nullopt;
        }
        std::string payload;
        if (!read_exact(fd, buffer, static_cast<std::size_t>(len), payload)) {
            return std::nullopt;
        }
        if (!mask.empty()) {
            for (std::size_t i = 0; i < payload.size(); ++i) {
                payload[i] = static_cast<char>(payload[i] ^ mask[i % 4]);
            }
        }
        return payload;
    }

    static void send_all(int fd, const std::string& data) {
        std::size_t offset = 0;
        while (offset < data.size()) {
            auto n = ::send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
            if (n <= 0) {
                return;
            }
            offset += static_cast<std::size_t>(n);
        }
    }

    Mode mode_;
    Responder responder_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<std::string> requests_;
};

/// @brief Ответ wRPC с тем же id, что у запроса
std::string reply_with(const std::string& request, std::string_view payload) {
    auto id = core::json::get_u64(request, "id").value_or(0);
    return std::format(R"({{"id":{},"params":{}}})", id, payload);
}

} // anonymous namespace

/**
 * @brief Тест: запрос уходит текстовым кадром, ответ сопоставляется по id
 */
TEST(RpcTransportTest, GetCurrentNetworkOverWebSocket) {
    FakeWrpcNode node(FakeWrpcNode::Mode::Reply, [](const std::string& request) {
        return reply_with(request, R"({"network":"testnet"})");
    });
    kaspa::RpcClient client(node.config());

    auto network = client.get_current_network();

    ASSERT_TRUE(network.has_value()) << network.error().message;
    EXPECT_EQ(*network, "testnet");

    auto requests = node.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(core::json::get_string(requests[0], "method"), "getCurrentNetwork");
}

TEST(RpcTransportTest, BalanceByAddress) {
    FakeWrpcNode node(FakeWrpcNode::Mode::Reply, [](const std::string& request) {
        return reply_with(request, R"({"balance":"250000000"})");
    });
    kaspa::RpcClient client(node.config());
    auto address = kaspa::parse_address(TESTNET_ADDRESS);
    ASSERT_TRUE(address.has_value());

    auto balance = client.get_balance(*address);

    ASSERT_TRUE(balance.has_value()) << balance.error().message;
    EXPECT_EQ(*balance, 250'000'000u);

    auto requests = node.requests();
    ASSERT_EQ(requests.size(), 1u);
    auto params = core::json::find_member(requests[0], "params");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(core::json::get_string(*params, "address"), TESTNET_ADDRESS);
}

TEST(RpcTransportTest, NodeErrorIsRejection) {
    FakeWrpcNode node(FakeWrpcNode::Mode::Reply, [](const std::string& request) {
        auto id = core::json::get_u64(request, "id").value_or(0);
        return std::format(R"({{"id":{},"error":{{"message":"not synced"}}}})", id);
    });
    kaspa::RpcClient client(node.config());

    auto pong = client.ping();

    ASSERT_FALSE(pong.has_value());
    EXPECT_EQ(pong.error().code, ErrorCode::RpcRejected);
    EXPECT_EQ(pong.error().message, "not synced");
}

/**
 * @brief Тест: запрос отправлен, нода молчит: RpcTimeout, а не
 *        RpcConnectionFailed
 */
TEST(RpcTransportTest, SilentNodeTimesOutAfterSending) {
    FakeWrpcNode node(FakeWrpcNode::Mode::Silent);
    kaspa::RpcClient client(node.config(1));

    auto start = std::chrono::steady_clock::now();
    auto pong = client.ping();
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(pong.has_value());
    EXPECT_EQ(pong.error().code, ErrorCode::RpcTimeout);
    EXPECT_EQ(node.requests().size(), 1u);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(RpcTransportTest, NodeDropsConnectionAfterRequest) {
    FakeWrpcNode node(FakeWrpcNode::Mode::Close);
    kaspa::RpcClient client(node.config());

    auto pong = client.ping();

    ASSERT_FALSE(pong.has_value());
    EXPECT_EQ(pong.error().code, ErrorCode::RpcNoResponse);
}

/**
 * @brief Тест: порт закрыт, запрос точно не отправлен
 */
TEST(RpcTransportTest, RefusedConnectionNeverSends) {
    uint16_t port = 0;
    int fd = listen_loopback(port);
    ASSERT_GE(fd, 0);
    ::close(fd);

    kaspa::RpcConfig cfg;
    cfg.url = std::format("ws://127.0.0.1:{}", port);
    cfg.timeout = 2;
    cfg.connect_timeout = 1;
    kaspa::RpcClient client(cfg);

    auto pong = client.ping();

    ASSERT_FALSE(pong.has_value());
    EXPECT_EQ(pong.error().code, ErrorCode::RpcConnectionFailed);
}

/**
 * @brief Тест: медленные вызовы из разных потоков идут параллельно,
 *        а не друг за другом
 */
TEST(RpcTransportTest, ConcurrentCallsDoNotQueue) {
    uint16_t port = 0;
    int fd = listen_loopback(port);   // принимает TCP, но не отвечает
    ASSERT_GE(fd, 0);

    kaspa::RpcConfig cfg;
    cfg.url = std::format("ws://127.0.0.1:{}", port);
    cfg.timeout = 1;
    cfg.connect_timeout = 1;
    kaspa::RpcClient client(cfg);

    constexpr int CALLS = 4;
    std::atomic<int> failed{0};
    std::vector<std::thread> threads;

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < CALLS; ++i) {
        threads.emplace_back([&] {
            if (!client.ping()) {
                failed++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    ::close(fd);

    EXPECT_EQ(failed.load(), CALLS);
    EXPECT_LT(elapsed, std::chrono::milliseconds(CALLS * 1000 - 500));
}

} // namespace kasfaucet::tests
