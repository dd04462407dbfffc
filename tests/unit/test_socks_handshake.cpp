#include <utility>
#include <boost/asio.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include "../../src/binary/reader.hpp"
#include "../../src/binary/writer.hpp"
#include "../../src/network/proxy/socks_handshake.hpp"

using Trawl::Network::Proxy::SocksHandshake;
namespace net = boost::asio;
using tcp     = net::ip::tcp;

namespace {

struct ProxySide {
    std::vector<uint8_t> greeting;
    std::string          username;
    std::string          password;
    std::string          host;
    uint16_t             port = 0;
};

// A SOCKS5 proxy that answers one handshake with `method` and `reply` codes.
net::awaitable<void> socks5_proxy(tcp::acceptor& acceptor, ProxySide& seen, uint8_t method, uint8_t reply) {
    auto socket = co_await acceptor.async_accept(net::use_awaitable);

    seen.greeting.resize(3);
    co_await net::async_read(socket, net::buffer(seen.greeting), net::use_awaitable);
    std::vector<uint8_t> choice = {0x05, method};
    co_await net::async_write(socket, net::buffer(choice), net::use_awaitable);
    if (method == 0xFF)
        co_return;

    if (method == 0x02) {
        uint8_t head[2];
        co_await net::async_read(socket, net::buffer(head), net::use_awaitable);
        seen.username.resize(head[1]);
        co_await net::async_read(socket, net::buffer(seen.username), net::use_awaitable);
        uint8_t plen;
        co_await net::async_read(socket, net::buffer(&plen, 1), net::use_awaitable);
        seen.password.resize(plen);
        co_await net::async_read(socket, net::buffer(seen.password), net::use_awaitable);
        std::vector<uint8_t> ok = {0x01, 0x00};
        co_await net::async_write(socket, net::buffer(ok), net::use_awaitable);
    }

    std::vector<uint8_t> head(5);
    co_await net::async_read(socket, net::buffer(head), net::use_awaitable);
    std::vector<uint8_t> rest(head[4] + 2);
    co_await net::async_read(socket, net::buffer(rest), net::use_awaitable);
    Trawl::Binary::Reader reader(rest);
    auto                  host = reader.read_bytes(head[4]);
    seen.host.assign(host.begin(), host.end());
    seen.port = reader.read_uint16_be();

    std::vector<uint8_t> answer = {0x05, reply, 0x00, 0x01, 127, 0, 0, 1, 0x1F, 0x90};
    co_await net::async_write(socket, net::buffer(answer), net::use_awaitable);
}

class SocksHandshakeTest : public ::testing::Test {
protected:
    SocksHandshakeTest() : acceptor_(ioc_, {net::ip::make_address("127.0.0.1"), 0}) {
    }

    // Runs the proxy and the client side together; returns the client's failure message.
    std::string handshake(uint8_t method, uint8_t reply, const std::string& username, const std::string& password) {
        std::string failure;
        tcp::socket client(ioc_);

        net::co_spawn(ioc_, socks5_proxy(acceptor_, seen_, method, reply), net::detached);
        net::co_spawn(
            ioc_,
            [&]() -> net::awaitable<void> {
                co_await client.async_connect(acceptor_.local_endpoint(), net::use_awaitable);
                co_await SocksHandshake::perform_socks5(client, "public.api.test", "443", username, password);
            },
            [&](std::exception_ptr e) {
                if (!e)
                    return;
                try {
                    std::rethrow_exception(e);
                } catch (const std::exception& ex) {
                    failure = ex.what();
                }
            });
        ioc_.run();
        return failure;
    }

    net::io_context ioc_;
    tcp::acceptor   acceptor_;
    ProxySide       seen_;
};

}  // namespace

TEST_F(SocksHandshakeTest, NoAuthConnect) {
    EXPECT_EQ(handshake(0x00, 0x00, "", ""), "");
    EXPECT_EQ(seen_.greeting, (std::vector<uint8_t>{0x05, 0x01, 0x00}));
    EXPECT_EQ(seen_.host, "public.api.test");
    EXPECT_EQ(seen_.port, 443);
}

TEST_F(SocksHandshakeTest, UsernamePasswordAuth) {
    EXPECT_EQ(handshake(0x02, 0x00, "crawler", "s3cret"), "");
    EXPECT_EQ(seen_.greeting, (std::vector<uint8_t>{0x05, 0x01, 0x02}));
    EXPECT_EQ(seen_.username, "crawler");
    EXPECT_EQ(seen_.password, "s3cret");
    EXPECT_EQ(seen_.host, "public.api.test");
}

TEST_F(SocksHandshakeTest, NoAcceptableMethodFails) {
    EXPECT_EQ(handshake(0xFF, 0x00, "", ""), "SOCKS5 handshake failed (auth choice)");
}

TEST_F(SocksHandshakeTest, ConnectRefusedFails) {
    EXPECT_EQ(handshake(0x00, 0x05, "", ""), "SOCKS5 connect failed");
}

TEST(BinaryTest, BigEndianLayout) {
    std::vector<uint8_t>  data;
    Trawl::Binary::Writer writer(data);
    writer.write_uint16_be(0x1F90);
    writer.write_uint32_be(3);
    writer.write_raw("did");
    EXPECT_EQ(data, (std::vector<uint8_t>{0x1F, 0x90, 0, 0, 0, 3, 'd', 'i', 'd'}));

    Trawl::Binary::Reader reader(data);
    EXPECT_EQ(reader.read_uint16_be(), 0x1F90);
    EXPECT_EQ(reader.read_uint32_be(), 3u);
    EXPECT_EQ(reader.read_bytes(3), (std::vector<uint8_t>{'d', 'i', 'd'}));
    EXPECT_TRUE(reader.eof());
    EXPECT_THROW(reader.read_uint8(), std::out_of_range);
}
