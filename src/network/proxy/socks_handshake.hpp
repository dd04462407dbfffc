#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <string>

namespace Trawl::Network::Proxy {

/**
 * @brief SOCKS4 and SOCKS5 client handshakes over an already connected socket.
 *
 * Both throw std::runtime_error when the proxy refuses the request.
 */
class SocksHandshake {
public:
    /**
     * @brief Performs a SOCKS4 CONNECT.
     * @param host Target host (must be an IPv4 address).
     * @param port Target port.
     * @param user_id Optional SOCKS4 user id.
     */
    static boost::asio::awaitable<void> perform_socks4(boost::asio::ip::tcp::socket& socket,
                                                       const std::string&            host,
                                                       const std::string&            port,
                                                       const std::string&            user_id = "");

    /**
     * @brief Performs a SOCKS5 CONNECT.
     *
     * Offers username/password authentication (RFC 1929) when a username is given,
     * otherwise no authentication.
     */
    static boost::asio::awaitable<void> perform_socks5(boost::asio::ip::tcp::socket& socket,
                                                       const std::string&            host,
                                                       const std::string&            port,
                                                       const std::string&            username = "",
                                                       const std::string&            password = "");
};

}  // namespace Trawl::Network::Proxy
