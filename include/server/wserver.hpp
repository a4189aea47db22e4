#pragma once
#include <boost/asio.hpp>
#include <map>
#include <string>
#include <unordered_map>
#include "const/rest_enums.hpp"
#include "http/Request.hpp"
#include "server/endpoint.hpp"

namespace later {

class wServer
{
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::map<std::string, std::map<HttpRequest, endpoint>> handlers_;
  size_t max_body_bytes_ = 1024 * 1024;

public:
    wServer();
    void add_endpoint(const endpoint& ep);

    // Blocking accept loop, one request per connection.
    void run(uint16_t port);

    // Routes a parsed request and turns exceptions into error responses.
    http::Response handle(const http::Request& request) const;

    void set_max_body_bytes(size_t bytes) { max_body_bytes_ = bytes; }

    // "a=1&b=x%20y" -> {a: 1, b: "x y"}
    static std::unordered_map<std::string, std::string> parse_query(const std::string& query);
    static std::string url_decode(const std::string& value);
};

} // namespace later
