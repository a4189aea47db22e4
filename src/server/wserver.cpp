#include "server/wserver.hpp"
#include "core/Errors.hpp"
#include <cctype>
#include <iostream>
#include <sstream>

namespace later {

namespace asio = boost::asio;
using boost::asio::ip::tcp;

namespace {
    const char* status_text(int s) {
        switch (s) {
            case 200: return "OK";
            case 201: return "Created";
            case 204: return "No Content";
            case 400: return "Bad Request";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 409: return "Conflict";
            case 411: return "Length Required";
            case 413: return "Payload Too Large";
            case 422: return "Unprocessable Entity";
            case 500: return "Internal Server Error";
            case 502: return "Bad Gateway";
            case 504: return "Gateway Timeout";
            default:  return "OK";
        }
    }

    void trim(std::string& s) {
        size_t a = 0, b = s.size();
        while (a < b && (s[a] == ' ' || s[a] == '\t')) ++a;
        while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r' || s[b - 1] == '\n')) --b;
        s = s.substr(a, b - a);
    }

    void tolower_inplace(std::string& s) {
        for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    void write_response(tcp::socket& socket, const http::Response& res) {
        std::ostringstream response;
        response << "HTTP/1.1 " << res.status << " " << status_text(res.status) << "\r\n";
        response << "Content-Length: " << res.body.size() << "\r\n";
        response << "Content-Type: " << res.contentType << "\r\n";
        response << "Connection: close\r\n\r\n";
        response << res.body;
        asio::write(socket, asio::buffer(response.str()));
    }
}

wServer::wServer(): acceptor_(io_context_){}

void wServer::add_endpoint(const endpoint& ep)
{
    handlers_[ep.get_path()].insert_or_assign(ep.get_rest_type(), ep);
}

std::string wServer::url_decode(const std::string& value)
{
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < value.size() &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            out += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::unordered_map<std::string, std::string> wServer::parse_query(const std::string& query)
{
    std::unordered_map<std::string, std::string> params;
    size_t start = 0;
    while (start <= query.size()) {
        size_t amp = query.find('&', start);
        std::string pair = query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
            if (!key.empty()) params.insert_or_assign(key, value);
        }
        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return params;
}

http::Response wServer::handle(const http::Request& request) const
{
    auto it = handlers_.find(request.path);
    if (it == handlers_.end()) {
        return http::Response::notFound("No route for " + request.path);
    }
    auto handler = it->second.find(request.method);
    if (handler == it->second.end()) {
        return http::Response::methodNotAllowed();
    }

    try {
        return handler->second.get_handler()(request);
    }
    catch (const ValidationError& e) {
        return http::Response::error(400, e.what());
    }
    catch (const NotFoundError& e) {
        return http::Response::error(404, e.what());
    }
    catch (const ConflictError& e) {
        return http::Response::error(409, e.what());
    }
    catch (const InsufficientDataError& e) {
        return http::Response::error(422, e.what());
    }
    catch (const ProviderTimeoutError& e) {
        return http::Response::error(504, e.what());
    }
    catch (const ProviderError& e) {
        return http::Response::error(502, e.what());
    }
    catch (const ExtractionError& e) {
        return http::Response::error(502, e.what());
    }
    catch (const nlohmann::json::exception& e) {
        return http::Response::error(400, std::string("Invalid JSON: ") + e.what());
    }
    catch (const std::exception& e) {
        std::cerr << "[server] " << to_string(request.method) << " " << request.path
                  << " failed: " << e.what() << std::endl;
        return http::Response::error(500, e.what());
    }
}

void wServer::run(uint16_t port)
{
    tcp::endpoint endpoint(tcp::v4(), port);
    acceptor_ = tcp::acceptor(io_context_, endpoint);
    std::cout << "[server] listening on port " << port << std::endl;

    while (true)
    {
        tcp::socket socket(io_context_);
        acceptor_.accept(socket);

        try {
            asio::streambuf buf;
            asio::read_until(socket, buf, "\r\n\r\n");
            std::istream request_stream(&buf);

            std::string method, path, version;
            request_stream >> method >> path >> version;

            std::string dummy;
            std::getline(request_stream, dummy);

            http::Request request;
            auto qm = path.find('?');
            request.path = qm == std::string::npos ? path : path.substr(0, qm);
            if (qm != std::string::npos) {
                request.query = parse_query(path.substr(qm + 1));
            }

            try {
                request.method = from_string(method);
            } catch (const std::invalid_argument&) {
                write_response(socket, http::Response::methodNotAllowed());
                socket.close();
                continue;
            }

            std::string header_line;
            size_t content_length = 0;
            bool has_content_length = false;
            bool bad_length = false;

            while (std::getline(request_stream, header_line) && header_line != "\r")
            {
                if (!header_line.empty() && header_line.back() == '\r') header_line.pop_back();
                if (header_line.empty()) break;

                auto colon = header_line.find(':');
                if (colon == std::string::npos) continue;

                std::string name = header_line.substr(0, colon);
                std::string value = header_line.substr(colon + 1);
                trim(name); trim(value);
                tolower_inplace(name);

                if (name == "content-length") {
                    try {
                        content_length = static_cast<size_t>(std::stoull(value));
                        has_content_length = true;
                    } catch (const std::exception&) {
                        bad_length = true;
                    }
                }
                request.headers.insert_or_assign(name, value);
            }

            if (bad_length) {
                write_response(socket, http::Response::badRequest("Invalid Content-Length"));
                socket.close();
                continue;
            }
            if (has_content_length && content_length > max_body_bytes_) {
                write_response(socket, http::Response::error(413, "Request body too large"));
                socket.close();
                continue;
            }

            std::string body(std::istreambuf_iterator<char>(request_stream), {});
            if (has_content_length) {
                if (body.size() < content_length) {
                    std::string rest;
                    rest.resize(content_length - body.size());
                    asio::read(socket, asio::buffer(&rest[0], rest.size()));
                    body += rest;
                } else if (body.size() > content_length) {
                    body.resize(content_length);
                }
            }
            request.body = std::move(body);

            http::Response response = handle(request);
            std::cout << "[server] " << method << " " << request.path << " -> " << response.status << std::endl;
            write_response(socket, response);
            socket.close();
        }
        catch (const boost::system::system_error& e) {
            std::cerr << "[server] connection error: " << e.what() << std::endl;
        }
    }
}

} // namespace later
