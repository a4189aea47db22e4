#pragma once

#include <string>
#include <functional>
#include "const/rest_enums.hpp"
#include "http/Request.hpp"

namespace later {

class endpoint
{
public:
    using Handler = std::function<http::Response(const http::Request&)>;

private:
    Handler handler;
    HttpRequest rest_type;
    std::string path;

public:
    endpoint(Handler handler,
             HttpRequest rest_type,
             const std::string& path)
        : handler(std::move(handler)), rest_type(rest_type), path(path) {}

    std::string get_path() const { return path; }
    const Handler& get_handler() const { return handler; }
    HttpRequest get_rest_type() const { return rest_type; }
};

} // namespace later
