#ifndef GHCLIENT_CLIENT_INTERFACE_HPP
#define GHCLIENT_CLIENT_INTERFACE_HPP

#include "../model/model.hpp"

namespace ghclient::client {
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        IHttpClient& operator=(IHttpClient&&) = delete;

        virtual model::Response send(model::Request req) = 0;
    };

    // One stage of a Pipeline. `next` is the remainder of the stack below this stage.
    class IMiddleware {
       public:
        IMiddleware() = default;
        virtual ~IMiddleware() = default;
        IMiddleware(const IMiddleware&) = delete;
        IMiddleware& operator=(const IMiddleware&) = delete;
        IMiddleware(IMiddleware&&) = delete;
        IMiddleware& operator=(IMiddleware&&) = delete;

        virtual model::Response handle(model::Request req, IHttpClient& next) = 0;
    };
}  // namespace ghclient::client

#endif
