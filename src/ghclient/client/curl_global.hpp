#ifndef GHCLIENT_CURL_GLOBAL_HPP
#define GHCLIENT_CURL_GLOBAL_HPP

namespace ghclient::client {

    // Scoped curl_global_init / curl_global_cleanup. Create one in main()
    // before any transport or Url is constructed.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };

}  // namespace ghclient::client

#endif
