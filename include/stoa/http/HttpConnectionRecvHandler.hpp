#pragma once

#include "stoa/util/ProvidedBufferToken.hpp"
#include <memory>

namespace stoa {

class HttpServer;

// Routes a connection's multishot recv results to its HttpServer
struct HttpConnectionRecvHandler {
    HttpServer* server;
    int fd;

    void onDataToken(std::shared_ptr<ProvidedBufferToken> token);
    void onError(int error);
};

} // namespace stoa
