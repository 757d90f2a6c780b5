#include "stoa/http/HttpConnectionRecvHandler.hpp"
#include "stoa/http/HttpServer.hpp"

namespace stoa {

void HttpConnectionRecvHandler::onDataToken(std::shared_ptr<ProvidedBufferToken> token) {
    // The connection copies what it keeps; the buffer goes back with the token
    server->onData(fd, std::string_view(token->data(), token->size()));
}

void HttpConnectionRecvHandler::onError(int error) {
    server->onDisconnect(fd, error);
}

} // namespace stoa
