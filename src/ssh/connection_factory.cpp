#include "connection_factory.hpp"
#include "session.hpp"
#include <memory>

ConnectResult ConnectionFactory::connect(const ConnectionParameters& params,
                                         StatusCallback callback) {
    auto session = std::make_unique<SessionManager>(params);
    auto result = session->establish(callback);
    if (!result.is_ok()) {
        return result;
    }
    return ConnectResult::Ok(std::move(session));
}
