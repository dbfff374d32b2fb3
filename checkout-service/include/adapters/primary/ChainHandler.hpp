#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/JsonViews.hpp"
#include <iostream>
#include <memory>
#include <vector>

namespace checkout::adapters::primary {

/**
 * @brief Цепочка middleware + handler
 *
 * Звенья выполняются по очереди, пока статус ответа равен 0.
 */
class ChainHandler : public IHttpHandler {
public:
    template <typename... Handlers>
    explicit ChainHandler(Handlers&&... handlers) {
        (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
    }

    void handle(IRequest& req, IResponse& res) override {
        for (auto& h : handlers_) {
            h->handle(req, res);
            if (res.getStatus() != 0)
                return;
        }

        std::cerr << "[ChainHandler] Error: chain finished, but httpStatus is zero." << std::endl;
        sendError(res, 500, "Internal server error");
    }

private:
    std::vector<std::shared_ptr<IHttpHandler>> handlers_;
};

} // namespace checkout::adapters::primary
