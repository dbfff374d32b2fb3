#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/CacheSettings.hpp"
#include "settings/CheckoutSettings.hpp"
#include "settings/NowPaymentsSettings.hpp"

// Ports
#include "ports/input/ICatalogService.hpp"
#include "ports/input/IChatSessionService.hpp"
#include "ports/input/ICheckoutService.hpp"
#include "ports/input/IReservationService.hpp"
#include "ports/input/ISettlementReconciler.hpp"
#include "ports/output/IBuyerRepository.hpp"
#include "ports/output/ICatalogRepository.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IDiscountCodeRepository.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IIdempotencyRepository.hpp"
#include "ports/output/IInventoryRepository.hpp"
#include "ports/output/INotificationOutbox.hpp"
#include "ports/output/IPaymentProcessor.hpp"
#include "ports/output/IPendingSettlementRepository.hpp"
#include "ports/output/IPurchaseRepository.hpp"
#include "ports/output/IResellerDiscountRepository.hpp"

// Application
#include "application/BasketExpirySweeper.hpp"
#include "application/CatalogService.hpp"
#include "application/ChatSessionService.hpp"
#include "application/CheckoutService.hpp"
#include "application/NotificationOutbox.hpp"
#include "application/PaymentIntentBroker.hpp"
#include "application/PurchaseFinalizer.hpp"
#include "application/ReservationService.hpp"
#include "application/SessionRegistry.hpp"
#include "application/SettlementReconciler.hpp"

// Secondary Adapters
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/cache/CachedCatalogRepository.hpp"
#include "adapters/secondary/events/RabbitMQAdapter.hpp"
#include "adapters/secondary/payment/CachedPaymentProcessor.hpp"
#include "adapters/secondary/payment/NowPaymentsGateway.hpp"
#include "adapters/secondary/persistence/PostgresSchema.hpp"
#include "adapters/secondary/persistence/PostgresCatalogRepository.hpp"
#include "adapters/secondary/persistence/PostgresDiscountRepository.hpp"
#include "adapters/secondary/persistence/PostgresIdempotencyRepository.hpp"
#include "adapters/secondary/persistence/PostgresInventoryRepository.hpp"
#include "adapters/secondary/persistence/PostgresPurchaseRepository.hpp"
#include "adapters/secondary/persistence/PostgresSettlementRepository.hpp"

// Primary Adapters
#include "adapters/primary/BasketHandler.hpp"
#include "adapters/primary/BuyerIdExtractorMiddleware.hpp"
#include "adapters/primary/CatalogHandler.hpp"
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/ChatHandler.hpp"
#include "adapters/primary/CheckoutHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/IdempotentHandler.hpp"
#include "adapters/primary/IpnSignatureVerifier.hpp"
#include "adapters/primary/PaymentWebhookHandler.hpp"
#include "adapters/primary/PurchaseHistoryHandler.hpp"
#include "adapters/primary/TopUpHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace checkout
{

    /**
     * @brief Checkout Service Application
     *
     * HTTP: корзина, оформление, пополнение баланса, чат-сессия, webhook процессора
     * Публикует: buyer.notification, operator.alert (в checkout.events)
     * Фон: BasketExpirySweeper, NotificationOutbox
     */
    class CheckoutApp : public BoostBeastApplication
    {
    public:
        CheckoutApp() { std::cout << "[CheckoutApp] Initializing..." << std::endl; }

        ~CheckoutApp() override
        {
            if (sweeper_) sweeper_->stop();
            if (outbox_) outbox_->stop();
            std::cout << "[CheckoutApp] Shutting down..." << std::endl;
        }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[CheckoutApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[CheckoutApp] Configuring DI..." << std::endl;

            // Шаг 1: RabbitMQAdapter создаётся отдельно и биндится экземпляром
            auto rabbitInjector = di::make_injector(
                di::bind<settings::RabbitMQSettings>().in(di::singleton));
            auto rabbitMQAdapter = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQAdapter>>();

            // Шаг 2: основной injector
            auto injector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<settings::CacheSettings>().in(di::singleton),
                di::bind<settings::ICheckoutSettings>().to<settings::CheckoutSettings>().in(di::singleton),
                di::bind<settings::INowPaymentsSettings>().to<settings::NowPaymentsSettings>().in(di::singleton),

                di::bind<ports::output::IClock>().to<adapters::secondary::SystemClock>().in(di::singleton),

                // PostgreSQL
                di::bind<adapters::secondary::PostgresSchema>().in(di::singleton),
                di::bind<ports::output::IInventoryRepository>()
                    .to<adapters::secondary::PostgresInventoryRepository>().in(di::singleton),
                di::bind<ports::output::IPurchaseRepository>()
                    .to<adapters::secondary::PostgresPurchaseRepository>().in(di::singleton),
                di::bind<ports::output::IPendingSettlementRepository, ports::output::IBuyerRepository>()
                    .to<adapters::secondary::PostgresSettlementRepository>().in(di::singleton),
                di::bind<ports::output::IDiscountCodeRepository, ports::output::IResellerDiscountRepository>()
                    .to<adapters::secondary::PostgresDiscountRepository>().in(di::singleton),
                di::bind<ports::output::IIdempotencyRepository>()
                    .to<adapters::secondary::PostgresIdempotencyRepository>().in(di::singleton),

                // Справочник через read-through кэш
                di::bind<adapters::secondary::PostgresCatalogRepository>().in(di::singleton),
                di::bind<ports::output::ICatalogRepository, ports::output::ICatalogCache>()
                    .to<adapters::secondary::CachedCatalogRepository>().in(di::singleton),

                // Платёжный процессор: HTTP клиент + кэш минимальных сумм
                di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
                di::bind<adapters::secondary::NowPaymentsGateway>().in(di::singleton),
                di::bind<ports::output::IPaymentProcessor>()
                    .to<adapters::secondary::CachedPaymentProcessor>().in(di::singleton),

                di::bind<ports::output::IEventPublisher>().to(rabbitMQAdapter),
                di::bind<ports::output::INotificationOutbox>()
                    .to<application::NotificationOutbox>().in(di::singleton),

                di::bind<application::SessionRegistry>().in(di::singleton),
                di::bind<application::PurchaseFinalizer>().in(di::singleton),
                di::bind<application::PaymentIntentBroker>().in(di::singleton),
                di::bind<application::BasketExpirySweeper>().in(di::singleton),
                di::bind<adapters::primary::IpnSignatureVerifier>().in(di::singleton),

                di::bind<ports::input::IReservationService>().to<application::ReservationService>().in(di::singleton),
                di::bind<ports::input::ICheckoutService>().to<application::CheckoutService>().in(di::singleton),
                di::bind<ports::input::IChatSessionService>().to<application::ChatSessionService>().in(di::singleton),
                di::bind<ports::input::ICatalogService>().to<application::CatalogService>().in(di::singleton),
                di::bind<ports::input::ISettlementReconciler>().to<application::SettlementReconciler>().in(di::singleton));

            // Шаг 3: HTTP Handlers
            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            auto buyerId = injector.create<std::shared_ptr<adapters::primary::BuyerIdExtractorMiddleware>>();
            auto idempotencyRepo = injector.create<std::shared_ptr<ports::output::IIdempotencyRepository>>();

            auto catalogHandler = injector.create<std::shared_ptr<adapters::primary::CatalogHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/catalog")] = catalogHandler;
            handlers_[getHandlerKey("POST", "/api/v1/admin/catalog/invalidate")] =
                injector.create<std::shared_ptr<adapters::primary::CatalogInvalidateHandler>>();

            auto basketHandler = std::make_shared<adapters::primary::ChainHandler>(
                buyerId, injector.create<std::shared_ptr<adapters::primary::BasketHandler>>());
            handlers_[getHandlerKey("GET", "/api/v1/basket")] = basketHandler;
            handlers_[getHandlerKey("DELETE", "/api/v1/basket")] = basketHandler;
            handlers_[getHandlerKey("POST", "/api/v1/basket/items")] = basketHandler;
            handlers_[getHandlerKey("DELETE", "/api/v1/basket/items/*")] = basketHandler;
            handlers_[getHandlerKey("POST", "/api/v1/basket/discount")] = basketHandler;
            handlers_[getHandlerKey("DELETE", "/api/v1/basket/discount")] = basketHandler;

            // Оформление и пополнение идемпотентны по X-Idempotency-Key
            auto checkoutHandler = std::make_shared<adapters::primary::ChainHandler>(
                buyerId,
                std::make_shared<adapters::primary::IdempotentHandler>(
                    injector.create<std::shared_ptr<adapters::primary::CheckoutHandler>>(), idempotencyRepo));
            handlers_[getHandlerKey("POST", "/api/v1/checkout")] = checkoutHandler;

            auto topUpHandler = std::make_shared<adapters::primary::ChainHandler>(
                buyerId,
                std::make_shared<adapters::primary::IdempotentHandler>(
                    injector.create<std::shared_ptr<adapters::primary::TopUpHandler>>(), idempotencyRepo));
            handlers_[getHandlerKey("POST", "/api/v1/topups")] = topUpHandler;
            handlers_[getHandlerKey("GET", "/api/v1/balance")] = topUpHandler;

            handlers_[getHandlerKey("GET", "/api/v1/purchases")] = std::make_shared<adapters::primary::ChainHandler>(
                buyerId, injector.create<std::shared_ptr<adapters::primary::PurchaseHistoryHandler>>());

            auto chatHandler = std::make_shared<adapters::primary::ChainHandler>(
                buyerId, injector.create<std::shared_ptr<adapters::primary::ChatHandler>>());
            handlers_[getHandlerKey("POST", "/api/v1/chat/messages")] = chatHandler;
            handlers_[getHandlerKey("POST", "/api/v1/chat/state")] = chatHandler;

            // Webhook процессора: без X-Buyer-Id, аутентификация подписью
            handlers_[getHandlerKey("POST", "/webhook")] =
                injector.create<std::shared_ptr<adapters::primary::PaymentWebhookHandler>>();

            // Шаг 4: фоновые задачи
            outbox_ = std::dynamic_pointer_cast<application::NotificationOutbox>(
                injector.create<std::shared_ptr<ports::output::INotificationOutbox>>());
            sweeper_ = injector.create<std::shared_ptr<application::BasketExpirySweeper>>();
            sweeper_->start();

            std::cout << "[CheckoutApp] Ready" << std::endl;
        }

    private:
        std::shared_ptr<application::BasketExpirySweeper> sweeper_;
        std::shared_ptr<application::NotificationOutbox> outbox_;
    };

} // namespace checkout
