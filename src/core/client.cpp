#include "dingstream/core/client.hpp"
#include "dingstream/core/auth/token_negotiator.hpp"
#include "dingstream/core/dispatch/inbound_dispatcher.hpp"
#include "dingstream/core/session/heartbeat_watchdog.hpp"
#include "dingstream/core/session/transport_session.hpp"
#include "dingstream/core/util/error_types.hpp"
#include "dingstream/core/util/logger.hpp"
#include "dingstream/core/util/thread_pool.hpp"
#include "dingstream/transports/http/https_client.hpp"
#include "dingstream/transports/websocket/websocket_transport.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace dingstream {

    struct StreamClient::Impl {
        ClientOptions                options;
        std::shared_ptr<IScheduler>  scheduler;
        std::shared_ptr<ThreadPool>  ownedPool;     ///< set when the client created its scheduler
        Credentials                  creds;
        TokenNegotiator              negotiator;
        TransportSession             session;
        CallbackRegistry             registry;

        std::atomic<bool>            exited{ false };
        std::atomic<ConnectionState> state{ ConnectionState::Disconnected };

        std::mutex                   observerMx;
        StateObserver                observer;

        std::mutex                   connectMx;     ///< held for the whole connect() loop

        // Wakes the supervisor when the epoch ends or exit() is requested.
        std::mutex                   signalMx;
        std::condition_variable      signalCv;
        bool                         epochEnded{ false };

        // Tasks spawned on the scheduler that reference this Impl.
        std::mutex                   tasksMx;
        std::condition_variable      tasksCv;
        size_t                       activeTasks{ 0 };

        Impl(ClientIdentity identity,
             ClientOptions opts,
             std::shared_ptr<IHttpClient> http,
             TransportFactory transports,
             std::shared_ptr<IScheduler> sched)
            : options(std::move(opts)),
              scheduler(std::move(sched)),
              creds(std::move(identity)),
              negotiator(creds, std::move(http), options.tokenUrl, options.gatewayUrl),
              session(std::move(transports)),
              registry(creds, *ensureScheduler(), options.broadcastCapacity) {
            creds.setUserAgent(options.userAgent);
            creds.setHeartbeatInterval(options.heartbeatInterval);
            creds.setReconnectInterval(options.reconnectInterval);
        }

        IScheduler* ensureScheduler() {
            if (!scheduler) {
                ownedPool = std::make_shared<ThreadPool>(options.schedulerThreads);
                scheduler = ownedPool;
            }
            return scheduler.get();
        }

        void setState(ConnectionState s) {
            if (state.exchange(s) == s) return;
            LOG_INFO("[Supervisor] state " + std::string(toString(s)));
            StateObserver cb;
            {
                std::lock_guard<std::mutex> lk(observerMx);
                cb = observer;
            }
            if (cb) cb(s);
        }

        void signalEpochEnd() {
            {
                std::lock_guard<std::mutex> lk(signalMx);
                epochEnded = true;
            }
            signalCv.notify_all();
        }

        /// Spawn a task counted in activeTasks; @p done is fulfilled when it returns.
        void spawnTracked(const char* name, std::function<void()> body, std::shared_ptr<std::promise<void>> done) {
            {
                std::lock_guard<std::mutex> lk(tasksMx);
                ++activeTasks;
            }
            try {
                scheduler->spawn([this, name, body = std::move(body), done] {
                    try {
                        body();
                    } catch (const std::exception& e) {
                        LOG_ERROR(std::string("[Supervisor] ") + name + " task failed: " + e.what());
                    }
                    if (done) done->set_value();
                    finishTask();
                });
            } catch (...) {
                finishTask();
                throw;
            }
        }

        void finishTask() {
            {
                std::lock_guard<std::mutex> lk(tasksMx);
                --activeTasks;
            }
            tasksCv.notify_all();
        }

        void waitForTasks() {
            std::unique_lock<std::mutex> lk(tasksMx);
            tasksCv.wait(lk, [this] { return activeTasks == 0; });
        }

        /// @return true if exit() was requested before @p interval elapsed
        bool sleepUnlessExited(std::chrono::milliseconds interval) {
            std::unique_lock<std::mutex> lk(signalMx);
            return signalCv.wait_for(lk, interval, [this] { return exited.load(); });
        }

        void runEpoch();
    };

    void StreamClient::Impl::runEpoch() {
        setState(ConnectionState::Connecting);
        try {
            std::string url = negotiator.getEndpoint();
            LOG_DEBUG("[Supervisor] endpoint negotiated");
            session.open(url);
        } catch (const StreamError& e) {
            LOG_ERROR(std::string("[Supervisor] connect failed (") + toString(e.code()) + "): " + e.what());
            setState(ConnectionState::Disconnected);
            throw;
        }

        {
            std::lock_guard<std::mutex> lk(signalMx);
            epochEnded = false;
        }
        setState(ConnectionState::Connected);

        auto interval = creds.heartbeatInterval();
        auto watchdog = std::make_shared<HeartbeatWatchdog>(session, interval, [this] {
            session.abort();
            signalEpochEnd();
        });
        auto dispatcher = std::make_shared<InboundDispatcher>(session, registry, [watchdog] {
            watchdog->markAlive();
        });

        auto dispatchDone = std::make_shared<std::promise<void>>();
        auto watchdogDone = std::make_shared<std::promise<void>>();
        std::future<void> dispatchFinished = dispatchDone->get_future();
        std::future<void> watchdogFinished = watchdogDone->get_future();

        try {
            spawnTracked("dispatcher", [this, dispatcher] {
                dispatcher->run();
                signalEpochEnd();
            }, dispatchDone);
            if (interval.count() > 0)
                spawnTracked("heartbeat", [watchdog] { watchdog->run(); }, watchdogDone);
            else
                watchdogDone->set_value();
        } catch (const std::exception& e) {
            session.close();
            setState(ConnectionState::Disconnected);
            throw StreamError(StreamErr::Internal, std::string("cannot schedule epoch tasks: ") + e.what());
        }

        {
            std::unique_lock<std::mutex> lk(signalMx);
            signalCv.wait(lk, [this] { return epochEnded || exited.load(); });
        }

        session.abort();
        watchdog->stop();
        dispatchFinished.wait();
        watchdogFinished.wait();
        session.close();

        if (watchdog->timedOut()) LOG_WARN("[Supervisor] epoch ended by heartbeat timeout");
        else if (exited) LOG_INFO("[Supervisor] epoch ended by exit request");
        else LOG_INFO("[Supervisor] epoch ended by disconnect");

        setState(ConnectionState::Disconnected);
    }

    // ---------------------------------------------------------------------

    StreamClient::StreamClient(std::string clientId, std::string clientSecret, ClientOptions options) {
        auto http = std::make_shared<HttpsClient>(options.httpTimeout, options.userAgent);
        WebSocketOptions ws;
        ws.userAgent = options.userAgent;
        ws.handshakeTimeout = options.httpTimeout;
        TransportFactory transports = [ws] { return std::make_unique<WebSocketTransport>(ws); };
        pImpl_ = std::make_unique<Impl>(ClientIdentity{ std::move(clientId), std::move(clientSecret) },
                                        std::move(options), std::move(http), std::move(transports), nullptr);
    }

    StreamClient::StreamClient(ClientIdentity identity,
                               ClientOptions options,
                               std::shared_ptr<IHttpClient> http,
                               TransportFactory transports,
                               std::shared_ptr<IScheduler> scheduler)
        : pImpl_(std::make_unique<Impl>(std::move(identity), std::move(options), std::move(http),
                                        std::move(transports), std::move(scheduler))) {}

    StreamClient::~StreamClient() {
        exit();
        pImpl_->waitForTasks();
        pImpl_->registry.shutdown();
        if (pImpl_->ownedPool) pImpl_->ownedPool->join();
    }

    CallbackRegistry& StreamClient::registry() {
        return pImpl_->registry;
    }

    void StreamClient::registerEventListener(EventHandler handler) {
        pImpl_->registry.setEventHandler(std::move(handler));
    }

    void StreamClient::registerRawTopicListener(const std::string& topic, RawTopicHandler handler) {
        pImpl_->registry.registerRawTopicListener(topic, std::move(handler));
    }

    void StreamClient::setUserAgent(std::string ua) {
        pImpl_->creds.setUserAgent(std::move(ua));
    }

    void StreamClient::setHeartbeatInterval(std::chrono::milliseconds interval) {
        pImpl_->creds.setHeartbeatInterval(interval);
    }

    void StreamClient::setReconnectInterval(std::chrono::milliseconds interval) {
        pImpl_->creds.setReconnectInterval(interval);
    }

    void StreamClient::connect() {
        Impl& d = *pImpl_;
        std::unique_lock<std::mutex> running(d.connectMx, std::try_to_lock);
        if (!running.owns_lock())
            throw StreamError(StreamErr::Internal, "connect() is already running");

        while (!d.exited) {
            d.runEpoch();

            auto reconnect = d.creds.reconnectInterval();
            if (reconnect.count() <= 0 || d.exited) break;
            LOG_INFO("[Supervisor] reconnecting in " + std::to_string(reconnect.count()) + "ms");
            if (d.sleepUnlessExited(reconnect)) break;
        }
        LOG_DEBUG("[Supervisor] connection loop finished");
    }

    std::future<void> StreamClient::start() {
        auto result = std::make_shared<std::promise<void>>();
        std::future<void> f = result->get_future();
        pImpl_->spawnTracked("supervisor", [this, result] {
            try {
                connect();
                result->set_value();
            } catch (...) {
                result->set_exception(std::current_exception());
            }
        }, nullptr);
        return f;
    }

    void StreamClient::exit() {
        Impl& d = *pImpl_;
        {
            std::lock_guard<std::mutex> lk(d.signalMx);
            if (d.exited.exchange(true)) return;
        }
        LOG_INFO("[Supervisor] exit requested");
        d.signalCv.notify_all();
        d.session.abort();
    }

    bool StreamClient::exited() const noexcept {
        return pImpl_->exited.load();
    }

    ConnectionState StreamClient::state() const noexcept {
        return pImpl_->state.load();
    }

    void StreamClient::onStateChange(StateObserver observer) {
        std::lock_guard<std::mutex> lk(pImpl_->observerMx);
        pImpl_->observer = std::move(observer);
    }

    Credentials& StreamClient::credentials() {
        return pImpl_->creds;
    }

    std::string StreamClient::token() {
        return pImpl_->negotiator.getToken();
    }

}
